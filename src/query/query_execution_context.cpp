#include <astkg/query/query_execution_context.h>

#include <spdlog/fmt/fmt.h>

#include <random>

namespace astkg::query {

QueryExecutionContext::QueryExecutionContext(std::string query, std::string executionId,
                                             size_t maxRefinements)
    : originalQuery_(std::move(query)),
      executionId_(std::move(executionId)),
      startTime_(std::chrono::system_clock::now()),
      startedAt_(std::chrono::steady_clock::now()),
      maxRefinements_(maxRefinements) {}

std::chrono::milliseconds QueryExecutionContext::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 startedAt_);
}

Result<void> QueryExecutionContext::beginRefinement() {
    if (refinementCount_ >= maxRefinements_) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("refinement budget of {} exhausted", maxRefinements_)};
    }
    ++refinementCount_;
    verified = false;
    return {};
}

void QueryExecutionContext::markStepComplete(const std::string& step) {
    const auto at = elapsed();
    std::lock_guard<std::mutex> lk(stepsMutex_);
    completedSteps_.emplace_back(step, at);
}

std::vector<std::string> QueryExecutionContext::completedSteps() const {
    std::lock_guard<std::mutex> lk(stepsMutex_);
    std::vector<std::string> out;
    out.reserve(completedSteps_.size());
    for (const auto& [name, at] : completedSteps_)
        out.push_back(name);
    return out;
}

std::vector<std::pair<std::string, std::chrono::milliseconds>>
QueryExecutionContext::stepTimeline() const {
    std::lock_guard<std::mutex> lk(stepsMutex_);
    return completedSteps_;
}

std::string generateExecutionId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    const uint64_t hi = rng();
    const uint64_t lo = rng();
    return fmt::format("{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}", static_cast<uint32_t>(hi >> 32),
                       static_cast<uint16_t>(hi >> 16), static_cast<uint16_t>(hi & 0x0fff),
                       static_cast<uint16_t>(((lo >> 48) & 0x3fff) | 0x8000),
                       lo & 0xffffffffffffULL);
}

} // namespace astkg::query
