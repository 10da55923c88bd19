#include <astkg/query/services/verification_service.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <vector>

namespace astkg::query {

VerificationService::VerificationService(std::shared_ptr<graph::GraphStore> store,
                                         std::shared_ptr<common::WorkerPool> pool,
                                         std::chrono::milliseconds claimTimeout)
    : store_(std::move(store)), pool_(std::move(pool)), claimTimeout_(claimTimeout) {}

Result<void> VerificationService::verify(QueryExecutionContext& ctx) const {
    ++ctx.verificationAttempts;
    ctx.metadata["verificationAttempt"] = std::to_string(ctx.verificationAttempts);
    ctx.verificationErrors.clear();

    if (!ctx.generatedAnswer) {
        ctx.verified = false;
        ctx.verificationErrors.push_back("No result to verify");
        ctx.metadata["totalRelationships"] = "0";
        ctx.metadata["verifiedRelationships"] = "0";
        ctx.metadata["verificationSuccessRate"] = "0.0000";
        return {};
    }
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "no graph store configured"};
    }

    auto& claims = ctx.generatedAnswer->claims;
    std::vector<std::future<Result<bool>>> checks;
    checks.reserve(claims.size());
    for (const auto& claim : claims) {
        checks.push_back(pool_->submit(
            [store = store_, from = claim.fromComponent, to = claim.toComponent,
             type = claim.relationshipType]() { return store->edgeExists(from, to, type); }));
    }

    size_t verifiedCount = 0;
    const auto deadline = std::chrono::steady_clock::now() + claimTimeout_;
    for (size_t i = 0; i < claims.size(); ++i) {
        auto& claim = claims[i];
        const auto remaining = std::max(
            std::chrono::milliseconds(0), std::chrono::duration_cast<std::chrono::milliseconds>(
                                              deadline - std::chrono::steady_clock::now()));
        auto exists = common::awaitResult(checks[i], remaining, "claim check");
        auto message = fmt::format("Invalid relationship claim: {} -> {} ({})", claim.fromComponent,
                                   claim.toComponent, claim.relationshipType);
        if (!exists) {
            claim.verified = false;
            spdlog::warn("[VerificationService] {}: {}", message, exists.error().message);
            ctx.verificationErrors.push_back(message + ": " + exists.error().message);
            continue;
        }
        claim.verified = exists.value();
        if (claim.verified) {
            ++verifiedCount;
        } else {
            ctx.verificationErrors.push_back(std::move(message));
        }
    }

    const double rate = claims.empty() ? 1.0
                                       : static_cast<double>(verifiedCount) /
                                             static_cast<double>(claims.size());
    ctx.verified = verifiedCount == claims.size();
    ctx.metadata["totalRelationships"] = std::to_string(claims.size());
    ctx.metadata["verifiedRelationships"] = std::to_string(verifiedCount);
    ctx.metadata["verificationSuccessRate"] = fmt::format("{:.4f}", rate);
    spdlog::info("[VerificationService] {}: {}/{} claims verified (attempt {})", ctx.executionId(),
                 verifiedCount, claims.size(), ctx.verificationAttempts);
    return {};
}

} // namespace astkg::query
