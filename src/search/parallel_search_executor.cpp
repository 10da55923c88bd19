#include <astkg/search/parallel_search_executor.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace astkg::search {

namespace {

using Clock = std::chrono::steady_clock;
using HitsResult = Result<std::vector<SearchHit>>;

void settle(std::future<HitsResult>& fut, Clock::time_point start, Clock::time_point deadline,
            const char* what, std::vector<SearchHit>& hits, BranchStats& stats) {
    const auto remaining = std::max(std::chrono::milliseconds(0),
                                    std::chrono::duration_cast<std::chrono::milliseconds>(
                                        deadline - Clock::now()));
    auto res = common::awaitResult(fut, remaining, std::string(what) + " search");
    stats.latency = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    if (res) {
        hits = std::move(res).value();
        std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
            if (a.score != b.score)
                return a.score > b.score;
            return a.nodeId < b.nodeId;
        });
        stats.status = BranchStatus::Ok;
        stats.hits = hits.size();
        return;
    }
    stats.status = res.error().code == ErrorCode::Timeout ? BranchStatus::Timeout
                                                          : BranchStatus::Failed;
    stats.error = res.error().message;
    spdlog::warn("[ParallelSearch] {} branch degraded to empty: {}", what, stats.error);
}

} // namespace

ParallelSearchExecutor::ParallelSearchExecutor(std::shared_ptr<graph::GraphStore> store,
                                               std::shared_ptr<common::WorkerPool> pool,
                                               ParallelSearchConfig config)
    : store_(std::move(store)), pool_(std::move(pool)), config_(config) {}

ParallelSearchResult ParallelSearchExecutor::search(const ExtractedTerms& terms,
                                                    const Embedding& queryEmbedding,
                                                    const ParallelSearchConfig& config) const {
    ParallelSearchResult out;
    const auto start = Clock::now();
    const auto deadline = start + config.timeout;

    // Tasks capture the store by shared_ptr and inputs by value: a branch that
    // misses the deadline keeps running after this call returns.
    std::future<HitsResult> lexFut;
    std::future<HitsResult> vecFut;
    if (config.enable_lexical && !terms.empty()) {
        lexFut = pool_->submit([store = store_, terms, limit = config.lexical_limit]() {
            return store->lexicalSearch(terms, limit);
        });
    }
    if (config.enable_vector && !queryEmbedding.empty()) {
        vecFut = pool_->submit([store = store_, emb = queryEmbedding, limit = config.vector_limit]() {
            return store->vectorSearch(emb, limit);
        });
    }

    if (lexFut.valid())
        settle(lexFut, start, deadline, "lexical", out.lexicalHits, out.lexical);
    if (vecFut.valid())
        settle(vecFut, start, deadline, "vector", out.vectorHits, out.vector);

    spdlog::debug("[ParallelSearch] lexical={} ({} hits, {} ms) vector={} ({} hits, {} ms)",
                  toString(out.lexical.status), out.lexical.hits, out.lexical.latency.count(),
                  toString(out.vector.status), out.vector.hits, out.vector.latency.count());
    return out;
}

} // namespace astkg::search
