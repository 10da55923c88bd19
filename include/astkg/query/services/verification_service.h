#pragma once

#include <astkg/common/worker_pool.h>
#include <astkg/graph/graph_store.h>
#include <astkg/query/query_execution_context.h>

#include <chrono>
#include <memory>

namespace astkg::query {

/**
 * VERIFY: check every relationship claim of the generated answer against the
 * graph with GraphStore::edgeExists.
 *
 * Checks run concurrently on the worker pool under one shared deadline. A check
 * that errors or times out leaves its claim unverified. The answer is verified
 * when no claim failed, so an answer without claims is verified.
 */
class VerificationService {
public:
    VerificationService(std::shared_ptr<graph::GraphStore> store,
                        std::shared_ptr<common::WorkerPool> pool,
                        std::chrono::milliseconds claimTimeout);

    Result<void> verify(QueryExecutionContext& ctx) const;

private:
    std::shared_ptr<graph::GraphStore> store_;
    std::shared_ptr<common::WorkerPool> pool_;
    std::chrono::milliseconds claimTimeout_;
};

} // namespace astkg::query
