#pragma once

#include <astkg/common/worker_pool.h>
#include <astkg/graph/graph_store.h>
#include <astkg/search/search_types.h>

#include <chrono>
#include <memory>

namespace astkg::search {

struct ParallelSearchConfig {
    size_t lexical_limit = 50;
    size_t vector_limit = 50;
    bool enable_lexical = true;
    bool enable_vector = true;
    // Wall-clock budget shared by both branches
    std::chrono::milliseconds timeout{2000};
};

/**
 * Runs the lexical and vector queries as independent tasks on the worker pool
 * and joins both within one deadline. A branch that fails, throws or misses the
 * deadline contributes an empty list; the other branch is still returned.
 */
class ParallelSearchExecutor {
public:
    ParallelSearchExecutor(std::shared_ptr<graph::GraphStore> store,
                           std::shared_ptr<common::WorkerPool> pool,
                           ParallelSearchConfig config = {});

    ParallelSearchResult search(const ExtractedTerms& terms, const Embedding& queryEmbedding,
                                const ParallelSearchConfig& config) const;

    ParallelSearchResult search(const ExtractedTerms& terms,
                                const Embedding& queryEmbedding) const {
        return search(terms, queryEmbedding, config_);
    }

    const ParallelSearchConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<graph::GraphStore> store_;
    std::shared_ptr<common::WorkerPool> pool_;
    ParallelSearchConfig config_;
};

} // namespace astkg::search
