#pragma once

#include <astkg/common/worker_pool.h>
#include <astkg/config/query_config.h>
#include <astkg/graph/graph_store.h>
#include <astkg/retrieval/graph_expander.h>
#include <astkg/retrieval/node_scorer.h>
#include <astkg/retrieval/reranker.h>
#include <astkg/search/parallel_search_executor.h>
#include <astkg/search/result_combiner.h>
#include <astkg/search/search_strategy.h>

#include <map>
#include <memory>
#include <vector>

namespace astkg::retrieval {

struct RetrievalResult {
    std::vector<NodeId> seedNodeIds; // combinedScore descending
    std::vector<search::RankedResult> seeds;
    graph::SubGraph subGraph;
    std::map<NodeId, double> scoreMap; // One entry per subGraph node
    Metadata metadata;

    double scoreOf(const NodeId& id) const {
        auto it = scoreMap.find(id);
        return it == scoreMap.end() ? 0.0 : it->second;
    }
};

/**
 * search -> combine -> threshold/limit -> expand -> score -> re-rank.
 *
 * Final scores: seeds blend combinedScore with NodeScorer importance
 * (seed_blend : 1 - seed_blend); expansion-only nodes that survive re-ranking
 * keep their importance times expansion_discount.
 */
class HybridRetriever {
public:
    HybridRetriever(std::shared_ptr<graph::GraphStore> store,
                    std::shared_ptr<common::WorkerPool> pool, config::QueryConfig config);

    RetrievalResult retrieve(const search::ExtractedTerms& terms,
                             const Embedding& queryEmbedding) const;

    const config::QueryConfig& config() const noexcept { return config_; }

private:
    config::QueryConfig config_;
    search::SearchStrategyTable strategies_;
    search::ParallelSearchExecutor searcher_;
    GraphExpander expander_;
    NodeScorer scorer_;
    ReRanker reranker_;
};

} // namespace astkg::retrieval
