#pragma once

#include <astkg/common/worker_pool.h>
#include <astkg/graph/graph_store.h>

#include <chrono>
#include <map>
#include <memory>
#include <set>

namespace astkg::retrieval {

struct ReRankConfig {
    bool enabled = true;
    double relevance_floor = 0.3;
    size_t final_limit = 0; // 0 = keep every expansion-only node above the floor
    bool keep_unembedded = true;
    double unembedded_score = 0.5;
    std::chrono::milliseconds timeout{1000};
};

struct ReRankOutcome {
    graph::SubGraph subGraph;
    std::map<NodeId, double> relevance; // Query similarity per surviving node
    size_t pruned = 0;
    bool applied = false;
};

/**
 * Precision pass over an expanded subgraph: scores each node by cosine
 * similarity between its stored embedding and the query embedding, then
 * removes expansion-only nodes below the relevance floor. Seeds are never
 * removed. Embeddings are fetched in one pool task bounded by `timeout`; a
 * failed fetch treats every node as unembedded.
 */
class ReRanker {
public:
    ReRanker(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<common::WorkerPool> pool);

    ReRankOutcome rerank(graph::SubGraph subGraph, const std::set<NodeId>& seedIds,
                         const Embedding& queryEmbedding, const ReRankConfig& config) const;

private:
    std::shared_ptr<graph::GraphStore> store_;
    std::shared_ptr<common::WorkerPool> pool_;
};

} // namespace astkg::retrieval
