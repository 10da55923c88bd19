#include <astkg/retrieval/reranker.h>

#include <astkg/common/vector_math.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <vector>

namespace astkg::retrieval {

namespace {

using EmbeddingMap = std::map<NodeId, std::optional<Embedding>>;

} // namespace

ReRanker::ReRanker(std::shared_ptr<graph::GraphStore> store,
                   std::shared_ptr<common::WorkerPool> pool)
    : store_(std::move(store)), pool_(std::move(pool)) {}

ReRankOutcome ReRanker::rerank(graph::SubGraph subGraph, const std::set<NodeId>& seedIds,
                               const Embedding& queryEmbedding, const ReRankConfig& config) const {
    ReRankOutcome out;
    if (!config.enabled || queryEmbedding.empty() || subGraph.empty()) {
        out.subGraph = std::move(subGraph);
        return out;
    }

    std::vector<NodeId> ids;
    ids.reserve(subGraph.nodeCount());
    for (const auto& [id, node] : subGraph.nodes())
        ids.push_back(id);

    auto fut = pool_->submit([store = store_, ids]() -> Result<EmbeddingMap> {
        EmbeddingMap found;
        for (const auto& id : ids) {
            auto r = store->getNodeEmbedding(id);
            if (r)
                found[id] = r.value();
            else
                found[id] = std::nullopt;
        }
        return found;
    });
    auto fetched = common::awaitResult(fut, config.timeout, "embedding lookup");
    if (!fetched) {
        spdlog::warn("[ReRanker] {}; treating all nodes as unembedded", fetched.error().message);
    }

    std::vector<std::pair<NodeId, double>> candidates; // expansion-only survivors
    std::set<NodeId> drop;
    for (const auto& id : ids) {
        std::optional<Embedding> emb;
        if (fetched) {
            auto it = fetched.value().find(id);
            if (it != fetched.value().end())
                emb = it->second;
        }
        double rel = config.unembedded_score;
        const bool embedded = emb.has_value() && !emb->empty();
        if (embedded)
            rel = common::clamp01(common::cosineSimilarity(queryEmbedding, *emb));
        out.relevance[id] = rel;

        if (seedIds.count(id))
            continue;
        if (!embedded && config.keep_unembedded) {
            candidates.emplace_back(id, rel);
            continue;
        }
        if (!embedded || rel < config.relevance_floor) {
            drop.insert(id);
            continue;
        }
        candidates.emplace_back(id, rel);
    }

    if (config.final_limit > 0 && candidates.size() > config.final_limit) {
        std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second)
                return a.second > b.second;
            return a.first < b.first;
        });
        for (size_t i = config.final_limit; i < candidates.size(); ++i)
            drop.insert(candidates[i].first);
    }

    for (const auto& id : drop)
        out.relevance.erase(id);
    out.pruned = subGraph.removeNodes(drop);
    out.subGraph = std::move(subGraph);
    out.applied = true;
    spdlog::debug("[ReRanker] kept {} nodes, pruned {} (floor={})", out.subGraph.nodeCount(),
                  out.pruned, config.relevance_floor);
    return out;
}

} // namespace astkg::retrieval
