#include <astkg/retrieval/hybrid_retriever.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <set>

namespace astkg::retrieval {

HybridRetriever::HybridRetriever(std::shared_ptr<graph::GraphStore> store,
                                 std::shared_ptr<common::WorkerPool> pool,
                                 config::QueryConfig config)
    : config_(std::move(config)),
      strategies_(config_),
      searcher_(store, pool,
                search::ParallelSearchConfig{.lexical_limit = config_.lexical_limit,
                                             .vector_limit = config_.vector_limit,
                                             .enable_lexical = config_.enable_lexical,
                                             .enable_vector = config_.enable_vector,
                                             .timeout = config_.search_timeout}),
      expander_(store, pool),
      scorer_(NodeScorerConfig{.expansion_ceiling = config_.expansion_ceiling,
                               .degree_weight = config_.degree_weight}),
      reranker_(std::move(store), std::move(pool)) {}

RetrievalResult HybridRetriever::retrieve(const search::ExtractedTerms& terms,
                                          const Embedding& queryEmbedding) const {
    const auto start = std::chrono::steady_clock::now();
    const auto& profile = strategies_.resolve(terms.intent);
    RetrievalResult result;

    // 1. Parallel lexical + vector search
    auto searchCfg = searcher_.config();
    searchCfg.lexical_limit = std::min(searchCfg.lexical_limit, profile.search_limit);
    searchCfg.vector_limit = std::min(searchCfg.vector_limit, profile.search_limit);
    auto hits = searcher_.search(terms, queryEmbedding, searchCfg);

    // 2. Fusion
    search::ResultCombiner combiner(
        search::FusionConfig{.lexical_weight = profile.lexical_weight,
                             .vector_weight = profile.vector_weight,
                             .single_signal_discount = config_.single_signal_discount,
                             .normalize_lexical = config_.normalize_lexical});
    auto combined = combiner.combine(hits.lexicalHits, hits.vectorHits);

    // 3. Threshold + limit
    for (const auto& r : combined) {
        if (result.seeds.size() >= config_.initial_limit)
            break;
        if (r.combinedScore > 0.0 && r.combinedScore >= profile.score_threshold)
            result.seeds.push_back(r);
    }
    for (const auto& r : result.seeds)
        result.seedNodeIds.push_back(r.nodeId);

    // 4. Expansion; the cap never squeezes out a seed
    ExpansionConfig expCfg{.depth = profile.expansion_depth,
                           .node_cap = std::max(profile.expansion_node_cap, result.seeds.size()),
                           .call_timeout = config_.expansion_call_timeout,
                           .relationship_types = profile.relationship_types};
    auto expanded = expander_.expand(result.seedNodeIds, expCfg);
    const size_t expandedCount = expanded.nodeCount();

    // A failed seed lookup leaves seeds out of the subgraph; rebuild them from
    // the search hits so direct evidence is never lost
    size_t restored = 0;
    for (const auto& r : result.seeds) {
        if (expanded.hasNode(r.nodeId))
            continue;
        graph::GraphNode node;
        node.id = r.nodeId;
        node.type = r.nodeType;
        if (!r.nodeType.empty())
            node.labels.insert(r.nodeType);
        if (!r.name.empty())
            node.properties[graph::prop::Name] = r.name;
        if (!r.signature.empty())
            node.properties[graph::prop::Signature] = r.signature;
        expanded.addNode(std::move(node));
        expanded.setHop(r.nodeId, 0, r.nodeId);
        ++restored;
    }
    if (restored > 0) {
        spdlog::warn("[HybridRetriever] restored {} seeds missing from the expanded subgraph",
                     restored);
    }

    // 5. Importance scoring
    auto importance = scorer_.score(expanded, result.seeds, profile);

    // 6. Re-ranking
    std::set<NodeId> seedSet(result.seedNodeIds.begin(), result.seedNodeIds.end());
    auto reranked = reranker_.rerank(std::move(expanded), seedSet, queryEmbedding,
                                     ReRankConfig{.enabled = config_.enable_reranking,
                                                  .relevance_floor = config_.relevance_floor,
                                                  .final_limit = config_.rerank_final_limit,
                                                  .keep_unembedded = config_.keep_unembedded,
                                                  .unembedded_score = config_.unembedded_score,
                                                  .timeout = config_.expansion_call_timeout});
    result.subGraph = std::move(reranked.subGraph);

    // 7. Final scores
    std::map<NodeId, double> combinedById;
    for (const auto& r : result.seeds)
        combinedById[r.nodeId] = r.combinedScore;
    for (const auto& [id, node] : result.subGraph.nodes()) {
        const double imp = importance.count(id) ? importance.at(id) : 0.0;
        auto seed = combinedById.find(id);
        if (seed != combinedById.end()) {
            result.scoreMap[id] =
                config_.seed_blend * seed->second + (1.0 - config_.seed_blend) * imp;
        } else {
            result.scoreMap[id] = imp * config_.expansion_discount;
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    auto& md = result.metadata;
    md["strategy"] = profile.name;
    md["lexicalResultCount"] = std::to_string(hits.lexicalHits.size());
    md["vectorResultCount"] = std::to_string(hits.vectorHits.size());
    md["lexicalStatus"] = search::toString(hits.lexical.status);
    md["vectorStatus"] = search::toString(hits.vector.status);
    md["combinedResultCount"] = std::to_string(combined.size());
    md["seedCount"] = std::to_string(result.seedNodeIds.size());
    md["expandedNodeCount"] = std::to_string(expandedCount);
    md["reRankedNodeCount"] = std::to_string(result.subGraph.nodeCount());
    md["prunedNodeCount"] = std::to_string(reranked.pruned);
    md["scoreThreshold"] = fmt::format("{:.3f}", profile.score_threshold);
    md["expansionDepth"] = std::to_string(profile.expansion_depth);
    md["elapsedMs"] = std::to_string(elapsed.count());
    for (const char* key : {"truncated", "partial", "error"}) {
        auto it = result.subGraph.metadata.find(key);
        if (it != result.subGraph.metadata.end())
            md[std::string("expansion.") + key] = it->second;
    }
    if (!hits.lexical.error.empty())
        md["lexicalError"] = hits.lexical.error;
    if (!hits.vector.error.empty())
        md["vectorError"] = hits.vector.error;

    spdlog::info("[HybridRetriever] strategy={} lexical={} vector={} combined={} seeds={} "
                 "expanded={} kept={} ({} ms)",
                 profile.name, hits.lexicalHits.size(), hits.vectorHits.size(), combined.size(),
                 result.seedNodeIds.size(), expandedCount, result.subGraph.nodeCount(),
                 elapsed.count());
    return result;
}

} // namespace astkg::retrieval
