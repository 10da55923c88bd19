#include <astkg/retrieval/node_scorer.h>

#include <astkg/common/vector_math.h>

#include <algorithm>

namespace astkg::retrieval {

namespace {

double degreeFactor(size_t degree) {
    return static_cast<double>(degree) / (1.0 + static_cast<double>(degree));
}

} // namespace

NodeScorer::NodeScorer(NodeScorerConfig config) : config_(config) {
    config_.expansion_ceiling = std::clamp(config_.expansion_ceiling, 0.01, 0.99);
    config_.degree_weight = std::clamp(config_.degree_weight, 0.0, 0.99);
}

double NodeScorer::structuralWeight(size_t hop, size_t degree) const {
    const double dw = config_.degree_weight;
    return (1.0 - dw) / (1.0 + static_cast<double>(hop)) + dw * degreeFactor(degree);
}

std::map<NodeId, double> NodeScorer::score(const graph::SubGraph& subGraph,
                                           const std::vector<search::RankedResult>& seeds,
                                           const search::StrategyProfile& profile) const {
    std::map<NodeId, double> scores;

    // Seeds keep their fused search score
    double minSeed = 1.0;
    for (const auto& r : seeds) {
        if (!subGraph.hasNode(r.nodeId))
            continue;
        const double importance = common::clamp01(r.combinedScore);
        scores[r.nodeId] = importance;
        minSeed = std::min(minSeed, importance);
    }

    const double ceiling = config_.expansion_ceiling * minSeed;
    for (const auto& [id, node] : subGraph.nodes()) {
        if (scores.count(id))
            continue;
        const size_t hop = std::max<size_t>(subGraph.hopOf(id).value_or(1), 1);
        const double structural = structuralWeight(hop, subGraph.degree(id));
        const double boost = std::clamp(profile.typeBoost(node.type), 0.0, 1.0);
        scores[id] = ceiling * structural * boost;
    }
    return scores;
}

} // namespace astkg::retrieval
