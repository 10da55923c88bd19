#pragma once

#include <astkg/graph/graph_types.h>
#include <astkg/search/search_strategy.h>
#include <astkg/search/search_types.h>

#include <map>
#include <vector>

namespace astkg::retrieval {

struct NodeScorerConfig {
    // Expansion-only scores are capped at ceiling * (lowest seed importance)
    double expansion_ceiling = 0.9;
    // Share of local degree in the structural weight; the rest is hop proximity
    double degree_weight = 0.2;
};

/**
 * Importance per subgraph node.
 *
 *   seed:            combinedScore
 *   expansion-only:  ceiling * minSeed * structural * typeBoost
 *   structural:      (1 - dw) / (1 + hop) + dw * deg / (1 + deg)
 *
 * ceiling is below 1 and structural and typeBoost are at most 1, so every
 * expansion-only node scores strictly below the weakest seed.
 */
class NodeScorer {
public:
    explicit NodeScorer(NodeScorerConfig config = {});

    std::map<NodeId, double> score(const graph::SubGraph& subGraph,
                                   const std::vector<search::RankedResult>& seeds,
                                   const search::StrategyProfile& profile) const;

    double structuralWeight(size_t hop, size_t degree) const;

private:
    NodeScorerConfig config_;
};

} // namespace astkg::retrieval
