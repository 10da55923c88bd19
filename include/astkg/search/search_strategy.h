#pragma once

#include <astkg/config/query_config.h>
#include <astkg/search/search_types.h>

#include <map>
#include <string>
#include <vector>

namespace astkg::search {

// Retrieval parameters selected by query intent
struct StrategyProfile {
    std::string name;
    double lexical_weight = 0.5;
    double vector_weight = 0.5;
    double score_threshold = 0.1;
    size_t search_limit = 50; // Hits requested per branch
    size_t expansion_depth = 1;
    size_t expansion_node_cap = 50;
    std::vector<std::string> relationship_types; // empty = all
    // Multiplier per node type for expansion-only scores; unlisted types use 0.5
    std::map<std::string, double> node_type_boosts;

    double typeBoost(const std::string& type) const {
        auto it = node_type_boosts.find(type);
        return it == node_type_boosts.end() ? 0.5 : it->second;
    }
};

/**
 * Intent -> profile lookup built once from the active configuration.
 *
 * QueryIntent::Unknown resolves to the configured defaults. Intent profiles
 * adjust node type boosts and may only lower the configured expansion depth
 * and search limits. Their own fusion weights, score threshold and
 * relationship filter apply only with `retrieval.intent_profiles = true`.
 */
class SearchStrategyTable {
public:
    explicit SearchStrategyTable(const config::QueryConfig& cfg);

    const StrategyProfile& resolve(QueryIntent intent) const;
    const StrategyProfile& defaults() const noexcept { return defaults_; }

private:
    StrategyProfile defaults_;
    std::map<QueryIntent, StrategyProfile> profiles_;
};

} // namespace astkg::search
