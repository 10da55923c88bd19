#include <astkg/search/search_strategy.h>

#include <algorithm>

namespace astkg::search {

namespace {

const std::map<std::string, double> kDefaultTypeBoosts = {
    {"Method", 1.0}, {"Class", 0.8}, {"Interface", 0.7}, {"Enum", 0.6}, {"Field", 0.5},
};

// Depth and limits never exceed the configured values. Weights, threshold and
// the relationship filter replace the configured ones only when `tuned` is set.
StrategyProfile makeProfile(const StrategyProfile& base, bool tuned, std::string name,
                            double lexical, double vector, double threshold, size_t limit,
                            size_t depth, std::vector<std::string> rels,
                            std::map<std::string, double> boosts) {
    StrategyProfile p = base;
    p.name = std::move(name);
    p.search_limit = std::min(limit, base.search_limit);
    p.expansion_depth = std::min(depth, base.expansion_depth);
    if (tuned) {
        p.lexical_weight = lexical;
        p.vector_weight = vector;
        p.score_threshold = threshold;
        if (!rels.empty())
            p.relationship_types = std::move(rels);
    }
    for (auto& [type, boost] : boosts)
        p.node_type_boosts[type] = boost;
    return p;
}

} // namespace

SearchStrategyTable::SearchStrategyTable(const config::QueryConfig& cfg) {
    defaults_.name = "default";
    defaults_.lexical_weight = cfg.lexical_weight;
    defaults_.vector_weight = cfg.vector_weight;
    defaults_.score_threshold = cfg.score_threshold;
    defaults_.search_limit = std::max(cfg.lexical_limit, cfg.vector_limit);
    defaults_.expansion_depth = cfg.expansion_depth;
    defaults_.expansion_node_cap = cfg.expansion_node_cap;
    defaults_.relationship_types = cfg.relationship_types;
    defaults_.node_type_boosts = kDefaultTypeBoosts;

    const bool tuned = cfg.intent_profiles;

    profiles_[QueryIntent::Implementation] =
        makeProfile(defaults_, tuned, "implementation", 0.4, 0.6, 0.1, 100, 2, {},
                    {{"Method", 1.0}, {"Class", 0.6}, {"Interface", 0.5}, {"Description", 0.7}});
    profiles_[QueryIntent::Usage] =
        makeProfile(defaults_, tuned, "usage", 0.5, 0.5, 0.05, 150, 3,
                    {"CALLS", "USES", "DEPENDS_ON", "EXTENDS", "IMPLEMENTS"},
                    {{"Method", 0.7}, {"Class", 0.7}, {"Interface", 0.8}});
    profiles_[QueryIntent::Configuration] =
        makeProfile(defaults_, tuned, "configuration", 0.7, 0.3, 0.2, 50, 0, {},
                    {{"Field", 0.6}, {"Configuration", 0.9}, {"Property", 0.9}});
    profiles_[QueryIntent::Discovery] =
        makeProfile(defaults_, tuned, "discovery", 0.5, 0.5, 0.1, 100, 2, {},
                    {{"Class", 0.8}, {"Interface", 0.9}, {"Method", 0.7}});
    profiles_[QueryIntent::Status] =
        makeProfile(defaults_, tuned, "status", 0.6, 0.4, 0.15, 75, 1, {},
                    {{"Enum", 0.9}, {"Field", 0.7}});
}

const StrategyProfile& SearchStrategyTable::resolve(QueryIntent intent) const {
    auto it = profiles_.find(intent);
    return it == profiles_.end() ? defaults_ : it->second;
}

} // namespace astkg::search
