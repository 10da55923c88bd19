#include <gtest/gtest.h>

#include <astkg/search/search_strategy.h>

using namespace astkg;
using namespace astkg::search;

TEST(SearchStrategyTableTest, UnknownIntentUsesConfiguredDefaults) {
    config::QueryConfig cfg;
    cfg.expansion_depth = 2;
    cfg.score_threshold = 0.2;
    cfg.relationship_types = {"CALLS"};
    SearchStrategyTable table(cfg);

    const auto& p = table.resolve(QueryIntent::Unknown);
    EXPECT_EQ(p.name, "default");
    EXPECT_EQ(p.expansion_depth, 2u);
    EXPECT_DOUBLE_EQ(p.score_threshold, 0.2);
    EXPECT_DOUBLE_EQ(p.lexical_weight, 0.5);
    ASSERT_EQ(p.relationship_types.size(), 1u);
    EXPECT_EQ(&p, &table.defaults());
}

TEST(SearchStrategyTableTest, IntentProfiles) {
    config::QueryConfig cfg;
    cfg.intent_profiles = true;
    cfg.expansion_depth = 3;
    SearchStrategyTable table(cfg);

    const auto& impl = table.resolve(QueryIntent::Implementation);
    EXPECT_EQ(impl.name, "implementation");
    EXPECT_GT(impl.vector_weight, impl.lexical_weight);
    EXPECT_EQ(impl.expansion_depth, 2u);

    const auto& usage = table.resolve(QueryIntent::Usage);
    EXPECT_EQ(usage.expansion_depth, 3u);
    EXPECT_FALSE(usage.relationship_types.empty());

    const auto& conf = table.resolve(QueryIntent::Configuration);
    EXPECT_EQ(conf.expansion_depth, 0u);
    EXPECT_GT(conf.lexical_weight, conf.vector_weight);

    // Search limits never exceed the configured branch limits
    for (auto intent : {QueryIntent::Implementation, QueryIntent::Usage, QueryIntent::Discovery,
                        QueryIntent::Status, QueryIntent::Configuration}) {
        EXPECT_LE(table.resolve(intent).search_limit, 50u);
        EXPECT_EQ(table.resolve(intent).expansion_node_cap, 50u);
    }
}

TEST(SearchStrategyTableTest, ProfilesHonourConfiguredRetrievalSettings) {
    config::QueryConfig cfg;
    cfg.expansion_depth = 0;
    cfg.lexical_weight = 1.0;
    cfg.vector_weight = 0.0;
    cfg.score_threshold = 0.9;
    cfg.relationship_types = {"CALLS"};
    SearchStrategyTable table(cfg);

    for (auto intent : {QueryIntent::Implementation, QueryIntent::Usage, QueryIntent::Discovery,
                        QueryIntent::Status, QueryIntent::Configuration}) {
        const auto& p = table.resolve(intent);
        EXPECT_EQ(p.expansion_depth, 0u) << p.name;
        EXPECT_DOUBLE_EQ(p.lexical_weight, 1.0) << p.name;
        EXPECT_DOUBLE_EQ(p.vector_weight, 0.0) << p.name;
        EXPECT_DOUBLE_EQ(p.score_threshold, 0.9) << p.name;
        EXPECT_EQ(p.relationship_types, std::vector<std::string>{"CALLS"}) << p.name;
    }
    // Profiles still lower the depth below a deeper configured one
    cfg.expansion_depth = 2;
    SearchStrategyTable deeper(cfg);
    EXPECT_EQ(deeper.resolve(QueryIntent::Usage).expansion_depth, 2u);
    EXPECT_EQ(deeper.resolve(QueryIntent::Status).expansion_depth, 1u);
}

TEST(SearchStrategyTableTest, TypeBoosts) {
    SearchStrategyTable table(config::QueryConfig{});
    const auto& p = table.defaults();
    EXPECT_DOUBLE_EQ(p.typeBoost("Method"), 1.0);
    EXPECT_DOUBLE_EQ(p.typeBoost("Class"), 0.8);
    EXPECT_DOUBLE_EQ(p.typeBoost("Unheard"), 0.5);
}

TEST(SearchStrategyTableTest, IntentNamesRoundTrip) {
    EXPECT_EQ(parseIntent("usage"), QueryIntent::Usage);
    EXPECT_EQ(parseIntent("IMPLEMENTATION"), QueryIntent::Implementation);
    EXPECT_EQ(parseIntent("nonsense"), QueryIntent::Unknown);
    EXPECT_STREQ(toString(QueryIntent::Status), "status");
}
