#include <gtest/gtest.h>

#include <astkg/retrieval/node_scorer.h>

#include "common/test_graph.h"

using namespace astkg;
using namespace astkg::retrieval;
using namespace astkg::test;

namespace {

search::RankedResult seed(const NodeId& id, double combined) {
    search::RankedResult r;
    r.nodeId = id;
    r.combinedScore = combined;
    return r;
}

// login and validate as seeds, the rest of the auth corner as expansion
graph::SubGraph authSubGraph() {
    using graph::node_type::Class;
    using graph::node_type::Interface;
    using graph::node_type::Method;

    graph::SubGraph sg;
    sg.addNode(makeNode(ids::Login, Method, "login"));
    sg.addNode(makeNode(ids::Validate, Method, "validate"));
    sg.addNode(makeNode(ids::AuthService, Class, "AuthService"));
    sg.addNode(makeNode(ids::FindByName, Method, "findByName"));
    sg.addNode(makeNode(ids::UserRepository, Interface, "UserRepository"));
    sg.addEdge(makeEdge(ids::Login, ids::Validate, "CALLS"));
    sg.addEdge(makeEdge(ids::AuthService, ids::Login, "HAS_METHOD"));
    sg.addEdge(makeEdge(ids::AuthService, ids::Validate, "HAS_METHOD"));
    sg.addEdge(makeEdge(ids::Validate, ids::FindByName, "CALLS"));
    sg.addEdge(makeEdge(ids::UserRepository, ids::FindByName, "HAS_METHOD"));
    sg.addEdge(makeEdge(ids::AuthService, ids::UserRepository, "USES"));
    sg.setHop(ids::Login, 0, ids::Login);
    sg.setHop(ids::Validate, 0, ids::Validate);
    sg.setHop(ids::AuthService, 1, ids::Login);
    sg.setHop(ids::FindByName, 1, ids::Validate);
    sg.setHop(ids::UserRepository, 2, ids::Login);
    return sg;
}

} // namespace

TEST(NodeScorerTest, ExpansionNodesScoreBelowWeakestSeed) {
    NodeScorer scorer;
    search::StrategyProfile profile;
    profile.node_type_boosts = {{"Method", 1.0}, {"Class", 1.0}, {"Interface", 1.0}};
    const auto sg = authSubGraph();

    auto scores = scorer.score(sg, {seed(ids::Login, 0.98), seed(ids::Validate, 0.35)}, profile);
    ASSERT_EQ(scores.size(), sg.nodeCount());

    const double minSeed = std::min(scores.at(ids::Login), scores.at(ids::Validate));
    for (const auto& id : {ids::AuthService, ids::FindByName, ids::UserRepository}) {
        EXPECT_GT(scores.at(id), 0.0) << id;
        EXPECT_LT(scores.at(id), minSeed) << id;
    }
}

TEST(NodeScorerTest, SeedsKeepTheirCombinedScore) {
    NodeScorer scorer(NodeScorerConfig{.expansion_ceiling = 0.9, .degree_weight = 0.5});
    const auto sg = authSubGraph();
    // Degree only shapes expansion-only scores; validate's higher degree is ignored here
    auto scores = scorer.score(sg, {seed(ids::Login, 0.9), seed(ids::Validate, 0.6)},
                               search::StrategyProfile{});
    EXPECT_DOUBLE_EQ(scores.at(ids::Login), 0.9);
    EXPECT_DOUBLE_EQ(scores.at(ids::Validate), 0.6);
}

TEST(NodeScorerTest, StructuralWeightFallsWithDistance) {
    NodeScorer scorer;
    for (size_t degree : {0u, 1u, 5u}) {
        EXPECT_GT(scorer.structuralWeight(1, degree), scorer.structuralWeight(2, degree));
        EXPECT_GT(scorer.structuralWeight(2, degree), scorer.structuralWeight(3, degree));
        EXPECT_LT(scorer.structuralWeight(1, degree), 1.0);
    }
    EXPECT_GT(scorer.structuralWeight(1, 4), scorer.structuralWeight(1, 1));
}

TEST(NodeScorerTest, TypeBoostScalesExpansionNodes) {
    NodeScorer scorer;
    search::StrategyProfile profile;
    profile.node_type_boosts = {{"Method", 1.0}, {"Interface", 0.0}};
    auto scores = scorer.score(authSubGraph(), {seed(ids::Login, 0.9)}, profile);
    EXPECT_DOUBLE_EQ(scores.at(ids::UserRepository), 0.0);
    EXPECT_GT(scores.at(ids::FindByName), 0.0);
}
