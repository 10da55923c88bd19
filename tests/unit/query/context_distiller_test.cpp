#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <astkg/query/context_distiller.h>

#include "common/test_graph.h"

#include <thread>

using namespace astkg;
using namespace astkg::query;
using namespace astkg::test;
using ::testing::_;
using ::testing::Invoke;

namespace {

class MockAnswerer : public llm::Answerer {
public:
    MOCK_METHOD(Result<std::string>, generate, (const std::string& prompt), (override));
};

bool mentions(const std::string& prompt, const std::string& name) {
    return prompt.find("Name: " + name + "\n") != std::string::npos;
}

retrieval::RetrievalResult authRetrieval() {
    using graph::node_type::Class;
    using graph::node_type::Interface;
    using graph::node_type::Method;
    using graph::node_type::Package;

    retrieval::RetrievalResult r;
    r.seedNodeIds = {ids::Login, ids::Validate};
    auto add = [&](graph::GraphNode n, double score) {
        r.scoreMap[n.id] = score;
        r.subGraph.addNode(std::move(n));
    };
    add(makeNode(ids::Login, Method, "login", "boolean login(String, String)", "Logs in"), 0.9);
    add(makeNode(ids::Validate, Method, "validate"), 0.8);
    add(makeNode(ids::AuthService, Class, "AuthService"), 0.4);
    add(makeNode(ids::UserRepository, Interface, "UserRepository"), 0.2);
    add(makeNode(ids::AuthPkg, Package, "com.acme.auth"), 0.1);
    add(makeNode("com.acme.auth.Helper", Class, "Helper"), 0.3);
    return r;
}

CandidateContext candidate(const std::string& name, double score) {
    CandidateContext c;
    c.nodeId = "com.acme." + name;
    c.type = "method";
    c.name = name;
    c.signature = name + "()";
    c.retrievalScore = score;
    return c;
}

} // namespace

TEST(StripCodeFenceTest, Variants) {
    EXPECT_EQ(stripCodeFence("{\"a\":1}"), "{\"a\":1}");
    EXPECT_EQ(stripCodeFence("```json\n{\"a\":1}\n```"), "{\"a\":1}");
    EXPECT_EQ(stripCodeFence("  ```\n{\"a\":1}\n```  "), "{\"a\":1}");
    EXPECT_EQ(stripCodeFence("```json\n{\"a\":1}"), "{\"a\":1}");
}

TEST(ContextDistillerTest, CandidatesAreMethodsAndKeyTypes) {
    ContextDistiller distiller(nullptr, std::make_shared<common::WorkerPool>(1));
    auto cands = distiller.candidates(authRetrieval());

    std::vector<std::string> names;
    for (const auto& c : cands)
        names.push_back(c.name);
    // Ordered by retrieval score; packages and plain helper classes are skipped
    EXPECT_THAT(names, ::testing::ElementsAre("login", "validate", "AuthService", "UserRepository"));

    EXPECT_EQ(cands[0].type, "method");
    EXPECT_EQ(cands[0].signature, "boolean login(String, String)");
    EXPECT_EQ(cands[0].summary, "Logs in");
    EXPECT_EQ(cands[1].signature, ids::Validate); // no signature recorded
    EXPECT_EQ(cands[2].type, "class");
    EXPECT_EQ(cands[2].summary, "Class: " + ids::AuthService);
    EXPECT_EQ(cands[2].details, "Type: Class");
    EXPECT_DOUBLE_EQ(cands[2].retrievalScore, 0.4);
}

TEST(ContextDistillerTest, RelevancePromptDescribesCandidate) {
    auto c = candidate("login", 0.9);
    c.tags = {"auth", "entrypoint"};
    auto prompt = ContextDistiller::buildRelevancePrompt("How does login work?", c);
    EXPECT_TRUE(ScriptedAnswerer::isRelevancePrompt(prompt));
    EXPECT_NE(prompt.find("Question: \"How does login work?\""), std::string::npos);
    EXPECT_NE(prompt.find("Name: login\n"), std::string::npos);
    EXPECT_NE(prompt.find("Summary: N/A"), std::string::npos);
    EXPECT_NE(prompt.find("Tags: auth, entrypoint"), std::string::npos);
}

TEST(ContextDistillerTest, ParseVerdict) {
    ContextDistiller distiller(nullptr, std::make_shared<common::WorkerPool>(1));
    const auto c = candidate("login", 0.9);

    auto ok = distiller.parseVerdict(
        c, "```json\n{\"relevant\": true, \"relevanceScore\": 0.7, \"reason\": \"core\"}\n```");
    EXPECT_DOUBLE_EQ(ok.relevanceScore, 0.7);
    EXPECT_EQ(ok.reason, "core");

    auto clamped = distiller.parseVerdict(c, R"({"relevant": true, "relevanceScore": 3})");
    EXPECT_DOUBLE_EQ(clamped.relevanceScore, 1.0);

    auto garbage = distiller.parseVerdict(c, "I think it is relevant");
    EXPECT_DOUBLE_EQ(garbage.relevanceScore, 0.5);
    EXPECT_EQ(garbage.reason, "Unparsed verdict");

    auto rejected = distiller.parseVerdict(c, R"({"relevant": false, "reason": "billing"})");
    EXPECT_LT(rejected.relevanceScore, 0.0);
}

TEST(ContextDistillerTest, JudgesEveryCandidateAndOrdersByRelevance) {
    auto answerer = std::make_shared<MockAnswerer>();
    EXPECT_CALL(*answerer, generate(_))
        .Times(4)
        .WillRepeatedly(Invoke([](const std::string& prompt) -> Result<std::string> {
            if (mentions(prompt, "login"))
                return std::string(R"({"relevant": true, "relevanceScore": 0.9, "reason": "entry"})");
            if (mentions(prompt, "render"))
                return std::string(R"({"relevant": false, "relevanceScore": 0.1})");
            if (mentions(prompt, "validate"))
                return Error{ErrorCode::NetworkError, "model offline"};
            return std::string("no idea");
        }));

    ContextDistiller distiller(answerer, std::make_shared<common::WorkerPool>(2));
    auto kept = distiller.distill("How does login work?",
                                  {candidate("login", 0.9), candidate("render", 0.8),
                                   candidate("validate", 0.7), candidate("findByName", 0.2)});

    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[0].candidate.name, "login");
    EXPECT_DOUBLE_EQ(kept[0].relevanceScore, 0.9);
    EXPECT_EQ(kept[1].candidate.name, "findByName");
    EXPECT_DOUBLE_EQ(kept[1].relevanceScore, 0.5);
    EXPECT_EQ(kept[2].candidate.name, "validate");
    EXPECT_DOUBLE_EQ(kept[2].relevanceScore, 0.3);
    EXPECT_EQ(kept[2].reason, "Evaluation error");
}

TEST(ContextDistillerTest, SlowVerdictsFallBackAfterDeadline) {
    auto answerer = std::make_shared<ScriptedAnswerer>(
        [](const std::string&) -> Result<std::string> { return std::string("{}"); },
        [](const std::string&) -> Result<std::string> {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return std::string(R"({"relevant": true, "relevanceScore": 1.0})");
        });
    ContextDistiller distiller(answerer, std::make_shared<common::WorkerPool>(2),
                               DistillerConfig{.timeout = std::chrono::milliseconds(50)});

    auto kept = distiller.distill("q", {candidate("login", 0.9), candidate("validate", 0.8)});
    ASSERT_EQ(kept.size(), 2u);
    for (const auto& rc : kept) {
        EXPECT_DOUBLE_EQ(rc.relevanceScore, 0.3);
        EXPECT_EQ(rc.reason, "Evaluation error");
    }
    // Equal relevance falls back to retrieval order
    EXPECT_EQ(kept[0].candidate.name, "login");
}

TEST(ContextDistillerTest, WithoutAnswererUsesRetrievalScores) {
    ContextDistiller distiller(nullptr, std::make_shared<common::WorkerPool>(1),
                               DistillerConfig{.max_contexts = 2});
    auto kept = distiller.distill(
        "q", {candidate("a", 0.2), candidate("b", 0.9), candidate("c", 0.5)});
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].candidate.name, "b");
    EXPECT_DOUBLE_EQ(kept[0].relevanceScore, 0.9);
    EXPECT_EQ(kept[1].candidate.name, "c");
}

TEST(ContextDistillerTest, EmptyCandidatesNeverCallAnswerer) {
    auto answerer = std::make_shared<MockAnswerer>();
    EXPECT_CALL(*answerer, generate(_)).Times(0);
    ContextDistiller distiller(answerer, std::make_shared<common::WorkerPool>(1));
    EXPECT_TRUE(distiller.distill("q", {}).empty());
}
