#include <gtest/gtest.h>

#include <astkg/search/result_combiner.h>

#include <set>

using namespace astkg::search;

namespace {

SearchHit hit(const std::string& id, double score, SearchSignal signal) {
    SearchHit h;
    h.nodeId = id;
    h.score = score;
    h.signal = signal;
    return h;
}

} // namespace

TEST(ResultCombinerTest, DisjointListsKeepEveryNodeWithDiscountedScore) {
    ResultCombiner combiner;
    std::vector<SearchHit> lex{hit("a", 0.9, SearchSignal::Lexical),
                               hit("b", 0.4, SearchSignal::Lexical)};
    std::vector<SearchHit> vec{hit("c", 0.8, SearchSignal::Vector),
                               hit("d", 0.2, SearchSignal::Vector),
                               hit("e", 0.6, SearchSignal::Vector)};
    auto out = combiner.combine(lex, vec);
    ASSERT_EQ(out.size(), lex.size() + vec.size());

    for (const auto& r : out) {
        const bool lexical = r.nodeId == "a" || r.nodeId == "b";
        EXPECT_NE(r.foundByLexical, r.foundByVector);
        const double raw = lexical ? r.lexicalScore : r.vectorScore;
        EXPECT_DOUBLE_EQ(r.combinedScore,
                         combiner.singleSignalScore(lexical ? SearchSignal::Lexical
                                                            : SearchSignal::Vector,
                                                    raw));
        EXPECT_DOUBLE_EQ(r.combinedScore, 0.5 * raw * 0.8);
    }
    EXPECT_EQ(out.front().nodeId, "a");
    EXPECT_EQ(out.back().nodeId, "d");
}

TEST(ResultCombinerTest, DualSignalBeatsSameEvidenceFromOneSignal) {
    ResultCombiner combiner;
    auto out = combiner.combine({hit("both", 0.7, SearchSignal::Lexical),
                                 hit("lex", 0.7, SearchSignal::Lexical)},
                                {hit("both", 0.7, SearchSignal::Vector)});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].nodeId, "both");
    EXPECT_TRUE(out[0].foundByLexical && out[0].foundByVector);
    EXPECT_DOUBLE_EQ(out[0].combinedScore, 0.7);
    EXPECT_LT(out[1].combinedScore, out[0].combinedScore);
}

TEST(ResultCombinerTest, CombinedScoreIsMonotonicInEachSignal) {
    ResultCombiner combiner(FusionConfig{.lexical_weight = 0.3, .vector_weight = 0.7});
    double prev = -1.0;
    for (double lex = 0.0; lex <= 1.0; lex += 0.1) {
        const double s = combiner.dualSignalScore(lex, 0.5);
        EXPECT_GT(s, prev);
        prev = s;
    }
    prev = -1.0;
    for (double v = 0.0; v <= 1.0; v += 0.1) {
        const double s = combiner.dualSignalScore(0.5, v);
        EXPECT_GT(s, prev);
        prev = s;
    }
}

TEST(ResultCombinerTest, TiesBrokenByNodeId) {
    ResultCombiner combiner;
    auto out = combiner.combine({hit("zeta", 0.5, SearchSignal::Lexical),
                                 hit("alpha", 0.5, SearchSignal::Lexical),
                                 hit("mid", 0.5, SearchSignal::Lexical)},
                                {});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].nodeId, "alpha");
    EXPECT_EQ(out[1].nodeId, "mid");
    EXPECT_EQ(out[2].nodeId, "zeta");

    auto again = combiner.combine({hit("mid", 0.5, SearchSignal::Lexical),
                                   hit("zeta", 0.5, SearchSignal::Lexical),
                                   hit("alpha", 0.5, SearchSignal::Lexical)},
                                  {});
    for (size_t i = 0; i < out.size(); ++i)
        EXPECT_EQ(out[i].nodeId, again[i].nodeId);
}

TEST(ResultCombinerTest, DuplicateHitsKeepBestScore) {
    ResultCombiner combiner;
    auto out = combiner.combine({hit("a", 0.3, SearchSignal::Lexical),
                                 hit("a", 0.6, SearchSignal::Lexical)},
                                {});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].lexicalScore, 0.6);
}

TEST(ResultCombinerTest, UnboundedLexicalScoresAreNormalized) {
    ResultCombiner combiner;
    auto out = combiner.combine({hit("a", 12.0, SearchSignal::Lexical),
                                 hit("b", 6.0, SearchSignal::Lexical)},
                                {hit("a", 0.5, SearchSignal::Vector)});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].lexicalScore, 1.0);
    EXPECT_DOUBLE_EQ(out[1].lexicalScore, 0.5);
    EXPECT_DOUBLE_EQ(out[0].combinedScore, 0.75);
}

TEST(ResultCombinerTest, InvalidConfigFallsBack) {
    ResultCombiner combiner(
        FusionConfig{.lexical_weight = -1.0, .vector_weight = 0.0, .single_signal_discount = 1.5});
    EXPECT_DOUBLE_EQ(combiner.config().lexical_weight, 0.5);
    EXPECT_DOUBLE_EQ(combiner.config().vector_weight, 0.5);
    EXPECT_DOUBLE_EQ(combiner.config().single_signal_discount, 0.8);
}

TEST(ResultCombinerTest, WeightsAreNormalized) {
    ResultCombiner combiner(FusionConfig{.lexical_weight = 2.0, .vector_weight = 6.0});
    EXPECT_DOUBLE_EQ(combiner.config().lexical_weight, 0.25);
    EXPECT_DOUBLE_EQ(combiner.config().vector_weight, 0.75);
}
