#include <gtest/gtest.h>

#include <astkg/graph/name_index.h>

using namespace astkg::graph;
using astkg::search::MatchKind;

TEST(LevenshteinTest, Distances) {
    EXPECT_EQ(levenshteinDistance("", "abc"), 3u);
    EXPECT_EQ(levenshteinDistance("kitten", "sitting"), 3u);
    EXPECT_EQ(levenshteinDistance("validate", "valdate"), 1u);
    EXPECT_EQ(levenshteinDistance("same", "same"), 0u);
}

class NameIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        index_.add("login", "m1");
        index_.add("loginWithToken", "m2");
        index_.add("logout", "m3");
        index_.add("validate", "m4");
        index_.add("AuthService", "c1");
        index_.add("authservice", "c2");
    }

    NameIndex index_;
};

TEST_F(NameIndexTest, ExactIsCaseInsensitive) {
    auto hits = index_.exact("AUTHSERVICE");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].nodeId, "c1");
    EXPECT_EQ(hits[1].nodeId, "c2");
    EXPECT_EQ(hits[0].kind, MatchKind::Exact);
}

TEST_F(NameIndexTest, PrefixExcludesExactKey) {
    auto hits = index_.prefix("login", 10);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].nodeId, "m2");
    EXPECT_EQ(hits[0].kind, MatchKind::Prefix);
}

TEST_F(NameIndexTest, Wildcard) {
    auto hits = index_.wildcard("log*", 10);
    EXPECT_EQ(hits.size(), 3u);
    EXPECT_EQ(index_.wildcard("*service", 10).size(), 2u);
}

TEST_F(NameIndexTest, FuzzyOrdersByDistance) {
    auto hits = index_.fuzzy("valdate", 1, 10);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].nodeId, "m4");
    EXPECT_EQ(hits[0].distance, 1u);

    auto wider = index_.fuzzy("logot", 2, 10);
    ASSERT_EQ(wider.size(), 2u);
    EXPECT_EQ(wider[0].key, "logout");
    EXPECT_EQ(wider[0].distance, 1u);
    EXPECT_EQ(wider[1].key, "login");
    EXPECT_EQ(wider[1].distance, 2u);
}

TEST_F(NameIndexTest, FuzzyExcludesExactAndRespectsLimit) {
    for (const auto& m : index_.fuzzy("logout", 2, 10))
        EXPECT_GT(m.distance, 0u);
    EXPECT_EQ(index_.fuzzy("logot", 2, 1).size(), 1u);
}

TEST_F(NameIndexTest, Clear) {
    index_.clear();
    EXPECT_EQ(index_.keyCount(), 0u);
    EXPECT_TRUE(index_.exact("login").empty());
    EXPECT_TRUE(index_.fuzzy("login", 2, 10).empty());
}
