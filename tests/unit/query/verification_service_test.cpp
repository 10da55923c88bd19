#include <gtest/gtest.h>

#include <astkg/query/services/verification_service.h>

#include "common/test_graph.h"

using namespace astkg;
using namespace astkg::query;
using namespace astkg::test;

namespace {

RelationshipClaim claim(const std::string& from, const std::string& to, const std::string& type) {
    RelationshipClaim c;
    c.fromComponent = from;
    c.toComponent = to;
    c.relationshipType = type;
    return c;
}

} // namespace

class VerificationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_shared<common::WorkerPool>(2);
        store_ = std::make_shared<FaultyGraphStore>(makeLoginGraph());
        ctx_ = std::make_unique<QueryExecutionContext>("q", "exec-1", 3);
    }

    VerificationService service() const {
        return VerificationService(store_, pool_, std::chrono::seconds(2));
    }

    void answerWith(std::vector<RelationshipClaim> claims) {
        GeneratedAnswer a;
        a.summary = "s";
        a.claims = std::move(claims);
        ctx_->generatedAnswer = std::move(a);
    }

    std::shared_ptr<common::WorkerPool> pool_;
    std::shared_ptr<FaultyGraphStore> store_;
    std::unique_ptr<QueryExecutionContext> ctx_;
};

TEST_F(VerificationServiceTest, SupportedClaimsVerify) {
    answerWith({claim("login", "validate", "CALLS"), claim("AuthService", "login", "HAS_METHOD")});
    ASSERT_TRUE(service().verify(*ctx_));

    EXPECT_TRUE(ctx_->verified);
    EXPECT_TRUE(ctx_->verificationErrors.empty());
    EXPECT_TRUE(ctx_->generatedAnswer->claims[0].verified);
    EXPECT_TRUE(ctx_->generatedAnswer->claims[1].verified);
    EXPECT_EQ(ctx_->metadata["totalRelationships"], "2");
    EXPECT_EQ(ctx_->metadata["verifiedRelationships"], "2");
    EXPECT_EQ(ctx_->metadata["verificationSuccessRate"], "1.0000");
    EXPECT_EQ(ctx_->metadata["verificationAttempt"], "1");
}

TEST_F(VerificationServiceTest, UnsupportedClaimIsReported) {
    answerWith({claim("login", "validate", "CALLS"), claim("login", "render", "CALLS")});
    ASSERT_TRUE(service().verify(*ctx_));

    EXPECT_FALSE(ctx_->verified);
    ASSERT_EQ(ctx_->verificationErrors.size(), 1u);
    EXPECT_EQ(ctx_->verificationErrors[0], "Invalid relationship claim: login -> render (CALLS)");
    EXPECT_FALSE(ctx_->generatedAnswer->claims[1].verified);
    EXPECT_EQ(ctx_->metadata["verificationSuccessRate"], "0.5000");
}

TEST_F(VerificationServiceTest, NoClaimsIsVacuouslyVerified) {
    answerWith({});
    ASSERT_TRUE(service().verify(*ctx_));
    EXPECT_TRUE(ctx_->verified);
    EXPECT_EQ(ctx_->metadata["totalRelationships"], "0");
    EXPECT_EQ(ctx_->metadata["verificationSuccessRate"], "1.0000");
}

TEST_F(VerificationServiceTest, FailedCheckCountsAsUnverified) {
    store_->failEdgeExists = true;
    answerWith({claim("login", "validate", "CALLS")});
    ASSERT_TRUE(service().verify(*ctx_));

    EXPECT_FALSE(ctx_->verified);
    ASSERT_EQ(ctx_->verificationErrors.size(), 1u);
    EXPECT_EQ(ctx_->verificationErrors[0],
              "Invalid relationship claim: login -> validate (CALLS): edge check timed out");
}

TEST_F(VerificationServiceTest, MissingAnswer) {
    ASSERT_TRUE(service().verify(*ctx_));
    EXPECT_FALSE(ctx_->verified);
    ASSERT_EQ(ctx_->verificationErrors.size(), 1u);
    EXPECT_EQ(ctx_->verificationErrors[0], "No result to verify");
    EXPECT_EQ(ctx_->metadata["verificationSuccessRate"], "0.0000");
}

TEST_F(VerificationServiceTest, ErrorsResetBetweenAttempts) {
    answerWith({claim("login", "render", "CALLS")});
    ASSERT_TRUE(service().verify(*ctx_));
    ASSERT_EQ(ctx_->verificationErrors.size(), 1u);

    answerWith({claim("login", "validate", "CALLS")});
    ASSERT_TRUE(service().verify(*ctx_));
    EXPECT_TRUE(ctx_->verified);
    EXPECT_TRUE(ctx_->verificationErrors.empty());
    EXPECT_EQ(ctx_->verificationAttempts, 2u);
}
