#include <gtest/gtest.h>

#include <astkg/query/services/refinement_service.h>

using namespace astkg;
using namespace astkg::query;

TEST(RefinementServiceTest, RequiresConsumedBudget) {
    QueryExecutionContext ctx("q", "exec-1", 2);
    auto r = RefinementService().refine(ctx);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
}

TEST(RefinementServiceTest, RecordsPreviousErrors) {
    QueryExecutionContext ctx("q", "exec-1", 2);
    ctx.verificationErrors = {"Invalid relationship claim: a -> b (CALLS)",
                              "Invalid relationship claim: b -> c (USES)"};
    ctx.distilledContext = std::vector<RelevantContext>(2);
    ASSERT_TRUE(ctx.beginRefinement());

    ASSERT_TRUE(RefinementService().refine(ctx));
    EXPECT_EQ(ctx.metadata["isRefinement"], "true");
    EXPECT_EQ(ctx.metadata["refinementIteration"], "1");
    EXPECT_EQ(ctx.metadata["previousErrors"],
              "Invalid relationship claim: a -> b (CALLS); Invalid relationship claim: b -> c (USES)");
    EXPECT_FALSE(ctx.verified);
    // Context is reused unless redistillation is on
    EXPECT_TRUE(ctx.distilledContext.has_value());
}

TEST(RefinementServiceTest, RedistillDropsContext) {
    QueryExecutionContext ctx("q", "exec-1", 2);
    ctx.distilledContext = std::vector<RelevantContext>(2);
    ASSERT_TRUE(ctx.beginRefinement());
    ASSERT_TRUE(RefinementService(true).refine(ctx));
    EXPECT_FALSE(ctx.distilledContext.has_value());
}

TEST(QueryExecutionContextTest, RefinementBudgetIsBounded) {
    QueryExecutionContext ctx("q", "exec-1", 2);
    EXPECT_TRUE(ctx.canRefine());
    ASSERT_TRUE(ctx.beginRefinement());
    ASSERT_TRUE(ctx.beginRefinement());
    EXPECT_FALSE(ctx.canRefine());
    auto r = ctx.beginRefinement();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(ctx.refinementCount(), 2u);

    QueryExecutionContext fresh("q", "exec-2", 2);
    fresh.verified = true;
    EXPECT_FALSE(fresh.canRefine());
}

TEST(QueryExecutionContextTest, ExecutionIdsAreUuids) {
    const auto a = generateExecutionId();
    const auto b = generateExecutionId();
    EXPECT_NE(a, b);
    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[14], '4');
}
