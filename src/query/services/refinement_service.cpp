#include <astkg/query/services/refinement_service.h>

#include <spdlog/spdlog.h>

namespace astkg::query {

Result<void> RefinementService::refine(QueryExecutionContext& ctx) const {
    if (ctx.refinementCount() == 0) {
        return Error{ErrorCode::InvalidState, "refine entered without a refinement budget"};
    }

    std::string previous;
    for (const auto& e : ctx.verificationErrors) {
        if (!previous.empty())
            previous += "; ";
        previous += e;
    }
    ctx.metadata["isRefinement"] = "true";
    ctx.metadata["refinementIteration"] = std::to_string(ctx.refinementCount());
    ctx.metadata["previousErrors"] = previous;
    ctx.verified = false;
    if (redistill_) {
        ctx.distilledContext.reset();
    }

    spdlog::info("[RefinementService] {}: refinement {}/{} after {} verification errors",
                 ctx.executionId(), ctx.refinementCount(), ctx.maxRefinements(),
                 ctx.verificationErrors.size());
    return {};
}

} // namespace astkg::query
