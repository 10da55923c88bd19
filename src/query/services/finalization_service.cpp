#include <astkg/query/services/finalization_service.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace astkg::query {

double FinalizationService::computeConfidence(const QueryExecutionContext& ctx) {
    if (ctx.generatedAnswer && ctx.generatedAnswer->metadata.count("noContext"))
        return 0.0;

    double confidence = 0.5;
    if (ctx.verified)
        confidence += 0.3;

    const size_t contexts = ctx.distilledContext ? ctx.distilledContext->size() : 0;
    if (contexts > 5)
        confidence += 0.15;
    else if (contexts > 2)
        confidence += 0.1;

    if (ctx.refinementCount() == 0)
        confidence += 0.05;
    else
        confidence -= 0.05 * static_cast<double>(ctx.refinementCount());

    if (ctx.retrievalResult && !ctx.retrievalResult->seedNodeIds.empty())
        confidence += 0.1;

    if (!ctx.generatedAnswer || ctx.generatedAnswer->degraded)
        confidence = std::min(confidence, 0.2);

    return std::clamp(confidence, 0.0, 1.0);
}

Result<void> FinalizationService::finalize(QueryExecutionContext& ctx) const {
    QueryResult r;
    r.query = ctx.originalQuery();
    if (ctx.generatedAnswer) {
        r.summary = ctx.generatedAnswer->summary;
        r.components = ctx.generatedAnswer->components;
        r.claims = ctx.generatedAnswer->claims;
        for (const auto& [k, v] : ctx.generatedAnswer->metadata)
            r.metadata["answer." + k] = v;
    } else {
        r.summary = "No answer was generated for the query.";
    }
    r.verified = ctx.verified;
    r.verificationErrors = ctx.verificationErrors;
    r.confidence = computeConfidence(ctx);

    for (const auto& [k, v] : ctx.metadata)
        r.metadata[k] = v;

    std::string trail;
    for (const auto& s : ctx.completedSteps()) {
        trail += s;
        trail += ",";
    }
    trail += "finalize";

    r.metadata["executionId"] = ctx.executionId();
    r.metadata["completedSteps"] = trail;
    r.metadata["refinementCount"] = std::to_string(ctx.refinementCount());
    r.metadata["verified"] = ctx.verified ? "true" : "false";
    r.metadata["processingTimeMs"] = std::to_string(ctx.elapsed().count());
    r.metadata["contextCandidates"] = std::to_string(ctx.contextCandidates);
    r.metadata["relevantContexts"] =
        std::to_string(ctx.distilledContext ? ctx.distilledContext->size() : 0);
    r.metadata["confidence"] = fmt::format("{:.2f}", r.confidence);

    ctx.finalResult = std::move(r);
    return {};
}

} // namespace astkg::query
