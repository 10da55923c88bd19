#include <astkg/query/services/distillation_service.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace astkg::query {

DistillationService::DistillationService(std::shared_ptr<ContextDistiller> distiller)
    : distiller_(std::move(distiller)) {}

Result<void> DistillationService::distill(QueryExecutionContext& ctx) const {
    if (!distiller_) {
        return Error{ErrorCode::NotInitialized, "no context distiller configured"};
    }
    if (!ctx.retrievalResult) {
        spdlog::warn("[DistillationService] {} has no retrieval result; context left empty",
                     ctx.executionId());
        ctx.distilledContext.emplace();
        ctx.contextCandidates = 0;
        ctx.metadata["distilledContextCount"] = "0";
        ctx.metadata["distillationRatio"] = "0.0000";
        return {};
    }

    auto candidates = distiller_->candidates(*ctx.retrievalResult);
    auto kept = distiller_->distill(ctx.originalQuery(), candidates);

    const double ratio =
        candidates.empty() ? 0.0
                           : static_cast<double>(kept.size()) / static_cast<double>(candidates.size());
    ctx.contextCandidates = candidates.size();
    ctx.metadata["distilledContextCount"] = std::to_string(kept.size());
    ctx.metadata["distillationRatio"] = fmt::format("{:.4f}", ratio);
    spdlog::debug("[DistillationService] {}: {} of {} candidates relevant", ctx.executionId(),
                  kept.size(), candidates.size());
    ctx.distilledContext = std::move(kept);
    return {};
}

} // namespace astkg::query
