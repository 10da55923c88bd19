// Copyright 2025 The ASTKG Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <astkg/query/query_pipeline.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <spdlog/spdlog.h>

#include <optional>
#include <utility>

namespace astkg::query {

const char* toString(PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::Retrieve:
            return "retrieve";
        case PipelineStage::Distill:
            return "distill";
        case PipelineStage::Generate:
            return "generate";
        case PipelineStage::Verify:
            return "verify";
        case PipelineStage::Refine:
            return "refine";
        case PipelineStage::Finalize:
            return "finalize";
        case PipelineStage::Done:
            return "done";
    }
    return "unknown";
}

QueryPipeline::QueryPipeline(boost::asio::any_io_executor executor, PipelineOptions options)
    : executor_(std::move(executor)), options_(options) {}

QueryPipeline& QueryPipeline::step(PipelineStage stage, StepFn fn) {
    steps_[stage] = Registered{std::move(fn), {}};
    return *this;
}

QueryPipeline& QueryPipeline::conditionalStep(PipelineStage stage, Guard guard, StepFn fn) {
    steps_[stage] = Registered{std::move(fn), std::move(guard)};
    return *this;
}

PipelineStage QueryPipeline::next(PipelineStage current, const QueryExecutionContext& ctx) const {
    switch (current) {
        case PipelineStage::Retrieve:
            return PipelineStage::Distill;
        case PipelineStage::Distill:
            return PipelineStage::Generate;
        case PipelineStage::Generate:
            return PipelineStage::Verify;
        case PipelineStage::Verify:
            return ctx.canRefine() ? PipelineStage::Refine : PipelineStage::Finalize;
        case PipelineStage::Refine:
            return options_.redistill_on_refine ? PipelineStage::Distill
                                                : PipelineStage::Generate;
        case PipelineStage::Finalize:
        case PipelineStage::Done:
            return PipelineStage::Done;
    }
    return PipelineStage::Done;
}

Result<void> QueryPipeline::runStage(PipelineStage stage, QueryExecutionContext& ctx,
                                     bool guardChecked) const {
    auto it = steps_.find(stage);
    if (it == steps_.end() || !it->second.fn) {
        spdlog::debug("[QueryPipeline] {} has no step registered; skipping", toString(stage));
        return {};
    }
    const auto& reg = it->second;
    if (!guardChecked && reg.guard && !reg.guard(ctx)) {
        spdlog::debug("[QueryPipeline] {} skipped by guard", toString(stage));
        return {};
    }

    const auto start = std::chrono::steady_clock::now();
    Result<void> r;
    try {
        r = reg.fn(ctx);
    } catch (const std::exception& e) {
        r = Error{ErrorCode::InternalError, e.what()};
    } catch (...) {
        r = Error{ErrorCode::InternalError, "unknown exception"};
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();
    const std::string name = toString(stage);
    ctx.metadata[name + "_ms"] = std::to_string(ms);
    if (r) {
        ctx.markStepComplete(name);
    }
    return r;
}

boost::asio::awaitable<QueryResult>
QueryPipeline::run(std::shared_ptr<QueryExecutionContext> ctx) const {
    auto stage = PipelineStage::Retrieve;
    std::optional<std::pair<std::string, std::string>> failure; // (step, message)

    while (stage != PipelineStage::Done) {
        co_await boost::asio::post(executor_, boost::asio::use_awaitable);

        // The refine guard is judged once, before the budget is consumed
        const bool refining = stage == PipelineStage::Refine;
        if (refining) {
            auto it = steps_.find(stage);
            const bool allowed = ctx->canRefine() && (it == steps_.end() || !it->second.guard ||
                                                      it->second.guard(*ctx));
            if (!allowed || !ctx->beginRefinement()) {
                stage = PipelineStage::Finalize;
                continue;
            }
            spdlog::debug("[QueryPipeline] {} refinement {}/{}", ctx->executionId(),
                          ctx->refinementCount(), ctx->maxRefinements());
        }

        auto r = runStage(stage, *ctx, refining);
        if (!r) {
            spdlog::error("[QueryPipeline] {} failed at {}: {}", ctx->executionId(),
                          toString(stage), r.error().message);
            if (stage == PipelineStage::Finalize) {
                if (!failure)
                    failure.emplace(toString(stage), r.error().message);
                break;
            }
            failure.emplace(toString(stage), r.error().message);
            stage = PipelineStage::Finalize;
            continue;
        }
        stage = next(stage, *ctx);
    }

    if (failure) {
        co_return errorResult(*ctx, failure->second, failure->first);
    }
    if (!ctx->finalResult) {
        co_return errorResult(*ctx, "pipeline finished without a result", "finalize");
    }
    spdlog::info("[QueryPipeline] {} done: verified={} refinements={} confidence={:.2f} ({} ms)",
                 ctx->executionId(), ctx->verified, ctx->refinementCount(),
                 ctx->finalResult->confidence, ctx->elapsed().count());
    co_return *ctx->finalResult;
}

std::future<QueryResult> QueryPipeline::execute(std::shared_ptr<QueryExecutionContext> ctx) {
    return boost::asio::co_spawn(
        executor_,
        [self = shared_from_this(), ctx = std::move(ctx)]() { return self->run(ctx); },
        boost::asio::use_future);
}

QueryResult QueryPipeline::errorResult(const QueryExecutionContext& ctx,
                                       const std::string& message,
                                       const std::string& failedStep) {
    QueryResult r;
    if (ctx.finalResult) {
        r.metadata = ctx.finalResult->metadata;
    }
    r.query = ctx.originalQuery();
    r.summary = "An error occurred while processing your query: " + message;
    r.confidence = 0.0;
    r.verified = false;
    r.error = true;
    r.errorMessage = message;
    r.verificationErrors = ctx.verificationErrors;
    r.metadata["error"] = "true";
    r.metadata["errorMessage"] = message;
    r.metadata["failedStep"] = failedStep;
    r.metadata["executionId"] = ctx.executionId();
    r.metadata["refinementCount"] = std::to_string(ctx.refinementCount());
    r.metadata["processingTimeMs"] = std::to_string(ctx.elapsed().count());
    std::string trail;
    for (const auto& s : ctx.completedSteps()) {
        if (!trail.empty())
            trail += ",";
        trail += s;
    }
    r.metadata["completedSteps"] = trail;
    return r;
}

} // namespace astkg::query
