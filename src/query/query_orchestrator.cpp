// Copyright 2025 The ASTKG Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <astkg/query/query_orchestrator.h>

#include <spdlog/spdlog.h>

namespace astkg::query {

QueryOrchestrator::QueryOrchestrator(std::shared_ptr<graph::GraphStore> store,
                                     QueryServices services, config::QueryConfig config)
    : config_(std::move(config)) {
    if (!config_.isValid()) {
        spdlog::warn("[QueryOrchestrator] invalid query config; using defaults");
        config_ = config::QueryConfig{};
    }
    config_.normalizeWeights();

    workers_ = std::make_shared<common::WorkerPool>(config_.worker_threads);
    pipelinePool_ = std::make_unique<common::WorkerPool>(config_.worker_threads);

    retriever_ = std::make_shared<retrieval::HybridRetriever>(store, workers_, config_);
    retrieval_ = std::make_shared<RetrievalService>(retriever_, services.extractor,
                                                    services.embedder, workers_,
                                                    config_.embed_timeout);

    auto distillAnswerer = services.distillAnswerer ? services.distillAnswerer : services.answerer;
    auto distiller = std::make_shared<ContextDistiller>(
        std::move(distillAnswerer), workers_,
        DistillerConfig{.max_contexts = config_.distill_max_contexts,
                        .timeout = config_.distill_timeout});
    distillation_ = std::make_shared<DistillationService>(std::move(distiller));
    generation_ =
        std::make_shared<GenerationService>(services.answerer, workers_, config_.answer_timeout);
    verification_ =
        std::make_shared<VerificationService>(std::move(store), workers_, config_.claim_timeout);
    refinement_ = std::make_shared<RefinementService>(config_.redistill_on_refine);
    finalization_ = std::make_shared<FinalizationService>();

    spdlog::info("[QueryOrchestrator] ready: {} workers, {} pipeline threads, max_refinements={}",
                 workers_->size(), pipelinePool_->size(), config_.max_refinements);
}

QueryOrchestrator::~QueryOrchestrator() {
    // Pipelines first: their steps wait on worker tasks
    pipelinePool_->shutdown();
    workers_->shutdown();
}

std::shared_ptr<QueryExecutionContext>
QueryOrchestrator::createContext(const std::string& query) const {
    return std::make_shared<QueryExecutionContext>(query, generateExecutionId(),
                                                   config_.max_refinements);
}

std::shared_ptr<QueryPipeline> QueryOrchestrator::buildPipeline() {
    auto pipeline = std::make_shared<QueryPipeline>(
        pipelinePool_->executor(),
        PipelineOptions{.redistill_on_refine = config_.redistill_on_refine});

    pipeline->step(PipelineStage::Retrieve,
                   [svc = retrieval_](QueryExecutionContext& ctx) { return svc->retrieve(ctx); });
    pipeline->conditionalStep(
        PipelineStage::Distill,
        [](const QueryExecutionContext& ctx) { return !ctx.distilledContext.has_value(); },
        [svc = distillation_](QueryExecutionContext& ctx) { return svc->distill(ctx); });
    pipeline->step(PipelineStage::Generate,
                   [svc = generation_](QueryExecutionContext& ctx) { return svc->generate(ctx); });
    pipeline->step(PipelineStage::Verify,
                   [svc = verification_](QueryExecutionContext& ctx) { return svc->verify(ctx); });
    // The pipeline only enters REFINE while the budget allows it
    pipeline->step(PipelineStage::Refine,
                   [svc = refinement_](QueryExecutionContext& ctx) { return svc->refine(ctx); });
    pipeline->step(PipelineStage::Finalize, [svc = finalization_](QueryExecutionContext& ctx) {
        return svc->finalize(ctx);
    });
    return pipeline;
}

std::future<QueryResult> QueryOrchestrator::submit(const std::string& query) {
    return submit(createContext(query));
}

std::future<QueryResult> QueryOrchestrator::submit(std::shared_ptr<QueryExecutionContext> ctx) {
    spdlog::info("[QueryOrchestrator] {} query: \"{}\"", ctx->executionId(), ctx->originalQuery());
    return buildPipeline()->execute(std::move(ctx));
}

QueryResult QueryOrchestrator::query(const std::string& query) {
    auto ctx = createContext(query);
    try {
        return submit(ctx).get();
    } catch (const std::exception& e) {
        spdlog::error("[QueryOrchestrator] {} failed: {}", ctx->executionId(), e.what());
        return QueryPipeline::errorResult(*ctx, e.what(), "pipeline");
    } catch (...) {
        spdlog::error("[QueryOrchestrator] {} failed: unknown exception", ctx->executionId());
        return QueryPipeline::errorResult(*ctx, "unknown exception", "pipeline");
    }
}

} // namespace astkg::query
