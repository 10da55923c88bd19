// Copyright 2025 The ASTKG Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <astkg/common/worker_pool.h>
#include <astkg/config/query_config.h>
#include <astkg/graph/graph_store.h>
#include <astkg/llm/model_interfaces.h>
#include <astkg/query/query_pipeline.h>
#include <astkg/query/services/distillation_service.h>
#include <astkg/query/services/finalization_service.h>
#include <astkg/query/services/generation_service.h>
#include <astkg/query/services/refinement_service.h>
#include <astkg/query/services/retrieval_service.h>
#include <astkg/query/services/verification_service.h>
#include <astkg/retrieval/hybrid_retriever.h>

#include <future>
#include <memory>
#include <string>

namespace astkg::query {

// External collaborators; any of them may be null
struct QueryServices {
    std::shared_ptr<llm::EntityExtractor> extractor;
    std::shared_ptr<llm::EmbeddingModel> embedder;
    std::shared_ptr<llm::Answerer> answerer;
    // Judges context relevance during DISTILL; falls back to `answerer`
    std::shared_ptr<llm::Answerer> distillAnswerer;
};

/**
 * Entry point for question answering over one graph store.
 *
 * Each query gets a fresh QueryExecutionContext and pipeline run. Pipeline
 * coroutines run on their own pool while searches, traversal hops, relevance
 * checks and claim checks run on the shared worker pool, so a step blocked on
 * a fan-out never starves the tasks it waits for.
 */
class QueryOrchestrator {
public:
    QueryOrchestrator(std::shared_ptr<graph::GraphStore> store, QueryServices services,
                      config::QueryConfig config = {});
    ~QueryOrchestrator();

    QueryOrchestrator(const QueryOrchestrator&) = delete;
    QueryOrchestrator& operator=(const QueryOrchestrator&) = delete;

    std::shared_ptr<QueryExecutionContext> createContext(const std::string& query) const;

    std::future<QueryResult> submit(const std::string& query);
    std::future<QueryResult> submit(std::shared_ptr<QueryExecutionContext> ctx);

    // Blocking; never throws
    QueryResult query(const std::string& query);

    const config::QueryConfig& config() const noexcept { return config_; }
    std::shared_ptr<retrieval::HybridRetriever> retriever() const { return retriever_; }

private:
    std::shared_ptr<QueryPipeline> buildPipeline();

    config::QueryConfig config_;
    std::shared_ptr<common::WorkerPool> workers_;
    std::unique_ptr<common::WorkerPool> pipelinePool_;

    std::shared_ptr<retrieval::HybridRetriever> retriever_;
    std::shared_ptr<RetrievalService> retrieval_;
    std::shared_ptr<DistillationService> distillation_;
    std::shared_ptr<GenerationService> generation_;
    std::shared_ptr<VerificationService> verification_;
    std::shared_ptr<RefinementService> refinement_;
    std::shared_ptr<FinalizationService> finalization_;
};

} // namespace astkg::query
