#pragma once

#include <astkg/common/worker_pool.h>
#include <astkg/llm/model_interfaces.h>
#include <astkg/query/query_models.h>
#include <astkg/retrieval/hybrid_retriever.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace astkg::query {

struct DistillerConfig {
    size_t max_contexts = 20;
    std::chrono::milliseconds timeout{30000}; // Budget for the whole fan-out
    double parse_fallback_score = 0.5;         // Verdict present but unreadable
    double error_fallback_score = 0.3;         // Evaluation failed or timed out
};

/**
 * Narrows a retrieval subgraph to the contexts worth showing the Answerer.
 *
 * Candidates are method nodes plus key types: interfaces, abstract classes,
 * seeds, and classes named *Service, *Controller or *Repository. Each
 * candidate is judged concurrently on the worker pool by asking the Answerer
 * for {"relevant", "relevanceScore", "reason"}. Without an Answerer the
 * retrieval score stands in for relevance.
 */
class ContextDistiller {
public:
    ContextDistiller(std::shared_ptr<llm::Answerer> answerer,
                     std::shared_ptr<common::WorkerPool> pool, DistillerConfig config = {});

    std::vector<CandidateContext> candidates(const retrieval::RetrievalResult& retrieval) const;

    std::vector<RelevantContext> distill(const std::string& query,
                                         const std::vector<CandidateContext>& candidates) const;

    static std::string buildRelevancePrompt(const std::string& query,
                                            const CandidateContext& candidate);
    // Parse an Answerer verdict; unreadable verdicts count as relevant
    RelevantContext parseVerdict(const CandidateContext& candidate, const std::string& text) const;

private:
    std::shared_ptr<llm::Answerer> answerer_;
    std::shared_ptr<common::WorkerPool> pool_;
    DistillerConfig config_;
};

// Strips a ```json ... ``` fence (or any ``` fence) around model output
std::string stripCodeFence(const std::string& text);

} // namespace astkg::query
