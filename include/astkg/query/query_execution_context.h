#pragma once

#include <astkg/core/types.h>
#include <astkg/query/query_models.h>
#include <astkg/retrieval/hybrid_retriever.h>
#include <astkg/search/search_types.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace astkg::query {

/**
 * State threaded through one pipeline run.
 *
 * Owned by exactly one run and mutated by its steps in sequence. The
 * completed-step log is the only part written from completion callbacks and is
 * guarded by its own mutex. refinementCount only grows and never passes
 * maxRefinements.
 */
class QueryExecutionContext {
public:
    QueryExecutionContext(std::string query, std::string executionId, size_t maxRefinements);

    const std::string& originalQuery() const noexcept { return originalQuery_; }
    const std::string& executionId() const noexcept { return executionId_; }
    TimePoint startTime() const noexcept { return startTime_; }
    std::chrono::milliseconds elapsed() const;

    size_t refinementCount() const noexcept { return refinementCount_; }
    size_t maxRefinements() const noexcept { return maxRefinements_; }
    bool canRefine() const noexcept { return !verified && refinementCount_ < maxRefinements_; }

    // Consumes one refinement; InvalidState once the budget is spent
    Result<void> beginRefinement();

    void markStepComplete(const std::string& step);
    std::vector<std::string> completedSteps() const;
    std::vector<std::pair<std::string, std::chrono::milliseconds>> stepTimeline() const;

    // Step outputs
    std::optional<search::ExtractedTerms> extractedTerms;
    Embedding queryEmbedding;
    std::optional<retrieval::RetrievalResult> retrievalResult;
    std::optional<std::vector<RelevantContext>> distilledContext;
    size_t contextCandidates = 0;
    std::optional<GeneratedAnswer> generatedAnswer;
    bool verified = false;
    std::vector<std::string> verificationErrors;
    size_t generationAttempts = 0;
    size_t verificationAttempts = 0;
    std::optional<QueryResult> finalResult;
    Metadata metadata;

private:
    std::string originalQuery_;
    std::string executionId_;
    TimePoint startTime_;
    std::chrono::steady_clock::time_point startedAt_;
    size_t refinementCount_ = 0;
    size_t maxRefinements_;

    mutable std::mutex stepsMutex_;
    std::vector<std::pair<std::string, std::chrono::milliseconds>> completedSteps_;
};

// Random 128-bit id rendered as a UUID string
std::string generateExecutionId();

} // namespace astkg::query
