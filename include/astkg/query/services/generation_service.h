#pragma once

#include <astkg/common/worker_pool.h>
#include <astkg/llm/model_interfaces.h>
#include <astkg/query/query_execution_context.h>

#include <chrono>
#include <memory>
#include <string>

namespace astkg::query {

/**
 * GENERATE: prompt the Answerer with the distilled context and parse its JSON.
 *
 * Output is expected as {"summary", "components": [...], "relationships": [...]}
 * and may be wrapped in a code fence. An Answerer failure or unreadable output
 * yields a degraded answer (metadata generationError / parseError) instead of a
 * step error. Without any context the Answerer is not called.
 */
class GenerationService {
public:
    GenerationService(std::shared_ptr<llm::Answerer> answerer,
                      std::shared_ptr<common::WorkerPool> pool,
                      std::chrono::milliseconds answerTimeout);

    Result<void> generate(QueryExecutionContext& ctx) const;

    static std::string buildPrompt(const QueryExecutionContext& ctx);
    static Result<GeneratedAnswer> parseAnswer(const std::string& text);

private:
    std::shared_ptr<llm::Answerer> answerer_;
    std::shared_ptr<common::WorkerPool> pool_;
    std::chrono::milliseconds answerTimeout_;
};

} // namespace astkg::query
