#pragma once

#include <astkg/common/worker_pool.h>
#include <astkg/llm/model_interfaces.h>
#include <astkg/query/query_execution_context.h>
#include <astkg/retrieval/hybrid_retriever.h>

#include <chrono>
#include <memory>

namespace astkg::query {

/**
 * RETRIEVE: extract terms, embed the query, run the hybrid retriever.
 *
 * Terms or an embedding already present on the context are reused. A failed
 * extractor falls back to the query's words as free terms; a failed or slow
 * embedding model leaves the embedding empty so only the lexical branch runs.
 */
class RetrievalService {
public:
    RetrievalService(std::shared_ptr<retrieval::HybridRetriever> retriever,
                     std::shared_ptr<llm::EntityExtractor> extractor,
                     std::shared_ptr<llm::EmbeddingModel> embedder,
                     std::shared_ptr<common::WorkerPool> pool,
                     std::chrono::milliseconds embedTimeout);

    Result<void> retrieve(QueryExecutionContext& ctx) const;

private:
    search::ExtractedTerms extractTerms(const std::string& query) const;
    Embedding embedQuery(const std::string& query) const;

    std::shared_ptr<retrieval::HybridRetriever> retriever_;
    std::shared_ptr<llm::EntityExtractor> extractor_;
    std::shared_ptr<llm::EmbeddingModel> embedder_;
    std::shared_ptr<common::WorkerPool> pool_;
    std::chrono::milliseconds embedTimeout_;
};

} // namespace astkg::query
