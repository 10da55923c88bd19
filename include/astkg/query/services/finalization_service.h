#pragma once

#include <astkg/query/query_execution_context.h>

namespace astkg::query {

/**
 * FINALIZE: turn the context into the QueryResult handed back to the caller.
 *
 * Confidence starts at 0.5 and moves with the evidence:
 *   +0.30 verified answer
 *   +0.15 more than five relevant contexts (+0.10 for more than two)
 *   +0.05 no refinement needed, otherwise -0.05 per refinement
 *   +0.10 retrieval found seeds
 * A degraded answer is capped at 0.2 and an answer without context scores 0.
 */
class FinalizationService {
public:
    Result<void> finalize(QueryExecutionContext& ctx) const;

    static double computeConfidence(const QueryExecutionContext& ctx);
};

} // namespace astkg::query
