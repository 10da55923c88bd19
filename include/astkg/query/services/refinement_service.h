#pragma once

#include <astkg/query/query_execution_context.h>

namespace astkg::query {

// REFINE: record the refinement round and what went wrong in the last answer.
// The pipeline has already consumed one refinement from the context budget.
class RefinementService {
public:
    explicit RefinementService(bool redistill = false) : redistill_(redistill) {}

    Result<void> refine(QueryExecutionContext& ctx) const;

private:
    bool redistill_;
};

} // namespace astkg::query
