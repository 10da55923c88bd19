#pragma once

#include <astkg/query/context_distiller.h>
#include <astkg/query/query_execution_context.h>

#include <memory>

namespace astkg::query {

// DISTILL: keep the retrieved contexts the Answerer judges relevant
class DistillationService {
public:
    explicit DistillationService(std::shared_ptr<ContextDistiller> distiller);

    Result<void> distill(QueryExecutionContext& ctx) const;

private:
    std::shared_ptr<ContextDistiller> distiller_;
};

} // namespace astkg::query
