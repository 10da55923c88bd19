// Copyright 2025 The ASTKG Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <astkg/query/query_execution_context.h>
#include <astkg/query/query_models.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>

namespace astkg::query {

enum class PipelineStage { Retrieve, Distill, Generate, Verify, Refine, Finalize, Done };

const char* toString(PipelineStage stage) noexcept;

struct PipelineOptions {
    // Re-run DISTILL after each REFINE instead of reusing the first context
    bool redistill_on_refine = false;
};

/**
 * RETRIEVE -> DISTILL -> GENERATE -> VERIFY -> {REFINE -> GENERATE -> VERIFY}* -> FINALIZE
 *
 * Runs as a coroutine on the given executor, hopping back to it between
 * stages. REFINE is entered only while the context reports canRefine(); the
 * pipeline itself consumes the refinement budget before each REFINE so the
 * loop ends after at most maxRefinements + 1 generate/verify cycles whatever
 * the registered steps do.
 *
 * A REFINE guard sees the context before the round is counted.
 *
 * A step that throws or returns an error ends the run: FINALIZE still runs
 * over the partial context, then a terminal QueryResult with error=true is
 * returned. Callers always get a result.
 */
class QueryPipeline : public std::enable_shared_from_this<QueryPipeline> {
public:
    using StepFn = std::function<Result<void>(QueryExecutionContext&)>;
    using Guard = std::function<bool(const QueryExecutionContext&)>;

    explicit QueryPipeline(boost::asio::any_io_executor executor, PipelineOptions options = {});

    QueryPipeline& step(PipelineStage stage, StepFn fn);
    QueryPipeline& conditionalStep(PipelineStage stage, Guard guard, StepFn fn);

    boost::asio::awaitable<QueryResult> run(std::shared_ptr<QueryExecutionContext> ctx) const;

    // Spawn run() on the executor; the pipeline must be owned by a shared_ptr
    std::future<QueryResult> execute(std::shared_ptr<QueryExecutionContext> ctx);

    PipelineStage next(PipelineStage current, const QueryExecutionContext& ctx) const;

    static QueryResult errorResult(const QueryExecutionContext& ctx, const std::string& message,
                                   const std::string& failedStep);

private:
    struct Registered {
        StepFn fn;
        Guard guard; // empty = unconditional
    };

    Result<void> runStage(PipelineStage stage, QueryExecutionContext& ctx,
                          bool guardChecked = false) const;

    boost::asio::any_io_executor executor_;
    PipelineOptions options_;
    std::map<PipelineStage, Registered> steps_;
};

} // namespace astkg::query
