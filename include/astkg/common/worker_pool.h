#pragma once

#include <astkg/core/types.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <type_traits>

namespace astkg::common {

/**
 * Bounded executor shared by fork-join work (search branches, distillation
 * fan-out, per-hop traversal and claim checks).
 *
 * Tasks are posted to a boost::asio::thread_pool. submit() wraps the callable in
 * a packaged_task so the caller can join with a deadline; a task that outlives
 * its deadline keeps running detached and must only touch state it owns.
 */
class WorkerPool {
public:
    // 0 = hardware concurrency, capped at 8
    explicit WorkerPool(std::size_t threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F, typename R = std::invoke_result_t<F&>> std::future<R> submit(F&& f) {
        // shared_ptr holds the move-only packaged_task inside a copyable handler
        auto pt = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        auto fut = pt->get_future();
        boost::asio::post(pool_, [pt]() { (*pt)(); });
        return fut;
    }

    boost::asio::thread_pool::executor_type executor() { return pool_.get_executor(); }

    std::size_t size() const noexcept { return threads_; }

    // Stop accepting work and join. Pending tasks are abandoned (their futures
    // report broken_promise).
    void shutdown();

private:
    std::size_t threads_;
    boost::asio::thread_pool pool_;
};

std::size_t resolveThreadCount(std::size_t requested);

/**
 * Join a future carrying Result<T> within `timeout`. A timeout yields
 * ErrorCode::Timeout; an exception escaping the task yields InternalError.
 */
template <typename T>
Result<T> awaitResult(std::future<Result<T>>& fut, std::chrono::milliseconds timeout,
                      const std::string& what) {
    if (!fut.valid()) {
        return Error{ErrorCode::InvalidState, what + ": no pending task"};
    }
    if (fut.wait_for(timeout) != std::future_status::ready) {
        return Error{ErrorCode::Timeout, what + " timed out after " +
                                             std::to_string(timeout.count()) + " ms"};
    }
    try {
        return fut.get();
    } catch (const std::future_error& e) {
        return Error{ErrorCode::OperationCancelled, what + ": " + e.what()};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, what + " failed: " + e.what()};
    }
}

} // namespace astkg::common
