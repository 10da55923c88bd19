#include <astkg/common/worker_pool.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace astkg::common {

std::size_t resolveThreadCount(std::size_t requested) {
    if (requested > 0)
        return requested;
    const auto hw = std::thread::hardware_concurrency();
    return std::clamp<std::size_t>(hw == 0 ? 2 : hw, 2, 8);
}

WorkerPool::WorkerPool(std::size_t threads)
    : threads_(resolveThreadCount(threads)), pool_(threads_) {
    spdlog::debug("[WorkerPool] started with {} threads", threads_);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    pool_.stop();
    pool_.join();
}

} // namespace astkg::common
