//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Fixed-size worker pool with a completion barrier.
///
/// Tasks run on worker threads in submission order. `wait()` blocks until
/// every submitted task has finished, which is the barrier between the
/// per-file and the per-directory analysis phases.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_SUPPORT_WORKER_POOL_H
#define TFCHECK_SUPPORT_WORKER_POOL_H

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tfcheck
{

/// @brief Unit of work executed by the pool.
using WorkerTask = std::function<void()>;

/// @brief Worker pool running independent tasks.
class WorkerPool final
{
public:
    /// @brief Starts the workers.
    /// @param[in] threadCount Worker count; 0 selects the hardware concurrency.
    explicit WorkerPool(std::size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// @brief Enqueues one task.
    /// @param[in] task Task body.
    /// @return `false` when the pool is shutting down.
    [[nodiscard]] bool submit(WorkerTask task);

    /// @brief Blocks until all submitted tasks completed.
    /// @return Messages of tasks that escaped with an exception, in completion order.
    [[nodiscard]] std::vector<std::string> wait();

    /// @brief Returns the number of worker threads.
    [[nodiscard]] std::size_t threadCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tfcheck

#endif  // TFCHECK_SUPPORT_WORKER_POOL_H
