//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the worker pool.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Support/WorkerPool.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace tfcheck
{

class WorkerPool::Impl final
{
public:
    explicit Impl(std::size_t threadCount)
    {
        if (threadCount == 0)
        {
            threadCount = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i)
        {
            workers_.emplace_back([this]() { run(); });
        }
    }

    ~Impl()
    {
        shutdown();
    }

    bool submit(WorkerTask task)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return false;
            }
            queue_.push_back(std::move(task));
            ++pending_;
        }
        cv_.notify_one();
        return true;
    }

    std::vector<std::string> wait()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this]() { return pending_ == 0; });
        std::vector<std::string> failures = std::move(failures_);
        failures_.clear();
        return failures;
    }

    std::size_t threadCount() const
    {
        return workers_.size();
    }

private:
    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (std::thread& worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void run()
    {
        while (true)
        {
            WorkerTask task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (queue_.empty())
                {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop_front();
            }

            std::optional<std::string> failure;
            try
            {
                task();
            } catch (const std::exception& ex)
            {
                failure = std::string(ex.what());
            } catch (...)
            {
                failure = std::string("unknown exception");
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (failure)
                {
                    failures_.push_back(std::move(*failure));
                }
                --pending_;
                if (pending_ == 0)
                {
                    idle_.notify_all();
                }
            }
        }
    }

    std::mutex               mutex_;
    std::condition_variable  cv_;
    std::condition_variable  idle_;
    std::deque<WorkerTask>   queue_;
    std::vector<std::string> failures_;
    std::size_t              pending_{0};
    bool                     stopping_{false};
    std::vector<std::thread> workers_;
};

WorkerPool::WorkerPool(const std::size_t threadCount)
    : impl_(std::make_unique<Impl>(threadCount))
{
}

WorkerPool::~WorkerPool() = default;

bool WorkerPool::submit(WorkerTask task)
{
    return impl_->submit(std::move(task));
}

std::vector<std::string> WorkerPool::wait()
{
    return impl_->wait();
}

std::size_t WorkerPool::threadCount() const
{
    return impl_->threadCount();
}

}  // namespace tfcheck
