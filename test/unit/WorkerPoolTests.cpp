//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tfcheck/Support/WorkerPool.h"

bool runWorkerPoolTests()
{
    {
        tfcheck::WorkerPool pool(4);
        if (pool.threadCount() != 4)
        {
            std::cerr << "expected four workers\n";
            return false;
        }

        std::vector<std::uint32_t> slots(64, 0);
        std::mutex                 mutex;
        std::set<std::thread::id>  threads;
        for (std::size_t i = 0; i < slots.size(); ++i)
        {
            const bool accepted = pool.submit([&slots, &mutex, &threads, i]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                slots[i] = static_cast<std::uint32_t>(i * 2);
                std::lock_guard<std::mutex> lock(mutex);
                threads.insert(std::this_thread::get_id());
            });
            if (!accepted)
            {
                std::cerr << "expected submit to succeed\n";
                return false;
            }
        }
        if (!pool.wait().empty())
        {
            std::cerr << "expected no task failures\n";
            return false;
        }
        for (std::size_t i = 0; i < slots.size(); ++i)
        {
            if (slots[i] != i * 2)
            {
                std::cerr << "task " << i << " did not run before wait returned\n";
                return false;
            }
        }
        if (threads.empty() || threads.size() > 4)
        {
            std::cerr << "unexpected worker thread usage\n";
            return false;
        }
    }

    {
        tfcheck::WorkerPool pool(2);
        std::atomic<int>    completed{0};
        for (int i = 0; i < 6; ++i)
        {
            const bool accepted = pool.submit([&completed, i]() {
                if (i % 3 == 0)
                {
                    throw std::runtime_error("task " + std::to_string(i) + " failed");
                }
                ++completed;
            });
            if (!accepted)
            {
                std::cerr << "expected submit to succeed\n";
                return false;
            }
        }
        const std::vector<std::string> failures = pool.wait();
        const std::set<std::string>    unique(failures.begin(), failures.end());
        if (failures.size() != 2 || unique.count("task 0 failed") != 1 || unique.count("task 3 failed") != 1 ||
            completed.load() != 4)
        {
            std::cerr << "expected two reported failures and four completed tasks\n";
            return false;
        }

        // Failures are reported once and the pool stays usable.
        if (!pool.submit([&completed]() { ++completed; }) || !pool.wait().empty() || completed.load() != 5)
        {
            std::cerr << "expected the pool to accept work after a failure\n";
            return false;
        }
    }

    {
        tfcheck::WorkerPool pool(0);
        if (pool.threadCount() == 0)
        {
            std::cerr << "a zero thread count must select at least one worker\n";
            return false;
        }
        if (!pool.wait().empty())
        {
            std::cerr << "waiting on an idle pool must return immediately\n";
            return false;
        }
    }

    return true;
}
