#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace qrfile::parallel {

// Worker count for a batch of tasks. requested == 0 means QRFILE_WORKERS, then the
// hardware concurrency. Always within [1, max(task_count, 1)].
std::size_t ResolveWorkers(std::size_t requested, std::size_t task_count);

// Runs fn(i) for every i in [0, count) on at most `workers` threads that pull
// indices from a shared counter, and returns once every call has finished.
// fn must not throw.
template <typename Fn>
void ParallelFor(std::size_t count, std::size_t workers, Fn&& fn) {
    if (count == 0) {
        return;
    }
    if (workers > count) {
        workers = count;
    }
    if (workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }
    std::atomic<std::size_t> next{0};
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&]() {
            while (true) {
                std::size_t idx = next.fetch_add(1);
                if (idx >= count) {
                    break;
                }
                fn(idx);
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
}

}  // namespace qrfile::parallel
