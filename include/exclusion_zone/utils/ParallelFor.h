#pragma once
// Row-parallel loops for grid generation
// Uses std::thread with contiguous chunks per thread

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace exclusion_zone {
namespace utils {

// Progress callback: (progress 0.0-1.0, message)
using ProgressCallback = std::function<void(float, const std::string&)>;

// Get the number of threads to use (respects hardware concurrency)
inline unsigned int getThreadCount() {
    unsigned int n = std::thread::hardware_concurrency();
    return std::max(1u, n);
}

// Parallel for loop over a range [start, end)
// Each thread processes a contiguous chunk; func must not touch shared mutable state
template<typename Func>
void parallel_for(size_t start, size_t end, Func&& func) {
    if (start >= end) return;

    size_t total = end - start;
    size_t numThreads = std::min<size_t>(getThreadCount(), total);

    if (numThreads <= 1) {
        for (size_t i = start; i < end; ++i) {
            func(i);
        }
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(numThreads);

    size_t chunkSize = (total + numThreads - 1) / numThreads;

    for (size_t t = 0; t < numThreads; ++t) {
        size_t chunkStart = start + t * chunkSize;
        size_t chunkEnd = std::min(chunkStart + chunkSize, end);

        if (chunkStart < end) {
            threads.emplace_back([=, &func] {
                for (size_t i = chunkStart; i < chunkEnd; ++i) {
                    func(i);
                }
            });
        }
    }

    for (auto& t : threads) {
        t.join();
    }
}

// Parallel for with progress reporting
// The callback runs on worker threads (serialized), roughly every 5%
template<typename Func>
void parallel_for_progress(size_t start, size_t end, Func&& func,
                           ProgressCallback progressCallback,
                           const std::string& taskName) {
    if (!progressCallback) {
        parallel_for(start, end, std::forward<Func>(func));
        return;
    }
    if (start >= end) return;

    size_t total = end - start;
    size_t interval = std::max<size_t>(1, total / 20);
    std::atomic<size_t> completed{0};
    std::mutex callbackMutex;

    parallel_for(start, end, [&](size_t i) {
        func(i);
        size_t current = ++completed;
        if (current == total || current % interval == 0) {
            std::lock_guard<std::mutex> lock(callbackMutex);
            progressCallback(static_cast<float>(current) / static_cast<float>(total),
                             taskName + " " + std::to_string(current) + "/" + std::to_string(total));
        }
    });
}

} // namespace utils
} // namespace exclusion_zone
