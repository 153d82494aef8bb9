#pragma once

/// @file include/sift/parallel.hpp
/// @brief Bounded fan-out over an index range.
///
/// `parallel_for(n, workers, fn)` calls `fn(i)` exactly once for every
/// i in [0, n) using at most `workers` threads, and returns when all calls
/// have finished. `fn` must not throw; callers isolate failures per item.

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace sift::core {

template <typename Fn>
void parallel_for(std::size_t n, std::size_t workers, Fn&& fn) {
    if (n == 0) {
        return;
    }
    const std::size_t threads = std::clamp<std::size_t>(workers, 1, n);
    if (threads == 1) {
        for (std::size_t i = 0; i < n; ++i) fn(i);
        return;
    }

    std::atomic<std::size_t> next{0};
    auto drain = [&] {
        for (std::size_t i = next.fetch_add(1, std::memory_order_relaxed); i < n;
             i = next.fetch_add(1, std::memory_order_relaxed)) {
            fn(i);
        }
    };

    std::vector<std::jthread> pool;
    pool.reserve(threads - 1);
    for (std::size_t t = 0; t + 1 < threads; ++t) {
        pool.emplace_back(drain);
    }
    drain();
    // jthread joins on destruction.
}

}  // namespace sift::core
