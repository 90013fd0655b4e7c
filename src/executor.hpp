#pragma once

// Internal header — not installed.
// Process-global Taskflow executor and a chunked parallel_for on top of it.

#include <taskflow/taskflow.hpp>

#include <algorithm>
#include <cstddef>

namespace jsondelta_cpp::detail {

// Created on first use, destroyed at exit. Sized to the hardware
// concurrency; Taskflow schedules by work stealing.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

/// Split [0, count) into at most @p max_chunks contiguous ranges, one task
/// each, and block until all ran. fn(index) is called once per index.
/// max_chunks 0 uses one chunk per executor worker.
template <typename Fn>
void parallel_for(std::size_t count, std::size_t max_chunks, Fn&& fn) {
    if (count == 0) return;
    auto& executor = global_executor();
    if (max_chunks == 0) max_chunks = executor.num_workers();
    const auto chunks = std::clamp<std::size_t>(max_chunks, 1, count);

    if (chunks == 1) {
        for (std::size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    auto flow = tf::Taskflow{};
    for (std::size_t c = 0; c < chunks; ++c) {
        const auto begin = c * count / chunks;
        const auto end = (c + 1) * count / chunks;
        flow.emplace([&fn, begin, end]() {
            for (auto i = begin; i < end; ++i) fn(i);
        });
    }
    executor.run(flow).wait();
}

}  // namespace jsondelta_cpp::detail
