#pragma once

// Global work-stealing thread pool via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). Chain verification replays
// snapshot segments through it.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

#include <cstddef>

namespace jsonrev_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

// Run fn(i) for every i in [0, count) on the global executor and wait.
// fn must not throw.
template <typename Fn>
void parallel_for(std::size_t count, Fn&& fn) {
    if (count == 0) return;
    if (count == 1) {
        fn(std::size_t{0});
        return;
    }
    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, count, std::size_t{1},
                            [&fn](std::size_t i) { fn(i); });
    global_executor().run(taskflow).wait();
}

}  // namespace jsonrev_cpp::detail
