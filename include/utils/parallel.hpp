#pragma once

#include <cstddef>
#include <functional>

namespace shardpack {
namespace utils {

// Task invoked with the index of the work item it should process
using IndexedTask = std::function<void(std::size_t)>;

// Runs task(0) .. task(count - 1) on a pool of at most max_parallel threads and
// waits for all of them. Once a task throws, tasks with a higher index that
// have not started yet are skipped. After every running task has returned,
// the exception of the lowest failing index is rethrown unchanged. With max_parallel <= 1 the tasks
// run in order on the calling thread.
void run_indexed(std::size_t count, std::size_t max_parallel, const IndexedTask& task);

} // namespace utils
} // namespace shardpack
