#pragma once
#include <atomic>
#include <cstddef>
#include <functional>

namespace geoalloc::distance {

  using PoolTask = std::function<void(size_t index, const std::atomic<bool>& cancelled)>;

  // Runs tasks [0, task_count) with at most max_in_flight running at once.
  // The first exception stops new tasks from starting, waits for the running
  // ones and is rethrown to the caller.
  void run_bounded(size_t task_count, size_t max_in_flight, const PoolTask& task);

}  // namespace geoalloc::distance
