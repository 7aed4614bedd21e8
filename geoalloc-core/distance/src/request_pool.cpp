#include <algorithm>
#include <exception>
#include <future>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/distance/request_pool.hpp>
#include <mutex>
#include <vector>

namespace geoalloc::distance {

  void run_bounded(size_t task_count, size_t max_in_flight, const PoolTask& task) {
    GEOALLOC_ZONE;
    if (task_count == 0) return;

    std::atomic<size_t> next_idx{0};
    std::atomic<bool> cancelled{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
      while (!cancelled.load()) {
        const size_t idx = next_idx.fetch_add(1);
        if (idx >= task_count) break;
        try {
          task(idx, cancelled);
        } catch (...) {
          std::lock_guard<std::mutex> lock(error_mutex);
          if (!first_error) first_error = std::current_exception();
          cancelled.store(true);
        }
      }
    };

    const size_t n_workers = std::max<size_t>(1, std::min(max_in_flight, task_count));
    std::vector<std::future<void>> pool;
    pool.reserve(n_workers);
    for (size_t t = 0; t < n_workers; ++t) {
      pool.emplace_back(std::async(std::launch::async, worker));
    }
    for (auto& f : pool) f.get();

    if (first_error) std::rethrow_exception(first_error);
  }

}  // namespace geoalloc::distance
