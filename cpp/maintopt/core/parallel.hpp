#pragma once
/*
================================================================================
Core: Batch Worker Pool
FILE: cpp/maintopt/core/parallel.hpp

Runs fn(i) for i in [0, n) on up to `threads` workers pulling indices from a
shared atomic counter, then joins. The join is the only barrier.

  - threads == 0 -> hardware concurrency.
  - threads is capped at n; the caller is one of the workers, and a single
    worker runs inline on the caller.
  - A worker that fails to start leaves fewer workers, never a lost index.
  - The first exception thrown by any fn(i) is rethrown on the caller after
    all workers have joined; remaining indices are skipped once it is set.
  - fn must only write to slot i of its output; results never depend on
    scheduling order.
================================================================================
*/

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "maintopt/core/logging.hpp"

namespace maintopt {

inline int resolve_thread_count(int requested, std::size_t n) noexcept {
  int threads = requested;
  if (threads <= 0) {
    threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads <= 0) threads = 1;
  }
  if (n < static_cast<std::size_t>(threads)) threads = static_cast<int>(n);
  return std::max(threads, 1);
}

// `spawn(worker)` returns a std::thread running worker. The default overload
// below starts plain std::threads; tests inject a failing spawner.
template <class Fn, class Spawn>
void parallel_for(std::size_t n, int requested_threads, Fn&& fn, Spawn&& spawn) {
  if (n == 0) return;

  const int threads = resolve_thread_count(requested_threads, n);
  if (threads <= 1) {
    for (std::size_t i = 0; i < n; ++i) fn(i);
    return;
  }

  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mu;

  auto worker = [&]() {
    for (;;) {
      if (failed.load(std::memory_order_relaxed)) break;
      const std::size_t i = next.fetch_add(1);
      if (i >= n) break;
      try {
        fn(i);
      } catch (...) {
        std::lock_guard<std::mutex> lk(error_mu);
        if (!first_error) first_error = std::current_exception();
        failed.store(true, std::memory_order_relaxed);
      }
    }
  };

  // The caller is worker 0. If a spawn fails, the threads already running
  // and the caller finish the batch; every started thread is joined.
  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(threads - 1));
  try {
    for (int t = 1; t < threads; ++t) pool.push_back(spawn(worker));
  } catch (const std::exception& e) {
    MAINTOPT_LOG(WARN, "parallel_for: started " << pool.size() + 1 << " of " << threads
                       << " workers (" << e.what() << ")");
  }

  worker();
  for (auto& th : pool) th.join();

  if (first_error) std::rethrow_exception(first_error);
}

template <class Fn>
void parallel_for(std::size_t n, int requested_threads, Fn&& fn) {
  parallel_for(n, requested_threads, std::forward<Fn>(fn),
               [](const auto& worker) { return std::thread(worker); });
}

}  // namespace maintopt
