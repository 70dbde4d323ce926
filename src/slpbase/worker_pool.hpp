#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace slp::util {

// 0 means one worker per hardware thread
inline size_t resolve_worker_count(size_t requested) {
  if (requested != 0) {
    return requested;
  }
  const unsigned hardware = std::thread::hardware_concurrency();
  return hardware == 0 ? 1 : hardware;
}

// Runs task(0..count-1) on up to `workers` threads. Tasks claim indices from a shared
// counter, so each index runs at most once; callers write results into pre-sized slots.
// The first exception thrown by a task stops further claims and is rethrown once every
// worker has been joined. If a thread cannot be started the remaining work runs on the
// threads that did start.
inline void run_indexed(size_t count, size_t workers, const std::function<void(size_t)>& task) {
  workers = std::min(resolve_worker_count(workers), count);
  if (workers <= 1) {
    for (size_t i = 0; i < count; ++i) {
      task(i);
    }
    return;
  }

  std::atomic<size_t> next{0};
  std::mutex failure_mutex;
  std::exception_ptr failure;
  auto drain = [&]() {
    try {
      for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
        task(i);
      }
    } catch (...) {
      std::lock_guard<std::mutex> lock(failure_mutex);
      if (!failure) {
        failure = std::current_exception();
      }
      next.store(count);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers - 1);
  for (size_t i = 0; i + 1 < workers; ++i) {
    try {
      threads.emplace_back(drain);
    } catch (const std::system_error&) {
      break;
    }
  }
  drain();
  for (auto& thread : threads) {
    thread.join();
  }
  if (failure) {
    std::rethrow_exception(failure);
  }
}

} // namespace slp::util
