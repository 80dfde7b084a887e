#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <latch>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of workers over a work list. Every queued item is processed
// before drain() returns.
template <typename T>
  requires std::is_move_assignable_v<T> && std::is_move_constructible_v<T>
class thread_pool {
  const size_t n_threads = 1;
  std::latch latch;

  using Func = std::function<void(T&&)>;
  const Func func;

  std::vector<T> vals;
  mutable std::mutex mtx;
  std::condition_variable cv;
  bool stopped = false;

  // declared last: joined before the rest is destroyed
  std::vector<std::jthread> threads;

  std::optional<T> pop() {
    std::unique_lock lk{mtx};
    cv.wait(lk, [this] { return stopped || !vals.empty(); });
    if (vals.empty())
      return std::nullopt;
    auto t = std::move(vals.back());
    vals.pop_back();
    return t;
  }

  void worker_loop() {
    while (true) {
      auto t_opt = pop();
      if (!t_opt)
        break;
      func(std::move(*t_opt));
    }
    latch.count_down();
  }

  void stop() {
    {
      std::lock_guard lk{mtx};
      stopped = true;
    }
    cv.notify_all();
  }

 public:
  thread_pool(size_t n_threads, Func func, std::vector<T> vec = {})
      : n_threads{std::max<size_t>(1, n_threads)},
        latch{static_cast<ptrdiff_t>(this->n_threads)},
        func{std::move(func)},
        vals{std::move(vec)}  //
  {
    threads.reserve(this->n_threads);
    for (size_t i = 0; i < this->n_threads; i++)
      threads.emplace_back(&thread_pool::worker_loop, this);
  }

  ~thread_pool() { drain(); }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;
  thread_pool(thread_pool&&) = delete;
  thread_pool& operator=(thread_pool&&) = delete;

  // Blocks until every queued item is handled
  void drain() {
    stop();
    latch.wait();
  }
};
