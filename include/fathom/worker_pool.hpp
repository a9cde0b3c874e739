#pragma once

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace fathom {

/// Fixed set of threads draining one shared FIFO of tasks.
class worker_pool {
public:
  using task = std::function<void()>;

  explicit worker_pool(size_t threads = 2) {
    if (threads == 0)
      threads = 1;
    for (size_t i = 0; i < threads; ++i)
      threads_.emplace_back([this]() { run(); });
  }

  worker_pool(const worker_pool &) = delete;
  worker_pool &operator=(const worker_pool &) = delete;

  ~worker_pool() { shutdown(); }

  /// Queue a task. Returns false once the pool is shutting down.
  bool post(task fn) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_)
        return false;
      tasks_.push_back(std::move(fn));
    }
    cv_.notify_one();
    return true;
  }

  /// Tasks queued but not yet picked up by a thread.
  size_t backlog() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
  }

  /// Run what is already queued, then join every thread.
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_ && threads_.empty())
        return;
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto &t : threads_) {
      if (t.joinable())
        t.join();
    }
    threads_.clear();
  }

private:
  void run() {
    for (;;) {
      task fn;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty())
          return;
        fn = std::move(tasks_.front());
        tasks_.pop_front();
      }
      try {
        fn();
      } catch (const std::exception &e) {
        spdlog::error("worker task failed: {}", e.what());
      }
    }
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<task> tasks_;
  std::vector<std::thread> threads_;
  bool stopping_ = false;
};

/// Serial view over a worker_pool: tasks posted to one strand run one at a
/// time, in posting order, never concurrently with each other.
class strand : public std::enable_shared_from_this<strand> {
public:
  explicit strand(worker_pool &pool) : pool_(pool) {}

  bool post(worker_pool::task fn) {
    bool schedule = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      queue_.push_back(std::move(fn));
      if (!scheduled_) {
        scheduled_ = true;
        schedule = true;
      }
    }
    if (!schedule)
      return true;

    auto self = shared_from_this();
    if (pool_.post([self]() { self->drain(); }))
      return true;

    std::lock_guard<std::mutex> lock(mu_);
    queue_.clear();
    scheduled_ = false;
    return false;
  }

private:
  void drain() {
    for (;;) {
      worker_pool::task fn;
      {
        std::lock_guard<std::mutex> lock(mu_);
        if (queue_.empty()) {
          scheduled_ = false;
          return;
        }
        fn = std::move(queue_.front());
        queue_.pop_front();
      }
      try {
        fn();
      } catch (const std::exception &e) {
        spdlog::error("strand task failed: {}", e.what());
      }
    }
  }

  worker_pool &pool_;
  std::mutex mu_;
  std::deque<worker_pool::task> queue_;
  bool scheduled_ = false;
};

} // namespace fathom
