#pragma once

#include "protocol.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fathom {

/// One timer thread for every execution deadline. Deadlines sit in a
/// min-heap; disarm() and re-arm() leave stale heap entries behind that are
/// skipped by generation when they surface.
///
/// The expiry callback runs on the watchdog thread and must not block; the
/// roles use it to post a timeout transition onto the execution's strand.
class deadline_watchdog {
public:
  using expiry_fn = std::function<void(const std::string &)>;

  explicit deadline_watchdog(expiry_fn on_expiry)
      : on_expiry_(std::move(on_expiry)) {
    thread_ = std::thread([this]() { run(); });
  }

  deadline_watchdog(const deadline_watchdog &) = delete;
  deadline_watchdog &operator=(const deadline_watchdog &) = delete;

  ~deadline_watchdog() { stop(); }

  void arm(const std::string &id, steady_clock::time_point deadline) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto generation = ++next_generation_;
      armed_[id] = generation;
      heap_.push(entry{deadline, generation, id});
    }
    cv_.notify_one();
  }

  void disarm(const std::string &id) {
    std::lock_guard<std::mutex> lock(mu_);
    armed_.erase(id);
  }

  bool armed(const std::string &id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return armed_.count(id) != 0;
  }

  size_t armed_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return armed_.size();
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
      thread_.join();
  }

private:
  struct entry {
    steady_clock::time_point deadline;
    std::uint64_t generation;
    std::string id;
  };

  struct later {
    bool operator()(const entry &a, const entry &b) const {
      return a.deadline > b.deadline;
    }
  };

  void run() {
    std::unique_lock<std::mutex> lock(mu_);
    while (!stopping_) {
      if (heap_.empty()) {
        cv_.wait(lock);
        continue;
      }
      auto next = heap_.top().deadline;
      if (steady_clock::now() < next) {
        cv_.wait_until(lock, next);
        continue;
      }

      std::vector<std::string> expired;
      auto now = steady_clock::now();
      while (!heap_.empty() && heap_.top().deadline <= now) {
        auto top = heap_.top();
        heap_.pop();
        auto it = armed_.find(top.id);
        if (it == armed_.end() || it->second != top.generation)
          continue;
        armed_.erase(it);
        expired.push_back(std::move(top.id));
      }

      lock.unlock();
      for (const auto &id : expired) {
        spdlog::debug("watchdog: deadline elapsed for {}", id);
        try {
          on_expiry_(id);
        } catch (const std::exception &e) {
          spdlog::error("watchdog: expiry handler for {} failed: {}", id,
                        e.what());
        }
      }
      lock.lock();
    }
  }

  expiry_fn on_expiry_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::priority_queue<entry, std::vector<entry>, later> heap_;
  std::unordered_map<std::string, std::uint64_t> armed_;
  std::uint64_t next_generation_ = 0;
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace fathom
