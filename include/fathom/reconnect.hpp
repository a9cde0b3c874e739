#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>

namespace fathom {

/// Initiator-side reconnect backoff. The first attempt after a loss is
/// immediate; attempt n >= 1 waits min(base * 2^(n-1), max), optionally
/// stretched by up to `jitter` of itself.
class reconnect_policy {
public:
  explicit reconnect_policy(
      std::chrono::milliseconds base = std::chrono::milliseconds(100),
      std::chrono::milliseconds max = std::chrono::seconds(30),
      double jitter = 0.0)
      : base_(base), max_(max), jitter_(jitter) {}

  std::chrono::milliseconds delay_for(int attempt) const {
    if (attempt <= 0)
      return std::chrono::milliseconds(0);
    double delay = static_cast<double>(base_.count()) *
                   std::pow(2.0, static_cast<double>(attempt - 1));
    if (jitter_ > 0.0)
      delay += delay * jitter_ *
               std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
    delay = std::min(delay, static_cast<double>(max_.count()));
    return std::chrono::milliseconds(static_cast<long long>(delay));
  }

  /// Delay before the next attempt; consumes the attempt.
  std::chrono::milliseconds next_delay() { return delay_for(attempt_++); }

  void reset() { attempt_ = 0; }

  int attempt() const { return attempt_; }

private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds max_;
  double jitter_;
  int attempt_ = 0;
  mutable std::mt19937 rng_{std::random_device{}()};
};

} // namespace fathom
