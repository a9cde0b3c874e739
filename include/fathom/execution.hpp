#pragma once

#include "errors.hpp"
#include "protocol.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace fathom {

/// Outcome of feeding an output chunk to a session.
struct output_verdict {
  /// Bytes of the chunk that fit in the output budget and may be delivered.
  size_t accepted = 0;
  /// The chunk overflowed the budget; the session is now failed/OUTPUT_LIMIT.
  bool limit_exceeded = false;
  /// The session was not running; nothing was accepted.
  bool rejected = false;
};

/// Lifecycle of one execution id. Both roles drive the same transitions: the
/// responder when it emits a message, the initiator when it observes one.
///
/// Not synchronized. An instance is only ever touched from the strand that
/// owns its id (see execution_handle).
class execution_session {
public:
  explicit execution_session(execution_request request,
                             steady_clock::time_point now = steady_clock::now())
      : request_(std::move(request)), created_at_(now),
        deadline_(now + request_.limits.timeout) {}

  const std::string &id() const { return request_.id; }
  const execution_request &request() const { return request_; }
  exec_status status() const { return status_; }
  bool terminal() const { return is_terminal(status_); }
  bool acked() const { return acked_; }
  bool cancel_requested() const { return cancel_requested_; }
  std::uint64_t output_bytes() const { return output_bytes_; }
  steady_clock::time_point created_at() const { return created_at_; }
  steady_clock::time_point deadline() const { return deadline_; }
  const std::optional<execution_result> &result() const { return result_; }
  const std::optional<error_body> &error() const { return error_; }

  std::chrono::milliseconds elapsed(steady_clock::time_point now =
                                        steady_clock::now()) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now -
                                                                 created_at_);
  }

  /// Ack confirms receipt only; the status stays pending.
  bool mark_acked() {
    if (status_ != exec_status::pending || acked_)
      return false;
    acked_ = true;
    return true;
  }

  bool start_running() {
    if (status_ != exec_status::pending)
      return false;
    status_ = exec_status::running;
    return true;
  }

  /// Account a chunk against max_output_bytes. On overflow only the part that
  /// still fits is accepted and the session fails with OUTPUT_LIMIT.
  output_verdict add_output(size_t bytes) {
    output_verdict verdict;
    if (status_ != exec_status::running) {
      verdict.rejected = true;
      return verdict;
    }
    auto budget = request_.limits.max_output_bytes;
    auto remaining = budget > output_bytes_ ? budget - output_bytes_ : 0;
    if (bytes <= remaining) {
      output_bytes_ += bytes;
      verdict.accepted = bytes;
      return verdict;
    }
    verdict.accepted = static_cast<size_t>(remaining);
    verdict.limit_exceeded = true;
    output_bytes_ = budget;
    finish(exec_status::failed,
           error_body{error_code::output_limit,
                      "output exceeded " + std::to_string(budget) + " bytes",
                      false});
    return verdict;
  }

  /// Keep the detail of an error reported while the session is still live;
  /// it is attached to the terminal status when that arrives.
  void note_error(error_body err) {
    if (!terminal() && !error_)
      error_ = std::move(err);
  }

  /// Enter a terminal status. A second terminal transition is dropped and
  /// reported as false; the first one always wins.
  bool finish(exec_status status, std::optional<error_body> err = std::nullopt) {
    if (!is_terminal(status) || terminal())
      return false;
    status_ = status;
    if (err)
      error_ = std::move(err);
    return true;
  }

  /// Attach the final accounting. Valid once, and only after finish().
  bool attach_result(execution_result result) {
    if (!terminal() || result_)
      return false;
    result_ = std::move(result);
    return true;
  }

  void request_cancel() { cancel_requested_ = true; }

  /// Connection lost while live: failed with a retryable NETWORK_ERROR and a
  /// result without exit code.
  bool abandon(const std::string &reason) {
    if (!finish(exec_status::failed,
                error_body{error_code::network_error, reason, true}))
      return false;
    attach_result(execution_result{std::nullopt, elapsed(), std::nullopt});
    return true;
  }

private:
  execution_request request_;
  exec_status status_ = exec_status::pending;
  steady_clock::time_point created_at_;
  steady_clock::time_point deadline_;
  std::uint64_t output_bytes_ = 0;
  bool acked_ = false;
  bool cancel_requested_ = false;
  std::optional<execution_result> result_;
  std::optional<error_body> error_;
};

} // namespace fathom
