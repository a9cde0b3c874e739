#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fathom {

/// Canonical error kinds shared by the codec, registry, watchdog and both
/// protocol roles.
enum class error_code {
  timeout,
  oom,
  output_limit,
  language_not_supported,
  invalid_request,
  unknown_execution,
  sandbox_overloaded,
  internal_error,
  network_error,
};

enum class error_class { resource, protocol, infrastructure };

inline error_class classify(error_code code) {
  switch (code) {
  case error_code::timeout:
  case error_code::oom:
  case error_code::output_limit:
    return error_class::resource;
  case error_code::language_not_supported:
  case error_code::invalid_request:
  case error_code::unknown_execution:
    return error_class::protocol;
  case error_code::sandbox_overloaded:
  case error_code::internal_error:
  case error_code::network_error:
    return error_class::infrastructure;
  }
  return error_class::infrastructure;
}

/// Only infrastructure failures may be retried by the caller.
inline bool is_retryable(error_code code) {
  return classify(code) == error_class::infrastructure;
}

inline std::string_view to_string(error_code code) {
  switch (code) {
  case error_code::timeout:
    return "TIMEOUT";
  case error_code::oom:
    return "OOM";
  case error_code::output_limit:
    return "OUTPUT_LIMIT";
  case error_code::language_not_supported:
    return "LANGUAGE_NOT_SUPPORTED";
  case error_code::invalid_request:
    return "INVALID_REQUEST";
  case error_code::unknown_execution:
    return "UNKNOWN_EXECUTION";
  case error_code::sandbox_overloaded:
    return "SANDBOX_OVERLOADED";
  case error_code::internal_error:
    return "INTERNAL_ERROR";
  case error_code::network_error:
    return "NETWORK_ERROR";
  }
  return "INTERNAL_ERROR";
}

inline std::optional<error_code> parse_error_code(std::string_view text) {
  static constexpr error_code all[] = {
      error_code::timeout,           error_code::oom,
      error_code::output_limit,      error_code::language_not_supported,
      error_code::invalid_request,   error_code::unknown_execution,
      error_code::sandbox_overloaded, error_code::internal_error,
      error_code::network_error,
  };
  for (auto code : all) {
    if (to_string(code) == text)
      return code;
  }
  return std::nullopt;
}

/// Error raised by the engine. Carries the wire error code and, when known,
/// the execution id the failure relates to.
class protocol_error : public std::runtime_error {
public:
  protocol_error(error_code code, const std::string &message,
                 std::optional<std::string> execution_id = std::nullopt)
      : std::runtime_error(std::string(to_string(code)) + ": " + message),
        code_(code), message_(message), execution_id_(std::move(execution_id)) {}

  error_code code() const { return code_; }
  bool retryable() const { return is_retryable(code_); }
  /// Message without the code prefix, as sent on the wire.
  const std::string &detail() const { return message_; }
  const std::optional<std::string> &execution_id() const {
    return execution_id_;
  }

private:
  error_code code_;
  std::string message_;
  std::optional<std::string> execution_id_;
};

} // namespace fathom
