#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fathom {

/// Protocol version spoken by this build.
constexpr int kProtocolVersion = 1;
/// Oldest protocol version still accepted on the wire.
constexpr int kMinProtocolVersion = 1;

/// Output budget applied when a request does not name one (1 MiB).
constexpr std::uint64_t kDefaultMaxOutputBytes = 1024 * 1024;

inline bool is_supported_version(std::int64_t version) {
  return version >= kMinProtocolVersion && version <= kProtocolVersion;
}

using wall_clock = std::chrono::system_clock;
using steady_clock = std::chrono::steady_clock;

enum class language { python, javascript, typescript, bash, ruby, go, rust, cpp };

inline std::string_view to_string(language lang) {
  switch (lang) {
  case language::python:
    return "python";
  case language::javascript:
    return "javascript";
  case language::typescript:
    return "typescript";
  case language::bash:
    return "bash";
  case language::ruby:
    return "ruby";
  case language::go:
    return "go";
  case language::rust:
    return "rust";
  case language::cpp:
    return "cpp";
  }
  return "python";
}

inline std::optional<language> parse_language(std::string_view text) {
  static constexpr language all[] = {
      language::python, language::javascript, language::typescript,
      language::bash,   language::ruby,       language::go,
      language::rust,   language::cpp,
  };
  for (auto lang : all) {
    if (to_string(lang) == text)
      return lang;
  }
  return std::nullopt;
}

/// Lifecycle of one execution. Everything past running is terminal.
enum class exec_status { pending, running, completed, failed, cancelled, timeout, oom };

inline bool is_terminal(exec_status status) {
  return status != exec_status::pending && status != exec_status::running;
}

inline std::string_view to_string(exec_status status) {
  switch (status) {
  case exec_status::pending:
    return "pending";
  case exec_status::running:
    return "running";
  case exec_status::completed:
    return "completed";
  case exec_status::failed:
    return "failed";
  case exec_status::cancelled:
    return "cancelled";
  case exec_status::timeout:
    return "timeout";
  case exec_status::oom:
    return "oom";
  }
  return "failed";
}

/// Parse a wire status. "pending" never travels on the wire.
inline std::optional<exec_status> parse_status(std::string_view text) {
  static constexpr exec_status wire[] = {
      exec_status::running,   exec_status::completed, exec_status::failed,
      exec_status::cancelled, exec_status::timeout,   exec_status::oom,
  };
  for (auto status : wire) {
    if (to_string(status) == text)
      return status;
  }
  return std::nullopt;
}

enum class message_type {
  hello,
  execute,
  cancel,
  ping,
  ack,
  status,
  stdout_chunk,
  stderr_chunk,
  result,
  error,
  pong,
};

inline std::string_view to_string(message_type type) {
  switch (type) {
  case message_type::hello:
    return "hello";
  case message_type::execute:
    return "execute";
  case message_type::cancel:
    return "cancel";
  case message_type::ping:
    return "ping";
  case message_type::ack:
    return "ack";
  case message_type::status:
    return "status";
  case message_type::stdout_chunk:
    return "stdout";
  case message_type::stderr_chunk:
    return "stderr";
  case message_type::result:
    return "result";
  case message_type::error:
    return "error";
  case message_type::pong:
    return "pong";
  }
  return "error";
}

inline std::optional<message_type> parse_message_type(std::string_view text) {
  static constexpr message_type all[] = {
      message_type::hello,        message_type::execute,
      message_type::cancel,       message_type::ping,
      message_type::ack,          message_type::status,
      message_type::stdout_chunk, message_type::stderr_chunk,
      message_type::result,       message_type::error,
      message_type::pong,
  };
  for (auto type : all) {
    if (to_string(type) == text)
      return type;
  }
  return std::nullopt;
}

/// Types that always belong to one execution and must carry its id.
inline bool requires_execution_id(message_type type) {
  switch (type) {
  case message_type::execute:
  case message_type::cancel:
  case message_type::ack:
  case message_type::status:
  case message_type::stdout_chunk:
  case message_type::stderr_chunk:
  case message_type::result:
    return true;
  case message_type::hello:
  case message_type::ping:
  case message_type::pong:
  case message_type::error:
    return false;
  }
  return false;
}

struct resource_limits {
  std::chrono::milliseconds timeout{0};
  std::uint64_t memory_mb = 0;
  std::optional<std::uint32_t> cpu_shares;
  std::uint64_t max_output_bytes = kDefaultMaxOutputBytes;
};

/// All bounds must be positive. Throws protocol_error(INVALID_REQUEST).
inline void validate_limits(const resource_limits &limits) {
  if (limits.timeout.count() <= 0)
    throw protocol_error(error_code::invalid_request,
                         "limits.timeout_ms must be positive");
  if (limits.memory_mb == 0)
    throw protocol_error(error_code::invalid_request,
                         "limits.memory_mb must be positive");
  if (limits.cpu_shares && *limits.cpu_shares == 0)
    throw protocol_error(error_code::invalid_request,
                         "limits.cpu_shares must be positive");
  if (limits.max_output_bytes == 0)
    throw protocol_error(error_code::invalid_request,
                         "limits.max_output_bytes must be positive");
}

struct execution_request {
  std::string id;
  language lang = language::python;
  std::string code;
  std::optional<std::string> stdin_data;
  std::map<std::string, std::string> env;
  resource_limits limits;
};

struct resource_usage {
  std::uint64_t peak_memory_mb = 0;
  std::chrono::milliseconds cpu_time{0};
};

/// Final accounting of an execution. exit_code is empty when the process was
/// never reaped (timeout, abandonment, rejection).
struct execution_result {
  std::optional<int> exit_code;
  std::chrono::milliseconds duration{0};
  std::optional<resource_usage> usage;
};

struct load_report {
  std::size_t active_executions = 0;
  std::size_t queue_depth = 0;
};

struct hello_body {
  std::vector<int> offered;
  std::optional<int> selected;
};
struct cancel_body {};
struct ping_body {};
struct ack_body {};
struct status_body {
  exec_status status = exec_status::running;
};
struct output_body {
  std::string data;
};
struct error_body {
  error_code code = error_code::internal_error;
  std::string message;
  bool retryable = true;
};
struct pong_body {
  std::optional<load_report> load;
};

/// Versioned wrapper common to every protocol message. Immutable once built;
/// use the named constructors or make().
class envelope {
public:
  using payload_type =
      std::variant<hello_body, execution_request, cancel_body, ping_body,
                   ack_body, status_body, output_body, execution_result,
                   error_body, pong_body>;

  /// Build an envelope after checking that the payload matches the type and
  /// that execution-scoped types carry an id. Throws INVALID_REQUEST.
  static envelope make(int version, message_type type,
                       std::optional<std::string> execution_id,
                       wall_clock::time_point timestamp, payload_type payload) {
    if (!payload_matches(type, payload))
      throw protocol_error(error_code::invalid_request,
                           "payload does not match type \"" +
                               std::string(to_string(type)) + "\"",
                           execution_id);
    if (requires_execution_id(type) &&
        (!execution_id || execution_id->empty()))
      throw protocol_error(error_code::invalid_request,
                           "\"" + std::string(to_string(type)) +
                               "\" requires an execution id");
    if (auto *req = std::get_if<execution_request>(&payload))
      req->id = *execution_id;
    return envelope(version, type, std::move(execution_id), timestamp,
                    std::move(payload));
  }

  static envelope hello_offer(std::vector<int> versions) {
    return make(kProtocolVersion, message_type::hello, std::nullopt,
                wall_clock::now(), hello_body{std::move(versions), std::nullopt});
  }
  static envelope hello_accept(int version) {
    return make(kProtocolVersion, message_type::hello, std::nullopt,
                wall_clock::now(), hello_body{{}, version});
  }
  static envelope execute(const execution_request &request) {
    return make(kProtocolVersion, message_type::execute, request.id,
                wall_clock::now(), request);
  }
  static envelope cancel(const std::string &id) {
    return make(kProtocolVersion, message_type::cancel, id, wall_clock::now(),
                cancel_body{});
  }
  static envelope ping() {
    return make(kProtocolVersion, message_type::ping, std::nullopt,
                wall_clock::now(), ping_body{});
  }
  static envelope ack(const std::string &id) {
    return make(kProtocolVersion, message_type::ack, id, wall_clock::now(),
                ack_body{});
  }
  static envelope status(const std::string &id, exec_status value) {
    return make(kProtocolVersion, message_type::status, id, wall_clock::now(),
                status_body{value});
  }
  static envelope output(const std::string &id, message_type stream,
                         std::string data) {
    return make(kProtocolVersion, stream, id, wall_clock::now(),
                output_body{std::move(data)});
  }
  static envelope result(const std::string &id, const execution_result &value) {
    return make(kProtocolVersion, message_type::result, id, wall_clock::now(),
                value);
  }
  static envelope error(std::optional<std::string> id, error_code code,
                        const std::string &message) {
    return make(kProtocolVersion, message_type::error, std::move(id),
                wall_clock::now(),
                error_body{code, message, is_retryable(code)});
  }
  static envelope pong(std::optional<load_report> load) {
    return make(kProtocolVersion, message_type::pong, std::nullopt,
                wall_clock::now(), pong_body{load});
  }

  int version() const { return version_; }
  message_type type() const { return type_; }
  const std::optional<std::string> &execution_id() const {
    return execution_id_;
  }
  wall_clock::time_point timestamp() const { return timestamp_; }
  const payload_type &payload() const { return payload_; }

  template <typename T> const T &body() const { return std::get<T>(payload_); }

private:
  envelope(int version, message_type type,
           std::optional<std::string> execution_id,
           wall_clock::time_point timestamp, payload_type payload)
      : version_(version), type_(type), execution_id_(std::move(execution_id)),
        timestamp_(timestamp), payload_(std::move(payload)) {}

  static bool payload_matches(message_type type, const payload_type &payload) {
    switch (type) {
    case message_type::hello:
      return std::holds_alternative<hello_body>(payload);
    case message_type::execute:
      return std::holds_alternative<execution_request>(payload);
    case message_type::cancel:
      return std::holds_alternative<cancel_body>(payload);
    case message_type::ping:
      return std::holds_alternative<ping_body>(payload);
    case message_type::ack:
      return std::holds_alternative<ack_body>(payload);
    case message_type::status:
      return std::holds_alternative<status_body>(payload);
    case message_type::stdout_chunk:
    case message_type::stderr_chunk:
      return std::holds_alternative<output_body>(payload);
    case message_type::result:
      return std::holds_alternative<execution_result>(payload);
    case message_type::error:
      return std::holds_alternative<error_body>(payload);
    case message_type::pong:
      return std::holds_alternative<pong_body>(payload);
    }
    return false;
  }

  int version_;
  message_type type_;
  std::optional<std::string> execution_id_;
  wall_clock::time_point timestamp_;
  payload_type payload_;
};

} // namespace fathom
