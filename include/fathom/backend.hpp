#pragma once

#include "protocol.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace fathom {

using backend_handle = std::uint64_t;

enum class output_stream { out, err };

struct output_chunk {
  output_stream stream = output_stream::out;
  std::string data;
};

/// How the backend saw the process end.
struct backend_exit {
  std::optional<int> exit_code;
  std::optional<resource_usage> usage;
  /// The process was killed for exceeding its memory bound.
  bool oom = false;
};

/// The isolation mechanism that actually runs code. The responder drives it
/// from one pump thread per execution; any exception it throws is reported
/// to the peer as INTERNAL_ERROR.
///
/// After signal_cancel() the backend must end the output stream and let
/// wait() return promptly.
class execution_backend {
public:
  virtual ~execution_backend() = default;

  virtual backend_handle start(language lang, const std::string &code,
                               const std::optional<std::string> &stdin_data,
                               const std::map<std::string, std::string> &env,
                               const resource_limits &limits) = 0;

  virtual void signal_cancel(backend_handle handle) = 0;

  /// Block for the next chunk; nullopt means EOF on both streams.
  virtual std::optional<output_chunk> poll_output(backend_handle handle) = 0;

  /// Block until the process is reaped.
  virtual backend_exit wait(backend_handle handle) = 0;
};

inline message_type message_for(output_stream stream) {
  return stream == output_stream::out ? message_type::stdout_chunk
                                      : message_type::stderr_chunk;
}

} // namespace fathom
