#include "fathom/fathom.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

// Dial a responder, complete the handshake and print its load report.
//
//   fathom_ping [--connect tcp://host:port | --port N]
int main(int argc, char **argv) {
  spdlog::cfg::load_env_levels();

  std::vector<std::string> args(argv + 1, argv + argc);
  std::string uri = fathom::parse_flags(args);

  fathom::initiator_options options;
  options.auto_reconnect = false;
  options.heartbeat_interval_ms = 0;

  fathom::initiator client(options);
  try {
    client.connect(uri);
    auto load = client.ping();
    std::printf("%s: active_executions=%zu queue_depth=%zu\n", uri.c_str(),
                load.active_executions, load.queue_depth);
  } catch (const fathom::protocol_error &e) {
    spdlog::error("ping {} failed: {} {}", uri, fathom::to_string(e.code()),
                  e.detail());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("ping {} failed: {}", uri, e.what());
    return 1;
  }
  client.close();
  return 0;
}
