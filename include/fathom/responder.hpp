#pragma once

#include "backend.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "execution.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include "watchdog.hpp"
#include "worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fathom {

/// What a responder accepts. Requests outside these bounds are rejected
/// before any ack.
struct responder_options {
  std::vector<language> languages = {language::python, language::javascript,
                                     language::bash};
  std::chrono::milliseconds max_timeout = std::chrono::minutes(5);
  std::uint64_t max_memory_mb = 4096;
  std::uint32_t max_cpu_shares = 1024;
  std::uint64_t max_output_bytes = 16 * 1024 * 1024;
  size_t max_active_executions = 64;
  size_t worker_threads = 2;
};

/// Responder-side state kept next to each execution session.
struct responder_job {
  std::optional<backend_handle> backend;
  /// Trailing bytes of a UTF-8 sequence split across backend reads.
  std::string partial_out;
  std::string partial_err;

  std::string &partial(output_stream stream) {
    return stream == output_stream::out ? partial_out : partial_err;
  }
};

/// Serves one connection: validates execute requests, drives the backend and
/// emits ack/status/stdout/stderr/result/error for every execution.
class responder : public connection_session {
public:
  using handle = execution_registry<responder_job>::handle;

  responder(connection conn, execution_backend &backend,
            responder_options options = {})
      : connection_session(std::move(conn), "responder"), backend_(backend),
        options_(std::move(options)), pool_(options_.worker_threads),
        registry_(pool_),
        watchdog_([this](const std::string &id) { on_deadline(id); }) {}

  ~responder() override { shutdown(); }

  /// Close the connection, abandon live executions and join every thread.
  void shutdown() {
    stop();
    watchdog_.stop();
    pool_.shutdown();
    join_pumps();
  }

  /// Block until the initiator goes away.
  void wait() { wait_closed(); }

  size_t active_executions() const { return registry_.size(); }

  const responder_options &options() const { return options_; }

protected:
  void on_envelope(const envelope &env) override {
    if (!handshaken_) {
      handshake(env);
      return;
    }

    switch (env.type()) {
    case message_type::execute:
      handle_execute(env.body<execution_request>());
      return;
    case message_type::cancel:
      handle_cancel(*env.execution_id());
      return;
    case message_type::hello:
      send(envelope::error(std::nullopt, error_code::invalid_request,
                           "handshake already completed"));
      return;
    case message_type::ping:
      return;
    case message_type::ack:
    case message_type::status:
    case message_type::stdout_chunk:
    case message_type::stderr_chunk:
    case message_type::result:
    case message_type::error:
    case message_type::pong:
      spdlog::warn("responder: ignoring {} from initiator",
                   to_string(env.type()));
      return;
    }
  }

  void on_decode_error(const protocol_error &e) override {
    spdlog::warn("responder: rejecting frame: {}", e.what());
    send(envelope::error(e.execution_id(), e.code(), e.detail()));
    if (!handshaken_)
      close("handshake failed");
  }

  void on_closed(const std::string &reason) override {
    for (auto &h : registry_.drain()) {
      h->post([this, reason](execution_session &s, responder_job &job) {
        if (!s.abandon(reason))
          return;
        watchdog_.disarm(s.id());
        if (job.backend)
          cancel_backend(*job.backend);
        spdlog::warn("responder: execution {} abandoned: {}", s.id(), reason);
      });
    }
  }

  load_report load() const override {
    return load_report{registry_.size(), pool_.backlog()};
  }

private:
  struct pump {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void handshake(const envelope &env) {
    if (env.type() != message_type::hello) {
      send(envelope::error(std::nullopt, error_code::invalid_request,
                           "expected hello before any other message"));
      close("handshake missing");
      return;
    }
    int chosen = 0;
    for (int v : env.body<hello_body>().offered) {
      if (is_supported_version(v))
        chosen = std::max(chosen, v);
    }
    if (chosen == 0) {
      send(envelope::error(std::nullopt, error_code::invalid_request,
                           "unsupported protocol version"));
      close("no common protocol version");
      return;
    }
    set_version(chosen);
    handshaken_ = true;
    send(envelope::hello_accept(chosen));
    spdlog::info("responder: handshake complete, protocol v{}", chosen);
  }

  void validate(const execution_request &req) const {
    if (std::find(options_.languages.begin(), options_.languages.end(),
                  req.lang) == options_.languages.end())
      throw protocol_error(error_code::language_not_supported,
                           "language \"" + std::string(to_string(req.lang)) +
                               "\" is not supported",
                           req.id);
    validate_limits(req.limits);
    const auto &l = req.limits;
    if (l.timeout > options_.max_timeout)
      throw protocol_error(error_code::invalid_request,
                           "limits.timeout_ms exceeds " +
                               std::to_string(options_.max_timeout.count()),
                           req.id);
    if (l.memory_mb > options_.max_memory_mb)
      throw protocol_error(error_code::invalid_request,
                           "limits.memory_mb exceeds " +
                               std::to_string(options_.max_memory_mb),
                           req.id);
    if (l.cpu_shares && *l.cpu_shares > options_.max_cpu_shares)
      throw protocol_error(error_code::invalid_request,
                           "limits.cpu_shares exceeds " +
                               std::to_string(options_.max_cpu_shares),
                           req.id);
    if (l.max_output_bytes > options_.max_output_bytes)
      throw protocol_error(error_code::invalid_request,
                           "limits.max_output_bytes exceeds " +
                               std::to_string(options_.max_output_bytes),
                           req.id);
  }

  /// Rejection before ack: an error and nothing else for this id.
  void reject(const std::string &id, const protocol_error &e) {
    spdlog::info("responder: rejected {}: {}", id, e.what());
    send(envelope::error(id, e.code(), e.detail()));
  }

  void handle_execute(const execution_request &req) {
    try {
      validate(req);
    } catch (const protocol_error &e) {
      reject(req.id, e);
      return;
    }
    if (registry_.size() >= options_.max_active_executions) {
      reject(req.id,
             protocol_error(error_code::sandbox_overloaded,
                            "too many active executions", req.id));
      return;
    }

    handle h;
    try {
      h = registry_.register_execution(req);
    } catch (const protocol_error &e) {
      reject(req.id, e);
      return;
    }
    h->post([this, h](execution_session &s, responder_job &job) {
      begin(h, s, job);
    });
  }

  void begin(const handle &h, execution_session &s, responder_job &job) {
    if (s.terminal())
      return;
    watchdog_.arm(s.id(), s.deadline());
    s.mark_acked();
    send(envelope::ack(s.id()));

    const auto &req = s.request();
    try {
      job.backend = backend_.start(req.lang, req.code, req.stdin_data, req.env,
                                   req.limits);
    } catch (const std::exception &e) {
      spdlog::error("responder: backend failed to start {}: {}", s.id(),
                    e.what());
      fail_internal(h, s, std::string("backend start failed: ") + e.what());
      return;
    }

    s.start_running();
    send(envelope::status(s.id(), exec_status::running));
    spdlog::info("responder: {} running ({})", s.id(), to_string(req.lang));
    launch_pump(h, *job.backend);
  }

  void handle_cancel(const std::string &id) {
    auto h = registry_.find(id);
    if (!h) {
      send(envelope::error(id, error_code::unknown_execution,
                           "unknown execution \"" + id + "\""));
      return;
    }
    h->post([this, h](execution_session &s, responder_job &job) {
      if (s.terminal() || s.cancel_requested())
        return;
      s.request_cancel();
      spdlog::info("responder: cancelling {}", s.id());
      if (job.backend)
        cancel_backend(*job.backend);
      else
        finalize(h, s, exec_status::cancelled, std::nullopt,
                 execution_result{std::nullopt, s.elapsed(), std::nullopt});
    });
  }

  void on_deadline(const std::string &id) {
    auto h = registry_.find(id);
    if (!h)
      return;
    h->post([this, h](execution_session &s, responder_job &job) {
      if (s.terminal())
        return;
      spdlog::info("responder: {} timed out after {}ms", s.id(),
                   s.elapsed().count());
      finalize(h, s, exec_status::timeout,
               error_body{error_code::timeout, "execution deadline elapsed",
                          false},
               execution_result{std::nullopt, s.elapsed(), std::nullopt});
      if (job.backend)
        cancel_backend(*job.backend);
    });
  }

  void launch_pump(const handle &h, backend_handle bh) {
    std::lock_guard<std::mutex> lock(pumps_mu_);
    reap_pumps();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread t([this, h, bh, done]() {
      pump_output(h, bh);
      done->store(true);
    });
    pumps_.push_back(pump{std::move(t), done});
  }

  /// Runs on the execution's pump thread; only posts to the strand.
  void pump_output(const handle &h, backend_handle bh) {
    try {
      while (auto chunk = backend_.poll_output(bh)) {
        h->post([this, h, bh, c = std::move(*chunk)](execution_session &s,
                                                      responder_job &job) {
          on_output(h, s, job, bh, c);
        });
      }
      auto exit = backend_.wait(bh);
      h->post([this, h, exit](execution_session &s, responder_job &job) {
        on_exit(h, s, job, exit);
      });
    } catch (const std::exception &e) {
      std::string message = e.what();
      spdlog::error("responder: backend failure on {}: {}", h->id(), message);
      h->post([this, h, message](execution_session &s, responder_job &job) {
        if (s.terminal())
          return;
        fail_internal(h, s, "backend failure: " + message);
        if (job.backend)
          cancel_backend(*job.backend);
      });
    }
  }

  void on_output(const handle &h, execution_session &s, responder_job &job,
                 backend_handle bh, const output_chunk &chunk) {
    if (s.terminal())
      return;
    auto verdict = s.add_output(chunk.data.size());
    if (verdict.rejected) {
      spdlog::warn("responder: dropping output for {} in state {}", s.id(),
                   to_string(s.status()));
      return;
    }
    // Chunks leave only on character boundaries. An incomplete tail waits for
    // the next read, or is dropped once the budget is spent.
    auto &partial = job.partial(chunk.stream);
    std::string data = partial + chunk.data.substr(0, verdict.accepted);
    partial.clear();
    auto cut = utf8_complete_prefix(data);
    if (!verdict.limit_exceeded)
      partial = data.substr(cut);
    data.resize(cut);
    if (!data.empty())
      send(envelope::output(s.id(), message_for(chunk.stream), data));
    if (!verdict.limit_exceeded)
      return;

    spdlog::info("responder: {} exceeded its output budget", s.id());
    send(envelope::error(s.id(), error_code::output_limit, s.error()->message));
    publish_terminal(h, s,
                     execution_result{std::nullopt, s.elapsed(), std::nullopt});
    cancel_backend(bh);
  }

  void on_exit(const handle &h, execution_session &s, responder_job &job,
               const backend_exit &exit) {
    if (s.terminal())
      return;
    flush_partial(s, job, output_stream::out);
    flush_partial(s, job, output_stream::err);
    std::optional<error_body> err;
    exec_status status;
    if (exit.oom) {
      status = exec_status::oom;
      err = error_body{error_code::oom, "memory limit exceeded", false};
    } else if (s.cancel_requested()) {
      status = exec_status::cancelled;
    } else if (exit.exit_code && *exit.exit_code == 0) {
      status = exec_status::completed;
    } else {
      status = exec_status::failed;
    }
    finalize(h, s, status, err,
             execution_result{exit.exit_code, s.elapsed(), exit.usage});
  }

  /// A sequence the process never finished goes out as-is; the encoder
  /// substitutes U+FFFD.
  void flush_partial(execution_session &s, responder_job &job,
                     output_stream stream) {
    auto &partial = job.partial(stream);
    if (partial.empty())
      return;
    send(envelope::output(s.id(), message_for(stream), partial));
    partial.clear();
  }

  void fail_internal(const handle &h, execution_session &s,
                     const std::string &message) {
    send(envelope::error(s.id(), error_code::internal_error, message));
    finalize(h, s, exec_status::failed,
             error_body{error_code::internal_error, message, true},
             execution_result{std::nullopt, s.elapsed(), std::nullopt});
  }

  bool finalize(const handle &h, execution_session &s, exec_status status,
                std::optional<error_body> err, execution_result result) {
    if (!s.finish(status, std::move(err)))
      return false;
    publish_terminal(h, s, std::move(result));
    return true;
  }

  /// Release the id of a session that just became terminal, then emit its
  /// status and result.
  void publish_terminal(const handle &h, execution_session &s,
                        execution_result result) {
    watchdog_.disarm(s.id());
    registry_.evict(h);
    send(envelope::status(s.id(), s.status()));
    s.attach_result(std::move(result));
    send(envelope::result(s.id(), *s.result()));
    spdlog::info("responder: {} finished {} in {}ms", s.id(),
                 to_string(s.status()), s.result()->duration.count());
  }

  void cancel_backend(backend_handle bh) {
    try {
      backend_.signal_cancel(bh);
    } catch (const std::exception &e) {
      spdlog::error("responder: backend cancel failed: {}", e.what());
    }
  }

  /// Join pump threads that have finished. Caller holds pumps_mu_.
  void reap_pumps() {
    for (auto it = pumps_.begin(); it != pumps_.end();) {
      if (it->done->load()) {
        it->thread.join();
        it = pumps_.erase(it);
      } else {
        ++it;
      }
    }
  }

  void join_pumps() {
    std::vector<pump> pumps;
    {
      std::lock_guard<std::mutex> lock(pumps_mu_);
      pumps.swap(pumps_);
    }
    for (auto &p : pumps) {
      if (p.thread.joinable())
        p.thread.join();
    }
  }

  execution_backend &backend_;
  responder_options options_;
  worker_pool pool_;
  execution_registry<responder_job> registry_;
  deadline_watchdog watchdog_;
  bool handshaken_ = false;

  std::mutex pumps_mu_;
  std::vector<pump> pumps_;
};

} // namespace fathom
