#pragma once

#include "backend.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "execution.hpp"
#include "protocol.hpp"
#include "reconnect.hpp"
#include "registry.hpp"
#include "transport.hpp"
#include "watchdog.hpp"
#include "worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fathom {

struct initiator_options {
  int heartbeat_interval_ms = 15000;
  int heartbeat_timeout_ms = 5000;
  int reconnect_base_ms = 100;
  int reconnect_max_ms = 30000;
  double reconnect_jitter = 0.0;
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 10000;
  /// Extra time granted to the responder past timeout_ms before the
  /// initiator gives up on a terminal status.
  int timeout_grace_ms = 2000;
  size_t worker_threads = 2;
  bool auto_reconnect = true;
};

/// Everything the caller learns about one execution.
struct execution_outcome {
  std::string id;
  exec_status status = exec_status::pending;
  bool acked = false;
  /// Refused before ack; error holds the reason and there is no result.
  bool rejected = false;
  std::optional<execution_result> result;
  std::optional<error_body> error;
  std::string stdout_data;
  std::string stderr_data;

  bool done() const {
    return rejected || (is_terminal(status) && result.has_value());
  }
  bool retryable() const { return error && error->retryable; }
};

/// Caller-side handle on a submitted execution.
class execution_ticket {
public:
  using output_fn = std::function<void(output_stream, const std::string &)>;

  explicit execution_ticket(std::string id, output_fn on_output = {})
      : on_output_(std::move(on_output)) {
    outcome_.id = std::move(id);
  }

  const std::string &id() const { return outcome_.id; }

  execution_outcome snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return outcome_;
  }

  bool done() const {
    std::lock_guard<std::mutex> lock(mu_);
    return outcome_.done();
  }

  /// Block until the execution reached its outcome.
  execution_outcome wait() const {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return outcome_.done(); });
    return outcome_;
  }

  std::optional<execution_outcome> wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [this]() { return outcome_.done(); }))
      return std::nullopt;
    return outcome_;
  }

private:
  friend class initiator_session;

  void update(const execution_session &s) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      outcome_.status = s.status();
      outcome_.acked = s.acked();
      outcome_.result = s.result();
      outcome_.error = s.error();
    }
    cv_.notify_all();
  }

  void append(output_stream stream, const std::string &data) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      (stream == output_stream::out ? outcome_.stdout_data
                                    : outcome_.stderr_data)
          .append(data);
    }
    if (on_output_)
      on_output_(stream, data);
  }

  void reject(const error_body &err) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      outcome_.status = exec_status::failed;
      outcome_.rejected = true;
      outcome_.error = err;
    }
    cv_.notify_all();
  }

  output_fn on_output_;
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  execution_outcome outcome_;
};

/// Initiator side of one physical connection: tracks the executions it
/// submitted and folds incoming events into their sessions. Lives from a
/// successful handshake until the connection drops; nothing survives it.
class initiator_session
    : public connection_session,
      public std::enable_shared_from_this<initiator_session> {
public:
  using ticket_ptr = std::shared_ptr<execution_ticket>;
  using handle = execution_registry<ticket_ptr>::handle;

  initiator_session(connection conn, worker_pool &pool,
                    deadline_watchdog &watchdog,
                    const initiator_options &options)
      : connection_session(std::move(conn), "initiator"), pool_(pool),
        watchdog_(watchdog), options_(options), registry_(pool) {}

  ~initiator_session() override { stop(); }

  /// Offer our protocol versions and wait for the responder's choice.
  /// Must run before start().
  void handshake() {
    std::vector<int> versions;
    for (int v = kProtocolVersion; v >= kMinProtocolVersion; --v)
      versions.push_back(v);
    if (!send(envelope::hello_offer(versions)))
      throw std::runtime_error("connection closed during handshake");

    auto reply = receive_one();
    if (!reply)
      throw std::runtime_error("connection closed during handshake");
    if (reply->type() == message_type::error) {
      const auto &err = reply->body<error_body>();
      throw protocol_error(err.code, err.message);
    }
    if (reply->type() != message_type::hello)
      throw protocol_error(error_code::invalid_request,
                           "expected hello, got " +
                               std::string(to_string(reply->type())));
    const auto &hello = reply->body<hello_body>();
    if (!hello.selected || !is_supported_version(*hello.selected))
      throw protocol_error(error_code::invalid_request,
                           "responder selected an unsupported version");
    set_version(*hello.selected);
  }

  ticket_ptr submit(execution_request request,
                    execution_ticket::output_fn on_output = {}) {
    validate_limits(request.limits);
    auto ticket =
        std::make_shared<execution_ticket>(request.id, std::move(on_output));
    handle h;
    {
      std::lock_guard<std::mutex> lock(accept_mu_);
      if (!accepting_)
        throw protocol_error(error_code::network_error, "connection lost",
                             request.id);
      h = registry_.register_execution(std::move(request), ticket);
    }

    auto self = shared_from_this();
    auto grace = std::chrono::milliseconds(options_.timeout_grace_ms);
    h->post([self, h, grace](execution_session &s, ticket_ptr &t) {
      if (s.terminal())
        return;
      self->watchdog_.arm(s.id(), s.deadline() + grace);
      if (!self->send(envelope::execute(s.request()))) {
        self->abandon(h, s, *t, "execute could not be sent");
        return;
      }
      spdlog::debug("initiator: submitted {}", s.id());
    });
    return ticket;
  }

  /// Ask the responder to stop an execution. The outcome still arrives
  /// through the ticket; cancel never finalizes anything by itself.
  void cancel(const std::string &id) {
    auto h = registry_.lookup(id);
    auto self = shared_from_this();
    h->post([self](execution_session &s, ticket_ptr &) {
      if (s.terminal() || s.cancel_requested())
        return;
      s.request_cancel();
      self->send(envelope::cancel(s.id()));
    });
  }

  load_report ping(std::chrono::milliseconds timeout) {
    auto waiter = std::make_shared<pong_waiter>();
    {
      std::lock_guard<std::mutex> lock(pongs_mu_);
      pongs_.push_back(waiter);
    }
    if (!send(envelope::ping())) {
      drop_waiter(waiter);
      throw protocol_error(error_code::network_error, "ping could not be sent");
    }
    std::unique_lock<std::mutex> lock(waiter->mu);
    if (!waiter->cv.wait_for(lock, timeout, [&waiter]() { return waiter->done; })) {
      lock.unlock();
      drop_waiter(waiter);
      throw protocol_error(error_code::network_error, "ping timeout");
    }
    if (waiter->failed)
      throw protocol_error(error_code::network_error, "connection lost");
    return waiter->load;
  }

  /// Watchdog expiry: the responder never reported a terminal status.
  void expire(const std::string &id) {
    auto h = registry_.find(id);
    if (!h)
      return;
    auto self = shared_from_this();
    h->post([self, h](execution_session &s, ticket_ptr &t) {
      if (!s.finish(exec_status::timeout,
                    error_body{error_code::timeout,
                               "no terminal status before the deadline",
                               false}))
        return;
      spdlog::warn("initiator: {} timed out locally", s.id());
      s.attach_result(execution_result{std::nullopt, s.elapsed(), std::nullopt});
      self->registry_.evict(h);
      self->send(envelope::cancel(s.id()));
      t->update(s);
    });
  }

  size_t active_executions() const { return registry_.size(); }

protected:
  void on_envelope(const envelope &env) override {
    switch (env.type()) {
    case message_type::ack:
    case message_type::status:
    case message_type::stdout_chunk:
    case message_type::stderr_chunk:
    case message_type::result:
      route(env);
      return;
    case message_type::error:
      handle_error(env);
      return;
    case message_type::pong:
      resolve_pong(env.body<pong_body>());
      return;
    case message_type::ping:
      return;
    case message_type::hello:
    case message_type::execute:
    case message_type::cancel:
      spdlog::warn("initiator: ignoring {} from responder",
                   to_string(env.type()));
      return;
    }
  }

  void on_closed(const std::string &reason) override {
    {
      std::lock_guard<std::mutex> lock(accept_mu_);
      accepting_ = false;
    }
    std::deque<std::shared_ptr<pong_waiter>> waiters;
    {
      std::lock_guard<std::mutex> lock(pongs_mu_);
      waiters.swap(pongs_);
    }
    for (auto &w : waiters) {
      std::lock_guard<std::mutex> lock(w->mu);
      w->done = true;
      w->failed = true;
      w->cv.notify_all();
    }
    auto self = weak_from_this().lock();
    if (!self) {
      spdlog::warn("initiator: session destroyed with {} live executions",
                   registry_.size());
      return;
    }
    for (auto &h : registry_.drain()) {
      h->post([self, h, reason](execution_session &s, ticket_ptr &t) {
        self->abandon(h, s, *t, reason);
      });
    }
  }

  load_report load() const override {
    return load_report{registry_.size(), pool_.backlog()};
  }

private:
  struct pong_waiter {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    bool failed = false;
    load_report load;
  };

  void route(const envelope &env) {
    const auto &id = *env.execution_id();
    auto h = registry_.find(id);
    if (!h) {
      spdlog::warn("initiator: {} for unknown execution {}",
                   to_string(env.type()), id);
      return;
    }
    auto self = shared_from_this();
    h->post([self, h, env](execution_session &s, ticket_ptr &t) {
      self->apply(h, s, *t, env);
    });
  }

  void apply(const handle &h, execution_session &s, execution_ticket &t,
             const envelope &env) {
    switch (env.type()) {
    case message_type::ack:
      if (!s.mark_acked())
        spdlog::warn("initiator: unexpected ack for {} in state {}", s.id(),
                     to_string(s.status()));
      break;
    case message_type::status: {
      auto status = env.body<status_body>().status;
      if (!s.acked())
        spdlog::warn("initiator: status for {} before ack", s.id());
      if (status == exec_status::running) {
        if (!s.start_running())
          spdlog::warn("initiator: late running status for {}", s.id());
      } else if (s.finish(status)) {
        watchdog_.disarm(s.id());
      } else {
        spdlog::debug("initiator: dropped second terminal status {} for {}",
                      to_string(status), s.id());
      }
      break;
    }
    case message_type::stdout_chunk:
    case message_type::stderr_chunk: {
      const auto &data = env.body<output_body>().data;
      auto verdict = s.add_output(data.size());
      if (verdict.rejected) {
        spdlog::warn("initiator: dropping output for {} in state {}", s.id(),
                     to_string(s.status()));
        break;
      }
      auto stream = env.type() == message_type::stdout_chunk
                        ? output_stream::out
                        : output_stream::err;
      if (verdict.accepted > 0)
        t.append(stream, verdict.accepted == data.size()
                             ? data
                             : data.substr(0, verdict.accepted));
      if (verdict.limit_exceeded) {
        spdlog::warn("initiator: {} exceeded its output budget", s.id());
        watchdog_.disarm(s.id());
        s.attach_result(
            execution_result{std::nullopt, s.elapsed(), std::nullopt});
        send(envelope::cancel(s.id()));
      }
      break;
    }
    case message_type::result:
      if (!s.terminal()) {
        spdlog::warn("initiator: result for {} before terminal status",
                     s.id());
        break;
      }
      if (!s.attach_result(env.body<execution_result>()))
        spdlog::debug("initiator: duplicate result for {}", s.id());
      break;
    default:
      break;
    }

    if (s.terminal() && s.result() && registry_.evict(h))
      spdlog::info("initiator: {} finished {}", s.id(), to_string(s.status()));
    t.update(s);
  }

  void handle_error(const envelope &env) {
    const auto &err = env.body<error_body>();
    if (!env.execution_id()) {
      spdlog::warn("initiator: connection error {}: {}", to_string(err.code),
                   err.message);
      return;
    }
    auto h = registry_.find(*env.execution_id());
    if (!h) {
      spdlog::info("initiator: error {} for unknown execution {}: {}",
                   to_string(err.code), *env.execution_id(), err.message);
      return;
    }
    auto self = shared_from_this();
    h->post([self, h, err](execution_session &s, ticket_ptr &t) {
      if (s.terminal())
        return;
      if (s.acked()) {
        // Protocol errors after ack answer a stray request (a repeated
        // execute or cancel), not this run.
        if (classify(err.code) == error_class::protocol) {
          spdlog::info("initiator: ignoring {} for running {}: {}",
                       to_string(err.code), s.id(), err.message);
          return;
        }
        s.note_error(err);
        t->update(s);
        return;
      }
      // Rejected before ack: the execution never existed on the responder.
      s.finish(exec_status::failed, err);
      self->watchdog_.disarm(s.id());
      self->registry_.evict(h);
      t->reject(err);
      spdlog::info("initiator: {} rejected: {} {}", s.id(),
                   to_string(err.code), err.message);
    });
  }

  void abandon(const handle &h, execution_session &s, execution_ticket &t,
               const std::string &reason) {
    if (!s.abandon(reason))
      return;
    watchdog_.disarm(s.id());
    registry_.evict(h);
    t.update(s);
    spdlog::warn("initiator: {} abandoned: {}", s.id(), reason);
  }

  void resolve_pong(const pong_body &pong) {
    std::shared_ptr<pong_waiter> waiter;
    {
      std::lock_guard<std::mutex> lock(pongs_mu_);
      if (pongs_.empty()) {
        spdlog::debug("initiator: unsolicited pong");
        return;
      }
      waiter = pongs_.front();
      pongs_.pop_front();
    }
    std::lock_guard<std::mutex> lock(waiter->mu);
    waiter->load = pong.load.value_or(load_report{});
    waiter->done = true;
    waiter->cv.notify_all();
  }

  void drop_waiter(const std::shared_ptr<pong_waiter> &waiter) {
    std::lock_guard<std::mutex> lock(pongs_mu_);
    for (auto it = pongs_.begin(); it != pongs_.end(); ++it) {
      if (*it == waiter) {
        pongs_.erase(it);
        return;
      }
    }
  }

  worker_pool &pool_;
  deadline_watchdog &watchdog_;
  initiator_options options_;
  execution_registry<ticket_ptr> registry_;

  std::mutex accept_mu_;
  bool accepting_ = true;

  std::mutex pongs_mu_;
  std::deque<std::shared_ptr<pong_waiter>> pongs_;
};

/// Long-lived initiator: dials the responder, keeps the connection alive
/// with heartbeats and reconnects with backoff. Executions never outlive the
/// connection they were submitted on.
class initiator {
public:
  explicit initiator(initiator_options options = {})
      : options_(options), pool_(options_.worker_threads),
        watchdog_([this](const std::string &id) { on_deadline(id); }),
        policy_(std::chrono::milliseconds(options_.reconnect_base_ms),
                std::chrono::milliseconds(options_.reconnect_max_ms),
                options_.reconnect_jitter) {}

  initiator(const initiator &) = delete;
  initiator &operator=(const initiator &) = delete;

  ~initiator() {
    close();
    watchdog_.stop();
    pool_.shutdown();
  }

  /// Dial a tcp:// or unix:// responder and keep reconnecting until close().
  void connect(const std::string &uri) {
    if (uri.empty())
      throw std::invalid_argument("uri is required");
    auto parsed = parse_uri(uri);
    if (parsed.scheme != "tcp" && parsed.scheme != "unix")
      throw std::invalid_argument("connect() supports tcp:// and unix:// only; "
                                  "use attach() for " + parsed.scheme + "://");

    close();
    endpoint_ = uri;
    policy_.reset();
    begin_run();

    io_thread_ = std::thread([this]() { io_loop(); });
    start_heartbeat();

    std::unique_lock<std::mutex> lock(state_mu_);
    bool ready = connected_cv_.wait_for(
        lock, std::chrono::milliseconds(options_.connect_timeout_ms),
        [this]() { return session_ != nullptr || !running_.load(); });
    if (!ready || session_ == nullptr) {
      std::string error =
          last_error_.empty() ? "fathom connect timeout" : last_error_;
      lock.unlock();
      close();
      throw std::runtime_error(error);
    }
  }

  /// Run the protocol over an already open stream (mem://, stdio://). There
  /// is no reconnect: once the stream ends the initiator stays disconnected.
  void attach(connection conn) {
    close();
    begin_run();
    auto session = establish(std::move(conn));
    if (!session) {
      std::string error = last_error();
      close();
      throw std::runtime_error(error);
    }
    io_thread_ = std::thread([this, session]() {
      session->wait_closed();
      retire(session);
      give_up();
    });
    start_heartbeat();
  }

  std::shared_ptr<execution_ticket>
  submit(execution_request request,
         execution_ticket::output_fn on_output = {}) {
    auto session = wait_session(options_.connect_timeout_ms);
    return session->submit(std::move(request), std::move(on_output));
  }

  /// Throws UNKNOWN_EXECUTION when the id is not live on this connection.
  void cancel(const std::string &id) {
    auto session = current();
    if (!session)
      throw protocol_error(error_code::unknown_execution,
                           "unknown execution \"" + id + "\"", id);
    session->cancel(id);
  }

  load_report ping(int timeout_ms = -1) {
    auto session = wait_session(options_.connect_timeout_ms);
    int timeout = timeout_ms > 0 ? timeout_ms : options_.request_timeout_ms;
    return session->ping(std::chrono::milliseconds(timeout));
  }

  bool connected() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return session_ != nullptr;
  }

  size_t active_executions() const {
    auto session = current();
    return session ? session->active_executions() : 0;
  }

  /// Number of connections established (handshake completed) so far.
  int connections() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return established_;
  }

  std::string last_error() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return last_error_;
  }

  void close() {
    if (!running_.load() && closed_.load())
      return;

    {
      std::lock_guard<std::mutex> lock(state_mu_);
      closed_.store(true);
      running_.store(false);
    }
    connected_cv_.notify_all();
    if (auto session = current())
      session->close("initiator closed");

    if (io_thread_.joinable())
      io_thread_.join();
    if (heartbeat_thread_.joinable())
      heartbeat_thread_.join();
  }

private:
  void begin_run() {
    running_.store(true);
    closed_.store(false);
    std::lock_guard<std::mutex> lock(state_mu_);
    last_error_.clear();
  }

  void start_heartbeat() {
    if (options_.heartbeat_interval_ms > 0)
      heartbeat_thread_ = std::thread([this]() { heartbeat_loop(); });
  }

  std::shared_ptr<initiator_session> current() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return session_;
  }

  std::shared_ptr<initiator_session> wait_session(int timeout_ms) {
    std::unique_lock<std::mutex> lock(state_mu_);
    bool ready = connected_cv_.wait_for(
        lock, std::chrono::milliseconds(timeout_ms),
        [this]() { return session_ != nullptr || !running_.load(); });
    if (!ready || session_ == nullptr)
      throw protocol_error(error_code::network_error,
                           last_error_.empty() ? "not connected" : last_error_);
    return session_;
  }

  std::shared_ptr<initiator_session> establish(connection conn) {
    auto session = std::make_shared<initiator_session>(std::move(conn), pool_,
                                                       watchdog_, options_);
    try {
      session->handshake();
    } catch (const std::exception &e) {
      spdlog::warn("initiator: handshake failed: {}", e.what());
      std::lock_guard<std::mutex> lock(state_mu_);
      last_error_ = std::string("handshake failed: ") + e.what();
      return nullptr;
    }
    session->start();
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      session_ = session;
      last_error_.clear();
      ++established_;
    }
    connected_cv_.notify_all();
    spdlog::info("initiator: connected, protocol v{}", session->version());
    return session;
  }

  void retire(const std::shared_ptr<initiator_session> &session) {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (session_ == session)
        session_.reset();
      last_error_ = "connection lost";
    }
    connected_cv_.notify_all();
    session->stop();
  }

  void io_loop() {
    while (running_.load()) {
      auto delay = policy_.next_delay();
      if (delay.count() > 0) {
        spdlog::info("initiator: reconnecting to {} in {}ms (attempt {})",
                     endpoint_, delay.count(), policy_.attempt());
        sleep_interruptible(delay);
        if (!running_.load())
          return;
      }

      std::shared_ptr<initiator_session> session;
      try {
        session = establish(dial(endpoint_));
      } catch (const std::runtime_error &e) {
        spdlog::warn("initiator: {}", e.what());
        std::lock_guard<std::mutex> lock(state_mu_);
        last_error_ = e.what();
      }
      if (session) {
        policy_.reset();
        if (!running_.load())
          session->close("initiator closed");
        session->wait_closed();
        retire(session);
      }
      if (!options_.auto_reconnect) {
        give_up();
        return;
      }
    }
  }

  void give_up() {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      running_.store(false);
    }
    connected_cv_.notify_all();
  }

  void heartbeat_loop() {
    while (running_.load()) {
      sleep_interruptible(
          std::chrono::milliseconds(options_.heartbeat_interval_ms));
      if (!running_.load())
        return;
      auto session = current();
      if (!session)
        continue;
      try {
        (void)session->ping(
            std::chrono::milliseconds(options_.heartbeat_timeout_ms));
      } catch (const protocol_error &e) {
        spdlog::warn("initiator: heartbeat failed: {}", e.what());
        session->close("heartbeat timeout");
      }
    }
  }

  void sleep_interruptible(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(state_mu_);
    connected_cv_.wait_for(lock, duration,
                           [this]() { return !running_.load(); });
  }

  void on_deadline(const std::string &id) {
    if (auto session = current())
      session->expire(id);
  }

  initiator_options options_;
  worker_pool pool_;
  deadline_watchdog watchdog_;
  reconnect_policy policy_;

  mutable std::mutex state_mu_;
  std::condition_variable connected_cv_;
  std::shared_ptr<initiator_session> session_;
  std::string last_error_;
  int established_ = 0;

  std::string endpoint_;
  std::atomic<bool> running_{false};
  std::atomic<bool> closed_{true};
  std::thread io_thread_;
  std::thread heartbeat_thread_;
};

} // namespace fathom
