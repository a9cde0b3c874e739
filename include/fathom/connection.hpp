#pragma once

#include "codec.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "transport.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace fathom {

/// One physical connection, shared by both roles. The receive thread only
/// decodes frames, answers pings and hands every other envelope to
/// on_envelope(); execution work happens on strands.
///
/// Derived classes must call stop() from their own destructor so that the
/// receive thread never calls into a half-destroyed object.
class connection_session {
public:
  connection_session(connection conn, std::string role)
      : conn_(std::move(conn)), role_(std::move(role)) {}

  connection_session(const connection_session &) = delete;
  connection_session &operator=(const connection_session &) = delete;

  virtual ~connection_session() {
    stop();
    close_connection(conn_);
  }

  /// Launch the receive thread.
  void start() {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (reader_thread_.joinable() || closed_)
      return;
    reader_thread_ = std::thread([this]() { receive_loop(); });
  }

  /// Close the connection and join the receive thread.
  void stop() {
    close("connection stopped locally");
    std::thread reader;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      reader.swap(reader_thread_);
    }
    if (reader.joinable() && reader.get_id() != std::this_thread::get_id())
      reader.join();
    else if (reader.joinable())
      reader.detach();
  }

  /// Shut the stream down; the receive loop exits and on_closed() fires.
  void close(const std::string &reason) {
    bool expected = false;
    if (!shutdown_.compare_exchange_strong(expected, true))
      return;
    spdlog::debug("{}: closing connection ({})", role_, reason);
    shutdown_connection(conn_);
    std::lock_guard<std::mutex> lock(state_mu_);
    if (!reader_thread_.joinable()) {
      closed_ = true;
      closed_cv_.notify_all();
    }
  }

  /// Serialize and write one envelope. Returns false once the peer is gone.
  bool send(const envelope &env) {
    std::string text;
    try {
      text = encode(env);
    } catch (const std::exception &e) {
      spdlog::error("{}: cannot encode {} {}: {}", role_, to_string(env.type()),
                    env.execution_id().value_or("-"), e.what());
      return false;
    }
    std::lock_guard<std::mutex> lock(send_mu_);
    if (send_failed_)
      return false;
    if (!write_frame(conn_, text)) {
      send_failed_ = true;
      spdlog::warn("{}: send of {} failed, peer gone", role_,
                   to_string(env.type()));
      return false;
    }
    spdlog::debug("{}: sent {} {}", role_, to_string(env.type()),
                  env.execution_id().value_or("-"));
    return true;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return closed_;
  }

  /// Block until the receive loop has ended.
  void wait_closed() {
    std::unique_lock<std::mutex> lock(state_mu_);
    closed_cv_.wait(lock, [this]() { return closed_; });
  }

  /// Negotiated protocol version, 0 before the handshake.
  int version() const { return version_.load(); }

  const std::string &role() const { return role_; }

protected:
  virtual void on_envelope(const envelope &env) = 0;
  virtual void on_closed(const std::string &reason) = 0;
  /// Snapshot reported in pong.
  virtual load_report load() const = 0;

  /// A frame failed to decode. Never attributed to an execution.
  virtual void on_decode_error(const protocol_error &e) {
    spdlog::warn("{}: dropping undecodable frame: {}", role_, e.what());
  }

  void set_version(int version) { version_.store(version); }

  /// Synchronous read of one envelope, for handshakes run before start().
  /// Returns nullopt when the stream ends.
  std::optional<envelope> receive_one() {
    std::string frame;
    while (reader_.read(conn_, frame)) {
      if (!frame.empty())
        return decode(frame);
    }
    return std::nullopt;
  }

private:
  void receive_loop() {
    std::string reason = "peer closed the connection";
    try {
      std::string frame;
      while (reader_.read(conn_, frame)) {
        if (frame.empty())
          continue;
        std::optional<envelope> env;
        try {
          env = decode(frame);
        } catch (const protocol_error &e) {
          on_decode_error(e);
          continue;
        }
        spdlog::debug("{}: received {} {}", role_, to_string(env->type()),
                      env->execution_id().value_or("-"));
        if (env->type() == message_type::ping) {
          send(envelope::pong(load()));
          continue;
        }
        on_envelope(*env);
      }
    } catch (const std::exception &e) {
      reason = e.what();
      spdlog::error("{}: receive loop failed: {}", role_, reason);
    }

    if (shutdown_.load())
      reason = "connection closed locally";
    shutdown_.store(true);
    shutdown_connection(conn_);
    spdlog::info("{}: connection ended: {}", role_, reason);
    on_closed(reason);
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      closed_ = true;
    }
    closed_cv_.notify_all();
  }

  connection conn_;
  std::string role_;
  frame_reader reader_;

  std::mutex send_mu_;
  bool send_failed_ = false;

  mutable std::mutex state_mu_;
  std::condition_variable closed_cv_;
  std::thread reader_thread_;
  bool closed_ = false;
  std::atomic<bool> shutdown_{false};
  std::atomic<int> version_{0};
};

} // namespace fathom
