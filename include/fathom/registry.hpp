#pragma once

#include "errors.hpp"
#include "execution.hpp"
#include "worker_pool.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fathom {

/// Single-owner access to one execution. The session and the role-specific
/// context are only reachable through post(), which runs the callback on the
/// execution's strand: callbacks for one id never overlap and run in the
/// order they were posted.
template <typename Context>
class execution_handle
    : public std::enable_shared_from_this<execution_handle<Context>> {
public:
  using callback = std::function<void(execution_session &, Context &)>;

  execution_handle(execution_request request, std::shared_ptr<strand> owner,
                   Context context)
      : id_(request.id), strand_(std::move(owner)),
        session_(std::move(request)), context_(std::move(context)) {}

  execution_handle(const execution_handle &) = delete;
  execution_handle &operator=(const execution_handle &) = delete;

  const std::string &id() const { return id_; }

  /// Returns false when the worker pool no longer accepts work.
  bool post(callback fn) {
    auto self = this->shared_from_this();
    return strand_->post([self, fn = std::move(fn)]() {
      fn(self->session_, self->context_);
    });
  }

private:
  std::string id_;
  std::shared_ptr<strand> strand_;
  execution_session session_;
  Context context_;
};

/// Map from execution id to its live handle. The only shared mutable
/// structure of a connection; insert, lookup and evict take one mutex.
template <typename Context> class execution_registry {
public:
  using handle = std::shared_ptr<execution_handle<Context>>;

  explicit execution_registry(worker_pool &pool) : pool_(pool) {}

  /// Create the session for a new id. Throws INVALID_REQUEST when the id is
  /// already live on this connection.
  handle register_execution(execution_request request, Context context = {}) {
    if (request.id.empty())
      throw protocol_error(error_code::invalid_request,
                           "execution id must not be empty");
    auto id = request.id;
    std::lock_guard<std::mutex> lock(mu_);
    if (entries_.count(id) != 0)
      throw protocol_error(error_code::invalid_request,
                           "execution \"" + id + "\" is already registered",
                           id);
    auto h = std::make_shared<execution_handle<Context>>(
        std::move(request), std::make_shared<strand>(pool_),
        std::move(context));
    entries_.emplace(id, h);
    return h;
  }

  /// Throws UNKNOWN_EXECUTION when the id is not live.
  handle lookup(const std::string &id) const {
    auto h = find(id);
    if (!h)
      throw protocol_error(error_code::unknown_execution,
                           "unknown execution \"" + id + "\"", id);
    return h;
  }

  handle find(const std::string &id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
  }

  bool evict(const std::string &id) {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.erase(id) != 0;
  }

  /// Evict only if id still maps to this exact handle.
  bool evict(const handle &h) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(h->id());
    if (it == entries_.end() || it->second != h)
      return false;
    entries_.erase(it);
    return true;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
  }

  /// Evict everything, handing the handles back to the caller.
  std::vector<handle> drain() {
    std::unordered_map<std::string, handle> snapshot;
    {
      std::lock_guard<std::mutex> lock(mu_);
      snapshot.swap(entries_);
    }
    std::vector<handle> out;
    out.reserve(snapshot.size());
    for (auto &kv : snapshot)
      out.push_back(std::move(kv.second));
    return out;
  }

private:
  worker_pool &pool_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, handle> entries_;
};

} // namespace fathom
