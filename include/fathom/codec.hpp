#pragma once

#include "errors.hpp"
#include "protocol.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace fathom {

/// ISO-8601 UTC with milliseconds, e.g. 2026-10-19T08:15:30.250Z.
inline std::string format_timestamp(wall_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count();
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  int millis = static_cast<int>(ms % 1000);
  if (millis < 0) {
    millis += 1000;
    --secs;
  }
  std::tm tm{};
  ::gmtime_r(&secs, &tm);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, millis);
  return buf;
}

/// Inverse of format_timestamp. Fractional seconds are optional on input.
inline std::optional<wall_clock::time_point>
parse_timestamp(const std::string &text) {
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year,
                  &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min,
                  &tm.tm_sec, &consumed) != 6)
    return std::nullopt;

  std::string_view rest(text);
  rest.remove_prefix(static_cast<size_t>(consumed));
  int millis = 0;
  if (!rest.empty() && rest.front() == '.') {
    rest.remove_prefix(1);
    int digits = 0;
    while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9') {
      if (digits < 3)
        millis = millis * 10 + (rest.front() - '0');
      ++digits;
      rest.remove_prefix(1);
    }
    if (digits == 0)
      return std::nullopt;
    for (; digits < 3; ++digits)
      millis *= 10;
  }
  if (rest != "Z")
    return std::nullopt;

  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
      tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
    return std::nullopt;
  std::time_t secs = ::timegm(&tm);
  return wall_clock::time_point(std::chrono::seconds(secs) +
                                std::chrono::milliseconds(millis));
}

namespace detail {

using json = nlohmann::json;

struct field_reader {
  const json &obj;
  const std::optional<std::string> &id;

  [[noreturn]] void fail(const std::string &message) const {
    throw protocol_error(error_code::invalid_request, message, id);
  }

  const json *find(const char *key) const {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return nullptr;
    return &*it;
  }

  std::string string(const char *key) const {
    auto *v = find(key);
    if (v == nullptr)
      fail(std::string("missing field \"") + key + "\"");
    if (!v->is_string())
      fail(std::string("field \"") + key + "\" must be a string");
    return v->get<std::string>();
  }

  std::optional<std::string> optional_string(const char *key) const {
    if (find(key) == nullptr)
      return std::nullopt;
    return string(key);
  }

  std::int64_t integer(const char *key) const {
    auto *v = find(key);
    if (v == nullptr)
      fail(std::string("missing field \"") + key + "\"");
    return integer_value(*v, std::string("field \"") + key + "\"");
  }

  std::int64_t integer_value(const json &v, const std::string &what) const {
    if (!v.is_number_integer())
      fail(what + " must be an integer");
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
      fail(what + " is out of range");
    return v.get<std::int64_t>();
  }

  /// Narrow a decoded integer, refusing values the target cannot hold.
  template <typename T> T narrow(std::int64_t n, const std::string &what) const {
    if (n < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
        n > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
      fail(what + " is out of range");
    return static_cast<T>(n);
  }

  std::uint64_t count(const char *key) const {
    auto n = integer(key);
    if (n < 0)
      fail(std::string("field \"") + key + "\" must not be negative");
    return static_cast<std::uint64_t>(n);
  }

  std::optional<std::uint64_t> optional_count(const char *key) const {
    if (find(key) == nullptr)
      return std::nullopt;
    return count(key);
  }

  field_reader object(const char *key) const {
    auto *v = find(key);
    if (v == nullptr)
      fail(std::string("missing field \"") + key + "\"");
    if (!v->is_object())
      fail(std::string("field \"") + key + "\" must be an object");
    return field_reader{*v, id};
  }
};

inline execution_request decode_execute(const field_reader &in) {
  execution_request req;
  auto lang_name = in.string("language");
  auto lang = parse_language(lang_name);
  if (!lang)
    throw protocol_error(error_code::language_not_supported,
                         "unknown language \"" + lang_name + "\"", in.id);
  req.lang = *lang;
  req.code = in.string("code");
  req.stdin_data = in.optional_string("stdin");

  if (auto *env = in.find("env")) {
    if (!env->is_object())
      in.fail("field \"env\" must be an object");
    for (auto it = env->begin(); it != env->end(); ++it) {
      if (!it.value().is_string())
        in.fail("env value for \"" + it.key() + "\" must be a string");
      req.env[it.key()] = it.value().get<std::string>();
    }
  }

  auto limits = in.object("limits");
  req.limits.timeout = std::chrono::milliseconds(limits.count("timeout_ms"));
  req.limits.memory_mb = limits.count("memory_mb");
  if (auto shares = limits.optional_count("cpu_shares"))
    req.limits.cpu_shares = limits.narrow<std::uint32_t>(
        static_cast<std::int64_t>(*shares), "field \"cpu_shares\"");
  if (auto max_out = limits.optional_count("max_output_bytes"))
    req.limits.max_output_bytes = *max_out;
  return req;
}

inline execution_result decode_result(const field_reader &in) {
  execution_result res;
  if (auto *code = in.find("exit_code")) {
    if (!code->is_number_integer())
      in.fail("field \"exit_code\" must be an integer or null");
    res.exit_code = in.narrow<int>(in.integer_value(*code, "field \"exit_code\""),
                                   "field \"exit_code\"");
  }
  res.duration = std::chrono::milliseconds(in.count("duration_ms"));
  if (in.find("resource_usage") != nullptr) {
    auto usage = in.object("resource_usage");
    resource_usage u;
    u.peak_memory_mb = usage.optional_count("peak_memory_mb").value_or(0);
    u.cpu_time =
        std::chrono::milliseconds(usage.optional_count("cpu_time_ms").value_or(0));
    res.usage = u;
  }
  return res;
}

inline envelope::payload_type decode_payload(message_type type,
                                             const field_reader &in) {
  switch (type) {
  case message_type::hello: {
    hello_body body;
    if (auto *offered = in.find("versions")) {
      if (!offered->is_array())
        in.fail("field \"versions\" must be an array");
      for (const auto &v : *offered) {
        if (!v.is_number_integer())
          in.fail("field \"versions\" must hold integers");
        body.offered.push_back(in.narrow<int>(
            in.integer_value(v, "field \"versions\""), "field \"versions\""));
      }
    }
    if (in.find("version") != nullptr)
      body.selected =
          in.narrow<int>(in.integer("version"), "field \"version\"");
    if (body.offered.empty() && !body.selected)
      in.fail("hello requires \"versions\" or \"version\"");
    return body;
  }
  case message_type::execute:
    return decode_execute(in);
  case message_type::cancel:
    return cancel_body{};
  case message_type::ping:
    return ping_body{};
  case message_type::ack:
    return ack_body{};
  case message_type::status: {
    auto name = in.string("status");
    auto status = parse_status(name);
    if (!status)
      in.fail("unknown status \"" + name + "\"");
    return status_body{*status};
  }
  case message_type::stdout_chunk:
  case message_type::stderr_chunk:
    return output_body{in.string("data")};
  case message_type::result:
    return decode_result(in);
  case message_type::error: {
    auto name = in.string("code");
    auto code = parse_error_code(name);
    if (!code)
      in.fail("unknown error code \"" + name + "\"");
    error_body body{*code, in.optional_string("message").value_or(""),
                    is_retryable(*code)};
    if (auto *retryable = in.find("retryable")) {
      if (!retryable->is_boolean())
        in.fail("field \"retryable\" must be a boolean");
      body.retryable = retryable->get<bool>();
    }
    return body;
  }
  case message_type::pong: {
    pong_body body;
    if (in.find("load") != nullptr) {
      auto load = in.object("load");
      body.load = load_report{
          static_cast<std::size_t>(load.count("active_executions")),
          static_cast<std::size_t>(load.optional_count("queue_depth").value_or(0))};
    }
    return body;
  }
  }
  in.fail("unrecognized type");
}

struct payload_encoder {
  json &out;

  void operator()(const hello_body &body) const {
    if (!body.offered.empty())
      out["versions"] = body.offered;
    if (body.selected)
      out["version"] = *body.selected;
  }
  void operator()(const execution_request &req) const {
    out["language"] = std::string(to_string(req.lang));
    out["code"] = req.code;
    if (req.stdin_data)
      out["stdin"] = *req.stdin_data;
    if (!req.env.empty())
      out["env"] = req.env;
    json limits = {{"timeout_ms", req.limits.timeout.count()},
                   {"memory_mb", req.limits.memory_mb},
                   {"max_output_bytes", req.limits.max_output_bytes}};
    if (req.limits.cpu_shares)
      limits["cpu_shares"] = *req.limits.cpu_shares;
    out["limits"] = limits;
  }
  void operator()(const cancel_body &) const {}
  void operator()(const ping_body &) const {}
  void operator()(const ack_body &) const {}
  void operator()(const status_body &body) const {
    out["status"] = std::string(to_string(body.status));
  }
  void operator()(const output_body &body) const { out["data"] = body.data; }
  void operator()(const execution_result &res) const {
    out["exit_code"] = res.exit_code ? json(*res.exit_code) : json(nullptr);
    out["duration_ms"] = res.duration.count();
    if (res.usage)
      out["resource_usage"] = {{"peak_memory_mb", res.usage->peak_memory_mb},
                               {"cpu_time_ms", res.usage->cpu_time.count()}};
  }
  void operator()(const error_body &body) const {
    out["code"] = std::string(to_string(body.code));
    out["message"] = body.message;
    out["retryable"] = body.retryable;
  }
  void operator()(const pong_body &body) const {
    if (body.load)
      out["load"] = {{"active_executions", body.load->active_executions},
                     {"queue_depth", body.load->queue_depth}};
  }
};

} // namespace detail

/// Serialize an envelope to a single-line JSON document.
inline std::string encode(const envelope &env) {
  detail::json out = detail::json::object();
  out["v"] = env.version();
  out["type"] = std::string(to_string(env.type()));
  if (env.execution_id())
    out["id"] = *env.execution_id();
  out["ts"] = format_timestamp(env.timestamp());
  std::visit(detail::payload_encoder{out}, env.payload());
  // Bytes that are not valid UTF-8 go out as U+FFFD.
  return out.dump(-1, ' ', false, detail::json::error_handler_t::replace);
}

/// Length of the longest prefix of `data` that does not end inside a UTF-8
/// sequence. Stray or malformed bytes count as complete.
inline std::size_t utf8_complete_prefix(std::string_view data) {
  std::size_t n = data.size();
  std::size_t start = n;
  while (start > 0 && n - start < 4 &&
         (static_cast<unsigned char>(data[start - 1]) & 0xC0) == 0x80)
    --start;
  if (start == 0)
    return n;
  auto lead = static_cast<unsigned char>(data[start - 1]);
  if (lead < 0xC0 || lead >= 0xF8)
    return n;
  std::size_t need = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : 2;
  return n - (start - 1) < need ? start - 1 : n;
}

/// Parse and validate one envelope. Throws protocol_error; the error carries
/// the raw "id" when the document had one.
inline envelope decode(std::string_view bytes) {
  detail::json doc;
  try {
    doc = detail::json::parse(bytes.begin(), bytes.end());
  } catch (const detail::json::parse_error &e) {
    throw protocol_error(error_code::invalid_request,
                         std::string("malformed JSON: ") + e.what());
  }
  if (!doc.is_object())
    throw protocol_error(error_code::invalid_request,
                         "envelope must be a JSON object");

  std::optional<std::string> id;
  auto id_it = doc.find("id");
  if (id_it != doc.end() && id_it->is_string())
    id = id_it->get<std::string>();
  detail::field_reader in{doc, id};

  auto version = in.integer("v");
  if (!is_supported_version(version))
    in.fail("unsupported protocol version " + std::to_string(version));

  auto type_name = in.string("type");
  auto type = parse_message_type(type_name);
  if (!type)
    in.fail("unrecognized type \"" + type_name + "\"");

  auto ts = parse_timestamp(in.string("ts"));
  if (!ts)
    in.fail("field \"ts\" must be an ISO-8601 UTC timestamp");

  if (id_it != doc.end() && !id_it->is_null() && !id_it->is_string())
    in.fail("field \"id\" must be a string");

  auto payload = detail::decode_payload(*type, in);
  return envelope::make(static_cast<int>(version), *type, id, *ts,
                        std::move(payload));
}

} // namespace fathom
