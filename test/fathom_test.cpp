#include "../include/fathom/fathom.hpp"

#include <spdlog/cfg/env.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using json = nlohmann::json;

fathom::execution_request make_request(const std::string &id,
                                       std::uint64_t max_output = 1024) {
  fathom::execution_request req;
  req.id = id;
  req.lang = fathom::language::python;
  req.code = "print(1)";
  req.limits.timeout = 5000ms;
  req.limits.memory_mb = 128;
  req.limits.max_output_bytes = max_output;
  return req;
}

template <typename Fn> fathom::error_code error_of(Fn &&fn) {
  try {
    fn();
  } catch (const fathom::protocol_error &e) {
    return e.code();
  }
  assert(false && "expected protocol_error");
  return fathom::error_code::internal_error;
}

const char *kExecuteLine =
    R"({"v":1,"type":"execute","id":"e1","ts":"2026-10-19T08:15:30.250Z",)"
    R"j("language":"python","code":"print(1)","env":{"A":"b"},)j"
    R"("limits":{"timeout_ms":5000,"memory_mb":128}})";

} // namespace

int main() {
  spdlog::cfg::load_env_levels();
  int passed = 0;

  // --- error taxonomy ---
  assert(fathom::classify(fathom::error_code::output_limit) ==
         fathom::error_class::resource);
  ++passed;
  assert(fathom::classify(fathom::error_code::unknown_execution) ==
         fathom::error_class::protocol);
  ++passed;
  assert(!fathom::is_retryable(fathom::error_code::timeout));
  assert(!fathom::is_retryable(fathom::error_code::language_not_supported));
  assert(fathom::is_retryable(fathom::error_code::sandbox_overloaded));
  assert(fathom::is_retryable(fathom::error_code::network_error));
  ++passed;
  assert(fathom::to_string(fathom::error_code::language_not_supported) ==
         "LANGUAGE_NOT_SUPPORTED");
  assert(fathom::parse_error_code("INTERNAL_ERROR") ==
         fathom::error_code::internal_error);
  assert(!fathom::parse_error_code("internal_error"));
  ++passed;
  {
    fathom::protocol_error e(fathom::error_code::unknown_execution, "gone",
                             std::string("x1"));
    assert(std::string(e.what()) == "UNKNOWN_EXECUTION: gone");
    assert(e.detail() == "gone");
    assert(e.execution_id() == std::string("x1"));
    assert(!e.retryable());
    ++passed;
  }

  // --- data model ---
  assert(fathom::parse_language("rust") == fathom::language::rust);
  assert(!fathom::parse_language("cobol"));
  ++passed;
  assert(!fathom::parse_status("pending"));
  assert(fathom::parse_status("oom") == fathom::exec_status::oom);
  assert(!fathom::is_terminal(fathom::exec_status::running));
  assert(fathom::is_terminal(fathom::exec_status::cancelled));
  ++passed;
  assert(fathom::to_string(fathom::message_type::stdout_chunk) == "stdout");
  assert(fathom::parse_message_type("stderr") ==
         fathom::message_type::stderr_chunk);
  assert(!fathom::parse_message_type("exec"));
  ++passed;
  {
    auto limits = make_request("x").limits;
    limits.timeout = 0ms;
    assert(error_of([&]() { fathom::validate_limits(limits); }) ==
           fathom::error_code::invalid_request);
    ++passed;
  }

  // --- envelope construction ---
  assert(error_of([]() {
           (void)fathom::envelope::make(1, fathom::message_type::status, "e1",
                                        fathom::wall_clock::now(),
                                        fathom::ack_body{});
         }) == fathom::error_code::invalid_request);
  ++passed;
  assert(error_of([]() {
           (void)fathom::envelope::make(1, fathom::message_type::ack,
                                        std::nullopt,
                                        fathom::wall_clock::now(),
                                        fathom::ack_body{});
         }) == fathom::error_code::invalid_request);
  ++passed;
  {
    auto err = fathom::envelope::error(std::string("e9"),
                                       fathom::error_code::sandbox_overloaded,
                                       "busy");
    assert(err.body<fathom::error_body>().retryable);
    ++passed;
  }

  // --- timestamps ---
  {
    auto tp = fathom::parse_timestamp("2026-10-19T08:15:30.250Z");
    assert(tp);
    assert(fathom::format_timestamp(*tp) == "2026-10-19T08:15:30.250Z");
    ++passed;
    auto whole = fathom::parse_timestamp("2026-10-19T08:15:30Z");
    assert(whole);
    assert(*tp - *whole == 250ms);
    ++passed;
    assert(!fathom::parse_timestamp("yesterday"));
    assert(!fathom::parse_timestamp("2026-10-19T08:15:30.250+02:00"));
    assert(!fathom::parse_timestamp("2026-13-19T08:15:30Z"));
    ++passed;
  }

  // --- codec: decode ---
  {
    auto env = fathom::decode(kExecuteLine);
    assert(env.type() == fathom::message_type::execute);
    assert(env.version() == 1);
    assert(env.execution_id() == std::string("e1"));
    const auto &req = env.body<fathom::execution_request>();
    assert(req.id == "e1");
    assert(req.lang == fathom::language::python);
    assert(req.code == "print(1)");
    assert(!req.stdin_data);
    assert(req.env.at("A") == "b");
    assert(req.limits.timeout == 5000ms);
    assert(req.limits.memory_mb == 128);
    assert(!req.limits.cpu_shares);
    assert(req.limits.max_output_bytes == fathom::kDefaultMaxOutputBytes);
    ++passed;
  }
  {
    auto env = fathom::decode(
        R"({"v":1,"type":"result","id":"e1","ts":"2026-10-19T08:15:31Z",)"
        R"("exit_code":null,"duration_ms":42})");
    const auto &res = env.body<fathom::execution_result>();
    assert(!res.exit_code);
    assert(res.duration == 42ms);
    assert(!res.usage);
    ++passed;
  }
  {
    auto env = fathom::decode(
        R"({"v":1,"type":"error","ts":"2026-10-19T08:15:31Z",)"
        R"("code":"NETWORK_ERROR","message":"lost"})");
    assert(!env.execution_id());
    const auto &err = env.body<fathom::error_body>();
    assert(err.code == fathom::error_code::network_error);
    assert(err.retryable);
    ++passed;
  }

  // --- codec: rejects ---
  try {
    (void)fathom::decode(
        R"({"v":2,"type":"ping","id":"e7","ts":"2026-10-19T08:15:31Z"})");
    assert(false && "unsupported version should throw");
  } catch (const fathom::protocol_error &e) {
    assert(e.code() == fathom::error_code::invalid_request);
    assert(e.execution_id() == std::string("e7"));
    ++passed;
  }
  assert(error_of([]() {
           (void)fathom::decode(
               R"({"v":1,"type":"shutdown","ts":"2026-10-19T08:15:31Z"})");
         }) == fathom::error_code::invalid_request);
  ++passed;
  assert(error_of([]() {
           (void)fathom::decode(R"({"v":1,"type":"status","status":)"
                                R"("running","ts":"2026-10-19T08:15:31Z"})");
         }) == fathom::error_code::invalid_request);
  ++passed;
  assert(error_of([]() {
           (void)fathom::decode(R"({"v":1,"type":"ping"})");
         }) == fathom::error_code::invalid_request);
  ++passed;
  assert(error_of([]() { (void)fathom::decode("{\"v\":1,"); }) ==
         fathom::error_code::invalid_request);
  ++passed;
  assert(error_of([]() { (void)fathom::decode("[1,2,3]"); }) ==
         fathom::error_code::invalid_request);
  ++passed;
  try {
    std::string line = kExecuteLine;
    line.replace(line.find("python"), 6, "cobol");
    (void)fathom::decode(line);
    assert(false && "unknown language should throw");
  } catch (const fathom::protocol_error &e) {
    assert(e.code() == fathom::error_code::language_not_supported);
    assert(e.execution_id() == std::string("e1"));
    ++passed;
  }
  {
    std::string line = kExecuteLine;
    line.replace(line.find("5000"), 4, "\"5s\"");
    assert(error_of([&]() { (void)fathom::decode(line); }) ==
           fathom::error_code::invalid_request);
    ++passed;
  }

  // integers that would wrap when narrowed
  for (const char *line : {
           R"({"v":4294967297,"type":"ping","ts":"2026-10-19T08:15:31Z"})",
           R"({"v":18446744073709551615,"type":"ping","ts":"2026-10-19T08:15:31Z"})",
           R"({"v":-4294967295,"type":"ping","ts":"2026-10-19T08:15:31Z"})",
           R"({"v":1,"type":"hello","ts":"2026-10-19T08:15:31Z","versions":[4294967297]})",
           R"({"v":1,"type":"hello","ts":"2026-10-19T08:15:31Z","version":4294967297})",
           R"({"v":1,"type":"result","id":"e1","ts":"2026-10-19T08:15:31Z",)"
           R"("exit_code":4294967296,"duration_ms":1})",
       }) {
    assert(error_of([&]() { (void)fathom::decode(line); }) ==
           fathom::error_code::invalid_request);
  }
  ++passed;
  {
    std::string line = kExecuteLine;
    line.replace(line.find("\"memory_mb\""), 0, "\"cpu_shares\":4294967297,");
    assert(error_of([&]() { (void)fathom::decode(line); }) ==
           fathom::error_code::invalid_request);
    line.replace(line.find("4294967297"), 10, "4294967295");
    auto env = fathom::decode(line);
    assert(env.body<fathom::execution_request>().limits.cpu_shares ==
           4294967295u);
    ++passed;
  }

  // --- codec: encode ---
  {
    auto req = make_request("e2");
    req.stdin_data = "input";
    req.limits.cpu_shares = 512;
    auto doc = json::parse(fathom::encode(fathom::envelope::execute(req)));
    assert(doc["v"] == 1);
    assert(doc["type"] == "execute");
    assert(doc["id"] == "e2");
    assert(doc["language"] == "python");
    assert(doc["stdin"] == "input");
    assert(doc["limits"]["timeout_ms"] == 5000);
    assert(doc["limits"]["cpu_shares"] == 512);
    assert(doc["limits"]["max_output_bytes"] == 1024);
    assert(doc.count("env") == 0);
    ++passed;
  }
  {
    fathom::execution_result res;
    res.duration = 7ms;
    auto doc = json::parse(
        fathom::encode(fathom::envelope::result("e3", res)));
    assert(doc["exit_code"].is_null());
    assert(doc["duration_ms"] == 7);
    ++passed;
  }
  {
    auto doc = json::parse(fathom::encode(fathom::envelope::output(
        "e4", fathom::message_type::stderr_chunk, "oops\n")));
    assert(doc["type"] == "stderr");
    assert(doc["data"] == "oops\n");
    ++passed;
    auto broken = json::parse(fathom::encode(fathom::envelope::output(
        "e5", fathom::message_type::stdout_chunk, "ab\xc3")));
    assert(broken["data"] == "ab\xef\xbf\xbd");
    ++passed;
    auto pong = json::parse(
        fathom::encode(fathom::envelope::pong(fathom::load_report{3, 1})));
    assert(pong.count("id") == 0);
    assert(pong["load"]["active_executions"] == 3);
    ++passed;
  }

  // --- codec: utf-8 boundaries ---
  assert(fathom::utf8_complete_prefix("") == 0);
  assert(fathom::utf8_complete_prefix("abc") == 3);
  assert(fathom::utf8_complete_prefix("abcd\xc3") == 4);
  assert(fathom::utf8_complete_prefix("abcd\xc3\xa9") == 6);
  assert(fathom::utf8_complete_prefix("x\xe2\x82") == 1);
  assert(fathom::utf8_complete_prefix("x\xf0\x9f\x98") == 1);
  assert(fathom::utf8_complete_prefix("x\xf0\x9f\x98\x80") == 5);
  assert(fathom::utf8_complete_prefix("\xa9\xa9") == 2);
  assert(fathom::utf8_complete_prefix("a\xff") == 2);
  ++passed;

  // --- execution state machine ---
  {
    fathom::execution_session s(make_request("s1", 10));
    assert(s.status() == fathom::exec_status::pending);
    assert(!s.add_output(1).accepted);
    assert(s.add_output(1).rejected);
    ++passed;
    assert(s.mark_acked());
    assert(!s.mark_acked());
    assert(s.status() == fathom::exec_status::pending);
    ++passed;
    assert(s.start_running());
    assert(!s.start_running());
    ++passed;

    auto first = s.add_output(4);
    assert(first.accepted == 4 && !first.limit_exceeded);
    auto over = s.add_output(10);
    assert(over.accepted == 6);
    assert(over.limit_exceeded);
    assert(s.status() == fathom::exec_status::failed);
    assert(s.error()->code == fathom::error_code::output_limit);
    assert(s.output_bytes() == 10);
    ++passed;

    assert(s.add_output(1).rejected);
    assert(!s.finish(fathom::exec_status::completed));
    assert(s.status() == fathom::exec_status::failed);
    ++passed;

    assert(s.attach_result(fathom::execution_result{std::nullopt, 5ms, {}}));
    assert(!s.attach_result(fathom::execution_result{0, 5ms, {}}));
    assert(!s.result()->exit_code);
    ++passed;
  }
  {
    fathom::execution_session s(make_request("s2"));
    assert(!s.attach_result(fathom::execution_result{}));
    assert(!s.finish(fathom::exec_status::running));
    s.mark_acked();
    s.start_running();
    s.note_error(fathom::error_body{fathom::error_code::internal_error,
                                    "backend", true});
    assert(s.finish(fathom::exec_status::failed));
    assert(s.error()->code == fathom::error_code::internal_error);
    ++passed;
  }
  {
    fathom::execution_session s(make_request("s3"));
    s.mark_acked();
    s.start_running();
    s.request_cancel();
    assert(s.cancel_requested());
    assert(s.abandon("connection lost"));
    assert(s.status() == fathom::exec_status::failed);
    assert(s.error()->code == fathom::error_code::network_error);
    assert(s.error()->retryable);
    assert(s.result() && !s.result()->exit_code);
    assert(!s.abandon("again"));
    ++passed;
  }
  {
    auto now = fathom::steady_clock::now();
    fathom::execution_session s(make_request("s4"), now);
    assert(s.deadline() - now == 5000ms);
    assert(s.elapsed(now + 30ms) == 30ms);
    ++passed;
  }

  // --- worker pool and strands ---
  {
    fathom::worker_pool pool(4);
    auto serial = std::make_shared<fathom::strand>(pool);
    std::vector<int> order;
    std::atomic<int> inside{0};
    bool overlapped = false;
    for (int i = 0; i < 200; ++i) {
      serial->post([&, i]() {
        if (inside.fetch_add(1) != 0)
          overlapped = true;
        order.push_back(i);
        inside.fetch_sub(1);
      });
    }
    pool.shutdown();
    assert(!overlapped);
    assert(order.size() == 200);
    for (int i = 0; i < 200; ++i)
      assert(order[static_cast<size_t>(i)] == i);
    ++passed;
    assert(!pool.post([]() {}));
    assert(!serial->post([]() {}));
    ++passed;
  }
  {
    fathom::worker_pool pool(1);
    std::promise<void> done;
    pool.post([]() { throw std::runtime_error("task failure"); });
    pool.post([&]() { done.set_value(); });
    assert(done.get_future().wait_for(2s) == std::future_status::ready);
    ++passed;
  }

  // --- registry ---
  {
    fathom::worker_pool pool(2);
    fathom::execution_registry<int> registry(pool);
    auto h1 = registry.register_execution(make_request("a"), 1);
    assert(registry.size() == 1);
    assert(registry.lookup("a") == h1);
    ++passed;
    assert(error_of([&]() { registry.register_execution(make_request("a")); }) ==
           fathom::error_code::invalid_request);
    assert(error_of([&]() { registry.register_execution(make_request("")); }) ==
           fathom::error_code::invalid_request);
    ++passed;
    assert(error_of([&]() { (void)registry.lookup("zz"); }) ==
           fathom::error_code::unknown_execution);
    assert(registry.find("zz") == nullptr);
    ++passed;

    std::promise<int> seen;
    h1->post([&](fathom::execution_session &s, int &ctx) {
      s.mark_acked();
      ctx += 41;
      seen.set_value(ctx);
    });
    assert(seen.get_future().get() == 42);
    ++passed;

    assert(registry.evict("a"));
    auto h2 = registry.register_execution(make_request("a"));
    assert(!registry.evict(h1));
    assert(registry.find("a") == h2);
    assert(registry.evict(h2));
    assert(!registry.evict("a"));
    ++passed;

    registry.register_execution(make_request("b"));
    registry.register_execution(make_request("c"));
    auto drained = registry.drain();
    assert(drained.size() == 2);
    assert(registry.size() == 0);
    ++passed;
  }

  // --- watchdog ---
  {
    std::mutex mu;
    std::condition_variable cv;
    std::vector<std::string> expired;
    fathom::deadline_watchdog watchdog([&](const std::string &id) {
      std::lock_guard<std::mutex> lock(mu);
      expired.push_back(id);
      cv.notify_all();
    });
    auto now = fathom::steady_clock::now();
    watchdog.arm("late", now + 10s);
    watchdog.arm("dropped", now + 20ms);
    watchdog.disarm("dropped");
    watchdog.arm("moved", now + 10s);
    watchdog.arm("moved", now + 30ms);
    watchdog.arm("soon", now + 10ms);
    assert(watchdog.armed_count() == 3);

    {
      std::unique_lock<std::mutex> lock(mu);
      bool both = cv.wait_for(lock, 2s, [&]() { return expired.size() >= 2; });
      assert(both);
    }
    std::this_thread::sleep_for(60ms);
    {
      std::lock_guard<std::mutex> lock(mu);
      assert(expired.size() == 2);
      assert(expired[0] == "soon");
      assert(expired[1] == "moved");
    }
    assert(watchdog.armed("late"));
    assert(!watchdog.armed("dropped"));
    assert(watchdog.armed_count() == 1);
    ++passed;
    watchdog.stop();
    ++passed;
  }

  // --- reconnect backoff ---
  {
    fathom::reconnect_policy policy;
    assert(policy.next_delay() == 0ms);
    assert(policy.next_delay() == 100ms);
    assert(policy.next_delay() == 200ms);
    assert(policy.next_delay() == 400ms);
    assert(policy.next_delay() == 800ms);
    assert(policy.attempt() == 5);
    ++passed;
    auto previous = 0ms;
    for (int attempt = 0; attempt < 40; ++attempt) {
      auto delay = policy.delay_for(attempt);
      assert(delay >= previous);
      assert(delay <= 30s);
      previous = delay;
    }
    assert(policy.delay_for(20) == 30s);
    ++passed;
    policy.reset();
    assert(policy.next_delay() == 0ms);
    assert(policy.next_delay() == 100ms);
    ++passed;

    fathom::reconnect_policy jittered(100ms, 30s, 0.5);
    for (int i = 0; i < 20; ++i) {
      auto delay = jittered.delay_for(3);
      assert(delay >= 400ms && delay <= 600ms);
    }
    assert(jittered.delay_for(0) == 0ms);
    ++passed;
  }

  // --- transport ---
  assert(fathom::scheme("unix:///tmp/fathom.sock") == "unix");
  assert(fathom::kDefaultURI == "tcp://127.0.0.1:7420");
  ++passed;
  assert(fathom::parse_flags({"--connect", "unix:///tmp/f.sock"}) ==
         "unix:///tmp/f.sock");
  assert(fathom::parse_flags({"--port", "9000"}) == "tcp://127.0.0.1:9000");
  assert(fathom::parse_flags({}) == "tcp://127.0.0.1:7420");
  ++passed;
  {
    auto parsed = fathom::parse_uri("tcp://localhost:7421");
    assert(parsed.host == "127.0.0.1");
    assert(parsed.port == 7421);
    ++passed;
  }
  try {
    (void)fathom::parse_uri("unix://");
    assert(false && "empty unix path should throw");
  } catch (const std::invalid_argument &) {
    ++passed;
  }
  try {
    (void)fathom::dial("mem://");
    assert(false && "mem dial should throw");
  } catch (const std::invalid_argument &) {
    ++passed;
  }
  try {
    (void)fathom::listen("ftp://host");
    assert(false && "unsupported scheme should throw");
  } catch (const std::invalid_argument &) {
    ++passed;
  }
  {
    auto lis = fathom::listen("mem://");
    auto server = fathom::accept(lis);
    auto client = fathom::mem_dial(lis);
    bool wrote = fathom::write_frame(client, "{\"a\":1}");
    wrote = wrote && fathom::write_frame(client, "second");
    assert(wrote);

    fathom::frame_reader reader;
    std::string frame;
    assert(reader.read(server, frame) && frame == "{\"a\":1}");
    assert(reader.read(server, frame) && frame == "second");
    ++passed;

    fathom::close_connection(client);
    assert(!reader.read(server, frame));
    ++passed;
    fathom::close_connection(server);
    fathom::close_listener(lis);
  }
  {
    auto lis = fathom::listen("mem://");
    auto server = fathom::accept(lis);
    auto client = fathom::mem_dial(lis);
    std::string big(64, 'x');
    auto sent = fathom::conn_write(client, big.data(), big.size());
    assert(sent == static_cast<ssize_t>(big.size()));

    fathom::frame_reader reader(16);
    std::string frame;
    try {
      (void)reader.read(server, frame);
      assert(false && "oversized frame should throw");
    } catch (const std::runtime_error &) {
      ++passed;
    }
    fathom::close_connection(client);
    fathom::close_connection(server);
    fathom::close_listener(lis);
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
