#include "hub_engine.hpp"
#include "log.hpp"
#include "push_notifier.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"
#include "wrapper_client.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

using ttyhub::test::TempDir;
using ttyhub::test::TestClient;
using ttyhub::test::expect;
using ttyhub::test::wait_for_condition;

struct TestContext {
  ttyhub::test::LogCapture& logs;
  bool verbose = false;
};

// Records notifications instead of posting them.
class RecordingPushSender : public PushSender {
public:
  struct Call {
    std::vector<PushToken> tokens;
    std::string title;
    std::string body;
    std::string session_id;
  };

  void send(const std::vector<PushToken>& tokens,
            const std::string& title,
            const std::string& body,
            const std::string& session_id) override {
    std::lock_guard lg(m_);
    calls_.push_back({tokens, title, body, session_id});
  }

  std::vector<Call> calls() const {
    std::lock_guard lg(m_);
    return calls_;
  }

private:
  mutable std::mutex m_;
  std::vector<Call> calls_;
};

// A running hub bound to an ephemeral loopback port with one sandbox root.
struct HubFixture {
  explicit HubFixture(TestContext& ctx,
                      const std::function<void(SettingsManager&)>& tweak = nullptr)
    : ctx_(ctx),
      state("hub_state"),
      root("hub_root"),
      settings(std::make_shared<SettingsManager>()),
      push(std::make_shared<RecordingPushSender>()) {
    std::string error;
    settings->set_settings_path(state.path() / "settings.json");
    settings->set_from_json("listen_ip", "127.0.0.1", error);
    settings->set_from_json("listen_port", 0, error);
    settings->set_from_json("allowed_roots", json::array({root.str()}), error);
    settings->set_from_json("watch_debounce_ms", 50, error);
    settings->set_from_json("device_id", "device-under-test", error);
    settings->set_from_json("device_name", "test-hub", error);
    if(tweak) tweak(*settings);

    HubEngine::Options options;
    options.state_dir = state.path();
    options.push_sender = push;
    engine = std::make_unique<HubEngine>(settings, options);
    ctx_.logs.attach(engine->logger());
    engine->start_background();
  }

  ~HubFixture() {
    ctx_.logs.detach_all();
    engine->stop();
  }

  bool connect(TestClient& client) {
    return client.connect(engine->listen_port());
  }

  // Client that completed hello and consumed the session list.
  bool connect_client(TestClient& client) {
    if(!connect(client)) return false;
    auto welcome = client.hello();
    if(!welcome) return false;
    return client.read_until_type("sessions", 3s).has_value();
  }

  // Raw wrapper connection; returns the assigned session id.
  std::string register_wrapper(TestClient& wrapper, const std::string& command = "bash") {
    if(!connect(wrapper)) return std::string();
    wrapper.send_json({{"type", "register_pty"}, {"name", "build"},
                       {"command", command}, {"project_path", root.str()}});
    auto registered = wrapper.read_until_type("registered", 3s);
    if(!registered) return std::string();
    return registered->value("session_id", std::string());
  }

  TestContext& ctx_;
  TempDir state;
  TempDir root;
  std::shared_ptr<SettingsManager> settings;
  std::shared_ptr<RecordingPushSender> push;
  std::unique_ptr<HubEngine> engine;
};

std::string decode(const json& message) {
  std::string out;
  base64_decode(message.value("data", std::string()), out);
  return out;
}

bool test_handshake(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient client;
  bool ok = expect(ctx.verbose, hub.connect(client), "connect");
  auto welcome = client.hello();
  ok = expect(ctx.verbose, welcome.has_value(), "welcome") && ok;
  if(!ok) return false;
  ok = expect(ctx.verbose, (*welcome)["server_version"] == "1.0.0", "server version") && ok;
  ok = expect(ctx.verbose, (*welcome)["authenticated"] == true, "open hub authenticates") && ok;
  ok = expect(ctx.verbose, (*welcome)["device_id"] == "device-under-test" &&
                           (*welcome)["device_name"] == "test-hub", "identity") && ok;
  auto sessions = client.read_until_type("sessions", 3s);
  ok = expect(ctx.verbose, sessions && (*sessions)["sessions"].is_array() && (*sessions)["sessions"].empty(),
              "empty session list") && ok;

  client.send_json({{"type", "ping"}});
  ok = expect(ctx.verbose, client.read_until_type("pong", 3s).has_value(), "pong") && ok;
  client.send_json({{"type", "no_such_thing"}});
  auto unknown = client.read_until_type("error", 3s);
  ok = expect(ctx.verbose, unknown && (*unknown)["code"] == "unknown_type", "unknown type") && ok;
  ok = expect(ctx.verbose, wait_for_condition([&]{ return hub.engine->stats().clients == 1; }, 2s), "one client") && ok;
  return ok;
}

bool test_hello_required_and_invalid_lines(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient client;
  bool ok = expect(ctx.verbose, hub.connect(client), "connect");
  client.send_json({{"type", "get_sessions"}});
  auto err = client.read_until_type("error", 3s);
  ok = expect(ctx.verbose, err && (*err)["code"] == "hello_required", "hello required") && ok;

  client.send_raw("this is not json\n");
  auto bad = client.read_until_type("error", 3s);
  ok = expect(ctx.verbose, bad && (*bad)["code"] == "invalid_message", "not json") && ok;

  client.send_raw("{\"no_type\":1}\n");
  auto untyped = client.read_until_type("error", 3s);
  ok = expect(ctx.verbose, untyped && (*untyped)["code"] == "invalid_message", "missing type") && ok;

  ok = expect(ctx.verbose, client.hello().has_value(), "connection still usable") && ok;
  return ok;
}

bool test_require_auth(TestContext& ctx) {
  HubFixture hub(ctx, [](SettingsManager& s){
    std::string error;
    s.set_from_json("auth_token", "open-sesame", error);
    s.set_from_json("require_auth", true, error);
  });
  bool ok = true;

  TestClient good;
  ok = expect(ctx.verbose, hub.connect(good), "connect good") && ok;
  auto welcome = good.hello("open-sesame");
  ok = expect(ctx.verbose, welcome && (*welcome)["authenticated"] == true, "matching token") && ok;

  TestClient bad;
  ok = expect(ctx.verbose, hub.connect(bad), "connect bad") && ok;
  auto rejected = bad.hello("wrong");
  ok = expect(ctx.verbose, rejected && (*rejected)["authenticated"] == false, "welcome reports failure") && ok;
  auto err = bad.read_until_type("error", 3s);
  ok = expect(ctx.verbose, err && (*err)["code"] == "unauthorized", "unauthorized") && ok;
  ok = expect(ctx.verbose, bad.wait_closed(3s), "connection closed") && ok;
  return ok;
}

bool test_wrapper_session_flow(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient viewer;
  bool ok = expect(ctx.verbose, hub.connect_client(viewer), "viewer connected");

  TestClient wrapper;
  auto id = hub.register_wrapper(wrapper);
  ok = expect(ctx.verbose, !id.empty(), "registered") && ok;
  if(!ok) return false;

  auto sessions = viewer.read_until_type("sessions", 3s);
  ok = expect(ctx.verbose, sessions && (*sessions)["sessions"].size() == 1 &&
                           (*sessions)["sessions"][0]["session_id"] == id &&
                           (*sessions)["sessions"][0]["name"] == "build", "session listed") && ok;

  wrapper.send_json(json{{"type", "pty_output"}, {"data", base64_encode("before viewers\r\n")}});
  wrapper.send_json({{"type", "ping"}});
  ok = expect(ctx.verbose, wrapper.read_until_type("pong", 3s).has_value(), "output recorded") && ok;
  viewer.send_json({{"type", "subscribe"}, {"session_id", id}});
  auto history = viewer.read_until_type("session_history", 3s);
  ok = expect(ctx.verbose, history && decode(*history) == "before viewers\r\n" &&
                           (*history)["total_bytes"] == 16, "scrollback replayed") && ok;

  wrapper.send_json(json{{"type", "pty_output"}, {"data", base64_encode("live bytes")}});
  auto live = viewer.read_until_type("pty_bytes", 3s);
  ok = expect(ctx.verbose, live && (*live)["session_id"] == id && decode(*live) == "live bytes", "live output") && ok;

  viewer.send_json({{"type", "send_input"}, {"session_id", id}, {"text", "ls\n"}});
  auto input = wrapper.read_until_type("input", 3s);
  ok = expect(ctx.verbose, input && decode(*input) == "ls\n", "input forwarded") && ok;

  viewer.send_json({{"type", "send_input"}, {"session_id", id}, {"data", base64_encode("\x03")}});
  auto ctrl_c = wrapper.read_until_type("input", 3s);
  ok = expect(ctx.verbose, ctrl_c && decode(*ctrl_c) == "\x03", "binary input") && ok;

  viewer.send_json({{"type", "pty_resize"}, {"session_id", id}, {"cols", 120}, {"rows", 40}});
  auto resize = wrapper.read_until_type("resize", 3s);
  ok = expect(ctx.verbose, resize && (*resize)["cols"] == 120 && (*resize)["rows"] == 40, "viewer resize") && ok;

  viewer.send_json({{"type", "rename_session"}, {"session_id", id}, {"new_name", "renamed"}});
  auto renamed = viewer.read_until_type("session_renamed", 3s);
  ok = expect(ctx.verbose, renamed && (*renamed)["new_name"] == "renamed", "renamed") && ok;

  viewer.send_json({{"type", "get_session_history"}, {"session_id", id}, {"max_bytes", 5}});
  auto tail = viewer.read_until_type("session_history", 3s);
  ok = expect(ctx.verbose, tail && decode(*tail) == "bytes" && (*tail)["total_bytes"] == 26, "history tail") && ok;

  viewer.send_json({{"type", "unsubscribe"}, {"session_id", id}});
  auto restore = wrapper.read_until_type("resize", 3s);
  ok = expect(ctx.verbose, restore && (*restore)["cols"] == 0 && (*restore)["rows"] == 0,
              "last viewer leaving restores the local size") && ok;

  wrapper.send_json({{"type", "session_ended"}, {"exit_code", 4}});
  auto ended = viewer.read_until_type("session_ended", 3s);
  ok = expect(ctx.verbose, ended && (*ended)["session_id"] == id && (*ended)["exit_code"] == 4, "ended") && ok;
  auto after = viewer.read_until_type("sessions", 3s);
  ok = expect(ctx.verbose, after && (*after)["sessions"].empty(), "ended session not listed") && ok;

  viewer.send_json({{"type", "subscribe"}, {"session_id", id}});
  auto gone = viewer.read_until_type("error", 3s);
  ok = expect(ctx.verbose, gone && (*gone)["code"] == "session_not_found", "cannot subscribe to ended") && ok;
  ok = expect(ctx.verbose, hub.engine->stats().recent_sessions == 1, "kept as recent") && ok;
  return ok;
}

// Reads pty_bytes until want bytes arrived or the deadline passes.
std::string collect_output(TestClient& viewer, std::size_t want, std::string seen = std::string()) {
  auto deadline = std::chrono::steady_clock::now() + 5s;
  while(seen.size() < want && std::chrono::steady_clock::now() < deadline) {
    if(auto bytes = viewer.read_until_type("pty_bytes", 1s)) seen += decode(*bytes);
  }
  return seen;
}

bool test_output_fan_out(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient wrapper;
  auto id = hub.register_wrapper(wrapper);
  bool ok = expect(ctx.verbose, !id.empty(), "registered");
  if(!ok) return false;

  std::vector<std::unique_ptr<TestClient>> viewers;
  for(int i = 0; i < 3; ++i) {
    viewers.push_back(std::make_unique<TestClient>());
    auto& viewer = *viewers.back();
    ok = expect(ctx.verbose, hub.connect_client(viewer), "viewer connected") && ok;
    viewer.send_json({{"type", "subscribe"}, {"session_id", id}});
    auto history = viewer.read_until_type("session_history", 3s);
    ok = expect(ctx.verbose, history && decode(*history).empty(), "subscribed") && ok;
  }
  if(!ok) return false;

  auto send_chunks = [&](int from, int to) {
    std::string sent;
    for(int i = from; i < to; ++i) {
      std::string chunk = "chunk-" + std::to_string(i) + ";";
      sent += chunk;
      wrapper.send_json(json{{"type", "pty_output"}, {"data", base64_encode(chunk)}});
    }
    return sent;
  };

  auto first = send_chunks(0, 50);
  for(auto& viewer : viewers) {
    ok = expect(ctx.verbose, collect_output(*viewer, first.size()) == first, "every chunk once and in order") && ok;
  }

  viewers[1]->send_json({{"type", "unsubscribe"}, {"session_id", id}});
  viewers[1]->send_json({{"type", "ping"}});
  ok = expect(ctx.verbose, viewers[1]->read_until_type("pong", 3s).has_value(), "unsubscribe handled") && ok;

  auto second = send_chunks(50, 100);
  ok = expect(ctx.verbose, collect_output(*viewers[0], second.size()) == second, "first viewer continues") && ok;
  ok = expect(ctx.verbose, collect_output(*viewers[2], second.size()) == second, "third viewer continues") && ok;
  ok = expect(ctx.verbose, !viewers[1]->read_until_type("pty_bytes", 300ms).has_value(),
              "unsubscribed viewer gets nothing further") && ok;
  return ok;
}

bool test_resubscribe_does_not_duplicate(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient wrapper;
  auto id = hub.register_wrapper(wrapper);
  TestClient viewer;
  bool ok = expect(ctx.verbose, !id.empty() && hub.connect_client(viewer), "connected");
  if(!ok) return false;
  viewer.send_json({{"type", "subscribe"}, {"session_id", id}});
  ok = expect(ctx.verbose, viewer.read_until_type("session_history", 3s).has_value(), "subscribed") && ok;

  std::string expected;
  std::string burst;
  for(int i = 0; i < 200; ++i) {
    std::string chunk = "line-" + std::to_string(i) + "\n";
    expected += chunk;
    burst += json{{"type", "pty_output"}, {"data", base64_encode(chunk)}}.dump() + "\n";
  }
  std::string toggles;
  const int rounds = 5;
  for(int i = 0; i < rounds; ++i) {
    toggles += json{{"type", "unsubscribe"}, {"session_id", id}}.dump() + "\n";
    toggles += json{{"type", "subscribe"}, {"session_id", id}}.dump() + "\n";
  }
  wrapper.send_raw(burst);
  viewer.send_raw(toggles);

  std::optional<json> replay;
  for(int i = 0; i < rounds; ++i) {
    replay = viewer.read_until_type("session_history", 3s);
    if(!replay) break;
  }
  ok = expect(ctx.verbose, replay.has_value(), "every resubscribe replays history") && ok;
  if(!ok) return false;

  // the last replay plus the live bytes after it must be the output exactly once
  auto seen = collect_output(viewer, expected.size(), decode(*replay));
  ok = expect(ctx.verbose, seen == expected, "no chunk delivered twice") && ok;
  ok = expect(ctx.verbose, !viewer.read_until_type("pty_bytes", 300ms).has_value(), "nothing stale after") && ok;
  return ok;
}

bool test_wait_state_and_push(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient viewer;
  bool ok = expect(ctx.verbose, hub.connect_client(viewer), "viewer connected");

  viewer.send_json({{"type", "register_push_token"}, {"token", "ExponentPushToken[test]"}, {"platform", "ios"}});
  viewer.send_json({{"type", "ping"}});
  ok = expect(ctx.verbose, viewer.read_until_type("pong", 3s).has_value(), "token registered") && ok;

  TestClient wrapper;
  auto id = hub.register_wrapper(wrapper);
  ok = expect(ctx.verbose, !id.empty(), "registered") && ok;
  if(!ok) return false;

  wrapper.send_json(json{{"type", "pty_output"}, {"data", base64_encode("Overwrite settings.ini? (y/n) ")}});
  auto waiting = viewer.read_until_type("waiting_for_input", 3s);
  ok = expect(ctx.verbose, waiting && (*waiting)["session_id"] == id &&
                           (*waiting)["wait_type"] == "awaiting_response" &&
                           (*waiting)["cli_type"] == "terminal", "waiting broadcast") && ok;
  ok = expect(ctx.verbose, waiting && (*waiting)["prompt_content"].get<std::string>().find("(y/n)") != std::string::npos,
              "prompt content") && ok;

  ok = expect(ctx.verbose, wait_for_condition([&]{ return hub.push->calls().size() == 1; }, 3s), "push sent") && ok;
  auto calls = hub.push->calls();
  if(calls.size() == 1) {
    ok = expect(ctx.verbose, calls[0].session_id == id &&
                             calls[0].title == "build \xc2\xb7 Awaiting Your Response" &&
                             calls[0].tokens.size() == 1 && calls[0].tokens[0].token_type == "expo",
                "push contents") && ok;
  }

  TestClient late;
  ok = expect(ctx.verbose, hub.connect(late) && late.hello().has_value(), "late client") && ok;
  auto replay = late.read_until_type("waiting_for_input", 3s);
  ok = expect(ctx.verbose, replay && (*replay)["session_id"] == id, "wait state sent on hello") && ok;

  viewer.send_json({{"type", "tool_approval"}, {"session_id", id}, {"response", "yes"}});
  auto keys = wrapper.read_until_type("input", 3s);
  ok = expect(ctx.verbose, keys && decode(*keys) == "y\n", "approval keystrokes") && ok;
  auto cleared = viewer.read_until_type("waiting_cleared", 3s);
  ok = expect(ctx.verbose, cleared && (*cleared)["session_id"] == id, "cleared broadcast") && ok;
  return ok;
}

bool test_wrapper_disconnect_ends_session(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient viewer;
  bool ok = expect(ctx.verbose, hub.connect_client(viewer), "viewer connected");
  std::string id;
  {
    TestClient wrapper;
    id = hub.register_wrapper(wrapper);
    ok = expect(ctx.verbose, !id.empty(), "registered") && ok;
    wrapper.close();
  }
  auto ended = viewer.read_until_type("session_ended", 3s);
  ok = expect(ctx.verbose, ended && (*ended)["session_id"] == id && (*ended)["exit_code"] == -1,
              "disconnect ends the session") && ok;

  TestClient first;
  auto reused = hub.register_wrapper(first);
  TestClient second;
  ok = expect(ctx.verbose, hub.connect(second), "connect second") && ok;
  second.send_json({{"type", "register_pty"}, {"session_id", reused}, {"name", "dup"}, {"command", "bash"}});
  auto dup = second.read_until_type("error", 3s);
  ok = expect(ctx.verbose, dup && (*dup)["code"] == "session_exists", "duplicate id rejected") && ok;
  return ok;
}

bool test_filesystem_requests(TestContext& ctx) {
  HubFixture hub(ctx);
  hub.root.write("notes.txt", "remember the milk");
  hub.root.write("src/main.cpp", "int main() {}\n");
  TestClient client;
  bool ok = expect(ctx.verbose, hub.connect_client(client), "connected");

  client.send_json({{"type", "list_directory"}, {"request_id", "r1"}, {"path", hub.root.str()}});
  auto listing = client.read_until_type("directory_listing", 3s);
  ok = expect(ctx.verbose, listing && (*listing)["request_id"] == "r1" && (*listing)["entries"].size() == 2,
              "listing") && ok;
  if(listing && (*listing)["entries"].size() == 2) {
    ok = expect(ctx.verbose, (*listing)["entries"][0]["name"] == "src" &&
                             (*listing)["entries"][1]["name"] == "notes.txt", "directories first") && ok;
  }

  client.send_json({{"type", "read_file"}, {"request_id", "r2"}, {"path", hub.root / "notes.txt"}});
  auto content = client.read_until_type("file_content", 3s);
  ok = expect(ctx.verbose, content && (*content)["content"] == "remember the milk" &&
                           (*content)["encoding"] == "utf8", "read") && ok;

  client.send_json({{"type", "write_file"}, {"request_id", "r3"}, {"path", hub.root / "out/new.txt"},
                    {"content", "written"}, {"encoding", "utf8"}, {"create_parents", true}});
  auto written = client.read_until_type("operation_success", 3s);
  ok = expect(ctx.verbose, written && (*written)["request_id"] == "r3" && (*written)["operation"] == "write_file",
              "write acknowledged") && ok;
  ok = expect(ctx.verbose, hub.root.read("out/new.txt") == "written", "write landed") && ok;

  client.send_json({{"type", "read_file"}, {"request_id", "r4"}, {"path", "notes.txt"}});
  auto relative = client.read_until_type("operation_error", 3s);
  ok = expect(ctx.verbose, relative && (*relative)["error"]["code"] == "path_traversal", "relative path") && ok;

  client.send_json({{"type", "list_directory"}, {"request_id", "r5"}, {"path", "/"}});
  auto outside = client.read_until_type("operation_error", 3s);
  ok = expect(ctx.verbose, outside && (*outside)["request_id"] == "r5" &&
                           (*outside)["error"]["code"] == "permission_denied", "outside roots") && ok;

  client.send_json({{"type", "get_allowed_roots"}, {"request_id", "r6"}});
  auto roots = client.read_until_type("allowed_roots", 3s);
  ok = expect(ctx.verbose, roots && (*roots)["roots"] == json::array({hub.root.str()}), "roots") && ok;

  client.send_json({{"type", "search_files"}, {"request_id", "r7"}, {"path", hub.root.str()}, {"pattern", "main"}});
  auto found = client.read_until_type("search_results", 3s);
  ok = expect(ctx.verbose, found && (*found)["matches"].size() == 1, "search") && ok;
  return ok;
}

bool test_filesystem_rate_limit(TestContext& ctx) {
  HubFixture hub(ctx, [](SettingsManager& s){
    std::string error;
    s.set_from_json("rate_limit_rps", 1, error);
    s.set_from_json("rate_limit_burst", 2, error);
  });
  TestClient client;
  bool ok = expect(ctx.verbose, hub.connect_client(client), "connected");
  for(int i = 0; i < 6; ++i) {
    client.send_json({{"type", "get_allowed_roots"}, {"request_id", "q" + std::to_string(i)}});
  }
  int allowed = 0;
  int limited = 0;
  for(int i = 0; i < 6; ++i) {
    auto reply = client.read_json(3s);
    if(!reply) break;
    if((*reply)["type"] == "allowed_roots") ++allowed;
    if((*reply)["type"] == "operation_error" && (*reply)["error"]["code"] == "rate_limited" &&
       (*reply)["error"].contains("retry_after_ms")) ++limited;
  }
  ok = expect(ctx.verbose, allowed + limited == 6, "every request answered") && ok;
  ok = expect(ctx.verbose, allowed >= 2 && limited >= 1, "burst then limited") && ok;
  return ok;
}

bool test_watch_directory(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient client;
  bool ok = expect(ctx.verbose, hub.connect_client(client), "connected");
  client.send_json({{"type", "watch_directory"}, {"request_id", "w1"}, {"path", hub.root.str()}});
  auto ack = client.read_until_type("operation_success", 3s);
  ok = expect(ctx.verbose, ack && (*ack)["operation"] == "watch_directory", "watching") && ok;
  ok = expect(ctx.verbose, hub.engine->stats().watched_directories == 1, "one watch") && ok;

  hub.root.write("fresh.txt", "new");
  auto change = client.read_until_type("file_changed", 3s);
  ok = expect(ctx.verbose, change && (*change)["path"] == hub.root / "fresh.txt" &&
                           (*change)["change_type"] == "created" &&
                           (*change)["new_entry"]["name"] == "fresh.txt", "created event") && ok;

  hub.root.write("id_rsa", "-----BEGIN-----");
  ok = expect(ctx.verbose, client.quiet_for("file_changed", 500ms), "denied paths are not reported") && ok;

  client.send_json({{"type", "unwatch_directory"}, {"request_id", "w2"}, {"path", hub.root.str()}});
  auto unwatched = client.read_until_type("operation_success", 3s);
  ok = expect(ctx.verbose, unwatched && (*unwatched)["request_id"] == "w2", "unwatched") && ok;
  ok = expect(ctx.verbose, wait_for_condition([&]{ return hub.engine->stats().watched_directories == 0; }, 2s),
              "watch released") && ok;
  return ok;
}

bool test_spawn_rejected(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient client;
  bool ok = expect(ctx.verbose, hub.connect_client(client), "connected");
  client.send_json({{"type", "spawn_session"}, {"command", "curl"}, {"args", json::array({"evil.example"})}});
  auto result = client.read_until_type("spawn_result", 3s);
  ok = expect(ctx.verbose, result && (*result)["success"] == false &&
                           (*result)["error"].get<std::string>().find("not in the allowed list") != std::string::npos,
              "command not allowed") && ok;
  ok = expect(ctx.verbose, hub.engine->stats().live_sessions == 0, "nothing spawned") && ok;
  return ok;
}

bool test_spawn_session(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient client;
  bool ok = expect(ctx.verbose, hub.connect_client(client), "connected");
  client.send_json({{"type", "spawn_session"}, {"command", "sh"},
                    {"args", json::array({"-c", "read line; echo \"spawned:$line\""})},
                    {"name", "spawned"}, {"working_dir", hub.root.str()}});
  auto result = client.read_until_type("spawn_result", 3s);
  ok = expect(ctx.verbose, result && (*result)["success"] == true, "spawned") && ok;
  if(!ok) return false;
  auto id = (*result)["session_id"].get<std::string>();

  client.send_json({{"type", "subscribe"}, {"session_id", id}});
  ok = expect(ctx.verbose, client.read_until_type("session_history", 3s).has_value(), "subscribed") && ok;
  client.send_json({{"type", "send_input"}, {"session_id", id}, {"text", "ok\n"}});

  std::string seen;
  auto deadline = std::chrono::steady_clock::now() + 5s;
  while(seen.find("spawned:ok") == std::string::npos && std::chrono::steady_clock::now() < deadline) {
    if(auto bytes = client.read_until_type("pty_bytes", 1s)) seen += decode(*bytes);
  }
  ok = expect(ctx.verbose, seen.find("spawned:ok") != std::string::npos, "output streamed") && ok;
  auto ended = client.read_until_type("session_ended", 5s);
  ok = expect(ctx.verbose, ended && (*ended)["session_id"] == id && (*ended)["exit_code"] == 0, "exit reported") && ok;
  return ok;
}

bool test_wrapper_client_end_to_end(TestContext& ctx) {
  HubFixture hub(ctx);
  TestClient viewer;
  bool ok = expect(ctx.verbose, hub.connect_client(viewer), "viewer connected");

  asio::io_context io;
  auto work = asio::make_work_guard(io);
  WrapperClient::Options options;
  options.port = hub.engine->listen_port();
  options.name = "wrapped";
  options.command = "/bin/sh";
  options.args = {"-c", "read line; echo \"wrapped:$line\"; exit 0"};
  options.working_dir = hub.root.path();
  options.mirror_fd = -1;
  auto logger = std::make_shared<Logger>("wrap");
  ctx.logs.attach(logger);
  auto client = std::make_shared<WrapperClient>(io, options, logger);
  client->start();
  std::thread io_thread([&io]{ io.run(); });

  ok = expect(ctx.verbose, client->wait_until_registered(5s), "wrapper registered") && ok;
  auto id = client->session_id();
  ok = expect(ctx.verbose, !id.empty(), "session id assigned") && ok;

  viewer.send_json({{"type", "subscribe"}, {"session_id", id}});
  ok = expect(ctx.verbose, viewer.read_until_type("session_history", 3s).has_value(), "subscribed") && ok;
  viewer.send_json({{"type", "send_input"}, {"session_id", id}, {"text", "hello\n"}});

  std::string seen;
  auto deadline = std::chrono::steady_clock::now() + 5s;
  while(seen.find("wrapped:hello") == std::string::npos && std::chrono::steady_clock::now() < deadline) {
    if(auto bytes = viewer.read_until_type("pty_bytes", 1s)) seen += decode(*bytes);
  }
  ok = expect(ctx.verbose, seen.find("wrapped:hello") != std::string::npos, "output relayed") && ok;

  int exit_code = client->wait();
  ok = expect(ctx.verbose, exit_code == 0, "wrapped command exit code") && ok;
  auto ended = viewer.read_until_type("session_ended", 3s);
  ok = expect(ctx.verbose, ended && (*ended)["session_id"] == id && (*ended)["exit_code"] == 0, "hub saw the exit") && ok;

  work.reset();
  io.stop();
  io_thread.join();
  return ok;
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("TTYHUB_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("TTYHUB_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  ttyhub::test::LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"handshake", test_handshake},
    {"hello_required_and_invalid_lines", test_hello_required_and_invalid_lines},
    {"require_auth", test_require_auth},
    {"wrapper_session_flow", test_wrapper_session_flow},
    {"output_fan_out", test_output_fan_out},
    {"resubscribe_does_not_duplicate", test_resubscribe_does_not_duplicate},
    {"wait_state_and_push", test_wait_state_and_push},
    {"wrapper_disconnect_ends_session", test_wrapper_disconnect_ends_session},
    {"filesystem_requests", test_filesystem_requests},
    {"filesystem_rate_limit", test_filesystem_rate_limit},
    {"watch_directory", test_watch_directory},
    {"spawn_rejected", test_spawn_rejected},
    {"spawn_session", test_spawn_session},
    {"wrapper_client_end_to_end", test_wrapper_client_end_to_end}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " hub tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " hub tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
