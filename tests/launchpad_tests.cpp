#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "launchpad/cleanup.hpp"
#include "launchpad/config.hpp"
#include "launchpad/hash.hpp"
#include "launchpad/jsonlite.hpp"
#include "launchpad/liveness.hpp"
#include "launchpad/local_sandbox.hpp"
#include "launchpad/observability.hpp"
#include "launchpad/pipeline.hpp"
#include "launchpad/process.hpp"
#include "launchpad/request.hpp"
#include "launchpad/result_format.hpp"
#include "launchpad/startup_script.hpp"
#include "launchpad/version.hpp"

namespace fs = std::filesystem;
using namespace launchpad;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// ============================================================================
// Scripted remote executor
// ============================================================================
//
// Every call is appended to FakeWorld::calls ("run:<cmd>", "write:<path>",
// "resolve:<port>", "release"). Commands are answered by the first rule whose
// needle occurs in the command text; unmatched commands exit 0.

struct Rule {
  std::string needle;
  CommandResult result;
};

struct FakeWorld {
  std::vector<std::string> calls;
  std::map<std::string, std::string> files;
  std::vector<Rule> rules;
  std::string hostname{"8000-sbx42.sandbox.test"};
  std::string write_fail_path;
  std::string release_error;
  bool reject_allocation{false};
  int allocations{0};
  int releases{0};
  AllocateOptions last_allocation;

  void on(const std::string& needle, int exit_code, std::string out = "", std::string err = "") {
    Rule r;
    r.needle = needle;
    r.result.exit_code = exit_code;
    r.result.stdout_text = std::move(out);
    r.result.stderr_text = std::move(err);
    rules.push_back(std::move(r));
  }

  void on_transport_error(const std::string& needle, const std::string& message) {
    Rule r;
    r.needle = needle;
    r.result.error_message = message;
    rules.push_back(std::move(r));
  }

  std::size_t count_calls(const std::string& needle) const {
    std::size_t n = 0;
    for (const auto& c : calls) {
      if (contains(c, needle)) ++n;
    }
    return n;
  }

  // Index of the first call containing needle, or calls.size().
  std::size_t first_call(const std::string& needle) const {
    for (std::size_t i = 0; i < calls.size(); ++i) {
      if (contains(calls[i], needle)) return i;
    }
    return calls.size();
  }
};

class FakeExecutor : public IRemoteExecutor {
public:
  explicit FakeExecutor(FakeWorld& world) : world_(world) {}

  std::string sandbox_id() const override { return "fake-sbx-1"; }

  CommandResult run_command(const std::string& command, const CommandOptions&) override {
    world_.calls.push_back("run:" + command);
    for (const auto& rule : world_.rules) {
      if (contains(command, rule.needle)) return rule.result;
    }
    return CommandResult{};
  }

  std::optional<TransportError> write_file(const std::string& path,
                                           const std::string& content) override {
    world_.calls.push_back("write:" + path);
    if (!world_.write_fail_path.empty() && path == world_.write_fail_path) {
      return TransportError{"quota exceeded"};
    }
    world_.files[path] = content;
    return std::nullopt;
  }

  std::string resolve_hostname(std::uint16_t port) override {
    world_.calls.push_back("resolve:" + std::to_string(port));
    return world_.hostname;
  }

  std::optional<TransportError> release() override {
    world_.calls.push_back("release");
    ++world_.releases;
    if (!world_.release_error.empty()) return TransportError{world_.release_error};
    return std::nullopt;
  }

private:
  FakeWorld& world_;
};

class FakeProvider : public ISandboxProvider {
public:
  explicit FakeProvider(FakeWorld& world) : world_(world) {}

  std::string provider_id() const override { return "fake"; }

  std::unique_ptr<IRemoteExecutor> allocate(const AllocateOptions& options,
                                            std::string* error) override {
    ++world_.allocations;
    world_.last_allocation = options;
    if (world_.reject_allocation) {
      if (error) *error = "401 invalid api key";
      return nullptr;
    }
    return std::make_unique<FakeExecutor>(world_);
  }

private:
  FakeWorld& world_;
};

Credentials test_credentials() {
  Credentials c;
  c.sandbox_api_key = "sbx-key";
  c.google_api_key = "g-key";
  c.adk_api_key = "adk-key";
  return c;
}

ProvisionRequest agent_request() {
  ProvisionRequest r;
  r.files["agent.py"] = "root_agent = object()\n";
  r.files["tools/search.py"] = "def search(q):\n    return q\n";
  return r;
}

struct RecordingSleeper {
  std::vector<std::chrono::milliseconds> sleeps;
  Sleeper fn() {
    return [this](std::chrono::milliseconds d) { sleeps.push_back(d); };
  }
  std::chrono::milliseconds total() const {
    std::chrono::milliseconds t{0};
    for (auto d : sleeps) t += d;
    return t;
  }
};

// Every liveness probe answers "tool present, no signal".
void silence_all_probes(FakeWorld& w) {
  w.on("pgrep -f", 4);  // process up, port refused
  w.on("ss -tln", 1);
  w.on("http_code", 1, "http_status=000\n");
  w.on("/dev/tcp/127.0.0.1", 1);
}

// ============================================================================
// Scripted probes (verifier in isolation)
// ============================================================================

class ScriptedProbe : public ILivenessProbe {
public:
  ScriptedProbe(ProbeKind kind, std::vector<ProbeResult> answers, std::vector<ProbeKind>* trace)
      : kind_(kind), answers_(std::move(answers)), trace_(trace) {}

  ProbeKind kind() const override { return kind_; }

  ProbeResult try_check() override {
    trace_->push_back(kind_);
    if (answers_.empty()) return ProbeResult{};
    ProbeResult r = answers_.front();
    if (answers_.size() > 1) answers_.erase(answers_.begin());
    return r;
  }

private:
  ProbeKind kind_;
  std::vector<ProbeResult> answers_;
  std::vector<ProbeKind>* trace_;
};

ProbeResult verdict(ProbeVerdict v, bool weak = false) {
  ProbeResult r;
  r.verdict = v;
  r.tool_available = true;
  r.weak = weak;
  return r;
}

// ============================================================================
// Hash + JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(hash_domain("pkg:", "x") != blake3_hex("x"), "domain prefix changes the digest");
}

void test_package_digest() {
  std::map<std::string, std::string> a{{"agent.py", "A"}, {"util.py", "B"}};
  std::map<std::string, std::string> b;
  b["util.py"] = "B";
  b["agent.py"] = "A";
  expect(package_digest(a) == package_digest(b), "digest independent of insertion order");
  expect(package_digest(a).size() == 64, "digest is 64 hex chars");

  std::map<std::string, std::string> c{{"agent.py", "A"}, {"util.py", "C"}};
  expect(package_digest(a) != package_digest(c), "content change changes digest");

  std::map<std::string, std::string> framed1{{"ab", "c"}};
  std::map<std::string, std::string> framed2{{"a", "bc"}};
  expect(package_digest(framed1) != package_digest(framed2), "path/content boundary is framed");
  expect(short_id(package_digest(a)).size() == 12, "short id length");
}

void test_json_roundtrip_and_errors() {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse("{\"b\":1,\"a\":\"x\\u00e9\",\"c\":[true,null,-2.5]}", &err);
  expect(!err, "valid document parses");
  expect(jsonlite::get_u64(obj, "b") == 1, "integer read");
  expect(jsonlite::get_string(obj, "a") == "x\xc3\xa9", "unicode escape decoded");
  expect(jsonlite::to_json(jsonlite::Value(obj)).rfind("{\"a\":", 0) == 0, "keys serialized sorted");

  jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value(), "duplicate key rejected");
  jsonlite::parse("{\"a\":1} x", &err);
  expect(err.has_value(), "trailing data rejected");
  jsonlite::parse("[1]", &err);
  expect(err.has_value(), "top level must be an object");

  expect(jsonlite::escape("a\"b\n\x01") == "a\\\"b\\n\\u0001", "escape quotes and controls");
}

void test_json_surrogates() {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse("{\"s\":\"\\ud83d\\ude00\"}", &err);
  expect(!err, "valid surrogate pair parses");
  expect(jsonlite::get_string(obj, "s") == "\xf0\x9f\x98\x80", "pair decoded to 4-byte UTF-8");

  jsonlite::parse("{\"s\":\"x\\ud800\\u0041y\"}", &err);
  expect(err.has_value() && err->code == "json_parse_error", "high surrogate + non-low rejected");
  jsonlite::parse("{\"s\":\"x\\ud800Ay\"}", &err);
  expect(err.has_value(), "high surrogate followed by plain char rejected");
  jsonlite::parse("{\"s\":\"\\ud800\"}", &err);
  expect(err.has_value(), "trailing high surrogate rejected");
  jsonlite::parse("{\"s\":\"\\udc00\"}", &err);
  expect(err.has_value(), "lone low surrogate rejected");

  std::string error;
  parse_request_json("{\"files\":{\"agent.py\":\"x\\ud800\\u0041y\"}}", &error);
  expect(!error.empty(), "package file with broken surrogate rejected");
}

// ============================================================================
// Request validation
// ============================================================================

void test_parse_request_json() {
  std::string error;
  auto req = parse_request_json("{\"files\":{\"agent.py\":\"print(1)\"}}", &error);
  expect(error.empty(), "valid request parses");
  expect(req.files.at("agent.py") == "print(1)", "file content kept");

  parse_request_json("{\"files\":[]}", &error);
  expect(!error.empty(), "files must be an object");
  error.clear();
  parse_request_json("{\"files\":{\"agent.py\":1}}", &error);
  expect(!error.empty(), "non-string content rejected");
  error.clear();
  parse_request_json("not json", &error);
  expect(!error.empty(), "malformed JSON rejected");
}

void test_safe_relative_paths() {
  expect(is_safe_relative_path("agent.py"), "plain file");
  expect(is_safe_relative_path("tools/search.py"), "nested file");
  expect(!is_safe_relative_path(""), "empty");
  expect(!is_safe_relative_path("/etc/passwd"), "absolute");
  expect(!is_safe_relative_path("../x.py"), "parent escape");
  expect(!is_safe_relative_path("a/../../x.py"), "nested escape");
  expect(!is_safe_relative_path("a//b.py"), "empty component");
  expect(!is_safe_relative_path("./a.py"), "dot component");
  expect(!is_safe_relative_path("a\\b.py"), "backslash");
}

void test_validate_request() {
  ProvisionRequest r;
  r.files["other.txt"] = "x";
  auto e = validate_request(r, "agent.py");
  expect(e.has_value(), "missing entry point rejected");
  expect(e->error_class == ErrorClass::client_input, "missing entry point is client input");
  expect(e->code == ErrorCode::missing_entry_point, "missing entry point code");
  expect(e->message == "No agent.py file provided", "display message");

  r.files["agent.py"] = "";
  expect(validate_request(r, "agent.py")->code == ErrorCode::missing_entry_point,
         "empty entry point rejected");

  r.files["agent.py"] = "x";
  r.files["../evil.py"] = "y";
  e = validate_request(r, "agent.py");
  expect(e && e->code == ErrorCode::path_escape, "path escape rejected");

  expect(!validate_request(agent_request(), "agent.py").has_value(), "valid request passes");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults_and_flavors() {
  PipelineConfig c;
  expect(c.port == 8000, "default port");
  expect(c.allocate_timeout_ms == 300000, "default allocation lifetime");
  expect(c.launch_timeout_ms == 60000, "default launch bound");
  expect(c.effective_server_command() == "adk api_server --host 0.0.0.0 --port 8000",
         "default server command");
  expect(c.package_path("agent.py") == "workspace/agent_package/agent.py", "package path");

  DeploymentFlavor f;
  expect(flavor_by_name("root", &f), "root flavor known");
  expect(f.workspace_dir == "app" && f.run_as_root, "root flavor shape");
  expect(!flavor_by_name("cluster", &f), "unknown flavor rejected");
  expect(f.name == "root", "unknown flavor leaves output untouched");
}

void test_config_validation() {
  auto r = validate_config("{\"port\":9000,\"colour\":\"blue\"}");
  expect(r.ok, "unknown key is only a warning");
  expect(r.warnings.size() == 1, "one warning");

  r = validate_config("{\"port\":\"9000\"}");
  expect(!r.ok && r.errors.size() == 1, "wrong type is an error");

  r = validate_config("{\"launch_timeout_ms\":0}");
  expect(!r.ok, "zero timeout is an error");

  r = validate_config("{\"port\":70000}");
  expect(!r.ok, "port out of range");

  r = validate_config("{\"workspace_dir\":\"/abs\"}");
  expect(!r.ok, "absolute workspace rejected");

  r = validate_config("{\"flavor\":\"nope\"}");
  expect(!r.ok, "unknown flavor is an error");

  r = validate_config("{");
  expect(!r.ok && !r.errors.empty(), "parse error reported");
}

void test_config_numeric_bounds() {
  auto r = validate_config("{\"startup_attempts\":4294967296}");
  expect(!r.ok, "attempts wider than 32 bits rejected");
  r = validate_config("{\"verify_attempts\":4294967296}");
  expect(!r.ok, "verify attempts wider than 32 bits rejected");
  r = validate_config("{\"startup_spacing_s\":4294967297}");
  expect(!r.ok, "spacing wider than 32 bits rejected");
  r = validate_config("{\"allocate_timeout_ms\":9223372036854775808}");
  expect(!r.ok, "timeout beyond the lifetime ceiling rejected");
  r = validate_config("{\"launch_timeout_ms\":" + std::to_string(kMaxTimeoutMs + 1) + "}");
  expect(!r.ok, "launch timeout one past the ceiling rejected");
  r = validate_config("{\"launch_timeout_ms\":" + std::to_string(kMaxTimeoutMs) +
                      ",\"port\":65535,\"process_grace_s\":0}");
  expect(r.ok, "values at the bounds accepted");

  PipelineConfig c;
  std::string error;
  expect(!load_config_json("{\"startup_attempts\":4294967296,\"verify_attempts\":4294967296}", &c,
                           &error),
         "overflowing attempts not applied");
  expect(c.startup_attempts == 30 && c.verify_attempts == 5, "config untouched");
  expect(contains(render_startup_script(c.startup_script_spec()), "i<=30;"),
         "script keeps the default attempt loop");
}

void test_load_config_json() {
  PipelineConfig c;
  std::string error;
  expect(load_config_json("{\"flavor\":\"root\",\"package_dir\":\"pkg\",\"verify_attempts\":3}",
                          &c, &error),
         "config applies");
  expect(c.flavor.workspace_dir == "app", "flavor applied");
  expect(c.flavor.package_dir == "pkg", "explicit key overrides flavor");
  expect(c.verify_attempts == 3, "numeric field applied");

  PipelineConfig before = c;
  expect(!load_config_json("{\"verify_attempts\":0,\"port\":1234}", &c, &error), "invalid rejected");
  expect(!error.empty(), "error text set");
  expect(c.port == before.port, "failed load leaves config untouched");
}

void test_local_provider_defaults() {
  PipelineConfig c;
  apply_local_provider_defaults(&c);
  expect(!c.require_sandbox_key && c.url_scheme == "http", "local defaults");

  FakeWorld w;
  FakeProvider provider(w);
  Credentials creds = test_credentials();
  creds.sandbox_api_key.clear();
  StageRunner runner(provider, c, creds);
  runner.set_sleeper([](std::chrono::milliseconds) {});
  ProvisionOutcome out = runner.run(agent_request());
  expect(out.ok, "runs without a provider key");
  expect(out.endpoint == "http://8000-sbx42.sandbox.test", "plain-HTTP endpoint");
}

void test_credentials_missing_and_env() {
  Credentials c;
  c.google_api_key = "your_google_api_key_here";
  auto missing = c.missing(true);
  expect(missing.size() == 2, "placeholder and empty keys are missing");
  expect(missing[0] == "SANDBOX_API_KEY" && missing[1] == "GOOGLE_API_KEY", "missing names");
  expect(c.missing(false).size() == 1, "sandbox key optional when not required");

  c.google_api_key = "real";
  auto env = c.sandbox_env();
  expect(env.at("ADK_API_KEY") == "real", "ADK key falls back to Google key");
  expect(env.at("PYTHONUNBUFFERED") == "1", "unbuffered python");
}

// ============================================================================
// Liveness verifier
// ============================================================================

void test_chain_stops_at_first_positive() {
  std::vector<ProbeKind> trace;
  std::vector<std::unique_ptr<ILivenessProbe>> probes;
  probes.push_back(std::make_unique<ScriptedProbe>(
      ProbeKind::socket_table, std::vector<ProbeResult>{verdict(ProbeVerdict::positive)}, &trace));
  probes.push_back(std::make_unique<ScriptedProbe>(ProbeKind::http, std::vector<ProbeResult>{}, &trace));
  probes.push_back(std::make_unique<ScriptedProbe>(ProbeKind::tcp, std::vector<ProbeResult>{}, &trace));
  probes.push_back(std::make_unique<ScriptedProbe>(ProbeKind::process, std::vector<ProbeResult>{}, &trace));

  LivenessVerifier v(std::move(probes));
  RecordingSleeper sleeper;
  auto report = v.verify(5, std::chrono::milliseconds(2000), sleeper.fn());
  expect(report.live, "positive socket probe is live");
  expect(report.method == "socket_table", "method recorded");
  expect(trace.size() == 1, "later probes never invoked");
  expect(sleeper.sleeps.empty(), "no sleep when first round succeeds");
}

void test_chain_order_and_negative_stop() {
  std::vector<ProbeKind> trace;
  std::vector<std::unique_ptr<ILivenessProbe>> probes;
  probes.push_back(std::make_unique<ScriptedProbe>(
      ProbeKind::socket_table, std::vector<ProbeResult>{ProbeResult{}}, &trace));
  probes.push_back(std::make_unique<ScriptedProbe>(
      ProbeKind::http, std::vector<ProbeResult>{verdict(ProbeVerdict::negative)}, &trace));
  probes.push_back(std::make_unique<ScriptedProbe>(
      ProbeKind::tcp, std::vector<ProbeResult>{verdict(ProbeVerdict::positive)}, &trace));

  LivenessVerifier v(std::move(probes));
  auto report = v.check_once();
  expect(!report.live, "negative ends the pass");
  expect(trace.size() == 2, "probe after a negative not invoked");
  expect(trace[0] == ProbeKind::socket_table && trace[1] == ProbeKind::http, "order preserved");
}

void test_verifier_round_budget() {
  std::vector<ProbeKind> trace;
  std::vector<std::unique_ptr<ILivenessProbe>> probes;
  probes.push_back(std::make_unique<ScriptedProbe>(ProbeKind::socket_table, std::vector<ProbeResult>{}, &trace));
  probes.push_back(std::make_unique<ScriptedProbe>(ProbeKind::process, std::vector<ProbeResult>{}, &trace));

  LivenessVerifier v(std::move(probes));
  RecordingSleeper sleeper;
  auto report = v.verify(5, std::chrono::milliseconds(2000), sleeper.fn());
  expect(!report.live, "all inconclusive is not live");
  expect(report.rounds == 5, "all rounds used");
  expect(report.attempts.size() == 10, "every probe tried every round");
  expect(sleeper.sleeps.size() == 4, "sleep between rounds only");
  expect(sleeper.total() == std::chrono::milliseconds(8000), "full bounded wait elapsed");
}

void test_verifier_succeeds_in_later_round() {
  std::vector<ProbeKind> trace;
  std::vector<std::unique_ptr<ILivenessProbe>> probes;
  probes.push_back(std::make_unique<ScriptedProbe>(
      ProbeKind::socket_table,
      std::vector<ProbeResult>{ProbeResult{}, ProbeResult{}, verdict(ProbeVerdict::positive)}, &trace));
  LivenessVerifier v(std::move(probes));
  RecordingSleeper sleeper;
  auto report = v.verify(5, std::chrono::milliseconds(100), sleeper.fn());
  expect(report.live && report.rounds == 3, "live in third round");
  expect(sleeper.sleeps.size() == 2, "two sleeps before success");
}

void test_remote_probe_exit_mapping() {
  FakeWorld w;
  FakeExecutor ex(w);
  LivenessTarget t;
  t.process_pattern = process_match_pattern("adk api_server --port 8000");

  w.on("ss -tln", 127);
  RemoteProbe ss(ex, ProbeKind::socket_table, t, 1000);
  auto r = ss.try_check();
  expect(r.verdict == ProbeVerdict::inconclusive && !r.tool_available, "missing tool is inconclusive");

  w.rules.clear();
  w.on("ss -tln", 1);
  r = ss.try_check();
  expect(r.verdict == ProbeVerdict::inconclusive && r.tool_available, "no listener is inconclusive");

  w.rules.clear();
  w.on_transport_error("ss -tln", "connection reset");
  r = ss.try_check();
  expect(r.verdict == ProbeVerdict::inconclusive, "transport error is inconclusive");

  RemoteProbe proc(ex, ProbeKind::process, t, 1000);
  w.rules.clear();
  w.on("pgrep", 1);
  expect(proc.try_check().verdict == ProbeVerdict::negative, "no process is negative");
  w.rules.clear();
  w.on("pgrep", 3);
  r = proc.try_check();
  expect(r.verdict == ProbeVerdict::positive && r.weak, "process without tcp tool is weak positive");
  w.rules.clear();
  w.on("pgrep", 4);
  expect(proc.try_check().verdict == ProbeVerdict::inconclusive, "refused port is inconclusive");
  w.rules.clear();
  expect(proc.try_check().verdict == ProbeVerdict::positive, "process + tcp is positive");
}

void test_probe_scripts() {
  LivenessTarget t;
  t.port = 8123;
  t.process_pattern = "[a]dk api_server";
  expect(contains(remote_probe_script(ProbeKind::socket_table, t), "[:.]8123[[:space:]]"),
         "socket probe targets port");
  expect(contains(remote_probe_script(ProbeKind::http, t), "http://127.0.0.1:8123"),
         "http probe targets port");
  expect(contains(remote_probe_script(ProbeKind::tcp, t), "/dev/tcp/127.0.0.1/8123"),
         "tcp probe targets port");
  const std::string proc = remote_probe_script(ProbeKind::process, t);
  expect(contains(proc, "pgrep -f '[a]dk api_server'"), "process probe pattern");
  expect(proc.find("pgrep -f") < proc.find("sleep 2"), "grace sleep after process check");
  expect(proc.find("sleep 2") < proc.find("/dev/tcp"), "tcp repeated after grace");

  expect(process_match_pattern("adk api_server --host 0.0.0.0 --port 8000") == "[a]dk api_server",
         "pattern from server command");
  expect(process_match_pattern("python3 -m http.server") == "[p]ython3", "flag not included");
}

// ============================================================================
// Startup script
// ============================================================================

void test_startup_script_contract() {
  PipelineConfig c;
  const std::string s = render_startup_script(c.startup_script_spec());
  const auto pos = [&](const std::string& needle) { return s.find(needle); };

  expect(s.rfind("#!/bin/bash\n", 0) == 0, "bash shebang");
  expect(pos("source 'venv'/bin/activate") != std::string::npos, "activates venv");
  expect(pos("cd \"$SCRIPT_DIR\"") < pos("source 'venv'/bin/activate"),
         "changes into its own directory first");
  expect(pos(". ./'.env'") != std::string::npos, "exports credentials");
  expect(pos("pip install --upgrade 'google-adk'") != std::string::npos, "just-in-time reinstall");
  expect(pos("pkill -f '[a]dk api_server'") < pos("setsid nohup adk api_server"),
         "previous instance stopped before launch");
  expect(pos("echo $! > 'server.pid'") > pos("setsid nohup"), "pid recorded after launch");
  expect(pos("> 'server.log' 2>&1 < /dev/null &") != std::string::npos, "output to log, detached");
  expect(pos("for ((i=1; i<=30; i++))") != std::string::npos, "30 attempts");
  expect(pos("tail -n 50 'server.log'") != std::string::npos, "log tail on failure");
  const std::string check = s.substr(pos("check_port() {"));
  expect(check.find("ss -tln") < check.find("http_code") &&
             check.find("http_code") < check.find("/dev/tcp") &&
             check.find("/dev/tcp") < check.find("pgrep -f"),
         "check_port keeps chain order");
  expect(pos("check_port() {") > pos("echo $! > 'server.pid'"), "checks run after launch");
}

void test_shell_quote_and_initializer() {
  expect(shell_quote("plain") == "'plain'", "plain quote");
  expect(shell_quote("it's") == "'it'\\''s'", "embedded quote");
  expect(package_initializer("agent.py", "root_agent") ==
             "from .agent import root_agent\n__all__ = [\"root_agent\"]\n",
         "initializer re-exports entry symbol");
  expect(package_initializer("app/main.py", "root_agent").rfind("from .app.main import", 0) == 0,
         "nested entry module");
}

// ============================================================================
// Stage runner (scripted executor)
// ============================================================================

int g_stage_events = 0;
int g_provision_events = 0;
std::string g_last_provision_class;
void count_stage_event(const StageEvent&) { ++g_stage_events; }
void count_provision_event(const ProvisionEvent& ev) {
  ++g_provision_events;
  g_last_provision_class = ev.error_class;
}

void test_happy_path() {
  FakeWorld w;
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  RecordingSleeper sleeper;
  runner.set_sleeper(sleeper.fn());

  g_stage_events = 0;
  g_provision_events = 0;
  set_stage_event_hook(count_stage_event);
  set_provision_event_hook(count_provision_event);

  const auto t0 = std::chrono::steady_clock::now();
  ProvisionOutcome out = runner.run(agent_request());
  const auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - t0);

  set_stage_event_hook(nullptr);
  set_provision_event_hook(nullptr);

  expect(out.ok, "happy path succeeds");
  expect(out.endpoint == "https://8000-sbx42.sandbox.test", "endpoint from resolved host");
  expect(out.sandbox != nullptr, "live handle handed to caller");
  expect(w.releases == 0, "no release on success");
  expect(w.allocations == 1, "one allocation");
  expect(g_stage_events == 8, "eight stage events");
  expect(g_provision_events == 1, "one provision event");
  expect(out.duration_ms <= static_cast<std::uint64_t>(wall.count()), "duration bounded by wall time");
  expect(out.verify_method == "socket_table", "first probe answered");
  expect(sleeper.sleeps.empty(), "no liveness sleeps");

  expect(w.last_allocation.timeout_ms == 300000, "allocation lifetime passed");
  expect(w.last_allocation.env.at("GOOGLE_API_KEY") == "g-key", "credentials seeded");
  expect(!w.last_allocation.run_as_root, "default flavor not root");

  expect(w.files.count("workspace/agent_package/agent.py") == 1, "entry file written");
  expect(w.files.count("workspace/agent_package/tools/search.py") == 1, "nested file written");
  expect(contains(w.files["workspace/agent_package/__init__.py"], "from .agent import root_agent"),
         "initializer synthesized");
  expect(contains(w.files["workspace/.env"], "GOOGLE_API_KEY='g-key'"), "env file written");
  expect(contains(w.files["workspace/.env"], "ADK_API_KEY='adk-key'"), "adk key written");
  expect(contains(w.files["workspace/adk.config.json"], "\"api_key\""), "framework config written");
  expect(w.files.count("workspace/start_server.sh") == 1, "startup script written");

  expect(w.first_call("'python3.9' -m venv") < w.first_call("pip install"), "venv before install");
  expect(w.first_call("pip install") < w.first_call("write:workspace/.env"), "install before secrets");
  expect(w.first_call("chmod +x") < w.first_call("./'start_server.sh'"), "chmod before launch");
  expect(w.first_call("./'start_server.sh'") < w.first_call("ss -tln"), "launch before verify");
  expect(w.first_call("ss -tln") < w.first_call("resolve:8000"), "verify before expose");

  const std::string json = outcome_to_json(out);
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  expect(!err, "success JSON parses");
  expect(jsonlite::get_string(obj, "openUrl") == out.endpoint, "openUrl");
  expect(jsonlite::get_bool(obj, "showOpenLink"), "showOpenLink");
  expect(jsonlite::get_string(obj, "linkText") == "Open Agent UI", "linkText");
  expect(std::holds_alternative<std::nullptr_t>(obj.at("error").v), "error is null");
  const auto& details = std::get<jsonlite::Object>(obj.at("executionDetails").v);
  expect(jsonlite::get_string(details, "status") == "running", "status running");
  expect(jsonlite::get_u64(details, "exitCode", 9) == 0, "exit code 0");
  expect(jsonlite::get_string(details, "serverUrl") == out.endpoint, "serverUrl");
  expect(http_status(out) == 200, "HTTP 200");
}

void test_missing_entry_point_makes_no_remote_calls() {
  FakeWorld w;
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  ProvisionRequest r;
  r.files["other.txt"] = "x";
  ProvisionOutcome out = runner.run(r);
  expect(!out.ok, "rejected");
  expect(out.error->error_class == ErrorClass::client_input, "ClientInputError");
  expect(w.allocations == 0, "no allocation");
  expect(w.calls.empty(), "zero remote calls");
  expect(http_status(out) == 400, "HTTP 400");
  expect(contains(outcome_to_json(out), "\"name\":\"ClientInputError\""), "error name in JSON");
}

void test_path_escape_rejected() {
  FakeWorld w;
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  ProvisionRequest r = agent_request();
  r.files["/etc/cron.d/x"] = "boom";
  ProvisionOutcome out = runner.run(r);
  expect(!out.ok && out.error->code == ErrorCode::path_escape, "path escape rejected");
  expect(w.calls.empty(), "no remote calls");
}

void test_missing_credentials() {
  FakeWorld w;
  FakeProvider provider(w);
  Credentials c = test_credentials();
  c.google_api_key.clear();
  StageRunner runner(provider, PipelineConfig{}, c);
  ProvisionOutcome out = runner.run(agent_request());
  expect(!out.ok, "fails");
  expect(out.error->error_class == ErrorClass::credential, "CredentialError");
  expect(out.error->code == ErrorCode::credentials_missing, "credentials_missing");
  expect(contains(out.error->message, "GOOGLE_API_KEY"), "names missing key");
  expect(w.allocations == 0, "no allocation attempted");
  expect(w.releases == 0, "nothing to release");
}

void test_allocation_rejected() {
  FakeWorld w;
  w.reject_allocation = true;
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  ProvisionOutcome out = runner.run(agent_request());
  expect(!out.ok, "fails");
  expect(out.error->error_class == ErrorClass::credential, "CredentialError");
  expect(out.error->code == ErrorCode::allocation_rejected, "allocation_rejected");
  expect(out.error->detail == "401 invalid api key", "provider text in detail");
  expect(w.calls.empty() && w.releases == 0, "no cleanup without a handle");
  expect(out.cleanup_errors.empty(), "no cleanup errors");
  expect(http_status(out) == 500, "HTTP 500");
}

void test_pinned_python_fallback() {
  FakeWorld w;
  w.on("command -v 'python3.9'", 1);
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  runner.set_sleeper([](std::chrono::milliseconds) {});
  ProvisionOutcome out = runner.run(agent_request());
  expect(out.ok, "pinned interpreter absence is not fatal");
  expect(w.count_calls("'python3.9' -m venv") == 0, "pinned interpreter not used");
  expect(w.count_calls("'python3' -m venv") == 1, "default interpreter used");
}

void test_venv_failure_is_fatal() {
  FakeWorld w;
  w.on("-m venv", 1, "", "ensurepip is not available");
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  ProvisionOutcome out = runner.run(agent_request());
  expect(!out.ok && out.error->code == ErrorCode::venv_create_failed, "venv failure fatal");
  expect(out.error->error_class == ErrorClass::provisioning, "ProvisioningError");
  expect(w.count_calls("-m venv") == 2, "pinned then default attempted");
  expect(contains(out.error->detail, "ensurepip"), "stderr carried in detail");
  expect(w.releases == 1, "released once");
}

void test_install_failure_and_soft_verification() {
  {
    FakeWorld w;
    w.on("pip list", 1);
    FakeProvider provider(w);
    StageRunner runner(provider, PipelineConfig{}, test_credentials());
    runner.set_sleeper([](std::chrono::milliseconds) {});
    ProvisionOutcome out = runner.run(agent_request());
    expect(out.ok, "unconfirmed install is only a warning");
    bool warned = false;
    for (const auto& e : out.log) {
      if (e.step == "pip_list" && contains(e.note, "warning")) warned = true;
    }
    expect(warned, "warning recorded in stage log");
  }
  {
    FakeWorld w;
    w.on("pip install", 1, "Collecting google-adk", "ERROR: No matching distribution");
    FakeProvider provider(w);
    StageRunner runner(provider, PipelineConfig{}, test_credentials());
    ProvisionOutcome out = runner.run(agent_request());
    expect(!out.ok && out.error->code == ErrorCode::install_failed, "install failure fatal");
    expect(contains(out.error->detail, "No matching distribution"), "install output kept");
    expect(w.releases == 1, "released once");
  }
}

void test_secret_write_failure() {
  FakeWorld w;
  w.write_fail_path = "workspace/.env";
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  ProvisionOutcome out = runner.run(agent_request());
  expect(!out.ok && out.error->code == ErrorCode::config_write_failed, "config write failure");
  expect(out.error->detail == "quota exceeded", "transport text kept");
  for (const auto& e : out.log) {
    expect(!contains(e.note, "g-key") && !contains(e.stdout_text, "g-key"), "secret not logged");
  }
}

void test_launch_failure_cleans_up_once() {
  FakeWorld w;
  w.on("./'start_server.sh'", 1, "starting\n", "Traceback\nImportError: no module\n");
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  ProvisionOutcome out = runner.run(agent_request());

  expect(!out.ok, "fails");
  expect(out.error->error_class == ErrorClass::provisioning, "ProvisioningError");
  expect(out.error->code == ErrorCode::launch_failed, "launch_failed");
  expect(out.error->stage == "launch", "failed stage");
  expect(contains(out.error->detail, "ImportError"), "script stderr tail carried");
  expect(out.stderr_lines.size() == 2, "stderr lines kept");
  expect(w.count_calls("ss -tln") == 0, "verification skipped");
  expect(w.count_calls("resolve:") == 0, "expose skipped");
  expect(w.releases == 1, "release exactly once");
  const std::size_t kill = w.first_call("server.pid");
  expect(kill < w.calls.size(), "pid kill attempted");
  expect(kill < w.first_call("release"), "pid kill before release");
  expect(out.sandbox == nullptr, "no handle returned on failure");
}

void test_cleanup_errors_never_mask_primary() {
  FakeWorld w;
  w.on("./'start_server.sh'", 2);
  w.on_transport_error("server.pid", "socket closed");
  w.release_error = "sandbox not found";
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  ProvisionOutcome out = runner.run(agent_request());
  expect(out.error->code == ErrorCode::launch_failed, "primary error kept");
  expect(out.cleanup_errors.size() == 2, "both cleanup failures recorded");
  expect(w.releases == 1, "release still attempted exactly once");
  const auto doc = jsonlite::parse(outcome_to_json(out), nullptr);
  const auto& details = std::get<jsonlite::Object>(doc.at("errorDetails").v);
  const auto& cleanup = std::get<jsonlite::Array>(details.at("cleanupErrors").v);
  expect(cleanup.size() == 2, "cleanup errors in diagnostics");
  for (const auto& entry : cleanup) {
    const auto& e = std::get<jsonlite::Object>(entry.v);
    expect(jsonlite::get_string(e, "name") == "CleanupError", "cleanup entry class");
    expect(jsonlite::get_string(e, "code") == "cleanup_failed", "cleanup entry code");
  }
  expect(jsonlite::get_string(std::get<jsonlite::Object>(cleanup[1].v), "message") ==
             "release: sandbox not found",
         "release failure text kept");
  expect(jsonlite::get_string(details, "name") == "ProvisioningError", "primary class unchanged");
  expect(jsonlite::get_string(jsonlite::parse(outcome_to_json(out), nullptr), "error") ==
             "Startup script exited with code 2",
         "display message unchanged");
}

void test_liveness_exhaustion() {
  FakeWorld w;
  silence_all_probes(w);
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  RecordingSleeper sleeper;
  runner.set_sleeper(sleeper.fn());
  ProvisionOutcome out = runner.run(agent_request());

  expect(!out.ok, "fails");
  expect(out.error->error_class == ErrorClass::verification, "VerificationError");
  expect(out.error->code == ErrorCode::liveness_exhausted, "liveness_exhausted");
  expect(out.verify_rounds == 5, "full retry budget used");
  expect(w.count_calls("ss -tln") == 5, "socket probe once per round");
  expect(w.count_calls("pgrep -f") == 5, "process probe once per round");
  expect(sleeper.sleeps.size() == 4, "sleeps between rounds");
  expect(sleeper.total() == std::chrono::milliseconds(8000), "bounded wait fully elapsed");
  expect(w.releases == 1, "released once");
  expect(w.count_calls("resolve:") == 0, "never exposed");
}

void test_weak_process_fallback() {
  FakeWorld w;
  w.on("pgrep -f", 3);
  w.on("ss -tln", 127);
  w.on("http_code", 127);
  w.on("/dev/tcp/127.0.0.1", 127);
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  runner.set_sleeper([](std::chrono::milliseconds) {});
  ProvisionOutcome out = runner.run(agent_request());
  expect(out.ok, "process-only signal accepted");
  expect(out.weak_verification, "marked weak");
  expect(out.verify_method == "process", "process method");
}

void test_hostname_unresolved() {
  FakeWorld w;
  w.hostname.clear();
  FakeProvider provider(w);
  StageRunner runner(provider, PipelineConfig{}, test_credentials());
  runner.set_sleeper([](std::chrono::milliseconds) {});
  ProvisionOutcome out = runner.run(agent_request());
  expect(!out.ok && out.error->code == ErrorCode::hostname_unresolved, "empty hostname fails");
  expect(w.releases == 1, "released once");
}

void test_root_flavor_layout() {
  FakeWorld w;
  FakeProvider provider(w);
  PipelineConfig c;
  c.flavor = root_flavor();
  StageRunner runner(provider, c, test_credentials());
  runner.set_sleeper([](std::chrono::milliseconds) {});
  ProvisionOutcome out = runner.run(agent_request());
  expect(out.ok, "root flavor succeeds");
  expect(w.last_allocation.run_as_root, "root requested");
  expect(w.files.count("app/agent_package/agent.py") == 1, "files under app/");
  expect(w.count_calls("cd 'app' && ./'start_server.sh'") == 1, "launch from app/");
}

void test_cleanup_coordinator_direct() {
  FakeWorld w;
  PipelineConfig c;
  CleanupCoordinator coordinator(c);
  ProvisionContext ctx;
  ctx.sandbox = std::make_unique<FakeExecutor>(w);
  ctx.current_stage = "verify";

  ProvisionError primary;
  primary.code = ErrorCode::liveness_exhausted;
  primary.error_class = classify(primary.code);
  primary.message = "not reachable";
  ProvisionOutcome out = coordinator.fail(ctx, primary);
  expect(coordinator.invocations() == 1, "cleanup invoked once");
  expect(w.releases == 1, "released once");
  expect(ctx.sandbox == nullptr, "handle taken from context");

  CleanupReport again = coordinator.cleanup(ctx);
  expect(!again.release_attempted, "second cleanup has nothing to release");
  expect(w.releases == 1, "still one release");
  expect(out.error->message == "not reachable", "primary error preserved");
  expect(contains(pid_kill_command(c), "'workspace/server.pid'"), "kill targets pid file");
}

// ============================================================================
// Observability
// ============================================================================

void test_stats_and_event_log() {
  const fs::path tmp = fs::temp_directory_path() / "launchpad_event_test";
  fs::create_directories(tmp);
  const fs::path log = tmp / "events.jsonl";
  fs::remove(log);
  ::setenv("LAUNCHPAD_EVENT_LOG", log.string().c_str(), 1);

  auto& stats = global_provision_stats();
  const auto runs_before = stats.total_runs.load();
  const auto verification_before =
      stats.failures_by_class[static_cast<std::size_t>(ErrorClass::verification)].load();

  StageEvent se;
  se.deployment_id = "d1";
  se.stage = "allocate";
  se.ok = true;
  emit_stage_event(se);

  ProvisionEvent pe;
  pe.deployment_id = "d1";
  pe.ok = false;
  pe.error_class = "VerificationError";
  pe.duration_ns = 3000000000ull;
  emit_provision_event(pe);
  ::unsetenv("LAUNCHPAD_EVENT_LOG");

  expect(stats.total_runs.load() == runs_before + 1, "run counted");
  expect(stats.failures_by_class[static_cast<std::size_t>(ErrorClass::verification)].load() ==
             verification_before + 1,
         "failure class counted");

  std::ifstream in(log);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(line, &err);
    expect(!err, "event line is JSON");
    expect(jsonlite::get_string(obj, "deployment_id") == "d1", "deployment id in event");
    ++lines;
  }
  expect(lines == 2, "one line per event");
  expect(contains(stats.to_json(), "\"VerificationError\":"), "stats JSON");

  LatencyHistogram h;
  h.record(1500000000ull);
  expect(h.count() == 1 && h.percentile(0.5) > 0.0, "histogram records milliseconds");
  fs::remove_all(tmp);
}

void test_version_manifest() {
  const auto m = version::current_manifest();
  const std::string json = version::manifest_to_json(m);
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  expect(!err, "manifest is JSON");
  expect(jsonlite::get_string(obj, "hash_primitive") == "blake3", "hash primitive");
  expect(jsonlite::get_u64(obj, "result_schema") == version::RESULT_SCHEMA_VERSION, "schema version");
}

// ============================================================================
// Local sandbox provider (/bin/bash)
// ============================================================================

fs::path local_base() {
  return fs::temp_directory_path() / ("launchpad_local_" + std::to_string(::getpid()));
}

std::unique_ptr<IRemoteExecutor> local_allocate(LocalSandboxProvider& p, AllocateOptions opts = {}) {
  std::string error;
  auto sbx = p.allocate(opts, &error);
  expect(sbx != nullptr, "local allocation: " + error);
  return sbx;
}

void test_local_run_and_files() {
  LocalSandboxOptions o;
  o.base_dir = local_base().string();
  LocalSandboxProvider p(o);
  AllocateOptions opts;
  opts.env["LAUNCHPAD_TEST_VAR"] = "seeded";
  auto sbx = local_allocate(p, opts);

  auto r = sbx->run_command("echo hi; echo err >&2; exit 3", CommandOptions{});
  expect(!r.transport_failed(), "command ran");
  expect(r.exit_code == 3, "exit code propagated");
  expect(r.stdout_text == "hi\n" && r.stderr_text == "err\n", "streams captured");

  expect(sbx->run_command("echo $LAUNCHPAD_TEST_VAR", {}).stdout_text == "seeded\n",
         "allocation env visible");

  expect(!sbx->write_file("/pkg/a.txt", "content").has_value(), "write succeeds");
  expect(sbx->run_command("cat pkg/a.txt", {}).stdout_text == "content", "file under sandbox root");
  expect(sbx->write_file("../escape.txt", "x").has_value(), "escape refused");

  expect(sbx->resolve_hostname(8000) == "localhost:8000", "local hostname");

  const std::string root = static_cast<LocalSandbox*>(sbx.get())->root();
  expect(!sbx->release().has_value(), "release succeeds");
  expect(!fs::exists(root), "directory removed");
  expect(sbx->release().has_value(), "second release reports error");
  expect(sbx->run_command("true", {}).transport_failed(), "commands after release fail");
  fs::remove_all(local_base());
}

void test_local_timeout() {
  LocalSandboxOptions o;
  o.base_dir = local_base().string();
  LocalSandboxProvider p(o);
  auto sbx = local_allocate(p);
  CommandOptions c;
  c.timeout_ms = 200;
  const auto t0 = std::chrono::steady_clock::now();
  auto r = sbx->run_command("sleep 5", c);
  const auto took = std::chrono::steady_clock::now() - t0;
  expect(r.timed_out && r.exit_code == 124, "timeout reported");
  expect(took < std::chrono::seconds(3), "timeout enforced");
  expect(!sbx->release().has_value(), "release");

  AllocateOptions zero;
  zero.timeout_ms = 0;
  std::string error;
  expect(p.allocate(zero, &error) == nullptr && !error.empty(), "zero lifetime rejected");

  AllocateOptions endless;
  endless.timeout_ms = kMaxTimeoutMs + 1;
  expect(p.allocate(endless, &error) == nullptr, "lifetime beyond ceiling rejected");

  AllocateOptions root;
  root.run_as_root = true;
  auto rs = p.allocate(root, &error);
  expect((rs != nullptr) == (::geteuid() == 0), "root honored only when already root");
  if (rs) expect(!rs->release().has_value(), "release root sandbox");
  fs::remove_all(local_base());
}

int count_matching(const std::string& pattern) {
  ProcessSpec spec;
  spec.command = "/bin/bash";
  spec.argv = {"-c", "pgrep -f " + shell_quote(pattern) + " | wc -l"};
  spec.timeout_ms = 5000;
  const ProcessResult r = run_process(spec);
  return std::atoi(r.stdout_text.c_str());
}

void test_local_startup_script_restart() {
  LocalSandboxOptions o;
  o.base_dir = local_base().string();
  LocalSandboxProvider p(o);
  auto sbx = local_allocate(p);

  StartupScriptSpec spec;
  spec.framework_cli = "bash";
  spec.server_command = "sleep 3017";
  spec.target.port = 58217;
  spec.target.process_pattern = process_match_pattern(spec.server_command);
  spec.target.grace_seconds = 0;
  spec.attempts = 1;
  spec.stop_wait_seconds = 5;

  expect(!sbx->write_file("venv/bin/activate", "").has_value(), "fake venv");
  expect(!sbx->write_file("start.sh", render_startup_script(spec)).has_value(), "script written");
  expect(sbx->run_command("chmod +x start.sh", {}).succeeded(), "chmod");

  CommandOptions c;
  c.timeout_ms = 30000;
  auto first = sbx->run_command("./start.sh", c);
  expect(!first.timed_out, "first launch returns while server keeps running");
  expect(first.exit_code == 1, "no port, so the script reports failure");
  expect(contains(first.stderr_text, "not reachable on port 58217"), "failure message");
  expect(count_matching("[s]leep 3017") == 1, "server detached and running");

  auto second = sbx->run_command("./start.sh", c);
  expect(!second.timed_out, "second launch returns");
  expect(count_matching("[s]leep 3017") == 1, "restart leaves exactly one instance");

  expect(!sbx->release().has_value(), "release");
  for (int i = 0; i < 50 && count_matching("[s]leep 3017") > 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  expect(count_matching("[s]leep 3017") == 0, "release stops the recorded server");
  fs::remove_all(local_base());
}

}  // namespace

int main() {
  std::cout << "=== Launchpad Test Suite ===\n";

  std::cout << "\n[Hash + JSON]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("package digest", test_package_digest);
  run_test("JSON parse/serialize/errors", test_json_roundtrip_and_errors);
  run_test("JSON surrogate validation", test_json_surrogates);

  std::cout << "\n[Request validation]\n";
  run_test("parse request JSON", test_parse_request_json);
  run_test("safe relative paths", test_safe_relative_paths);
  run_test("validate request", test_validate_request);

  std::cout << "\n[Configuration]\n";
  run_test("defaults and flavors", test_config_defaults_and_flavors);
  run_test("config validation", test_config_validation);
  run_test("config numeric bounds", test_config_numeric_bounds);
  run_test("load config JSON", test_load_config_json);
  run_test("local provider defaults", test_local_provider_defaults);
  run_test("credentials", test_credentials_missing_and_env);

  std::cout << "\n[Liveness verifier]\n";
  run_test("chain stops at first positive", test_chain_stops_at_first_positive);
  run_test("chain order and negative stop", test_chain_order_and_negative_stop);
  run_test("round budget and sleeps", test_verifier_round_budget);
  run_test("success in later round", test_verifier_succeeds_in_later_round);
  run_test("remote probe exit mapping", test_remote_probe_exit_mapping);
  run_test("probe scripts", test_probe_scripts);

  std::cout << "\n[Startup script]\n";
  run_test("startup script contract", test_startup_script_contract);
  run_test("shell quoting and initializer", test_shell_quote_and_initializer);

  std::cout << "\n[Stage runner]\n";
  run_test("happy path", test_happy_path);
  run_test("missing entry point: zero remote calls", test_missing_entry_point_makes_no_remote_calls);
  run_test("path escape rejected", test_path_escape_rejected);
  run_test("missing credentials", test_missing_credentials);
  run_test("allocation rejected", test_allocation_rejected);
  run_test("pinned python fallback", test_pinned_python_fallback);
  run_test("venv failure fatal", test_venv_failure_is_fatal);
  run_test("install failure and soft verification", test_install_failure_and_soft_verification);
  run_test("secret write failure", test_secret_write_failure);
  run_test("launch failure cleans up once", test_launch_failure_cleans_up_once);
  run_test("cleanup errors never mask primary", test_cleanup_errors_never_mask_primary);
  run_test("liveness exhaustion", test_liveness_exhaustion);
  run_test("weak process fallback", test_weak_process_fallback);
  run_test("hostname unresolved", test_hostname_unresolved);
  run_test("root flavor layout", test_root_flavor_layout);
  run_test("cleanup coordinator", test_cleanup_coordinator_direct);

  std::cout << "\n[Observability]\n";
  run_test("stats and event log", test_stats_and_event_log);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Local sandbox]\n";
  run_test("run, env, files, release", test_local_run_and_files);
  run_test("timeouts and allocation checks", test_local_timeout);
  run_test("startup script restart", test_local_startup_script_restart);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
