#include "launchpad/liveness.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

namespace launchpad {

namespace {

constexpr int kToolMissing = 127;
constexpr int kNoProcess = 1;
constexpr int kProcessOnly = 3;
constexpr int kProcessRefused = 4;

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string port_str(const LivenessTarget& t) { return std::to_string(t.port); }

std::uint64_t probe_timeout_ms(ProbeKind kind, const LivenessTarget& target) {
  switch (kind) {
    case ProbeKind::socket_table: return 5000;
    case ProbeKind::http: return 10000;
    case ProbeKind::tcp: return 5000;
    case ProbeKind::process: return 5000 + 1000ull * target.grace_seconds;
  }
  return 5000;
}

}  // namespace

std::string to_string(ProbeVerdict v) {
  switch (v) {
    case ProbeVerdict::positive: return "positive";
    case ProbeVerdict::negative: return "negative";
    case ProbeVerdict::inconclusive: return "inconclusive";
  }
  return "";
}

std::string to_string(ProbeKind k) {
  switch (k) {
    case ProbeKind::socket_table: return "socket_table";
    case ProbeKind::http: return "http";
    case ProbeKind::tcp: return "tcp";
    case ProbeKind::process: return "process";
  }
  return "";
}

std::string process_match_pattern(const std::string& server_command) {
  // First two words identify the server ("adk api_server").
  std::istringstream in(server_command);
  std::string a, b;
  in >> a >> b;
  if (a.empty()) return "";
  std::string pattern = "[" + a.substr(0, 1) + "]" + a.substr(1);
  if (!b.empty() && b[0] != '-') pattern += " " + b;
  return pattern;
}

ProbeCommand probe_command(ProbeKind kind, const LivenessTarget& target) {
  const std::string port = port_str(target);
  switch (kind) {
    case ProbeKind::socket_table:
      return {"ss", "ss -tln 2>/dev/null | grep -qE '[:.]" + port + "[[:space:]]'"};
    case ProbeKind::http:
      return {"curl",
              "code=$(curl -s -o /dev/null -m 5 -w '%{http_code}' http://127.0.0.1:" + port +
                  " 2>/dev/null); [ -n \"$code\" ] && [ \"$code\" != \"000\" ]"};
    case ProbeKind::tcp:
      return {"timeout",
              "timeout 1 bash -c 'echo > /dev/tcp/127.0.0.1/" + port + "' >/dev/null 2>&1"};
    case ProbeKind::process:
      return {"pgrep", "pgrep -f '" + target.process_pattern + "' >/dev/null 2>&1"};
  }
  return {};
}

std::string remote_probe_script(ProbeKind kind, const LivenessTarget& target) {
  const ProbeCommand pc = probe_command(kind, target);
  std::ostringstream o;
  o << "command -v " << pc.tool << " >/dev/null 2>&1 || exit " << kToolMissing << "\n";
  if (kind == ProbeKind::process) {
    const ProbeCommand tcp = probe_command(ProbeKind::tcp, target);
    o << pc.check << " || exit " << kNoProcess << "\n"
      << "sleep " << target.grace_seconds << "\n"
      << "command -v " << tcp.tool << " >/dev/null 2>&1 || exit " << kProcessOnly << "\n"
      << tcp.check << " || exit " << kProcessRefused << "\n"
      << "exit 0\n";
  } else if (kind == ProbeKind::http) {
    o << pc.check << "\nrc=$?\necho \"http_status=${code:-}\"\nexit $rc\n";
  } else {
    o << pc.check << "\n";
  }
  return o.str();
}

std::string render_check_function(const LivenessTarget& target) {
  const std::string port = port_str(target);
  const ProbeCommand ss = probe_command(ProbeKind::socket_table, target);
  const ProbeCommand http = probe_command(ProbeKind::http, target);
  const ProbeCommand tcp = probe_command(ProbeKind::tcp, target);
  const ProbeCommand proc = probe_command(ProbeKind::process, target);

  std::ostringstream o;
  o << "check_port() {\n"
    << "  if command -v " << ss.tool << " >/dev/null 2>&1; then\n"
    << "    if " << ss.check << "; then\n"
    << "      echo \"server listening on port " << port << " (socket_table)\"\n"
    << "      return 0\n"
    << "    fi\n"
    << "  fi\n"
    << "  if command -v " << http.tool << " >/dev/null 2>&1; then\n"
    << "    if " << http.check << "; then\n"
    << "      echo \"server responding on port " << port << " (http $code)\"\n"
    << "      return 0\n"
    << "    fi\n"
    << "  fi\n"
    << "  if command -v " << tcp.tool << " >/dev/null 2>&1; then\n"
    << "    if " << tcp.check << "; then\n"
    << "      echo \"server accepting connections on port " << port << " (tcp)\"\n"
    << "      return 0\n"
    << "    fi\n"
    << "  fi\n"
    << "  if command -v " << proc.tool << " >/dev/null 2>&1; then\n"
    << "    if " << proc.check << "; then\n"
    << "      sleep " << target.grace_seconds << "\n"
    << "      if ! command -v " << tcp.tool << " >/dev/null 2>&1; then\n"
    << "        echo \"server process running, port " << port << " unverified (process)\"\n"
    << "        return 0\n"
    << "      fi\n"
    << "      if " << tcp.check << "; then\n"
    << "        echo \"server accepting connections on port " << port << " (process+tcp)\"\n"
    << "        return 0\n"
    << "      fi\n"
    << "    fi\n"
    << "  fi\n"
    << "  return 1\n"
    << "}\n";
  return o.str();
}

// ---------------------------------------------------------------------------
// RemoteProbe
// ---------------------------------------------------------------------------

RemoteProbe::RemoteProbe(IRemoteExecutor& executor, ProbeKind kind, LivenessTarget target,
                         std::uint64_t timeout_ms)
    : executor_(executor), kind_(kind), target_(std::move(target)), timeout_ms_(timeout_ms) {}

ProbeResult RemoteProbe::try_check() {
  ProbeResult r;
  CommandOptions opts;
  opts.timeout_ms = timeout_ms_;
  const CommandResult cr = executor_.run_command(remote_probe_script(kind_, target_), opts);
  if (cr.transport_failed()) {
    r.detail = "transport: " + cr.error_message;
    return r;
  }
  if (cr.timed_out) {
    r.tool_available = true;
    r.detail = "probe timed out";
    return r;
  }
  r.detail = trim(cr.stdout_text);
  if (cr.exit_code == kToolMissing) {
    r.detail = "tool unavailable";
    return r;
  }
  r.tool_available = true;

  if (kind_ == ProbeKind::process) {
    switch (cr.exit_code) {
      case 0:
        r.verdict = ProbeVerdict::positive;
        break;
      case kProcessOnly:
        r.verdict = ProbeVerdict::positive;
        r.weak = true;
        r.detail = "process running, port unverified";
        break;
      case kNoProcess:
        r.verdict = ProbeVerdict::negative;
        r.detail = "no matching process";
        break;
      default:
        r.detail = "process running, port refused";
        break;
    }
    return r;
  }
  if (cr.exit_code == 0) r.verdict = ProbeVerdict::positive;
  return r;
}

std::vector<std::unique_ptr<ILivenessProbe>> default_probe_chain(IRemoteExecutor& executor,
                                                                 const LivenessTarget& target) {
  std::vector<std::unique_ptr<ILivenessProbe>> chain;
  for (ProbeKind k : {ProbeKind::socket_table, ProbeKind::http, ProbeKind::tcp, ProbeKind::process}) {
    chain.push_back(std::make_unique<RemoteProbe>(executor, k, target, probe_timeout_ms(k, target)));
  }
  return chain;
}

Sleeper thread_sleeper() {
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

// ---------------------------------------------------------------------------
// LivenessVerifier
// ---------------------------------------------------------------------------

LivenessVerifier::LivenessVerifier(std::vector<std::unique_ptr<ILivenessProbe>> probes)
    : probes_(std::move(probes)) {}

void LivenessVerifier::run_chain(std::uint32_t round, VerifyReport& report) {
  report.rounds = round;
  for (auto& probe : probes_) {
    ProbeAttempt attempt;
    attempt.round = round;
    attempt.kind = probe->kind();
    attempt.result = probe->try_check();
    const ProbeVerdict verdict = attempt.result.verdict;
    const bool weak = attempt.result.weak;
    report.attempts.push_back(std::move(attempt));
    if (verdict == ProbeVerdict::positive) {
      report.live = true;
      report.weak = weak;
      report.method = to_string(probe->kind());
      return;
    }
    if (verdict == ProbeVerdict::negative) return;
  }
}

VerifyReport LivenessVerifier::check_once() {
  VerifyReport report;
  run_chain(1, report);
  return report;
}

VerifyReport LivenessVerifier::verify(std::uint32_t rounds, std::chrono::milliseconds interval,
                                      const Sleeper& sleep) {
  VerifyReport report;
  const std::uint32_t total = std::max<std::uint32_t>(1, rounds);
  for (std::uint32_t round = 1; round <= total; ++round) {
    run_chain(round, report);
    if (report.live) break;
    if (round < total && sleep) sleep(interval);
  }
  return report;
}

}  // namespace launchpad
