#pragma once

// launchpad/liveness.hpp - Layered "is the server reachable on its port" check.
//
// CHAIN (descending preference, evaluated in order):
//   1. socket_table  - `ss -tln`, no network round-trip
//   2. http          - curl to the local port; any status code is positive
//   3. tcp           - bash /dev/tcp connect-and-close under `timeout`
//   4. process       - pgrep for the server command, grace sleep, repeat tcp
//
// Each probe answers positive / negative / inconclusive. A missing tool, a
// transport failure, or "no listener seen" are inconclusive: they never end
// the chain. The chain stops at the first non-inconclusive verdict.
//
// The same probe definitions render the check_port() shell function used by
// the startup script, so the caller-side verifier and the in-sandbox loop
// agree on what "running" means.
//
// KNOWN ACCURACY TRADE-OFF (process probe):
//   When the server process is found but the tcp tool is unavailable, the
//   probe reports positive with weak=true. The port may not be bound yet.
//   A definite tcp refusal after the grace sleep is inconclusive instead.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "launchpad/remote.hpp"

namespace launchpad {

enum class ProbeVerdict { positive, negative, inconclusive };

std::string to_string(ProbeVerdict v);

struct ProbeResult {
  ProbeVerdict verdict{ProbeVerdict::inconclusive};
  bool tool_available{false};
  bool weak{false};
  std::string detail;
};

struct LivenessTarget {
  std::uint16_t port{8000};
  std::string process_pattern;  // pgrep -f regex; see process_match_pattern()
  std::uint32_t grace_seconds{2};
};

enum class ProbeKind { socket_table, http, tcp, process };

std::string to_string(ProbeKind k);

// Shell fragments shared by both observers. `tool` is checked with
// `command -v`; `check` is a command list whose exit status is the signal.
struct ProbeCommand {
  std::string tool;
  std::string check;
};

ProbeCommand probe_command(ProbeKind kind, const LivenessTarget& target);

// Caller-side command for one probe. Exit codes:
//   0 positive, 127 tool missing; process probe also uses 1 (no process),
//   3 (process up, tcp tool missing: weak positive), 4 (process up, refused).
std::string remote_probe_script(ProbeKind kind, const LivenessTarget& target);

// pgrep -f pattern for a server command that never matches the command line
// of the shell running pgrep: "adk api_server ..." -> "[a]dk api_server".
std::string process_match_pattern(const std::string& server_command);

// Renders a bash function named check_port() implementing the full chain.
std::string render_check_function(const LivenessTarget& target);

class ILivenessProbe {
public:
  virtual ~ILivenessProbe() = default;
  virtual ProbeKind kind() const = 0;
  virtual ProbeResult try_check() = 0;
};

// Runs one probe's remote_probe_script() through an executor.
class RemoteProbe : public ILivenessProbe {
public:
  RemoteProbe(IRemoteExecutor& executor, ProbeKind kind, LivenessTarget target,
              std::uint64_t timeout_ms);

  ProbeKind kind() const override { return kind_; }
  ProbeResult try_check() override;

private:
  IRemoteExecutor& executor_;
  ProbeKind kind_;
  LivenessTarget target_;
  std::uint64_t timeout_ms_;
};

std::vector<std::unique_ptr<ILivenessProbe>> default_probe_chain(IRemoteExecutor& executor,
                                                                 const LivenessTarget& target);

struct ProbeAttempt {
  std::uint32_t round{0};
  ProbeKind kind{ProbeKind::socket_table};
  ProbeResult result;
};

struct VerifyReport {
  bool live{false};
  bool weak{false};
  std::uint32_t rounds{0};
  std::string method;  // probe that answered positive
  std::vector<ProbeAttempt> attempts;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Default sleeper: std::this_thread::sleep_for.
Sleeper thread_sleeper();

class LivenessVerifier {
public:
  explicit LivenessVerifier(std::vector<std::unique_ptr<ILivenessProbe>> probes);

  // One pass over the chain.
  VerifyReport check_once();

  // Up to `rounds` passes, sleeping `interval` between passes (not after the
  // last one).
  VerifyReport verify(std::uint32_t rounds, std::chrono::milliseconds interval,
                      const Sleeper& sleep);

private:
  void run_chain(std::uint32_t round, VerifyReport& report);

  std::vector<std::unique_ptr<ILivenessProbe>> probes_;
};

}  // namespace launchpad
