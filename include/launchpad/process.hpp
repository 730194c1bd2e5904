#pragma once

// launchpad/process.hpp - Local child-process execution (POSIX).
//
// Backs LocalSandboxProvider. The child runs in its own session so a timeout
// can kill the whole process group. Processes that the child detaches into a
// new session of their own (setsid) are outside that group and survive the
// timeout kill; the startup script relies on this.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace launchpad {

// Longer timeouts are clipped to this (7 days).
constexpr std::uint64_t kMaxProcessTimeoutMs = 7ull * 24 * 3600 * 1000;

struct ProcessSpec {
  std::string command;  // absolute path, exec'd directly
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;  // overlaid on the inherited env
  bool inherit_env{true};
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{1 << 20};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // spawn failure; exit_code is meaningless then
};

// Exit code conventions: 124 on timeout, 128+N when killed by signal N,
// 127 when exec fails.
ProcessResult run_process(const ProcessSpec& spec);

}  // namespace launchpad
