#pragma once

// launchpad/startup_script.hpp - In-sandbox launcher for the agent server.
//
// The rendered bash script lives in the workspace directory and, in order:
//   activates <venv_dir>, exports <env_file>, cd's to its own directory,
//   reinstalls the framework if its CLI is missing, stops any previous
//   instance (pid file + pattern), starts the server detached with setsid,
//   records $! in <pid_file>, then polls check_port() up to `attempts` times.
//
// Exit 0 on the first positive check; exit 1 with the server log tail
// otherwise.

#include <cstdint>
#include <string>

#include "launchpad/liveness.hpp"

namespace launchpad {

struct StartupScriptSpec {
  std::string framework_cli{"adk"};
  std::string framework_package{"google-adk"};
  std::string server_command;
  std::string venv_dir{"venv"};
  std::string env_file{".env"};
  std::string pid_file{"server.pid"};
  std::string log_file{"server.log"};
  LivenessTarget target;
  std::uint32_t attempts{30};
  std::uint32_t spacing_seconds{1};
  std::uint32_t stop_wait_seconds{10};
  std::uint32_t log_tail_lines{50};
};

std::string render_startup_script(const StartupScriptSpec& spec);

// Single-quotes `s` for bash: abc'd -> 'abc'\''d'.
std::string shell_quote(const std::string& s);

}  // namespace launchpad
