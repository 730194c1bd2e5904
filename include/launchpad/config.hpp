#pragma once

// launchpad/config.hpp - Pipeline configuration and credentials.
//
// Everything tunable lives in PipelineConfig. The two deployment flavors
// differ only in DeploymentFlavor (workspace directory, root request).
//
// ENVIRONMENT:
//   PipelineConfig::from_env() and Credentials::from_env() are the only
//   readers of process environment. They run once at the edge (CLI); the
//   pipeline receives plain values.
//
//   LAUNCHPAD_FLAVOR               default | root
//   LAUNCHPAD_PORT                 internal server port
//   LAUNCHPAD_ALLOCATE_TIMEOUT_MS  sandbox lifetime
//   LAUNCHPAD_LAUNCH_TIMEOUT_MS    startup script bound
//   LAUNCHPAD_VERIFY_ATTEMPTS      caller-side liveness rounds
//   LAUNCHPAD_VERIFY_INTERVAL_MS   sleep between rounds
//   LAUNCHPAD_PYTHON               pinned interpreter
//   LAUNCHPAD_FRAMEWORK_PACKAGE    pip package to install

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "launchpad/liveness.hpp"
#include "launchpad/startup_script.hpp"

namespace launchpad {

struct DeploymentFlavor {
  std::string name{"default"};
  std::string workspace_dir{"workspace"};  // relative to the sandbox cwd
  std::string package_dir{"agent_package"};
  std::string template_id;
  bool run_as_root{false};
};

DeploymentFlavor default_flavor();
DeploymentFlavor root_flavor();

// Returns false for unknown names; *out is left untouched then.
bool flavor_by_name(const std::string& name, DeploymentFlavor* out);

struct PipelineConfig {
  DeploymentFlavor flavor;
  std::uint16_t port{8000};

  std::uint64_t allocate_timeout_ms{300000};
  std::uint64_t launch_timeout_ms{60000};
  std::uint64_t install_timeout_ms{240000};
  std::uint64_t venv_timeout_ms{120000};
  std::uint64_t step_timeout_ms{30000};  // mkdir, chmod, inventory, pid kill

  std::string pinned_python{"python3.9"};
  std::string default_python{"python3"};
  std::string framework_package{"google-adk"};
  std::string framework_cli{"adk"};
  std::string server_command;  // empty: "<cli> api_server --host 0.0.0.0 --port <port>"

  std::string entry_file{"agent.py"};
  std::string entry_symbol{"root_agent"};

  std::string venv_dir{"venv"};
  std::string script_name{"start_server.sh"};
  std::string pid_file{"server.pid"};
  std::string log_file{"server.log"};
  std::string env_file{".env"};
  std::string framework_config_file{"adk.config.json"};

  std::uint32_t startup_attempts{30};
  std::uint32_t startup_spacing_s{1};
  std::uint32_t verify_attempts{5};
  std::uint64_t verify_interval_ms{2000};
  std::uint32_t process_grace_s{2};

  std::string url_scheme{"https"};
  bool require_sandbox_key{true};

  std::string effective_server_command() const;
  LivenessTarget liveness_target() const;
  StartupScriptSpec startup_script_spec() const;

  // "<workspace_dir>/<rel>" and "<workspace_dir>/<package_dir>/<rel>".
  std::string workspace_path(const std::string& rel) const;
  std::string package_path(const std::string& rel) const;

  static PipelineConfig from_env();
};

struct Credentials {
  std::string sandbox_api_key;
  std::string google_api_key;
  std::string adk_api_key;  // falls back to google_api_key

  // Names of required secrets that are absent.
  std::vector<std::string> missing(bool require_sandbox_key) const;

  // Environment seeded into the sandbox at allocation.
  std::map<std::string, std::string> sandbox_env() const;

  static Credentials from_env();
};

// "your_..._here" style values shipped in example env files.
bool is_placeholder_secret(const std::string& value);

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const std::string& config_json);

// Applies a JSON config document over *config. Returns false and sets *error
// if validation reports errors.
bool load_config_json(const std::string& config_json, PipelineConfig* config, std::string* error);

std::string config_to_json(const PipelineConfig& config);

// Defaults for LocalSandboxProvider: no provider key, plain-HTTP endpoint.
void apply_local_provider_defaults(PipelineConfig* config);

}  // namespace launchpad
