#pragma once

// launchpad/types.hpp - Core value types for the provisioning pipeline.
//
// ERROR MODEL:
//   Failures are values, never exceptions. Every failure carries an ErrorCode
//   (machine-readable, stable) and an ErrorClass derived from it (the
//   client-visible taxonomy). A stage returns a StageResult; the runner turns
//   the first failing StageResult into a ProvisionError.
//
// OWNERSHIP:
//   All types here are value-owned. No borrowed references, no handles.

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace launchpad {

enum class ErrorCode {
  none,
  invalid_request,
  missing_entry_point,
  path_escape,
  credentials_missing,
  allocation_rejected,
  workspace_write_failed,
  venv_create_failed,
  install_failed,
  config_write_failed,
  launch_script_write_failed,
  launch_failed,
  liveness_exhausted,
  hostname_unresolved,
  cleanup_failed,
};

std::string to_string(ErrorCode code);

// Client-visible error taxonomy.
enum class ErrorClass {
  none,
  client_input,   // rejected before any remote call, 400
  credential,     // secret absent or allocation rejected, nothing to clean up
  provisioning,   // stages 2-6
  verification,   // liveness chain exhausted; process may still be running
  cleanup,        // secondary, diagnostic only
};

std::string to_string(ErrorClass cls);

ErrorClass classify(ErrorCode code);

// One remote step inside a stage, in execution order.
struct StageLog {
  std::string stage;
  std::string step;
  int exit_code{0};
  std::string stdout_text;
  std::string stderr_text;
  std::string note;  // transport error or warning text, if any
};

struct StageResult {
  bool ok{true};
  ErrorCode code{ErrorCode::none};
  std::string message;  // display-safe
  std::string detail;   // raw transport / command output tail

  static StageResult success() { return {}; }
  static StageResult failure(ErrorCode code, std::string message, std::string detail = "") {
    StageResult r;
    r.ok = false;
    r.code = code;
    r.message = std::move(message);
    r.detail = std::move(detail);
    return r;
  }
};

struct ProvisionError {
  ErrorClass error_class{ErrorClass::none};
  ErrorCode code{ErrorCode::none};
  std::string stage;
  std::string message;
  std::string detail;
};

// Inbound package: relative path -> file content.
struct ProvisionRequest {
  std::map<std::string, std::string> files;
};

}  // namespace launchpad
