#include "launchpad/types.hpp"

namespace launchpad {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::invalid_request: return "invalid_request";
    case ErrorCode::missing_entry_point: return "missing_entry_point";
    case ErrorCode::path_escape: return "path_escape";
    case ErrorCode::credentials_missing: return "credentials_missing";
    case ErrorCode::allocation_rejected: return "allocation_rejected";
    case ErrorCode::workspace_write_failed: return "workspace_write_failed";
    case ErrorCode::venv_create_failed: return "venv_create_failed";
    case ErrorCode::install_failed: return "install_failed";
    case ErrorCode::config_write_failed: return "config_write_failed";
    case ErrorCode::launch_script_write_failed: return "launch_script_write_failed";
    case ErrorCode::launch_failed: return "launch_failed";
    case ErrorCode::liveness_exhausted: return "liveness_exhausted";
    case ErrorCode::hostname_unresolved: return "hostname_unresolved";
    case ErrorCode::cleanup_failed: return "cleanup_failed";
  }
  return "";
}

std::string to_string(ErrorClass cls) {
  switch (cls) {
    case ErrorClass::none: return "";
    case ErrorClass::client_input: return "ClientInputError";
    case ErrorClass::credential: return "CredentialError";
    case ErrorClass::provisioning: return "ProvisioningError";
    case ErrorClass::verification: return "VerificationError";
    case ErrorClass::cleanup: return "CleanupError";
  }
  return "";
}

ErrorClass classify(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:
      return ErrorClass::none;
    case ErrorCode::invalid_request:
    case ErrorCode::missing_entry_point:
    case ErrorCode::path_escape:
      return ErrorClass::client_input;
    case ErrorCode::credentials_missing:
    case ErrorCode::allocation_rejected:
      return ErrorClass::credential;
    case ErrorCode::workspace_write_failed:
    case ErrorCode::venv_create_failed:
    case ErrorCode::install_failed:
    case ErrorCode::config_write_failed:
    case ErrorCode::launch_script_write_failed:
    case ErrorCode::launch_failed:
    case ErrorCode::hostname_unresolved:
      return ErrorClass::provisioning;
    case ErrorCode::liveness_exhausted:
      return ErrorClass::verification;
    case ErrorCode::cleanup_failed:
      return ErrorClass::cleanup;
  }
  return ErrorClass::none;
}

}  // namespace launchpad
