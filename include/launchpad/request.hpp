#pragma once

// launchpad/request.hpp - Inbound package parsing and validation.
//
// Validation runs before any remote call. A rejected request never reaches
// the stage runner, so it never allocates a sandbox.

#include <optional>
#include <string>

#include "launchpad/types.hpp"

namespace launchpad {

// Reads {"files": {"<path>": "<content>", ...}}. Non-string contents are
// rejected. On failure returns an empty request and sets *error.
ProvisionRequest parse_request_json(const std::string& json_payload, std::string* error);

// Relative, non-empty, no '..' / '.' / empty components, no backslashes.
bool is_safe_relative_path(const std::string& path);

// nullopt when the request may proceed; otherwise a client_input error.
std::optional<ProvisionError> validate_request(const ProvisionRequest& request,
                                               const std::string& entry_file);

}  // namespace launchpad
