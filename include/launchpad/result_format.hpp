#pragma once

// launchpad/result_format.hpp - Client-visible rendering of a ProvisionOutcome.
//
// Success:
//   {output, error:null, executionTime, executionDetails{stdout[], stderr[],
//    exitCode:0, status:"running", duration, serverUrl}, openUrl,
//    showOpenLink:true, linkText}
// Failure:
//   {error, executionTime, errorDetails{name, message, code, stage,
//    cleanupErrors?[{name:"CleanupError", code:"cleanup_failed", message}]}}
//
// `error` / `output` are display-safe sentences. Transport text and command
// output tails only appear inside errorDetails.message.

#include <string>

#include "launchpad/context.hpp"

namespace launchpad {

std::string outcome_to_json(const ProvisionOutcome& outcome);

// 200 on success, 400 for client input errors, 500 otherwise.
int http_status(const ProvisionOutcome& outcome);

// Human-readable stage log, one block per step.
std::string stage_log_pretty(const ProvisionOutcome& outcome);

}  // namespace launchpad
