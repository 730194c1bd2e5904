#pragma once

// launchpad/cleanup.hpp - Failure path: best-effort teardown, then outcome.
//
// SEQUENCE (every failing run with a live sandbox, exactly once):
//   1. run pid_kill_command(): signals the recorded server pid; a missing pid
//      file or a dead process is not an error.
//   2. release() the sandbox. A failing release is recorded, never re-raised.
//   3. build the failure ProvisionOutcome from the primary error. Cleanup
//      errors ride along in cleanup_errors and never replace it.
//
// The handle is moved out of the context before release, so a second
// cleanup on the same context has nothing to release.

#include <cstdint>
#include <string>
#include <vector>

#include "launchpad/config.hpp"
#include "launchpad/context.hpp"

namespace launchpad {

struct CleanupReport {
  bool pid_kill_attempted{false};
  bool release_attempted{false};
  std::vector<std::string> errors;
};

// Shell command that kills the server recorded in the workspace pid file.
// Always exits 0.
std::string pid_kill_command(const PipelineConfig& config);

class CleanupCoordinator {
public:
  explicit CleanupCoordinator(const PipelineConfig& config);

  CleanupReport cleanup(ProvisionContext& ctx);

  // Runs cleanup() when the context still holds a sandbox, then builds the
  // failure outcome for `error`.
  ProvisionOutcome fail(ProvisionContext& ctx, ProvisionError error);

  std::uint32_t invocations() const { return invocations_; }

private:
  const PipelineConfig& config_;
  std::uint32_t invocations_{0};
};

}  // namespace launchpad
