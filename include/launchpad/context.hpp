#pragma once

// launchpad/context.hpp - Per-run mutable state and terminal outcome.
//
// OWNERSHIP:
//   ProvisionContext is owned by one StageRunner::run() call and never
//   shared. It holds the only handle to the allocated sandbox. On failure
//   the CleanupCoordinator takes the handle out and releases it; on success
//   the handle moves into ProvisionOutcome::sandbox, still running.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "launchpad/liveness.hpp"
#include "launchpad/remote.hpp"
#include "launchpad/types.hpp"

namespace launchpad {

struct ProvisionContext {
  std::unique_ptr<IRemoteExecutor> sandbox;
  std::uint16_t port{8000};
  std::vector<StageLog> logs;
  std::chrono::steady_clock::time_point start{std::chrono::steady_clock::now()};

  std::string deployment_id;
  std::string sandbox_id;
  std::string current_stage;
  std::size_t file_count{0};
  std::size_t bytes_in{0};

  // Filled in by stages, in order.
  std::string python;
  CommandResult launch;
  VerifyReport verify;
  std::string hostname;
  std::string endpoint;

  std::uint64_t elapsed_ms() const;

  // Appends a log entry for a command step of the current stage.
  StageLog& record(const std::string& step, const CommandResult& result, std::string note_text = "");

  // Appends a log entry for a non-command step (file write, resolution).
  StageLog& note(const std::string& step, std::string text, int exit_code = 0);
};

struct ProvisionOutcome {
  bool ok{false};
  std::string endpoint;
  std::string hostname;
  std::uint64_t duration_ms{0};
  std::vector<StageLog> log;
  std::optional<ProvisionError> error;

  std::string deployment_id;
  std::string sandbox_id;
  std::string verify_method;
  bool weak_verification{false};
  std::uint32_t verify_rounds{0};
  std::vector<std::string> cleanup_errors;

  // Startup script output, one entry per line.
  std::vector<std::string> stdout_lines;
  std::vector<std::string> stderr_lines;

  // Live sandbox handle on success; null on failure.
  std::unique_ptr<IRemoteExecutor> sandbox;
};

std::vector<std::string> split_lines(const std::string& text);

// Last `n` lines of `text`, newline-joined.
std::string tail_lines(const std::string& text, std::size_t n);

}  // namespace launchpad
