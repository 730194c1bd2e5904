#pragma once

// launchpad/remote.hpp - Remote executor boundary.
//
// The pipeline drives a sandbox only through IRemoteExecutor. Allocation goes
// through ISandboxProvider. Both are consumed, not built, by the pipeline;
// LocalSandboxProvider (local_sandbox.hpp) is the in-tree implementation.
//
// FAILURE CONTRACT:
//   Every call is fallible. A transport failure (the call did not reach the
//   sandbox, or the sandbox could not answer) is reported separately from a
//   command that ran and exited non-zero:
//     run_command  -> CommandResult::error_message non-empty
//     write_file   -> TransportError
//     release      -> TransportError
//     resolve_hostname -> empty string
//   Implementations must not throw across this boundary.
//
// OWNERSHIP:
//   allocate() hands out a unique_ptr. Destroying the handle object does NOT
//   release the remote sandbox; release() is the only teardown call. This is
//   what lets a successful run hand a live sandbox back to its caller.

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace launchpad {

// Upper bound for every timeout and lifetime crossing this boundary (7 days).
constexpr std::uint64_t kMaxTimeoutMs = 7ull * 24 * 3600 * 1000;

struct AllocateOptions {
  std::uint64_t timeout_ms{300000};  // total sandbox lifetime
  std::map<std::string, std::string> env;
  std::string template_id;
  bool run_as_root{false};
};

struct CommandOptions {
  std::uint64_t timeout_ms{60000};
  std::map<std::string, std::string> env;
};

struct CommandResult {
  int exit_code{0};
  bool timed_out{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // transport failure when non-empty

  bool transport_failed() const { return !error_message.empty(); }
  bool succeeded() const { return error_message.empty() && !timed_out && exit_code == 0; }
};

struct TransportError {
  std::string message;
};

class IRemoteExecutor {
public:
  virtual ~IRemoteExecutor() = default;

  virtual std::string sandbox_id() const = 0;

  // Runs `command` through a shell inside the sandbox's working directory.
  virtual CommandResult run_command(const std::string &command,
                                    const CommandOptions &options) = 0;

  // Paths are relative to the sandbox working directory. Parent directories
  // are created as needed.
  virtual std::optional<TransportError>
  write_file(const std::string &path, const std::string &content) = 0;

  // Externally routable host (without scheme) for an internal port.
  virtual std::string resolve_hostname(std::uint16_t port) = 0;

  virtual std::optional<TransportError> release() = 0;
};

class ISandboxProvider {
public:
  virtual ~ISandboxProvider() = default;

  virtual std::string provider_id() const = 0;

  // Returns nullptr and sets *error on rejection.
  virtual std::unique_ptr<IRemoteExecutor>
  allocate(const AllocateOptions &options, std::string *error) = 0;
};

} // namespace launchpad
