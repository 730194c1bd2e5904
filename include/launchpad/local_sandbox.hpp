#pragma once

// launchpad/local_sandbox.hpp - Host-local sandbox provider.
//
// Each allocation is a private directory under base_dir. Commands run through
// `<shell> -c` with that directory as working directory and the allocation
// env overlaid on the host env. Paths handed to write_file are confined to the
// directory (leading '/' is stripped, '..' escapes are refused).
//
// LIFETIME:
//   AllocateOptions::timeout_ms bounds the sandbox lifetime. Commands issued
//   after expiry fail with a transport error, and a command's own timeout is
//   clipped to the remaining lifetime.
//
// LIMITS:
//   No isolation beyond the directory. run_as_root is honored only when the
//   host process is already root; otherwise allocation is rejected.

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "launchpad/remote.hpp"

namespace launchpad {

struct LocalSandboxOptions {
  std::string base_dir;  // empty = <temp>/launchpad
  std::string public_host{"localhost"};
  std::string shell{"/bin/bash"};
  std::size_t max_output_bytes{1 << 20};
};

class LocalSandbox : public IRemoteExecutor {
public:
  LocalSandbox(std::string id, std::string root,
               std::map<std::string, std::string> env,
               std::chrono::steady_clock::time_point expires_at,
               LocalSandboxOptions options);

  std::string sandbox_id() const override { return id_; }
  CommandResult run_command(const std::string &command,
                            const CommandOptions &options) override;
  std::optional<TransportError>
  write_file(const std::string &path, const std::string &content) override;
  std::string resolve_hostname(std::uint16_t port) override;
  std::optional<TransportError> release() override;

  const std::string &root() const { return root_; }
  bool released() const { return released_; }

private:
  std::string id_;
  std::string root_;
  std::map<std::string, std::string> env_;
  std::chrono::steady_clock::time_point expires_at_;
  LocalSandboxOptions options_;
  bool released_{false};
};

class LocalSandboxProvider : public ISandboxProvider {
public:
  explicit LocalSandboxProvider(LocalSandboxOptions options = {});

  std::string provider_id() const override { return "local"; }
  std::unique_ptr<IRemoteExecutor> allocate(const AllocateOptions &options,
                                            std::string *error) override;

private:
  LocalSandboxOptions options_;
};

} // namespace launchpad
