#pragma once

// launchpad/pipeline.hpp - The provisioning stage runner.
//
// run() validates the request, then executes eight stages in order against
// one freshly allocated sandbox:
//
//   1 allocate             credentials check, provider allocation
//   2 lay_out_workspace    package dir, user files, synthesized __init__.py
//   3 provision_runtime    tool inventory, pinned interpreter probe, venv
//   4 install_dependencies pip install of the framework, presence check
//   5 write_secrets        .env and framework config file
//   6 launch               startup script write, chmod, bounded execution
//   7 verify               caller-side liveness chain, bounded rounds
//   8 expose               public hostname resolution, endpoint URL
//
// The first failing stage short-circuits the rest. Its StageResult becomes
// the ProvisionError and the context goes to the CleanupCoordinator. No
// stage throws; remote calls report failure through return values.
//
// THREADING: a StageRunner serves one run at a time. Independent runs use
// independent runners (each allocates its own sandbox).

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "launchpad/config.hpp"
#include "launchpad/context.hpp"
#include "launchpad/liveness.hpp"
#include "launchpad/remote.hpp"
#include "launchpad/types.hpp"

namespace launchpad {

class StageRunner {
public:
  using ProbeFactory = std::function<std::vector<std::unique_ptr<ILivenessProbe>>(
      IRemoteExecutor&, const LivenessTarget&)>;

  StageRunner(ISandboxProvider& provider, PipelineConfig config, Credentials credentials);

  // Sleep used between caller-side liveness rounds. Defaults to
  // thread_sleeper().
  void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

  // Replaces default_probe_chain() for the verify stage.
  void set_probe_factory(ProbeFactory factory) { probe_factory_ = std::move(factory); }

  const PipelineConfig& config() const { return config_; }

  ProvisionOutcome run(const ProvisionRequest& request);

  static std::vector<std::string> stage_names();

private:
  struct Stage {
    const char* name;
    StageResult (StageRunner::*fn)(ProvisionContext&);
  };
  static const std::array<Stage, 8>& stages();

  StageResult allocate(ProvisionContext& ctx);
  StageResult lay_out_workspace(ProvisionContext& ctx);
  StageResult provision_runtime(ProvisionContext& ctx);
  StageResult install_dependencies(ProvisionContext& ctx);
  StageResult write_secrets(ProvisionContext& ctx);
  StageResult launch(ProvisionContext& ctx);
  StageResult verify(ProvisionContext& ctx);
  StageResult expose(ProvisionContext& ctx);

  // Runs a command in the context's sandbox and records it in the stage log.
  CommandResult exec(ProvisionContext& ctx, const std::string& step, const std::string& command,
                     std::uint64_t timeout_ms);

  // Writes a file and records the write. Returns the transport error text,
  // empty on success.
  std::string put(ProvisionContext& ctx, const std::string& path, const std::string& content);

  ISandboxProvider& provider_;
  PipelineConfig config_;
  Credentials credentials_;
  Sleeper sleeper_;
  ProbeFactory probe_factory_;
  const ProvisionRequest* request_{nullptr};
};

// "from .<module> import <symbol>" initializer for the package directory.
std::string package_initializer(const std::string& entry_file, const std::string& entry_symbol);

}  // namespace launchpad
