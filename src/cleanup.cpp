#include "launchpad/cleanup.hpp"

#include "launchpad/startup_script.hpp"

namespace launchpad {

std::string pid_kill_command(const PipelineConfig& config) {
  const std::string pid_path = shell_quote(config.workspace_path(config.pid_file));
  // Negative pid first: the server leads its own session after setsid.
  return "pid=$(cat " + pid_path + " 2>/dev/null)\n"
         "if [ -n \"$pid\" ]; then\n"
         "  kill -- -\"$pid\" 2>/dev/null || kill \"$pid\" 2>/dev/null\n"
         "fi\n"
         "exit 0\n";
}

CleanupCoordinator::CleanupCoordinator(const PipelineConfig& config) : config_(config) {}

CleanupReport CleanupCoordinator::cleanup(ProvisionContext& ctx) {
  ++invocations_;
  CleanupReport report;
  std::unique_ptr<IRemoteExecutor> sandbox = std::move(ctx.sandbox);
  if (!sandbox) return report;

  const std::string failed_stage = ctx.current_stage;
  ctx.current_stage = "cleanup";

  report.pid_kill_attempted = true;
  CommandOptions opts;
  opts.timeout_ms = config_.step_timeout_ms;
  const CommandResult kill = sandbox->run_command(pid_kill_command(config_), opts);
  ctx.record("kill_server", kill);
  if (kill.transport_failed()) {
    report.errors.push_back("kill_server: " + kill.error_message);
  } else if (kill.timed_out) {
    report.errors.push_back("kill_server: timed out");
  }

  report.release_attempted = true;
  if (auto err = sandbox->release()) {
    report.errors.push_back("release: " + err->message);
    ctx.note("release", "release failed: " + err->message, 1);
  } else {
    ctx.note("release", "sandbox " + ctx.sandbox_id + " released");
  }

  ctx.current_stage = failed_stage;
  return report;
}

ProvisionOutcome CleanupCoordinator::fail(ProvisionContext& ctx, ProvisionError error) {
  CleanupReport report;
  if (ctx.sandbox) report = cleanup(ctx);

  ProvisionOutcome out;
  out.ok = false;
  out.deployment_id = ctx.deployment_id;
  out.sandbox_id = ctx.sandbox_id;
  out.verify_method = ctx.verify.method;
  out.verify_rounds = ctx.verify.rounds;
  out.cleanup_errors = std::move(report.errors);
  out.stdout_lines = split_lines(ctx.launch.stdout_text);
  out.stderr_lines = split_lines(ctx.launch.stderr_text);
  out.log = std::move(ctx.logs);
  out.error = std::move(error);
  out.duration_ms = ctx.elapsed_ms();
  return out;
}

}  // namespace launchpad
