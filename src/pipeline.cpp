#include "launchpad/pipeline.hpp"

#include <sstream>

#include "launchpad/cleanup.hpp"
#include "launchpad/hash.hpp"
#include "launchpad/jsonlite.hpp"
#include "launchpad/observability.hpp"
#include "launchpad/request.hpp"
#include "launchpad/startup_script.hpp"

namespace launchpad {

namespace {

constexpr std::size_t kDetailTailLines = 20;

// Transport text or the command's output tail, for ProvisionError::detail.
std::string command_detail(const CommandResult& r) {
  if (r.transport_failed()) return "transport: " + r.error_message;
  std::string out;
  if (r.timed_out) out = "timed out\n";
  const std::string err_tail = tail_lines(r.stderr_text, kDetailTailLines);
  const std::string out_tail = tail_lines(r.stdout_text, kDetailTailLines);
  if (!err_tail.empty()) out += "stderr:\n" + err_tail + "\n";
  if (!out_tail.empty()) out += "stdout:\n" + out_tail + "\n";
  return out;
}

std::string exit_phrase(const CommandResult& r) {
  if (r.transport_failed()) return "could not be run";
  if (r.timed_out) return "timed out";
  return "exited with code " + std::to_string(r.exit_code);
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (const auto& p : parts) {
    if (!out.empty()) out += sep;
    out += p;
  }
  return out;
}

ProvisionEvent make_event(const ProvisionContext& ctx, const ProvisionOutcome& out,
                          const PipelineConfig& config) {
  ProvisionEvent ev;
  ev.deployment_id = ctx.deployment_id;
  ev.sandbox_id = ctx.sandbox_id;
  ev.flavor = config.flavor.name;
  ev.ok = out.ok;
  if (out.error) {
    ev.error_class = to_string(out.error->error_class);
    ev.error_code = to_string(out.error->code);
    ev.failed_stage = out.error->stage;
  }
  ev.duration_ns = out.duration_ms * 1000000ull;
  ev.verify_method = out.verify_method;
  ev.weak_verification = out.weak_verification;
  ev.verify_rounds = out.verify_rounds;
  ev.cleanup_errors = out.cleanup_errors.size();
  ev.file_count = ctx.file_count;
  ev.bytes_in = ctx.bytes_in;
  return ev;
}

}  // namespace

std::string package_initializer(const std::string& entry_file, const std::string& entry_symbol) {
  std::string module = entry_file;
  if (module.size() > 3 && module.compare(module.size() - 3, 3, ".py") == 0) {
    module.resize(module.size() - 3);
  }
  for (char& c : module) {
    if (c == '/') c = '.';
  }
  return "from ." + module + " import " + entry_symbol + "\n__all__ = [\"" + entry_symbol + "\"]\n";
}

StageRunner::StageRunner(ISandboxProvider& provider, PipelineConfig config, Credentials credentials)
    : provider_(provider),
      config_(std::move(config)),
      credentials_(std::move(credentials)),
      sleeper_(thread_sleeper()) {}

const std::array<StageRunner::Stage, 8>& StageRunner::stages() {
  static const std::array<Stage, 8> kStages = {{
      {"allocate", &StageRunner::allocate},
      {"lay_out_workspace", &StageRunner::lay_out_workspace},
      {"provision_runtime", &StageRunner::provision_runtime},
      {"install_dependencies", &StageRunner::install_dependencies},
      {"write_secrets", &StageRunner::write_secrets},
      {"launch", &StageRunner::launch},
      {"verify", &StageRunner::verify},
      {"expose", &StageRunner::expose},
  }};
  return kStages;
}

std::vector<std::string> StageRunner::stage_names() {
  std::vector<std::string> names;
  for (const auto& s : stages()) names.emplace_back(s.name);
  return names;
}

ProvisionOutcome StageRunner::run(const ProvisionRequest& request) {
  ProvisionContext ctx;
  ctx.port = config_.port;
  ctx.deployment_id = package_digest(request.files);
  ctx.file_count = request.files.size();
  for (const auto& [path, content] : request.files) ctx.bytes_in += path.size() + content.size();

  CleanupCoordinator coordinator(config_);

  if (auto rejected = validate_request(request, config_.entry_file)) {
    ProvisionOutcome out = coordinator.fail(ctx, std::move(*rejected));
    emit_provision_event(make_event(ctx, out, config_));
    return out;
  }

  request_ = &request;
  std::uint32_t index = 0;
  for (const auto& stage : stages()) {
    ++index;
    ctx.current_stage = stage.name;
    StageResult result;
    std::uint64_t duration_ns = 0;
    {
      ScopeTimer timer(duration_ns);
      result = (this->*stage.fn)(ctx);
    }

    StageEvent ev;
    ev.deployment_id = ctx.deployment_id;
    ev.sandbox_id = ctx.sandbox_id;
    ev.stage = stage.name;
    ev.index = index;
    ev.ok = result.ok;
    ev.error_code = to_string(result.code);
    ev.duration_ns = duration_ns;
    emit_stage_event(ev);

    if (!result.ok) {
      request_ = nullptr;
      ProvisionError error;
      error.code = result.code;
      error.error_class = classify(result.code);
      error.stage = stage.name;
      error.message = std::move(result.message);
      error.detail = std::move(result.detail);
      ProvisionOutcome out = coordinator.fail(ctx, std::move(error));
      emit_provision_event(make_event(ctx, out, config_));
      return out;
    }
  }
  request_ = nullptr;

  ProvisionOutcome out;
  out.ok = true;
  out.endpoint = ctx.endpoint;
  out.hostname = ctx.hostname;
  out.deployment_id = ctx.deployment_id;
  out.sandbox_id = ctx.sandbox_id;
  out.verify_method = ctx.verify.method;
  out.weak_verification = ctx.verify.weak;
  out.verify_rounds = ctx.verify.rounds;
  out.stdout_lines = split_lines(ctx.launch.stdout_text);
  out.stderr_lines = split_lines(ctx.launch.stderr_text);
  out.sandbox = std::move(ctx.sandbox);
  out.log = std::move(ctx.logs);
  out.duration_ms = ctx.elapsed_ms();
  emit_provision_event(make_event(ctx, out, config_));
  return out;
}

CommandResult StageRunner::exec(ProvisionContext& ctx, const std::string& step,
                                const std::string& command, std::uint64_t timeout_ms) {
  CommandOptions opts;
  opts.timeout_ms = timeout_ms;
  CommandResult r = ctx.sandbox->run_command(command, opts);
  ctx.record(step, r);
  return r;
}

std::string StageRunner::put(ProvisionContext& ctx, const std::string& path,
                             const std::string& content) {
  if (auto err = ctx.sandbox->write_file(path, content)) {
    ctx.note("write " + path, "transport: " + err->message, 1);
    return err->message.empty() ? "write failed" : err->message;
  }
  ctx.note("write " + path, std::to_string(content.size()) + " bytes");
  return "";
}

// ---------------------------------------------------------------------------
// Stages
// ---------------------------------------------------------------------------

StageResult StageRunner::allocate(ProvisionContext& ctx) {
  const std::vector<std::string> missing = credentials_.missing(config_.require_sandbox_key);
  if (!missing.empty()) {
    return StageResult::failure(ErrorCode::credentials_missing,
                                "Missing required credentials: " + join(missing, ", "));
  }

  AllocateOptions opts;
  opts.timeout_ms = config_.allocate_timeout_ms;
  opts.env = credentials_.sandbox_env();
  opts.template_id = config_.flavor.template_id;
  opts.run_as_root = config_.flavor.run_as_root;

  std::string error;
  ctx.sandbox = provider_.allocate(opts, &error);
  if (!ctx.sandbox) {
    ctx.note("allocate", "rejected: " + error, 1);
    return StageResult::failure(ErrorCode::allocation_rejected,
                                "Sandbox provider rejected the allocation", error);
  }
  ctx.sandbox_id = ctx.sandbox->sandbox_id();
  ctx.note("allocate", "sandbox " + ctx.sandbox_id + " from provider " + provider_.provider_id() +
                           ", lifetime " + std::to_string(config_.allocate_timeout_ms) + " ms");
  return StageResult::success();
}

StageResult StageRunner::lay_out_workspace(ProvisionContext& ctx) {
  const std::string package_dir = config_.flavor.workspace_dir + "/" + config_.flavor.package_dir;
  const CommandResult mk = exec(ctx, "mkdir", "mkdir -p " + shell_quote(package_dir),
                                config_.step_timeout_ms);
  if (!mk.succeeded()) {
    return StageResult::failure(ErrorCode::workspace_write_failed,
                                "Failed to create the package directory", command_detail(mk));
  }

  for (const auto& [path, content] : request_->files) {
    const std::string err = put(ctx, config_.package_path(path), content);
    if (!err.empty()) {
      return StageResult::failure(ErrorCode::workspace_write_failed,
                                  "Failed to write " + path + " to the sandbox", err);
    }
  }

  const std::string err = put(ctx, config_.package_path("__init__.py"),
                              package_initializer(config_.entry_file, config_.entry_symbol));
  if (!err.empty()) {
    return StageResult::failure(ErrorCode::workspace_write_failed,
                                "Failed to write the package initializer", err);
  }
  return StageResult::success();
}

StageResult StageRunner::provision_runtime(ProvisionContext& ctx) {
  // Diagnostics only.
  exec(ctx, "tool_inventory",
       "which python3 pip curl ss 2>/dev/null; ls /usr/bin/python* 2>/dev/null | grep -v config; true",
       config_.step_timeout_ms);

  std::vector<std::string> candidates;
  if (!config_.pinned_python.empty()) {
    const CommandResult probe = exec(ctx, "probe_pinned_python",
                                     "command -v " + shell_quote(config_.pinned_python),
                                     config_.step_timeout_ms);
    if (probe.succeeded()) {
      candidates.push_back(config_.pinned_python);
    } else {
      ctx.logs.back().note = config_.pinned_python + " not found, falling back to " +
                             config_.default_python;
    }
  }
  if (candidates.empty() || candidates.front() != config_.default_python) {
    candidates.push_back(config_.default_python);
  }

  const std::string venv_path = shell_quote(config_.workspace_path(config_.venv_dir));
  CommandResult last;
  for (const auto& python : candidates) {
    last = exec(ctx, "create_venv", shell_quote(python) + " -m venv " + venv_path,
                config_.venv_timeout_ms);
    if (last.succeeded()) {
      ctx.python = python;
      ctx.logs.back().note = "isolated environment created with " + python;
      return StageResult::success();
    }
  }
  return StageResult::failure(ErrorCode::venv_create_failed,
                              "Failed to create the isolated Python environment",
                              command_detail(last));
}

StageResult StageRunner::install_dependencies(ProvisionContext& ctx) {
  const std::string activate =
      ". " + shell_quote(config_.workspace_path(config_.venv_dir) + "/bin/activate");
  const std::string package = shell_quote(config_.framework_package);

  const CommandResult install =
      exec(ctx, "pip_install", activate + " && pip install --progress-bar off -v " + package,
           config_.install_timeout_ms);
  if (!install.succeeded()) {
    return StageResult::failure(ErrorCode::install_failed,
                                "Installing " + config_.framework_package + " " + exit_phrase(install),
                                command_detail(install));
  }

  const CommandResult check =
      exec(ctx, "pip_list", activate + " && pip list 2>/dev/null | grep -i -- " + package,
           config_.step_timeout_ms);
  if (!check.succeeded()) {
    ctx.logs.back().note = "warning: " + config_.framework_package + " not confirmed by pip list";
  }
  return StageResult::success();
}

StageResult StageRunner::write_secrets(ProvisionContext& ctx) {
  const auto env = credentials_.sandbox_env();

  std::string dotenv;
  for (const char* key : {"GOOGLE_API_KEY", "ADK_API_KEY"}) {
    dotenv += std::string(key) + "=" + shell_quote(env.at(key)) + "\n";
  }
  std::string err = put(ctx, config_.workspace_path(config_.env_file), dotenv);
  if (!err.empty()) {
    return StageResult::failure(ErrorCode::config_write_failed,
                                "Failed to write the credentials file", err);
  }

  jsonlite::Object framework_config;
  framework_config["api_key"] = env.at("GOOGLE_API_KEY");
  err = put(ctx, config_.workspace_path(config_.framework_config_file),
            jsonlite::to_json_pretty(jsonlite::Value(std::move(framework_config))));
  if (!err.empty()) {
    return StageResult::failure(ErrorCode::config_write_failed,
                                "Failed to write the framework configuration", err);
  }
  return StageResult::success();
}

StageResult StageRunner::launch(ProvisionContext& ctx) {
  const std::string script_path = config_.workspace_path(config_.script_name);
  const std::string err =
      put(ctx, script_path, render_startup_script(config_.startup_script_spec()));
  if (!err.empty()) {
    return StageResult::failure(ErrorCode::launch_script_write_failed,
                                "Failed to write the startup script", err);
  }

  const CommandResult chmod =
      exec(ctx, "chmod", "chmod +x " + shell_quote(script_path), config_.step_timeout_ms);
  if (!chmod.succeeded()) {
    return StageResult::failure(ErrorCode::launch_script_write_failed,
                                "Failed to make the startup script executable",
                                command_detail(chmod));
  }

  ctx.launch = exec(ctx, "start_server",
                    "cd " + shell_quote(config_.flavor.workspace_dir) + " && ./" +
                        shell_quote(config_.script_name),
                    config_.launch_timeout_ms);
  if (!ctx.launch.succeeded()) {
    return StageResult::failure(ErrorCode::launch_failed,
                                "Startup script " + exit_phrase(ctx.launch),
                                command_detail(ctx.launch));
  }
  return StageResult::success();
}

StageResult StageRunner::verify(ProvisionContext& ctx) {
  const LivenessTarget target = config_.liveness_target();
  LivenessVerifier verifier(probe_factory_ ? probe_factory_(*ctx.sandbox, target)
                                           : default_probe_chain(*ctx.sandbox, target));
  ctx.verify = verifier.verify(config_.verify_attempts,
                               std::chrono::milliseconds(config_.verify_interval_ms), sleeper_);

  std::ostringstream attempts;
  for (const auto& a : ctx.verify.attempts) {
    attempts << "round " << a.round << " " << to_string(a.kind) << ": "
             << to_string(a.result.verdict);
    if (!a.result.detail.empty()) attempts << " (" << a.result.detail << ")";
    attempts << "\n";
  }

  if (!ctx.verify.live) {
    ctx.note("liveness", "no positive signal after " + std::to_string(ctx.verify.rounds) + " rounds", 1);
    return StageResult::failure(ErrorCode::liveness_exhausted,
                                "Server did not become reachable on port " +
                                    std::to_string(config_.port),
                                attempts.str());
  }

  std::string summary = "live via " + ctx.verify.method + " in round " +
                        std::to_string(ctx.verify.rounds);
  if (ctx.verify.weak) summary += "; warning: process found but port not confirmed";
  ctx.note("liveness", summary);

  // Recorded only; never gates.
  CommandOptions opts;
  opts.timeout_ms = config_.step_timeout_ms;
  const CommandResult status =
      ctx.sandbox->run_command(remote_probe_script(ProbeKind::http, target), opts);
  ctx.record("http_status", status);
  return StageResult::success();
}

StageResult StageRunner::expose(ProvisionContext& ctx) {
  ctx.hostname = ctx.sandbox->resolve_hostname(config_.port);
  if (ctx.hostname.empty()) {
    ctx.note("resolve_hostname", "provider returned no hostname", 1);
    return StageResult::failure(ErrorCode::hostname_unresolved,
                                "Could not resolve a public hostname for port " +
                                    std::to_string(config_.port));
  }
  ctx.endpoint = config_.url_scheme + "://" + ctx.hostname;
  ctx.note("resolve_hostname", ctx.endpoint);
  return StageResult::success();
}

}  // namespace launchpad
