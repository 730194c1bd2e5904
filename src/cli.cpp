#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "launchpad/config.hpp"
#include "launchpad/jsonlite.hpp"
#include "launchpad/local_sandbox.hpp"
#include "launchpad/observability.hpp"
#include "launchpad/pipeline.hpp"
#include "launchpad/request.hpp"
#include "launchpad/result_format.hpp"
#include "launchpad/startup_script.hpp"
#include "launchpad/version.hpp"

namespace {

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  std::ostringstream ss;
  ss << ifs.rdbuf();
  *out = ss.str();
  return true;
}

void usage() {
  std::cerr
      << "usage: launchpad <command> [options]\n"
         "  deploy --request <file> [--config <file>] [--flavor default|root]\n"
         "         [--sandbox-dir <dir>] [--verbose] [--stats] [--release-on-exit]\n"
         "  render-script [--config <file>]\n"
         "  config-check --config <file>\n"
         "  version\n";
}

// Applies --config on top of the environment-derived defaults.
bool load_config(const std::string &config_file, launchpad::PipelineConfig *config) {
  if (config_file.empty())
    return true;
  std::string text;
  if (!read_file(config_file, &text)) {
    std::cerr << "cannot read config " << config_file << "\n";
    return false;
  }
  std::string error;
  if (!launchpad::load_config_json(text, config, &error)) {
    std::cerr << "invalid config " << config_file << ": " << error << "\n";
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 2;
  }
  const std::string cmd = argv[1];

  if (cmd == "version") {
    std::cout << launchpad::version::manifest_to_json(
                     launchpad::version::current_manifest())
              << "\n";
    return 0;
  }

  if (cmd == "config-check") {
    std::string config_file;
    for (int i = 2; i < argc; ++i) {
      if (std::string(argv[i]) == "--config" && i + 1 < argc)
        config_file = argv[++i];
    }
    std::string text;
    if (config_file.empty() || !read_file(config_file, &text)) {
      std::cerr << "config-check requires a readable --config file\n";
      return 2;
    }
    const auto r = launchpad::validate_config(text);
    std::cout << "{\"ok\":" << (r.ok ? "true" : "false") << ",\"errors\":[";
    for (size_t i = 0; i < r.errors.size(); ++i)
      std::cout << (i ? "," : "") << "\"" << launchpad::jsonlite::escape(r.errors[i]) << "\"";
    std::cout << "],\"warnings\":[";
    for (size_t i = 0; i < r.warnings.size(); ++i)
      std::cout << (i ? "," : "") << "\"" << launchpad::jsonlite::escape(r.warnings[i]) << "\"";
    std::cout << "]}\n";
    return r.ok ? 0 : 1;
  }

  if (cmd == "render-script") {
    std::string config_file;
    for (int i = 2; i < argc; ++i) {
      if (std::string(argv[i]) == "--config" && i + 1 < argc)
        config_file = argv[++i];
    }
    launchpad::PipelineConfig config = launchpad::PipelineConfig::from_env();
    if (!load_config(config_file, &config))
      return 2;
    std::cout << launchpad::render_startup_script(config.startup_script_spec());
    return 0;
  }

  if (cmd == "deploy") {
    std::string request_file, config_file, flavor, sandbox_dir;
    bool verbose = false, stats = false, release_on_exit = false;
    for (int i = 2; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--request" && i + 1 < argc)
        request_file = argv[++i];
      else if (arg == "--config" && i + 1 < argc)
        config_file = argv[++i];
      else if (arg == "--flavor" && i + 1 < argc)
        flavor = argv[++i];
      else if (arg == "--sandbox-dir" && i + 1 < argc)
        sandbox_dir = argv[++i];
      else if (arg == "--verbose")
        verbose = true;
      else if (arg == "--stats")
        stats = true;
      else if (arg == "--release-on-exit")
        release_on_exit = true;
      else {
        std::cerr << "unknown option " << arg << "\n";
        usage();
        return 2;
      }
    }
    if (request_file.empty()) {
      usage();
      return 2;
    }

    launchpad::PipelineConfig config = launchpad::PipelineConfig::from_env();
    launchpad::apply_local_provider_defaults(&config);
    if (!load_config(config_file, &config))
      return 2;
    if (!flavor.empty() && !launchpad::flavor_by_name(flavor, &config.flavor)) {
      std::cerr << "unknown flavor " << flavor << "\n";
      return 2;
    }
    std::string payload;
    if (!read_file(request_file, &payload)) {
      std::cerr << "cannot read request " << request_file << "\n";
      return 2;
    }
    std::string parse_error;
    launchpad::ProvisionRequest request =
        launchpad::parse_request_json(payload, &parse_error);
    if (!parse_error.empty()) {
      launchpad::ProvisionOutcome rejected;
      launchpad::ProvisionError error;
      error.code = launchpad::ErrorCode::invalid_request;
      error.error_class = launchpad::classify(error.code);
      error.stage = "validate";
      error.message = "Invalid request body";
      error.detail = parse_error;
      rejected.error = error;
      std::cout << launchpad::outcome_to_json(rejected) << "\n";
      return 2;
    }

    launchpad::LocalSandboxOptions local;
    local.base_dir = sandbox_dir;
    launchpad::LocalSandboxProvider provider(local);
    launchpad::StageRunner runner(provider, config,
                                  launchpad::Credentials::from_env());
    launchpad::ProvisionOutcome outcome = runner.run(request);

    if (verbose)
      std::cerr << launchpad::stage_log_pretty(outcome);
    std::cout << launchpad::outcome_to_json(outcome) << "\n";
    if (stats)
      std::cerr << launchpad::global_provision_stats().to_json() << "\n";

    if (outcome.sandbox && release_on_exit) {
      if (auto err = outcome.sandbox->release()) {
        std::cerr << "release failed: " << err->message << "\n";
      }
    }

    const int status = launchpad::http_status(outcome);
    if (status == 200)
      return 0;
    return status == 400 ? 2 : 1;
  }

  usage();
  return 2;
}
