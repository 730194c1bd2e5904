#include "launchpad/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <limits>

#include "launchpad/jsonlite.hpp"
#include "launchpad/request.hpp"

namespace launchpad {

namespace {

std::string env_or(const char* name, const std::string& def) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : def;
}

// Unparseable values keep the default.
template <typename T>
void env_number(const char* name, T* out, std::uint64_t hi = std::numeric_limits<T>::max()) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (end == e || *end != '\0' || v == 0 || v > hi || v > std::numeric_limits<T>::max()) return;
  *out = static_cast<T>(v);
}

enum class FieldKind { string, u64, boolean };

struct Field {
  const char* name;
  FieldKind kind;
  std::function<void(PipelineConfig&, const jsonlite::Value&)> apply;
  std::function<std::string(const jsonlite::Value&)> check;  // "" when acceptable
};

std::uint64_t as_u64(const jsonlite::Value& v) { return std::get<std::uint64_t>(v.v); }
const std::string& as_str(const jsonlite::Value& v) { return std::get<std::string>(v.v); }

std::string non_empty(const jsonlite::Value& v) {
  return as_str(v).empty() ? "must not be empty" : "";
}

std::string relative_dir(const jsonlite::Value& v) {
  return is_safe_relative_path(as_str(v)) ? "" : "must be a relative path without '..'";
}

std::string no_check(const jsonlite::Value&) { return ""; }

// Numeric field stored in a T member, accepted only in [lo, hi].
template <typename T>
Field u64_field(const char* name, T PipelineConfig::*member, std::uint64_t lo, std::uint64_t hi) {
  hi = std::min<std::uint64_t>(hi, std::numeric_limits<T>::max());
  return Field{name, FieldKind::u64,
               [member](PipelineConfig& c, const jsonlite::Value& v) {
                 c.*member = static_cast<T>(as_u64(v));
               },
               [lo, hi](const jsonlite::Value& v) {
                 const std::uint64_t n = as_u64(v);
                 if (n < lo || n > hi) {
                   return "must be in " + std::to_string(lo) + ".." + std::to_string(hi);
                 }
                 return std::string();
               }};
}

Field string_field(const char* name, std::string PipelineConfig::*member,
                   std::string (*check)(const jsonlite::Value&)) {
  return Field{name, FieldKind::string,
               [member](PipelineConfig& c, const jsonlite::Value& v) { c.*member = as_str(v); },
               check};
}

constexpr std::uint64_t kMaxAttempts = 10000;
constexpr std::uint64_t kMaxSeconds = 3600;

const std::vector<Field>& config_fields() {
  static const std::vector<Field> fields = {
      Field{"flavor", FieldKind::string,
            [](PipelineConfig& c, const jsonlite::Value& v) { flavor_by_name(as_str(v), &c.flavor); },
            [](const jsonlite::Value& v) {
              DeploymentFlavor f;
              return flavor_by_name(as_str(v), &f) ? std::string() : "unknown flavor '" + as_str(v) + "'";
            }},
      Field{"workspace_dir", FieldKind::string,
            [](PipelineConfig& c, const jsonlite::Value& v) { c.flavor.workspace_dir = as_str(v); },
            relative_dir},
      Field{"package_dir", FieldKind::string,
            [](PipelineConfig& c, const jsonlite::Value& v) { c.flavor.package_dir = as_str(v); },
            relative_dir},
      u64_field("port", &PipelineConfig::port, 1, 65535),
      u64_field("allocate_timeout_ms", &PipelineConfig::allocate_timeout_ms, 1, kMaxTimeoutMs),
      u64_field("launch_timeout_ms", &PipelineConfig::launch_timeout_ms, 1, kMaxTimeoutMs),
      u64_field("install_timeout_ms", &PipelineConfig::install_timeout_ms, 1, kMaxTimeoutMs),
      u64_field("venv_timeout_ms", &PipelineConfig::venv_timeout_ms, 1, kMaxTimeoutMs),
      u64_field("step_timeout_ms", &PipelineConfig::step_timeout_ms, 1, kMaxTimeoutMs),
      string_field("pinned_python", &PipelineConfig::pinned_python, no_check),
      string_field("default_python", &PipelineConfig::default_python, non_empty),
      string_field("framework_package", &PipelineConfig::framework_package, non_empty),
      string_field("framework_cli", &PipelineConfig::framework_cli, non_empty),
      string_field("server_command", &PipelineConfig::server_command, no_check),
      string_field("entry_file", &PipelineConfig::entry_file, relative_dir),
      string_field("entry_symbol", &PipelineConfig::entry_symbol, non_empty),
      u64_field("startup_attempts", &PipelineConfig::startup_attempts, 1, kMaxAttempts),
      u64_field("startup_spacing_s", &PipelineConfig::startup_spacing_s, 1, kMaxSeconds),
      u64_field("verify_attempts", &PipelineConfig::verify_attempts, 1, kMaxAttempts),
      u64_field("verify_interval_ms", &PipelineConfig::verify_interval_ms, 0, kMaxSeconds * 1000),
      u64_field("process_grace_s", &PipelineConfig::process_grace_s, 0, kMaxSeconds),
      string_field("url_scheme", &PipelineConfig::url_scheme, non_empty),
      Field{"require_sandbox_key", FieldKind::boolean,
            [](PipelineConfig& c, const jsonlite::Value& v) { c.require_sandbox_key = std::get<bool>(v.v); },
            no_check},
  };
  return fields;
}

bool kind_matches(FieldKind kind, const jsonlite::Value& v) {
  switch (kind) {
    case FieldKind::string: return jsonlite::is_string(v);
    case FieldKind::u64: return jsonlite::is_u64(v);
    case FieldKind::boolean: return jsonlite::is_bool(v);
  }
  return false;
}

const char* kind_name(FieldKind kind) {
  switch (kind) {
    case FieldKind::string: return "a string";
    case FieldKind::u64: return "a non-negative integer";
    case FieldKind::boolean: return "a boolean";
  }
  return "";
}

// Validates every key of `doc` and applies the valid ones to *config.
// "flavor" is applied first so explicit directory keys override it.
ConfigValidationResult apply_document(const jsonlite::Object& doc, PipelineConfig* config) {
  ConfigValidationResult r;
  const auto& fields = config_fields();
  for (const auto& [key, value] : doc) {
    const Field* field = nullptr;
    for (const auto& f : fields) {
      if (key == f.name) {
        field = &f;
        break;
      }
    }
    if (!field) {
      r.warnings.push_back("unknown key '" + key + "' ignored");
      continue;
    }
    if (!kind_matches(field->kind, value)) {
      r.errors.push_back("'" + key + "' must be " + kind_name(field->kind));
      continue;
    }
    const std::string problem = field->check(value);
    if (!problem.empty()) {
      r.errors.push_back("'" + key + "' " + problem);
    }
  }
  if (r.errors.empty() && config) {
    auto flavor = doc.find("flavor");
    if (flavor != doc.end()) fields.front().apply(*config, flavor->second);
    for (const auto& f : fields) {
      if (std::string(f.name) == "flavor") continue;
      auto it = doc.find(f.name);
      if (it != doc.end()) f.apply(*config, it->second);
    }
  }
  r.ok = r.errors.empty();
  return r;
}

}  // namespace

DeploymentFlavor default_flavor() { return DeploymentFlavor{}; }

DeploymentFlavor root_flavor() {
  DeploymentFlavor f;
  f.name = "root";
  f.workspace_dir = "app";
  f.run_as_root = true;
  return f;
}

bool flavor_by_name(const std::string& name, DeploymentFlavor* out) {
  if (name == "default") {
    *out = default_flavor();
    return true;
  }
  if (name == "root") {
    *out = root_flavor();
    return true;
  }
  return false;
}

// ---------------------------------------------------------------------------
// PipelineConfig
// ---------------------------------------------------------------------------

std::string PipelineConfig::effective_server_command() const {
  if (!server_command.empty()) return server_command;
  return framework_cli + " api_server --host 0.0.0.0 --port " + std::to_string(port);
}

LivenessTarget PipelineConfig::liveness_target() const {
  LivenessTarget t;
  t.port = port;
  t.process_pattern = process_match_pattern(effective_server_command());
  t.grace_seconds = process_grace_s;
  return t;
}

StartupScriptSpec PipelineConfig::startup_script_spec() const {
  StartupScriptSpec s;
  s.framework_cli = framework_cli;
  s.framework_package = framework_package;
  s.server_command = effective_server_command();
  s.venv_dir = venv_dir;
  s.env_file = env_file;
  s.pid_file = pid_file;
  s.log_file = log_file;
  s.target = liveness_target();
  s.attempts = startup_attempts;
  s.spacing_seconds = startup_spacing_s;
  return s;
}

std::string PipelineConfig::workspace_path(const std::string& rel) const {
  return flavor.workspace_dir + "/" + rel;
}

std::string PipelineConfig::package_path(const std::string& rel) const {
  return flavor.workspace_dir + "/" + flavor.package_dir + "/" + rel;
}

PipelineConfig PipelineConfig::from_env() {
  PipelineConfig c;
  flavor_by_name(env_or("LAUNCHPAD_FLAVOR", "default"), &c.flavor);
  env_number("LAUNCHPAD_PORT", &c.port);
  env_number("LAUNCHPAD_ALLOCATE_TIMEOUT_MS", &c.allocate_timeout_ms, kMaxTimeoutMs);
  env_number("LAUNCHPAD_LAUNCH_TIMEOUT_MS", &c.launch_timeout_ms, kMaxTimeoutMs);
  env_number("LAUNCHPAD_VERIFY_ATTEMPTS", &c.verify_attempts, kMaxAttempts);
  env_number("LAUNCHPAD_VERIFY_INTERVAL_MS", &c.verify_interval_ms, kMaxSeconds * 1000);
  c.pinned_python = env_or("LAUNCHPAD_PYTHON", c.pinned_python);
  c.framework_package = env_or("LAUNCHPAD_FRAMEWORK_PACKAGE", c.framework_package);
  return c;
}

// ---------------------------------------------------------------------------
// Credentials
// ---------------------------------------------------------------------------

bool is_placeholder_secret(const std::string& value) {
  if (value.empty()) return true;
  const std::string prefix = "your_";
  const std::string suffix = "_here";
  return value.size() >= prefix.size() + suffix.size() &&
         value.compare(0, prefix.size(), prefix) == 0 &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> Credentials::missing(bool require_sandbox_key) const {
  std::vector<std::string> out;
  if (require_sandbox_key && is_placeholder_secret(sandbox_api_key)) out.push_back("SANDBOX_API_KEY");
  if (is_placeholder_secret(google_api_key)) out.push_back("GOOGLE_API_KEY");
  return out;
}

std::map<std::string, std::string> Credentials::sandbox_env() const {
  return {
      {"GOOGLE_API_KEY", google_api_key},
      {"ADK_API_KEY", adk_api_key.empty() ? google_api_key : adk_api_key},
      {"PYTHONUNBUFFERED", "1"},
  };
}

Credentials Credentials::from_env() {
  Credentials c;
  c.sandbox_api_key = env_or("SANDBOX_API_KEY", "");
  c.google_api_key = env_or("GOOGLE_API_KEY", "");
  c.adk_api_key = env_or("ADK_API_KEY", "");
  if (is_placeholder_secret(c.adk_api_key)) c.adk_api_key.clear();
  return c;
}

// ---------------------------------------------------------------------------
// JSON config
// ---------------------------------------------------------------------------

ConfigValidationResult validate_config(const std::string& config_json) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(config_json, &err);
  if (err) {
    ConfigValidationResult r;
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }
  return apply_document(doc, nullptr);
}

bool load_config_json(const std::string& config_json, PipelineConfig* config, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(config_json, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return false;
  }
  PipelineConfig scratch = *config;
  const ConfigValidationResult r = apply_document(doc, &scratch);
  if (!r.ok) {
    if (error) *error = r.errors.front();
    return false;
  }
  *config = std::move(scratch);
  return true;
}

std::string config_to_json(const PipelineConfig& c) {
  jsonlite::Object o;
  o["flavor"] = c.flavor.name;
  o["workspace_dir"] = c.flavor.workspace_dir;
  o["package_dir"] = c.flavor.package_dir;
  o["run_as_root"] = c.flavor.run_as_root;
  o["port"] = static_cast<std::uint64_t>(c.port);
  o["allocate_timeout_ms"] = static_cast<std::uint64_t>(c.allocate_timeout_ms);
  o["launch_timeout_ms"] = static_cast<std::uint64_t>(c.launch_timeout_ms);
  o["install_timeout_ms"] = static_cast<std::uint64_t>(c.install_timeout_ms);
  o["venv_timeout_ms"] = static_cast<std::uint64_t>(c.venv_timeout_ms);
  o["step_timeout_ms"] = static_cast<std::uint64_t>(c.step_timeout_ms);
  o["pinned_python"] = c.pinned_python;
  o["default_python"] = c.default_python;
  o["framework_package"] = c.framework_package;
  o["framework_cli"] = c.framework_cli;
  o["server_command"] = c.effective_server_command();
  o["entry_file"] = c.entry_file;
  o["entry_symbol"] = c.entry_symbol;
  o["startup_attempts"] = static_cast<std::uint64_t>(c.startup_attempts);
  o["startup_spacing_s"] = static_cast<std::uint64_t>(c.startup_spacing_s);
  o["verify_attempts"] = static_cast<std::uint64_t>(c.verify_attempts);
  o["verify_interval_ms"] = static_cast<std::uint64_t>(c.verify_interval_ms);
  o["process_grace_s"] = static_cast<std::uint64_t>(c.process_grace_s);
  o["url_scheme"] = c.url_scheme;
  o["require_sandbox_key"] = c.require_sandbox_key;
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

void apply_local_provider_defaults(PipelineConfig* config) {
  config->require_sandbox_key = false;
  config->url_scheme = "http";
}

}  // namespace launchpad
