#include "launchpad/result_format.hpp"

#include <sstream>

#include "launchpad/jsonlite.hpp"

namespace launchpad {

namespace {

jsonlite::Array to_array(const std::vector<std::string>& lines) {
  jsonlite::Array a;
  a.reserve(lines.size());
  for (const auto& l : lines) a.emplace_back(l);
  return a;
}

}  // namespace

std::string outcome_to_json(const ProvisionOutcome& outcome) {
  jsonlite::Object o;
  o["executionTime"] = static_cast<std::uint64_t>(outcome.duration_ms);

  if (outcome.ok) {
    jsonlite::Object details;
    details["stdout"] = to_array(outcome.stdout_lines);
    details["stderr"] = to_array(outcome.stderr_lines);
    details["exitCode"] = static_cast<std::uint64_t>(0);
    details["status"] = "running";
    details["duration"] = static_cast<std::uint64_t>(outcome.duration_ms);
    details["serverUrl"] = outcome.endpoint;

    o["output"] = "Agent started. Access the UI at " + outcome.endpoint;
    o["error"] = nullptr;
    o["executionDetails"] = std::move(details);
    o["openUrl"] = outcome.endpoint;
    o["showOpenLink"] = true;
    o["linkText"] = "Open Agent UI";
    return jsonlite::to_json(jsonlite::Value(std::move(o)));
  }

  const ProvisionError error = outcome.error.value_or(ProvisionError{});
  jsonlite::Object details;
  details["name"] = to_string(error.error_class);
  details["message"] = error.detail.empty() ? error.message : error.detail;
  details["code"] = to_string(error.code);
  details["stage"] = error.stage;
  if (!outcome.cleanup_errors.empty()) {
    jsonlite::Array cleanup;
    for (const auto& message : outcome.cleanup_errors) {
      jsonlite::Object entry;
      entry["name"] = to_string(ErrorClass::cleanup);
      entry["code"] = to_string(ErrorCode::cleanup_failed);
      entry["message"] = message;
      cleanup.emplace_back(std::move(entry));
    }
    details["cleanupErrors"] = std::move(cleanup);
  }

  o["error"] = error.message.empty() ? std::string("Provisioning failed") : error.message;
  o["errorDetails"] = std::move(details);
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

int http_status(const ProvisionOutcome& outcome) {
  if (outcome.ok) return 200;
  if (outcome.error && outcome.error->error_class == ErrorClass::client_input) return 400;
  return 500;
}

std::string stage_log_pretty(const ProvisionOutcome& outcome) {
  std::ostringstream o;
  o << "deployment " << outcome.deployment_id;
  if (!outcome.sandbox_id.empty()) o << " sandbox " << outcome.sandbox_id;
  o << "\n";
  for (const auto& entry : outcome.log) {
    o << "[" << entry.stage << "] " << entry.step << " exit=" << entry.exit_code;
    if (!entry.note.empty()) o << " (" << entry.note << ")";
    o << "\n";
    if (!entry.stdout_text.empty()) o << tail_lines(entry.stdout_text, 10) << "\n";
    if (!entry.stderr_text.empty()) o << tail_lines(entry.stderr_text, 10) << "\n";
  }
  if (outcome.ok) {
    o << "ok in " << outcome.duration_ms << " ms: " << outcome.endpoint << "\n";
  } else if (outcome.error) {
    o << to_string(outcome.error->error_class) << " at " << outcome.error->stage << ": "
      << outcome.error->message << " (" << outcome.duration_ms << " ms)\n";
  }
  for (const auto& e : outcome.cleanup_errors) o << "cleanup: " << e << "\n";
  return o.str();
}

}  // namespace launchpad
