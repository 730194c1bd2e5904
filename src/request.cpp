#include "launchpad/request.hpp"

#include <optional>

#include "launchpad/jsonlite.hpp"

namespace launchpad {

ProvisionRequest parse_request_json(const std::string& json_payload, std::string* error) {
  ProvisionRequest req;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(json_payload, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return req;
  }
  auto it = obj.find("files");
  if (it == obj.end() || !jsonlite::is_object(it->second)) {
    if (error) *error = "request must contain a \"files\" object";
    return req;
  }
  for (const auto& [path, content] : std::get<jsonlite::Object>(it->second.v)) {
    if (!jsonlite::is_string(content)) {
      if (error) *error = "content of \"" + path + "\" must be a string";
      return ProvisionRequest{};
    }
    req.files[path] = std::get<std::string>(content.v);
  }
  return req;
}

bool is_safe_relative_path(const std::string& path) {
  if (path.empty() || path.front() == '/') return false;
  if (path.find('\\') != std::string::npos || path.find('\0') != std::string::npos) return false;
  std::size_t start = 0;
  while (start <= path.size()) {
    const std::size_t slash = path.find('/', start);
    const std::size_t end = slash == std::string::npos ? path.size() : slash;
    const std::string part = path.substr(start, end - start);
    if (part.empty() || part == "." || part == "..") return false;
    if (slash == std::string::npos) break;
    start = slash + 1;
  }
  return true;
}

std::optional<ProvisionError> validate_request(const ProvisionRequest& request,
                                               const std::string& entry_file) {
  auto reject = [](ErrorCode code, std::string message, std::string detail) {
    ProvisionError e;
    e.code = code;
    e.error_class = classify(code);
    e.stage = "validate";
    e.message = std::move(message);
    e.detail = std::move(detail);
    return e;
  };

  auto entry = request.files.find(entry_file);
  if (entry == request.files.end() || entry->second.empty()) {
    return reject(ErrorCode::missing_entry_point, "No " + entry_file + " file provided",
                  entry == request.files.end() ? "file absent" : "file empty");
  }
  for (const auto& [path, content] : request.files) {
    (void)content;
    if (!is_safe_relative_path(path)) {
      return reject(ErrorCode::path_escape, "Invalid file path in package: " + path,
                    "paths must be relative and stay inside the package directory");
    }
  }
  return std::nullopt;
}

}  // namespace launchpad
