#pragma once

// launchpad/version.hpp - Version manifest for every emitted format.
//
// Consumers of the client response, the event log, or deployment ids can
// check the matching constant before reading data written by another build.

#include <cstdint>
#include <string>

#ifndef LAUNCHPAD_VERSION
#define LAUNCHPAD_VERSION "0.1.0"
#endif

namespace launchpad {
namespace version {

// Shape of the JSON returned to clients (result_format.hpp).
constexpr std::uint32_t RESULT_SCHEMA_VERSION = 1;

// JSONL event lines (observability.hpp).
constexpr std::uint32_t EVENT_LOG_VERSION = 1;

// Deployment id derivation: BLAKE3, "pkg:" domain, length-framed entries.
constexpr std::uint32_t DEPLOYMENT_ID_VERSION = 1;

// Startup script contract (exit codes, pid/log file names, check_port()).
constexpr std::uint32_t STARTUP_SCRIPT_VERSION = 1;

struct VersionManifest {
  std::uint32_t result_schema{RESULT_SCHEMA_VERSION};
  std::uint32_t event_log{EVENT_LOG_VERSION};
  std::uint32_t deployment_id{DEPLOYMENT_ID_VERSION};
  std::uint32_t startup_script{STARTUP_SCRIPT_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string hash_library_version;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace launchpad
