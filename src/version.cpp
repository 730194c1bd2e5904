#include "launchpad/version.hpp"

#include <sstream>

#include "launchpad/hash.hpp"

namespace launchpad {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver = LAUNCHPAD_VERSION;
  m.hash_primitive = "blake3";
  m.hash_library_version = blake3_library_version();
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"result_schema\":" << m.result_schema
    << ",\"event_log\":" << m.event_log
    << ",\"deployment_id\":" << m.deployment_id
    << ",\"startup_script\":" << m.startup_script
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_library_version\":\"" << m.hash_library_version << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace launchpad
