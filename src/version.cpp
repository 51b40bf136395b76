#include "pacer/version.hpp"

#include <sstream>

namespace pacer {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  // Deterministic within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"semver\":\"" << m.semver << "\""
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"checkpoint_format\":" << m.checkpoint_format
    << ",\"escalation_log\":" << m.escalation_log
    << ",\"event_schema\":" << m.event_schema
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"compression\":\"" << m.compression << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace pacer
