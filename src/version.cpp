#include "swarm/version.hpp"

#include <sstream>

#include "swarm/hash.hpp"

#ifndef SWARM_SEMVER
#define SWARM_SEMVER "0.1.0"
#endif

namespace swarm {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver          = SWARM_SEMVER;
  m.hash_primitive  = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"store_format\":" << m.store_format
    << ",\"backup_format\":" << m.backup_format
    << ",\"error_wire\":" << m.error_wire
    << ",\"checksum_algorithm\":" << m.checksum_algorithm
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace swarm
