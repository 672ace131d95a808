#pragma once

// swarm/version.hpp - Version manifest for every persisted or wire format.
//
// PURPOSE:
//   Prevent silent format drift between the store, its backups and the error
//   wire shape. Readers check the matching constant before trusting data.
//
// INVARIANT:
//   All version constants are compile-time. A reader that meets a newer
//   format than it was compiled against rejects the data instead of guessing.

#include <cstdint>
#include <string>

namespace swarm {
namespace version {

// ---------------------------------------------------------------------------
// STORE_FORMAT_VERSION
// On-disk record layout: "swarm-record v<N> <checksum>\n<payload-json>".
// Changing the header line or the payload field set requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t STORE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// BACKUP_FORMAT_VERSION
// Backup snapshot layout: <backup-id>/manifest.json + one file per record.
// ---------------------------------------------------------------------------
constexpr uint32_t BACKUP_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// ERROR_WIRE_VERSION
// StandardError JSON shape (kind, message, details, category, severity,
// timestamp, correlationId).
// ---------------------------------------------------------------------------
constexpr uint32_t ERROR_WIRE_VERSION = 1;

// Checksum algorithm for records and manifests. 1 = BLAKE3-256, hex encoded.
constexpr uint32_t CHECKSUM_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t store_format{STORE_FORMAT_VERSION};
  uint32_t backup_format{BACKUP_FORMAT_VERSION};
  uint32_t error_wire{ERROR_WIRE_VERSION};
  uint32_t checksum_algorithm{CHECKSUM_ALGORITHM_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace swarm
