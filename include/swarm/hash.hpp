#pragma once

// swarm/hash.hpp - Checksums and identifiers.
//
// BLAKE3 is the sole checksum primitive for persisted data. Domain prefixes
// keep the contexts apart:
//   "rec:"  stored record payloads
//   "bak:"  backup manifests
//   "cid:"  correlation id material

#include <cstdint>
#include <string>
#include <string_view>

namespace swarm {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex BLAKE3 digest.
std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string record_checksum(std::string_view payload);
std::string manifest_digest(std::string_view manifest_body);

bool is_hex_digest(const std::string& d);

// FNV-1a 32-bit. Non-cryptographic; used for lock striping only.
uint32_t fnv1a_32(std::string_view s);

}  // namespace swarm
