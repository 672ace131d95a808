#pragma once

// swarm/store.hpp - Durable, checksummed memory record store.
//
// ON-DISK LAYOUT (STORE_FORMAT_VERSION = 1):
//   <root>/records/<id>.rec
//       "swarm-record v1 <checksum>\n" followed by the payload JSON.
//       checksum = BLAKE3("rec:" || payload bytes), 64 lowercase hex.
//   <root>/backups/<backup-id>/manifest.json
//   <root>/backups/<backup-id>/manifest.digest   BLAKE3("bak:" || manifest)
//   <root>/backups/<backup-id>/records/<id>.rec[.zst]
//
// WRITE PROTOCOL:
//   encode -> write <records>/.tmp-* (O_EXCL) -> fsync -> rename over the
//   live file -> fsync the directory. A reader sees the old file or the new
//   one, never a prefix. A failure at any step unlinks the temp file and
//   leaves the previous version untouched.
//
// INVARIANTS:
//   - A record is only ever returned after its checksum verified. A live file
//     that fails verification is replaced from the newest backup holding a
//     good copy; with no such backup get() fails with resource-corrupted.
//   - Writes to one record are serialized (striped mutex by id); operations
//     on different records proceed in parallel.
//   - remove(), restore() and prune_older_than() take a backup first and do
//     nothing if that backup fails.
//   - backup() never holds a record lock for longer than one file copy, so
//     it does not block put().
//   - Write listeners run before the mutating call returns.
//
// ERRORS:
//   invalid-input / missing-field   bad id or empty content
//   resource-not-found              no such record or backup
//   resource-corrupted (critical)   checksum mismatch with no good backup
//   storage-failure                 disk full, permissions, I/O; never retried here

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "swarm/clock.hpp"
#include "swarm/config.hpp"
#include "swarm/errors.hpp"

namespace swarm {

struct MemoryRecord {
  std::string                   id;
  std::string                   content;
  std::string                   owner;
  uint64_t                      created_at_unix_ms{0};
  uint64_t                      last_referenced_unix_ms{0};
  uint64_t                      reference_count{0};
  std::set<std::string>         themes;
  std::map<std::string, double> emotions;
  std::string                   checksum;

  // Canonical payload JSON (sorted keys, no checksum). This is what the
  // checksum covers.
  std::string payload_json() const;

  // Payload plus checksum, for API responses.
  std::string to_json() const;
};

// Parses a payload or API JSON object into a record. Unknown keys are ignored.
Result<MemoryRecord> record_from_json(const std::string& json);

// Builds the on-disk file image and sets record.checksum.
std::string encode_record_file(MemoryRecord& record);

// Verifies header and checksum. `expected_id` must match the payload id.
Result<MemoryRecord> decode_record_file(const std::string& bytes, const std::string& expected_id);

// [A-Za-z0-9._-]{1,128}, not starting with '.'.
bool is_valid_record_id(const std::string& id);

enum class StoreOp {
  put,
  reference,
  remove,
  restore,
};

std::string to_string(StoreOp op);

struct StoreChange {
  StoreOp                     op{StoreOp::put};
  std::string                 id;      // empty for restore
  std::optional<MemoryRecord> record;  // set for put and reference
};

using StoreListener = std::function<void(const StoreChange&)>;

struct BackupInfo {
  std::string id;
  uint64_t    created_at_unix_ms{0};
  uint32_t    record_count{0};
  uint32_t    skipped_count{0};  // live records that failed verification
  std::string compression;       // "identity" | "zstd"
  std::string digest;

  std::string to_json() const;
};

struct LoadAllResult {
  std::vector<MemoryRecord> records;
  std::vector<std::string>  unreadable_ids;
};

class MemoryStore {
 public:
  // Creates the directory layout and removes temp files left by a crash.
  static Result<std::shared_ptr<MemoryStore>> open(const SwarmConfig& config,
                                                   std::shared_ptr<Clock> clock = system_clock());

  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  // Assigns "mem-<16 hex>" when record.id is empty; created/last-referenced
  // default to now. Returns the id.
  Result<std::string> put(MemoryRecord record, const std::string& correlation_id = "");

  Result<MemoryRecord> get(const std::string& id, const std::string& correlation_id = "");

  // Increments reference_count and sets last_referenced to now, atomically
  // with respect to other writers of the same record.
  Result<MemoryRecord> reference(const std::string& id, const std::string& correlation_id = "");

  Status remove(const std::string& id, const std::string& correlation_id = "");

  std::vector<std::string> list_ids() const;
  LoadAllResult load_all(const std::string& correlation_id = "");

  Result<BackupInfo> backup(const std::string& correlation_id = "");

  // Newest first. Backups whose manifest fails verification are omitted.
  std::vector<BackupInfo> list_backups() const;

  // Replaces the live record set with the backup's. Returns records restored.
  Result<uint32_t> restore(const std::string& backup_id, const std::string& correlation_id = "");

  // Deletes records not referenced within max_age_ms. Returns removed ids.
  Result<std::vector<std::string>> prune_older_than(uint64_t max_age_ms,
                                                    const std::string& correlation_id = "");

  uint64_t add_listener(StoreListener listener);
  void     remove_listener(uint64_t listener_id);

  const std::string& root() const { return root_; }
  std::string record_path(const std::string& id) const;

 private:
  MemoryStore(const SwarmConfig& config, std::shared_ptr<Clock> clock);

  static constexpr size_t kLockStripes = 64;
  std::mutex& lock_for(const std::string& id) const;

  std::string records_dir() const;
  std::string backups_dir() const;

  // Caller holds lock_for(id).
  Result<MemoryRecord> load_locked(const std::string& id, const std::string& cid);
  Status write_locked(MemoryRecord& record, const std::string& cid);

  std::optional<MemoryRecord> recover_from_backups(const std::string& id) const;
  Result<std::string> read_backup_record(const BackupInfo& info, const std::string& id) const;
  std::optional<BackupInfo> read_manifest(const std::string& backup_id,
                                          std::map<std::string, uint64_t>* sizes = nullptr) const;
  void rotate_backups();

  Status remove_unlocked_file(const std::string& id, const std::string& cid);

  void notify(const StoreChange& change);
  std::string new_record_id();

  std::string            root_;
  std::shared_ptr<Clock> clock_;
  uint32_t               retention_;
  std::string            compression_;

  mutable std::array<std::mutex, kLockStripes> stripes_;
  std::mutex                                   backup_mu_;
  std::atomic<uint64_t>                        backup_seq_{0};
  std::atomic<uint64_t>                        id_seq_{0};

  std::mutex                        listeners_mu_;
  std::map<uint64_t, StoreListener> listeners_;
  uint64_t                          next_listener_id_{1};
};

}  // namespace swarm
