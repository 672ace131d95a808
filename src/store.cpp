#include "swarm/store.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

#if defined(SWARM_WITH_ZSTD)
#include <zstd.h>
#endif

#include "swarm/chaos.hpp"
#include "swarm/hash.hpp"
#include "swarm/jsonlite.hpp"
#include "swarm/log.hpp"
#include "swarm/observability.hpp"
#include "swarm/version.hpp"

namespace fs = std::filesystem;

namespace swarm {

namespace {

constexpr const char* kRecordMagic    = "swarm-record v1 ";
constexpr const char* kRecordExt      = ".rec";
constexpr const char* kTmpPrefix      = ".tmp-";
constexpr const char* kStagingPrefix  = ".staging-";
constexpr const char* kManifestFile   = "manifest.json";
constexpr const char* kDigestFile     = "manifest.digest";
constexpr uint32_t    kManifestFormat = version::BACKUP_FORMAT_VERSION;

#if defined(SWARM_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return {};
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (std::string(kTmpPrefix) + std::to_string(dist(rng)))).string();
}

Status read_file(const std::string& path, std::string& out, const std::string& cid) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return translate_errno(errno, "open", path, cid);
  out.clear();
  char buf[8192];
  for (;;) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      const int e = errno;
      ::close(fd);
      return translate_errno(e, "read", path, cid);
    }
    if (n == 0) break;
    out.append(buf, static_cast<size_t>(n));
  }
  ::close(fd);
  return std::nullopt;
}

// Creates `path` (must not exist), writes `len` bytes and fsyncs.
Status write_new_file(const std::string& path, const char* data, size_t len,
                      const std::string& cid) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) return translate_errno(errno, "create", path, cid);
  size_t off = 0;
  while (off < len) {
    const ssize_t n = ::write(fd, data + off, len - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      const int e = errno;
      ::close(fd);
      return translate_errno(e, "write", path, cid);
    }
    off += static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    const int e = errno;
    ::close(fd);
    return translate_errno(e, "fsync", path, cid);
  }
  if (::close(fd) != 0) return translate_errno(errno, "close", path, cid);
  return std::nullopt;
}

Status fsync_dir(const std::string& dir, const std::string& cid) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return translate_errno(errno, "open", dir, cid);
  const int rc = ::fsync(fd);
  const int e = errno;
  ::close(fd);
  if (rc != 0) return translate_errno(e, "fsync", dir, cid);
  return std::nullopt;
}

// tmp -> fsync -> rename -> fsync(dir). `partial` simulates a crash after
// half the payload reached the temp file.
Status atomic_write(const fs::path& target, const std::string& data, bool partial,
                    const std::string& cid) {
  const std::string dir = target.parent_path().string();
  const std::string tmp = make_tmp_name(target.parent_path());
  const size_t len = partial ? data.size() / 2 : data.size();
  if (Status st = write_new_file(tmp, data.data(), len, cid)) {
    ::unlink(tmp.c_str());
    return st;
  }
  if (partial) {
    ::unlink(tmp.c_str());
    return make_error(ErrorKind::storage_failure, "write interrupted after partial payload", cid,
                      {{"path", target.string()}, {"reason", "partial_write"}});
  }
  if (::rename(tmp.c_str(), target.c_str()) != 0) {
    const int e = errno;
    ::unlink(tmp.c_str());
    StandardError err = translate_errno(e, "rename", target.string(), cid);
    // A vanished temp file is still a storage fault, not a missing record.
    err.kind     = ErrorKind::storage_failure;
    err.category = category_of(err.kind);
    err.severity = default_severity(err.kind);
    return err;
  }
  return fsync_dir(dir, cid);
}

jsonlite::Object record_object(const MemoryRecord& r) {
  jsonlite::Array themes;
  for (const auto& t : r.themes) themes.emplace_back(t);
  jsonlite::Object emotions;
  for (const auto& [k, v] : r.emotions) emotions[k] = v;
  jsonlite::Object o;
  o["id"]              = r.id;
  o["content"]         = r.content;
  o["owner"]           = r.owner;
  o["created_at"]      = r.created_at_unix_ms;
  o["last_referenced"] = r.last_referenced_unix_ms;
  o["reference_count"] = r.reference_count;
  o["themes"]          = std::move(themes);
  o["emotions"]        = std::move(emotions);
  return o;
}

StandardError corrupted(const std::string& id, const std::string& reason, const std::string& cid) {
  return make_error(ErrorKind::resource_corrupted, "record failed integrity verification", cid,
                    {{"id", id}, {"reason", reason}});
}

std::string backup_id_for(uint64_t now_ms, uint64_t seq) {
  std::ostringstream o;
  o << "bk-" << std::setw(20) << std::setfill('0') << now_ms << "-" << std::setw(6)
    << std::setfill('0') << seq;
  return o.str();
}

void emit_store_event(const std::string& type, const std::string& id, const std::string& cid,
                      const StandardError* err, uint64_t now, const std::string& detail = "") {
  SwarmEvent e;
  e.type              = type;
  e.component         = "store";
  e.subject_id        = id;
  e.correlation_id    = cid;
  e.ok                = err == nullptr;
  e.error_kind        = err ? to_string(err->kind) : "";
  e.timestamp_unix_ms = now;
  e.detail            = detail;
  emit_event(e);
}

}  // namespace

// ---------------------------------------------------------------------------
// Record codec
// ---------------------------------------------------------------------------

std::string MemoryRecord::payload_json() const { return jsonlite::to_json(record_object(*this)); }

std::string MemoryRecord::to_json() const {
  jsonlite::Object o = record_object(*this);
  o["checksum"] = checksum;
  return jsonlite::to_json(o);
}

Result<MemoryRecord> record_from_json(const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(json, &err);
  if (err) {
    return make_error(ErrorKind::invalid_input, "record is not valid JSON", "",
                      {{"code", err->code}, {"reason", err->message}});
  }
  MemoryRecord r;
  r.id                      = jsonlite::get_string(o, "id");
  r.content                 = jsonlite::get_string(o, "content");
  r.owner                   = jsonlite::get_string(o, "owner");
  r.created_at_unix_ms      = jsonlite::get_u64(o, "created_at");
  r.last_referenced_unix_ms = jsonlite::get_u64(o, "last_referenced");
  r.reference_count         = jsonlite::get_u64(o, "reference_count");
  for (auto& t : jsonlite::get_string_array(o, "themes")) r.themes.insert(std::move(t));
  r.emotions = jsonlite::get_double_map(o, "emotions");
  r.checksum = jsonlite::get_string(o, "checksum");
  return r;
}

std::string encode_record_file(MemoryRecord& record) {
  const std::string payload = record.payload_json();
  record.checksum = record_checksum(payload);
  std::string out;
  out.reserve(payload.size() + 96);
  out += kRecordMagic;
  out += record.checksum;
  out += '\n';
  out += payload;
  return out;
}

Result<MemoryRecord> decode_record_file(const std::string& bytes, const std::string& expected_id) {
  const size_t nl = bytes.find('\n');
  const std::string magic = kRecordMagic;
  if (nl == std::string::npos || bytes.compare(0, magic.size(), magic) != 0) {
    return corrupted(expected_id, "bad_header", "");
  }
  const std::string checksum = bytes.substr(magic.size(), nl - magic.size());
  if (!is_hex_digest(checksum)) return corrupted(expected_id, "bad_header", "");
  const std::string payload = bytes.substr(nl + 1);
  if (record_checksum(payload) != checksum) return corrupted(expected_id, "checksum_mismatch", "");

  auto parsed = record_from_json(payload);
  if (!parsed) return corrupted(expected_id, "unparseable_payload", "");
  MemoryRecord r = std::move(parsed.value());
  if (!expected_id.empty() && r.id != expected_id) return corrupted(expected_id, "id_mismatch", "");
  r.checksum = checksum;
  return r;
}

bool is_valid_record_id(const std::string& id) {
  if (id.empty() || id.size() > 128 || id[0] == '.') return false;
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '.' || c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

std::string to_string(StoreOp op) {
  switch (op) {
    case StoreOp::put: return "put";
    case StoreOp::reference: return "reference";
    case StoreOp::remove: return "remove";
    case StoreOp::restore: return "restore";
  }
  return "put";
}

std::string BackupInfo::to_json() const {
  jsonlite::Object o;
  o["id"]                 = id;
  o["created_at_unix_ms"] = created_at_unix_ms;
  o["record_count"]       = record_count;
  o["skipped_count"]      = skipped_count;
  o["compression"]        = compression;
  o["digest"]             = digest;
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// MemoryStore
// ---------------------------------------------------------------------------

MemoryStore::MemoryStore(const SwarmConfig& config, std::shared_ptr<Clock> clock)
    : root_(config.store_root),
      clock_(std::move(clock)),
      retention_(config.backup_retention),
      compression_(config.backup_compression == "zstd" ? "zstd" : "identity") {}

Result<std::shared_ptr<MemoryStore>> MemoryStore::open(const SwarmConfig& config,
                                                       std::shared_ptr<Clock> clock) {
  if (config.store_root.empty()) {
    return make_error(ErrorKind::missing_field, "store root is empty", "", {{"field", "store_root"}});
  }
  std::shared_ptr<MemoryStore> store(new MemoryStore(config, std::move(clock)));

  for (const std::string& dir : {store->records_dir(), store->backups_dir()}) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return translate_errno(ec.value(), "mkdir", dir);
  }

  // Crash leftovers: temp files in records/, staging directories in backups/.
  uint32_t cleaned = 0;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(store->records_dir(), ec)) {
    if (entry.path().filename().string().rfind(kTmpPrefix, 0) == 0) {
      std::error_code rm;
      if (fs::remove(entry.path(), rm)) ++cleaned;
    }
  }
  for (const auto& entry : fs::directory_iterator(store->backups_dir(), ec)) {
    if (entry.path().filename().string().rfind(kStagingPrefix, 0) == 0) {
      std::error_code rm;
      if (fs::remove_all(entry.path(), rm) > 0) ++cleaned;
    }
  }
  if (cleaned > 0) {
    log_info("store", "removed " + std::to_string(cleaned) + " leftover temp entries under " +
                          store->root_);
  }
  return store;
}

std::mutex& MemoryStore::lock_for(const std::string& id) const {
  return stripes_[fnv1a_32(id) % kLockStripes];
}

std::string MemoryStore::records_dir() const { return (fs::path(root_) / "records").string(); }
std::string MemoryStore::backups_dir() const { return (fs::path(root_) / "backups").string(); }

std::string MemoryStore::record_path(const std::string& id) const {
  return (fs::path(records_dir()) / (id + kRecordExt)).string();
}

std::string MemoryStore::new_record_id() {
  const std::string material = std::to_string(clock_->now_ms()) + ":" +
                               std::to_string(id_seq_.fetch_add(1)) + ":" +
                               std::to_string(std::random_device{}());
  return "mem-" + hash_domain("id:", material).substr(0, 16);
}

void MemoryStore::notify(const StoreChange& change) {
  std::vector<StoreListener> copy;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    copy.reserve(listeners_.size());
    for (const auto& [id, fn] : listeners_) copy.push_back(fn);
  }
  for (const auto& fn : copy) fn(change);
}

uint64_t MemoryStore::add_listener(StoreListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  const uint64_t id = next_listener_id_++;
  listeners_[id] = std::move(listener);
  return id;
}

void MemoryStore::remove_listener(uint64_t listener_id) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.erase(listener_id);
}

Status MemoryStore::write_locked(MemoryRecord& record, const std::string& cid) {
  auto& chaos = chaos::global_chaos();
  if (chaos.inject(chaos::FaultType::store_write_failure, record.id).injected) {
    return make_error(ErrorKind::storage_failure, "injected write failure", cid,
                      {{"id", record.id}, {"reason", "chaos"}});
  }
  const bool partial = chaos.inject(chaos::FaultType::store_partial_write, record.id).injected;
  const std::string bytes = encode_record_file(record);
  return atomic_write(record_path(record.id), bytes, partial, cid);
}

Result<std::string> MemoryStore::put(MemoryRecord record, const std::string& correlation_id) {
  if (record.id.empty()) {
    record.id = new_record_id();
  } else if (!is_valid_record_id(record.id)) {
    return make_error(ErrorKind::invalid_input, "record id must match [A-Za-z0-9._-]{1,128}",
                      correlation_id, {{"id", record.id}});
  }
  if (record.content.empty()) {
    return make_error(ErrorKind::missing_field, "record content is empty", correlation_id,
                      {{"field", "content"}, {"id", record.id}});
  }
  const uint64_t now = clock_->now_ms();
  if (record.created_at_unix_ms == 0) record.created_at_unix_ms = now;
  if (record.last_referenced_unix_ms == 0) record.last_referenced_unix_ms = record.created_at_unix_ms;

  Status st;
  {
    std::lock_guard<std::mutex> lk(lock_for(record.id));
    st = write_locked(record, correlation_id);
  }
  if (st) {
    global_swarm_stats().record_failure(st->kind);
    emit_store_event("store.put", record.id, correlation_id, &*st, now);
    return *st;
  }
  global_swarm_stats().store_puts.fetch_add(1, std::memory_order_relaxed);
  emit_store_event("store.put", record.id, correlation_id, nullptr, now);

  StoreChange change;
  change.op     = StoreOp::put;
  change.id     = record.id;
  change.record = record;
  notify(change);
  return record.id;
}

Result<MemoryRecord> MemoryStore::load_locked(const std::string& id, const std::string& cid) {
  std::string bytes;
  if (Status st = read_file(record_path(id), bytes, cid)) {
    if (st->kind == ErrorKind::resource_not_found) {
      return make_error(ErrorKind::resource_not_found, "no such record", cid, {{"id", id}});
    }
    return *st;
  }
  auto decoded = decode_record_file(bytes, id);
  if (decoded) return decoded;

  const std::string reason = decoded.error().details["reason"];
  log_warn("store", "record " + id + " failed verification (" + reason + "), trying backups");
  auto& stats = global_swarm_stats();
  stats.store_corruptions.fetch_add(1, std::memory_order_relaxed);

  std::optional<MemoryRecord> recovered = recover_from_backups(id);
  const uint64_t now = clock_->now_ms();
  if (!recovered) {
    StandardError err = corrupted(id, reason, cid);
    err.with_detail("path", record_path(id)).with_detail("recovery", "no_good_backup");
    stats.record_failure(err.kind);
    emit_store_event("store.corrupted", id, cid, &err, now, reason);
    log_error("store", "record " + id + " is corrupted and no backup holds a good copy");
    return err;
  }

  // Repair the live copy. The recovered record is served even if the repair
  // write fails; the next read will try again.
  MemoryRecord repaired = *recovered;
  if (Status st = write_locked(repaired, cid)) {
    log_error("store", "repair of " + id + " failed: " + st->message);
  }
  stats.store_recoveries.fetch_add(1, std::memory_order_relaxed);
  emit_store_event("store.recovered", id, cid, nullptr, now, reason);
  return repaired;
}

Result<MemoryRecord> MemoryStore::get(const std::string& id, const std::string& correlation_id) {
  if (!is_valid_record_id(id)) {
    return make_error(ErrorKind::invalid_input, "invalid record id", correlation_id, {{"id", id}});
  }
  global_swarm_stats().store_gets.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lk(lock_for(id));
  return load_locked(id, correlation_id);
}

Result<MemoryRecord> MemoryStore::reference(const std::string& id,
                                            const std::string& correlation_id) {
  if (!is_valid_record_id(id)) {
    return make_error(ErrorKind::invalid_input, "invalid record id", correlation_id, {{"id", id}});
  }
  MemoryRecord rec;
  {
    std::lock_guard<std::mutex> lk(lock_for(id));
    auto loaded = load_locked(id, correlation_id);
    if (!loaded) return loaded;
    rec = std::move(loaded.value());
    rec.reference_count += 1;
    rec.last_referenced_unix_ms = std::max(rec.last_referenced_unix_ms, clock_->now_ms());
    if (Status st = write_locked(rec, correlation_id)) {
      global_swarm_stats().record_failure(st->kind);
      return *st;
    }
  }
  StoreChange change;
  change.op     = StoreOp::reference;
  change.id     = id;
  change.record = rec;
  notify(change);
  return rec;
}

Status MemoryStore::remove_unlocked_file(const std::string& id, const std::string& cid) {
  if (chaos::global_chaos().inject(chaos::FaultType::store_write_failure, id).injected) {
    return make_error(ErrorKind::storage_failure, "injected write failure", cid,
                      {{"id", id}, {"reason", "chaos"}});
  }
  const std::string path = record_path(id);
  if (::unlink(path.c_str()) != 0) {
    StandardError err = translate_errno(errno, "unlink", path, cid);
    if (err.kind == ErrorKind::resource_not_found) {
      return make_error(ErrorKind::resource_not_found, "no such record", cid, {{"id", id}});
    }
    return err;
  }
  return fsync_dir(records_dir(), cid);
}

Status MemoryStore::remove(const std::string& id, const std::string& correlation_id) {
  if (!is_valid_record_id(id)) {
    return make_error(ErrorKind::invalid_input, "invalid record id", correlation_id, {{"id", id}});
  }
  {
    std::error_code ec;
    if (!fs::exists(record_path(id), ec)) {
      return make_error(ErrorKind::resource_not_found, "no such record", correlation_id,
                        {{"id", id}});
    }
  }
  auto bk = backup(correlation_id);
  if (!bk) {
    StandardError err = bk.error();
    err.with_detail("aborted", "remove").with_detail("id", id);
    return err;
  }
  Status st;
  {
    std::lock_guard<std::mutex> lk(lock_for(id));
    st = remove_unlocked_file(id, correlation_id);
  }
  const uint64_t now = clock_->now_ms();
  emit_store_event("store.remove", id, correlation_id, st ? &*st : nullptr, now);
  if (st) return st;

  StoreChange change;
  change.op = StoreOp::remove;
  change.id = id;
  notify(change);
  return std::nullopt;
}

std::vector<std::string> MemoryStore::list_ids() const {
  std::vector<std::string> ids;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(records_dir(), ec)) {
    if (!entry.is_regular_file()) continue;
    const fs::path p = entry.path();
    if (p.extension() != kRecordExt) continue;
    const std::string id = p.stem().string();
    if (is_valid_record_id(id)) ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

LoadAllResult MemoryStore::load_all(const std::string& correlation_id) {
  LoadAllResult out;
  for (const auto& id : list_ids()) {
    auto r = get(id, correlation_id);
    if (r) {
      out.records.push_back(std::move(r.value()));
    } else if (r.error().kind != ErrorKind::resource_not_found) {
      // Not-found here means a concurrent remove; anything else is unreadable.
      out.unreadable_ids.push_back(id);
    }
  }
  return out;
}

// ---------------------------------------------------------------------------
// Backups
// ---------------------------------------------------------------------------

std::optional<BackupInfo> MemoryStore::read_manifest(
    const std::string& backup_id, std::map<std::string, uint64_t>* sizes) const {
  const fs::path dir = fs::path(backups_dir()) / backup_id;
  std::string body;
  std::string digest;
  if (read_file((dir / kManifestFile).string(), body, "")) return std::nullopt;
  if (read_file((dir / kDigestFile).string(), digest, "")) return std::nullopt;
  while (!digest.empty() && (digest.back() == '\n' || digest.back() == ' ')) digest.pop_back();
  if (manifest_digest(body) != digest) {
    log_warn("store", "backup " + backup_id + " manifest digest mismatch, ignoring it");
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(body, &err);
  if (err || jsonlite::get_u64(o, "format") != kManifestFormat ||
      jsonlite::get_string(o, "backup_id") != backup_id) {
    return std::nullopt;
  }
  BackupInfo info;
  info.id                 = backup_id;
  info.created_at_unix_ms = jsonlite::get_u64(o, "created_at_unix_ms");
  info.compression        = jsonlite::get_string(o, "compression", "identity");
  info.skipped_count      = static_cast<uint32_t>(jsonlite::get_u64(o, "skipped"));
  info.digest             = digest;
  const jsonlite::Array records = jsonlite::get_array(o, "records");
  info.record_count = static_cast<uint32_t>(records.size());
  if (sizes) {
    for (const auto& v : records) {
      if (!v.is_object()) continue;
      const auto& ro = std::get<jsonlite::Object>(v.v);
      (*sizes)[jsonlite::get_string(ro, "id")] = jsonlite::get_u64(ro, "size");
    }
  }
  return info;
}

std::vector<BackupInfo> MemoryStore::list_backups() const {
  std::vector<std::string> ids;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(backups_dir(), ec)) {
    if (!entry.is_directory()) continue;
    const std::string name = entry.path().filename().string();
    if (name.rfind("bk-", 0) == 0) ids.push_back(name);
  }
  // Ids embed a zero-padded timestamp and sequence, so lexical order is
  // chronological.
  std::sort(ids.rbegin(), ids.rend());
  std::vector<BackupInfo> out;
  for (const auto& id : ids) {
    if (auto info = read_manifest(id)) out.push_back(std::move(*info));
  }
  return out;
}

Result<std::string> MemoryStore::read_backup_record(const BackupInfo& info,
                                                    const std::string& id) const {
  const bool zstd = info.compression == "zstd";
  const fs::path p = fs::path(backups_dir()) / info.id / "records" /
                     (id + kRecordExt + (zstd ? ".zst" : ""));
  std::string bytes;
  if (Status st = read_file(p.string(), bytes, "")) return *st;
  if (!zstd) return bytes;
#if defined(SWARM_WITH_ZSTD)
  std::map<std::string, uint64_t> sizes;
  if (!read_manifest(info.id, &sizes) || sizes.count(id) == 0) {
    return make_error(ErrorKind::resource_not_found, "record not in backup manifest", "",
                      {{"backup_id", info.id}, {"id", id}});
  }
  std::string plain = decompress_zstd(bytes, sizes[id]);
  if (plain.empty()) {
    return make_error(ErrorKind::resource_corrupted, "backup entry failed to decompress", "",
                      {{"backup_id", info.id}, {"id", id}});
  }
  return plain;
#else
  return make_error(ErrorKind::storage_failure, "backup is zstd-compressed but zstd is unavailable",
                    "", {{"backup_id", info.id}, {"id", id}});
#endif
}

std::optional<MemoryRecord> MemoryStore::recover_from_backups(const std::string& id) const {
  for (const auto& info : list_backups()) {
    auto bytes = read_backup_record(info, id);
    if (!bytes) continue;
    auto rec = decode_record_file(bytes.value(), id);
    if (rec) {
      log_info("store", "recovered " + id + " from backup " + info.id);
      return std::move(rec.value());
    }
    log_warn("store", "backup " + info.id + " copy of " + id + " is also bad");
  }
  return std::nullopt;
}

Result<BackupInfo> MemoryStore::backup(const std::string& correlation_id) {
  std::lock_guard<std::mutex> backup_lk(backup_mu_);
  const uint64_t now = clock_->now_ms();

  std::string backup_id;
  fs::path final_dir;
  do {
    backup_id = backup_id_for(now, backup_seq_.fetch_add(1));
    final_dir = fs::path(backups_dir()) / backup_id;
  } while (fs::exists(final_dir));
  const fs::path staging = fs::path(backups_dir()) / (std::string(kStagingPrefix) + backup_id);

  auto fail = [&](StandardError err) -> Result<BackupInfo> {
    std::error_code ec;
    fs::remove_all(staging, ec);
    global_swarm_stats().record_failure(err.kind);
    emit_store_event("store.backup", backup_id, correlation_id, &err, now);
    log_warn("store", "backup " + backup_id + " failed: " + err.message);
    return err;
  };

  {
    std::error_code ec;
    fs::create_directories(staging / "records", ec);
    if (ec) return fail(translate_errno(ec.value(), "mkdir", staging.string(), correlation_id));
  }
  if (chaos::global_chaos().inject(chaos::FaultType::backup_failure).injected) {
    return fail(make_error(ErrorKind::storage_failure, "injected backup failure", correlation_id,
                           {{"backup_id", backup_id}, {"reason", "chaos"}}));
  }

  const bool zstd = compression_ == "zstd";
  jsonlite::Array entries;
  uint32_t skipped = 0;
  for (const auto& id : list_ids()) {
    std::string bytes;
    {
      // One record lock at a time; puts to other records proceed.
      std::lock_guard<std::mutex> lk(lock_for(id));
      Status st = read_file(record_path(id), bytes, correlation_id);
      if (st && st->kind == ErrorKind::resource_not_found) continue;  // removed meanwhile
      if (st) return fail(*st);
    }
    auto verified = decode_record_file(bytes, id);
    if (!verified) {
      ++skipped;
      log_warn("store", "backup " + backup_id + " skips unverifiable record " + id);
      continue;
    }
    std::string stored = bytes;
    std::string file = id + kRecordExt;
#if defined(SWARM_WITH_ZSTD)
    if (zstd) {
      stored = compress_zstd(bytes);
      if (stored.empty()) {
        return fail(make_error(ErrorKind::internal_error, "zstd compression failed",
                               correlation_id, {{"id", id}}));
      }
      file += ".zst";
    }
#endif
    if (Status st = write_new_file((staging / "records" / file).string(), stored.data(),
                                   stored.size(), correlation_id)) {
      return fail(*st);
    }
    jsonlite::Object e;
    e["id"]       = id;
    e["checksum"] = verified.value().checksum;
    e["file"]     = file;
    e["size"]     = static_cast<uint64_t>(bytes.size());
    entries.emplace_back(std::move(e));
  }

  BackupInfo info;
  info.id                 = backup_id;
  info.created_at_unix_ms = now;
  info.record_count       = static_cast<uint32_t>(entries.size());
  info.skipped_count      = skipped;
#if defined(SWARM_WITH_ZSTD)
  info.compression = zstd ? "zstd" : "identity";
#else
  (void)zstd;
  info.compression = "identity";
#endif

  jsonlite::Object manifest;
  manifest["format"]             = kManifestFormat;
  manifest["backup_id"]          = backup_id;
  manifest["created_at_unix_ms"] = now;
  manifest["compression"]        = info.compression;
  manifest["skipped"]            = skipped;
  manifest["records"]            = std::move(entries);
  const std::string body = jsonlite::to_json(manifest);
  info.digest = manifest_digest(body);

  if (Status st = write_new_file((staging / kManifestFile).string(), body.data(), body.size(),
                                 correlation_id)) {
    return fail(*st);
  }
  const std::string digest_line = info.digest + "\n";
  if (Status st = write_new_file((staging / kDigestFile).string(), digest_line.data(),
                                 digest_line.size(), correlation_id)) {
    return fail(*st);
  }
  if (::rename(staging.c_str(), final_dir.c_str()) != 0) {
    return fail(translate_errno(errno, "rename", final_dir.string(), correlation_id));
  }
  if (Status st = fsync_dir(backups_dir(), correlation_id)) return fail(*st);

  rotate_backups();
  global_swarm_stats().backups_taken.fetch_add(1, std::memory_order_relaxed);
  emit_store_event("store.backup", backup_id, correlation_id, nullptr, now,
                   "records=" + std::to_string(info.record_count));
  return info;
}

void MemoryStore::rotate_backups() {
  std::vector<std::string> ids;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(backups_dir(), ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_directory() && name.rfind("bk-", 0) == 0) ids.push_back(name);
  }
  if (ids.size() <= retention_) return;
  std::sort(ids.begin(), ids.end());
  const size_t drop = ids.size() - retention_;
  for (size_t i = 0; i < drop; ++i) {
    std::error_code rm;
    fs::remove_all(fs::path(backups_dir()) / ids[i], rm);
    if (rm) log_warn("store", "could not rotate out backup " + ids[i] + ": " + rm.message());
    else log_debug("store", "rotated out backup " + ids[i]);
  }
}

Result<uint32_t> MemoryStore::restore(const std::string& backup_id,
                                      const std::string& correlation_id) {
  std::map<std::string, uint64_t> sizes;
  auto info = read_manifest(backup_id, &sizes);
  if (!info) {
    return make_error(ErrorKind::resource_not_found, "no such backup or manifest is invalid",
                      correlation_id, {{"backup_id", backup_id}});
  }

  // Read and verify the whole snapshot before touching anything; the
  // pre-restore backup may rotate this one out.
  std::vector<MemoryRecord> snapshot;
  snapshot.reserve(sizes.size());
  for (const auto& [id, size] : sizes) {
    auto bytes = read_backup_record(*info, id);
    if (!bytes) {
      StandardError err = bytes.error();
      err.correlation_id = correlation_id;
      return err.with_detail("backup_id", backup_id);
    }
    auto rec = decode_record_file(bytes.value(), id);
    if (!rec) {
      StandardError err = rec.error();
      err.correlation_id = correlation_id;
      return err.with_detail("backup_id", backup_id);
    }
    snapshot.push_back(std::move(rec.value()));
  }

  auto pre = backup(correlation_id);
  if (!pre) {
    StandardError err = pre.error();
    return err.with_detail("aborted", "restore").with_detail("backup_id", backup_id);
  }

  // A restore that stops partway has still changed the record set on disk,
  // so listeners hear about it before the error goes back.
  std::vector<std::string> rewritten;
  auto fail_partway = [&](StandardError err, const char* stage) {
    std::string ids;
    for (const auto& id : rewritten) ids += (ids.empty() ? "" : ",") + id;
    err.with_detail("restore_failure", stage)
        .with_detail("rewritten", ids)
        .with_detail("backup_id", backup_id)
        .with_detail("pre_restore_backup", pre.value().id);
    global_swarm_stats().record_failure(err.kind);
    log_error("store", "restore from " + backup_id + " stopped during " + stage + " after " +
                           std::to_string(rewritten.size()) + " changes: " + err.message);
    emit_store_event("store.restore", backup_id, correlation_id, &err, clock_->now_ms(),
                     "rewritten=" + std::to_string(rewritten.size()));
    if (!rewritten.empty()) {
      StoreChange change;
      change.op = StoreOp::restore;
      notify(change);
    }
    return err;
  };

  std::set<std::string> keep;
  for (auto& rec : snapshot) {
    keep.insert(rec.id);
    Status st;
    {
      std::lock_guard<std::mutex> lk(lock_for(rec.id));
      st = write_locked(rec, correlation_id);
    }
    if (st) return fail_partway(*st, "write");
    rewritten.push_back(rec.id);
  }
  for (const auto& id : list_ids()) {
    if (keep.count(id) != 0) continue;
    Status st;
    {
      std::lock_guard<std::mutex> lk(lock_for(id));
      st = remove_unlocked_file(id, correlation_id);
    }
    if (st && st->kind != ErrorKind::resource_not_found) return fail_partway(*st, "unlink");
    if (!st) rewritten.push_back(id);
  }

  log_info("store", "restored " + std::to_string(snapshot.size()) + " records from " + backup_id +
                        " (pre-restore backup " + pre.value().id + ")");
  emit_store_event("store.restore", backup_id, correlation_id, nullptr, clock_->now_ms(),
                   "records=" + std::to_string(snapshot.size()));
  StoreChange change;
  change.op = StoreOp::restore;
  notify(change);
  return static_cast<uint32_t>(snapshot.size());
}

Result<std::vector<std::string>> MemoryStore::prune_older_than(uint64_t max_age_ms,
                                                               const std::string& correlation_id) {
  const uint64_t now = clock_->now_ms();
  const uint64_t cutoff = now > max_age_ms ? now - max_age_ms : 0;
  std::vector<std::string> victims;
  for (const auto& id : list_ids()) {
    auto rec = get(id, correlation_id);
    if (rec && rec.value().last_referenced_unix_ms < cutoff) victims.push_back(id);
  }
  if (victims.empty()) return victims;

  auto bk = backup(correlation_id);
  if (!bk) {
    StandardError err = bk.error();
    return err.with_detail("aborted", "prune");
  }
  std::vector<std::string> removed;
  for (const auto& id : victims) {
    Status st;
    {
      std::lock_guard<std::mutex> lk(lock_for(id));
      st = remove_unlocked_file(id, correlation_id);
    }
    if (st && st->kind == ErrorKind::resource_not_found) continue;
    if (st) return *st;
    removed.push_back(id);
    StoreChange change;
    change.op = StoreOp::remove;
    change.id = id;
    notify(change);
  }
  emit_store_event("store.prune", "", correlation_id, nullptr, now,
                   "removed=" + std::to_string(removed.size()));
  return removed;
}

}  // namespace swarm
