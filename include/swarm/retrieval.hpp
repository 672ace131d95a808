#pragma once

// swarm/retrieval.hpp - Paginated listing and ranked search over the store,
// fronted by a two-level cache.
//
// CACHES:
//   short  record id -> MemoryRecord            (recently written or read)
//   long   "page:<sort>|<page>|<size>"          -> ordered slice + metadata
//          "search:<tokens>|<filters>|<page>|<size>"
//
// INVALIDATION (invalidate-then-acknowledge):
//   The engine listens to the store. Every put/reference refreshes the
//   record's short entry and clears the whole long cache; remove drops the
//   short entry and clears the long cache; restore clears both. The listener
//   runs before the store call returns, so a get_page() issued after put()
//   returned can never see the old result. A slice computed while a write
//   raced it is not cached (generation check).
//
// DERIVED STATUS:
//   is_new and frequently_accessed are computed when the view is built, from
//   the current clock, never stored or cached.
//
// RANKING:
//   search results order by score desc, then reference_count desc, then id
//   asc. The score comes from a pluggable RelevanceScorer.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "swarm/cache.hpp"
#include "swarm/clock.hpp"
#include "swarm/config.hpp"
#include "swarm/errors.hpp"
#include "swarm/store.hpp"

namespace swarm {

enum class SortKey {
  created_desc,
  created_asc,
  referenced_desc,
  reference_count_desc,
  id_asc,
};

std::string            to_string(SortKey key);
std::optional<SortKey> sort_key_from_string(const std::string& s);

struct RecordView {
  MemoryRecord record;
  bool         is_new{false};
  bool         frequently_accessed{false};
  double       score{0.0};  // search results only

  std::string to_json() const;
};

struct PageInfo {
  uint32_t page{1};
  uint32_t page_size{0};
  uint64_t total_count{0};
  uint64_t total_pages{0};
  bool     has_next{false};
  bool     has_prev{false};

  std::string to_json() const;
};

// Pagination metadata for `total` items. page and page_size must be >= 1.
PageInfo make_page_info(uint32_t page, uint32_t page_size, uint64_t total);

struct Page {
  std::vector<RecordView> items;
  PageInfo                info;

  std::string to_json() const;
};

struct SearchFilters {
  std::set<std::string> themes;        // every listed theme must be present
  std::string           emotion;       // empty = no emotion filter
  double                emotion_min{0.0};
  double                emotion_max{1.0};
  uint64_t              created_after_unix_ms{0};   // inclusive; 0 = unbounded
  uint64_t              created_before_unix_ms{0};  // exclusive; 0 = unbounded
  std::string           owner;         // empty = any owner

  bool matches(const MemoryRecord& r) const;

  // Stable text form used in cache keys.
  std::string canonical() const;
};

// Lowercased alphanumeric runs. Bytes >= 0x80 are kept inside tokens.
std::vector<std::string> tokenize_query(const std::string& query);

class RelevanceScorer {
 public:
  virtual ~RelevanceScorer() = default;
  // Higher is more relevant. Called only for records that already matched.
  virtual double score(const MemoryRecord& record, const std::vector<std::string>& tokens,
                       uint64_t now_ms) const = 0;
};

// 0.6 * text match strength + 0.25 * recency + 0.15 * reference weight.
class DefaultRelevanceScorer : public RelevanceScorer {
 public:
  explicit DefaultRelevanceScorer(uint64_t recent_window_ms) : recent_window_ms_(recent_window_ms) {}
  double score(const MemoryRecord& record, const std::vector<std::string>& tokens,
               uint64_t now_ms) const override;

 private:
  uint64_t recent_window_ms_;
};

class RetrievalEngine {
 public:
  RetrievalEngine(std::shared_ptr<MemoryStore> store, const SwarmConfig& config,
                  std::shared_ptr<Clock> clock = system_clock(),
                  std::shared_ptr<RelevanceScorer> scorer = nullptr);
  ~RetrievalEngine();

  RetrievalEngine(const RetrievalEngine&) = delete;
  RetrievalEngine& operator=(const RetrievalEngine&) = delete;

  Result<std::string> put(MemoryRecord record, const std::string& correlation_id = "");

  // reference = true counts the read (reference_count, last_referenced).
  Result<RecordView> get(const std::string& id, bool reference = true,
                         const std::string& correlation_id = "");

  Result<Page> get_page(uint32_t page, uint32_t page_size, SortKey sort = SortKey::created_desc,
                        const std::string& correlation_id = "");

  Result<Page> search(const std::string& query, const SearchFilters& filters, uint32_t page,
                      uint32_t page_size, const std::string& correlation_id = "");

  Status remove(const std::string& id, const std::string& correlation_id = "");

  // Maintenance hook; returns the number of entries dropped.
  size_t purge_expired();

  CacheStats short_cache_stats() const { return short_.stats(); }
  CacheStats long_cache_stats() const { return long_.stats(); }
  std::string stats_to_json() const;

  MemoryStore& store() { return *store_; }

 private:
  struct Slice {
    std::vector<MemoryRecord> records;
    std::vector<double>       scores;
    PageInfo                  info;
  };

  void on_store_change(const StoreChange& change);
  RecordView view_of(const MemoryRecord& r, uint64_t now, double score = 0.0) const;
  Page materialize(const Slice& slice) const;

  // Caches `slice` under `key` unless a write happened since `generation`.
  void fill_long(const std::string& key, const Slice& slice, uint64_t generation);
  uint64_t generation() const;

  std::shared_ptr<MemoryStore>     store_;
  std::shared_ptr<Clock>           clock_;
  std::shared_ptr<RelevanceScorer> scorer_;
  uint64_t                         recent_window_ms_;
  uint64_t                         frequent_threshold_;
  uint64_t                         listener_id_{0};

  TtlCache<MemoryRecord> short_;
  TtlCache<Slice>        long_;

  mutable std::mutex fill_mu_;
  uint64_t           generation_{0};
};

}  // namespace swarm
