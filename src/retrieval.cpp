#include "swarm/retrieval.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <sstream>

#include "swarm/jsonlite.hpp"
#include "swarm/log.hpp"
#include "swarm/observability.hpp"

namespace swarm {

namespace {

std::string lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return 0;
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

bool token_matches(const std::string& lowered_content, const std::set<std::string>& lowered_themes,
                   const std::string& token) {
  if (lowered_content.find(token) != std::string::npos) return true;
  for (const auto& t : lowered_themes) {
    if (t.find(token) != std::string::npos) return true;
  }
  return false;
}

std::set<std::string> lowered(const std::set<std::string>& themes) {
  std::set<std::string> out;
  for (const auto& t : themes) out.insert(lower(t));
  return out;
}

using RecordLess = std::function<bool(const MemoryRecord&, const MemoryRecord&)>;

RecordLess comparator_for(SortKey key) {
  switch (key) {
    case SortKey::created_asc:
      return [](const MemoryRecord& a, const MemoryRecord& b) {
        if (a.created_at_unix_ms != b.created_at_unix_ms) return a.created_at_unix_ms < b.created_at_unix_ms;
        return a.id < b.id;
      };
    case SortKey::referenced_desc:
      return [](const MemoryRecord& a, const MemoryRecord& b) {
        if (a.last_referenced_unix_ms != b.last_referenced_unix_ms) {
          return a.last_referenced_unix_ms > b.last_referenced_unix_ms;
        }
        return a.id < b.id;
      };
    case SortKey::reference_count_desc:
      return [](const MemoryRecord& a, const MemoryRecord& b) {
        if (a.reference_count != b.reference_count) return a.reference_count > b.reference_count;
        return a.id < b.id;
      };
    case SortKey::id_asc:
      return [](const MemoryRecord& a, const MemoryRecord& b) { return a.id < b.id; };
    case SortKey::created_desc:
      break;
  }
  return [](const MemoryRecord& a, const MemoryRecord& b) {
    if (a.created_at_unix_ms != b.created_at_unix_ms) return a.created_at_unix_ms > b.created_at_unix_ms;
    return a.id < b.id;
  };
}

Status validate_paging(uint32_t page, uint32_t page_size, const std::string& cid) {
  if (page < 1) {
    return make_error(ErrorKind::invalid_input, "page must be >= 1", cid, {{"page", std::to_string(page)}});
  }
  if (page_size < 1) {
    return make_error(ErrorKind::invalid_input, "page size must be >= 1", cid,
                      {{"page_size", std::to_string(page_size)}});
  }
  return std::nullopt;
}

void count_cache(bool hit) {
  auto& stats = global_swarm_stats();
  if (hit) stats.cache_hits.fetch_add(1, std::memory_order_relaxed);
  else stats.cache_misses.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace

// ---------------------------------------------------------------------------
// Value types
// ---------------------------------------------------------------------------

std::string to_string(SortKey key) {
  switch (key) {
    case SortKey::created_desc: return "created_desc";
    case SortKey::created_asc: return "created_asc";
    case SortKey::referenced_desc: return "referenced_desc";
    case SortKey::reference_count_desc: return "reference_count_desc";
    case SortKey::id_asc: return "id_asc";
  }
  return "created_desc";
}

std::optional<SortKey> sort_key_from_string(const std::string& s) {
  for (SortKey k : {SortKey::created_desc, SortKey::created_asc, SortKey::referenced_desc,
                    SortKey::reference_count_desc, SortKey::id_asc}) {
    if (to_string(k) == s) return k;
  }
  return std::nullopt;
}

std::string RecordView::to_json() const {
  std::string j = record.to_json();
  j.pop_back();  // reopen the record object
  std::ostringstream o;
  o << j << ",\"frequently_accessed\":" << (frequently_accessed ? "true" : "false")
    << ",\"is_new\":" << (is_new ? "true" : "false")
    << ",\"score\":" << jsonlite::format_double(score) << "}";
  return o.str();
}

std::string PageInfo::to_json() const {
  std::ostringstream o;
  o << "{\"page\":" << page << ",\"pageSize\":" << page_size << ",\"totalCount\":" << total_count
    << ",\"totalPages\":" << total_pages << ",\"hasNext\":" << (has_next ? "true" : "false")
    << ",\"hasPrev\":" << (has_prev ? "true" : "false") << "}";
  return o.str();
}

PageInfo make_page_info(uint32_t page, uint32_t page_size, uint64_t total) {
  PageInfo info;
  info.page        = page;
  info.page_size   = page_size;
  info.total_count = total;
  info.total_pages = page_size == 0 ? 0 : (total + page_size - 1) / page_size;
  info.has_next    = page < info.total_pages;
  info.has_prev    = page > 1;
  return info;
}

std::string Page::to_json() const {
  std::ostringstream o;
  o << "{\"items\":[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) o << ",";
    o << items[i].to_json();
  }
  std::string meta = info.to_json();
  o << "]," << meta.substr(1);
  return o.str();
}

bool SearchFilters::matches(const MemoryRecord& r) const {
  if (!owner.empty() && r.owner != owner) return false;
  for (const auto& t : themes) {
    if (r.themes.count(t) == 0) return false;
  }
  if (!emotion.empty()) {
    auto it = r.emotions.find(emotion);
    if (it == r.emotions.end()) return false;
    if (it->second < emotion_min || it->second > emotion_max) return false;
  }
  if (created_after_unix_ms != 0 && r.created_at_unix_ms < created_after_unix_ms) return false;
  if (created_before_unix_ms != 0 && r.created_at_unix_ms >= created_before_unix_ms) return false;
  return true;
}

std::string SearchFilters::canonical() const {
  std::ostringstream o;
  o << "themes=";
  bool first = true;
  for (const auto& t : themes) {
    if (!first) o << ",";
    first = false;
    o << jsonlite::escape(t);
  }
  o << ";emotion=" << jsonlite::escape(emotion);
  if (!emotion.empty()) {
    o << "[" << jsonlite::format_double(emotion_min) << "," << jsonlite::format_double(emotion_max) << "]";
  }
  o << ";after=" << created_after_unix_ms << ";before=" << created_before_unix_ms
    << ";owner=" << jsonlite::escape(owner);
  return o.str();
}

std::vector<std::string> tokenize_query(const std::string& query) {
  std::vector<std::string> tokens;
  std::string cur;
  for (unsigned char c : query) {
    if (std::isalnum(c) || c >= 0x80) {
      cur.push_back(static_cast<char>(std::tolower(c)));
    } else if (!cur.empty()) {
      tokens.push_back(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) tokens.push_back(std::move(cur));
  return tokens;
}

double DefaultRelevanceScorer::score(const MemoryRecord& record,
                                     const std::vector<std::string>& tokens,
                                     uint64_t now_ms) const {
  double text = 0.0;
  if (!tokens.empty()) {
    const std::string content = lower(record.content);
    const std::set<std::string> themes = lowered(record.themes);
    for (const auto& tok : tokens) {
      const size_t hits = std::min<size_t>(count_occurrences(content, tok), 5);
      text += static_cast<double>(hits) / 5.0;
      if (themes.count(tok) != 0) text += 1.0;
    }
    text /= static_cast<double>(tokens.size());
  }
  const uint64_t age = now_ms > record.created_at_unix_ms ? now_ms - record.created_at_unix_ms : 0;
  const double window = static_cast<double>(recent_window_ms_ == 0 ? 1 : recent_window_ms_);
  const double recency = 1.0 / (1.0 + static_cast<double>(age) / window);
  const double refs =
      std::min(1.0, std::log1p(static_cast<double>(record.reference_count)) / std::log1p(100.0));
  return 0.6 * text + 0.25 * recency + 0.15 * refs;
}

// ---------------------------------------------------------------------------
// RetrievalEngine
// ---------------------------------------------------------------------------

RetrievalEngine::RetrievalEngine(std::shared_ptr<MemoryStore> store, const SwarmConfig& config,
                                 std::shared_ptr<Clock> clock,
                                 std::shared_ptr<RelevanceScorer> scorer)
    : store_(std::move(store)),
      clock_(std::move(clock)),
      scorer_(scorer ? std::move(scorer)
                     : std::make_shared<DefaultRelevanceScorer>(config.recent_window_ms)),
      recent_window_ms_(config.recent_window_ms),
      frequent_threshold_(config.frequent_access_threshold),
      short_(config.short_cache_capacity, config.short_cache_ttl_ms, clock_),
      long_(config.long_cache_capacity, config.long_cache_ttl_ms, clock_) {
  listener_id_ = store_->add_listener([this](const StoreChange& c) { on_store_change(c); });
}

RetrievalEngine::~RetrievalEngine() { store_->remove_listener(listener_id_); }

void RetrievalEngine::on_store_change(const StoreChange& change) {
  std::lock_guard<std::mutex> lk(fill_mu_);
  ++generation_;
  switch (change.op) {
    case StoreOp::put:
    case StoreOp::reference:
      if (change.record) short_.put(change.id, *change.record);
      break;
    case StoreOp::remove:
      short_.erase(change.id);
      break;
    case StoreOp::restore:
      short_.clear();
      break;
  }
  long_.clear();
}

uint64_t RetrievalEngine::generation() const {
  std::lock_guard<std::mutex> lk(fill_mu_);
  return generation_;
}

void RetrievalEngine::fill_long(const std::string& key, const Slice& slice, uint64_t generation) {
  std::lock_guard<std::mutex> lk(fill_mu_);
  if (generation_ != generation) return;
  long_.put(key, slice);
}

RecordView RetrievalEngine::view_of(const MemoryRecord& r, uint64_t now, double score) const {
  RecordView v;
  v.record              = r;
  v.is_new              = r.created_at_unix_ms <= now && now - r.created_at_unix_ms < recent_window_ms_;
  v.frequently_accessed = r.reference_count > frequent_threshold_;
  v.score               = score;
  return v;
}

Page RetrievalEngine::materialize(const Slice& slice) const {
  const uint64_t now = clock_->now_ms();
  Page p;
  p.info = slice.info;
  p.items.reserve(slice.records.size());
  for (size_t i = 0; i < slice.records.size(); ++i) {
    p.items.push_back(view_of(slice.records[i], now, i < slice.scores.size() ? slice.scores[i] : 0.0));
  }
  return p;
}

Result<std::string> RetrievalEngine::put(MemoryRecord record, const std::string& correlation_id) {
  return store_->put(std::move(record), correlation_id);
}

Result<RecordView> RetrievalEngine::get(const std::string& id, bool reference,
                                        const std::string& correlation_id) {
  if (reference) {
    auto r = store_->reference(id, correlation_id);
    if (!r) return r.error();
    return view_of(r.value(), clock_->now_ms());
  }
  if (auto cached = short_.get(id)) {
    count_cache(true);
    return view_of(*cached, clock_->now_ms());
  }
  count_cache(false);
  const uint64_t gen = generation();
  auto r = store_->get(id, correlation_id);
  if (!r) return r.error();
  {
    std::lock_guard<std::mutex> lk(fill_mu_);
    if (generation_ == gen) short_.put(id, r.value());
  }
  return view_of(r.value(), clock_->now_ms());
}

Result<Page> RetrievalEngine::get_page(uint32_t page, uint32_t page_size, SortKey sort,
                                       const std::string& correlation_id) {
  if (Status st = validate_paging(page, page_size, correlation_id)) return *st;

  const std::string key =
      "page:" + to_string(sort) + "|" + std::to_string(page) + "|" + std::to_string(page_size);
  if (auto cached = long_.get(key)) {
    count_cache(true);
    return materialize(*cached);
  }
  count_cache(false);

  const uint64_t gen = generation();
  LoadAllResult all = store_->load_all(correlation_id);
  if (!all.unreadable_ids.empty()) {
    log_warn("retrieval", std::to_string(all.unreadable_ids.size()) +
                              " unreadable records excluded from page, cid=" + correlation_id);
  }
  std::sort(all.records.begin(), all.records.end(), comparator_for(sort));

  Slice slice;
  slice.info = make_page_info(page, page_size, all.records.size());
  const uint64_t begin = static_cast<uint64_t>(page - 1) * page_size;
  if (begin < all.records.size()) {
    const uint64_t end = std::min<uint64_t>(begin + page_size, all.records.size());
    slice.records.assign(all.records.begin() + static_cast<std::ptrdiff_t>(begin),
                         all.records.begin() + static_cast<std::ptrdiff_t>(end));
  }
  // Unreadable records are reported, not cached over.
  if (all.unreadable_ids.empty()) fill_long(key, slice, gen);
  return materialize(slice);
}

Result<Page> RetrievalEngine::search(const std::string& query, const SearchFilters& filters,
                                     uint32_t page, uint32_t page_size,
                                     const std::string& correlation_id) {
  if (Status st = validate_paging(page, page_size, correlation_id)) return *st;
  if (!filters.emotion.empty() && filters.emotion_min > filters.emotion_max) {
    return make_error(ErrorKind::invalid_input, "emotion range is empty", correlation_id,
                      {{"emotion", filters.emotion},
                       {"min", jsonlite::format_double(filters.emotion_min)},
                       {"max", jsonlite::format_double(filters.emotion_max)}});
  }

  const std::vector<std::string> tokens = tokenize_query(query);
  std::string joined;
  for (const auto& t : tokens) joined += (joined.empty() ? "" : " ") + t;
  const std::string key = "search:" + jsonlite::escape(joined) + "|" + filters.canonical() + "|" +
                          std::to_string(page) + "|" + std::to_string(page_size);
  if (auto cached = long_.get(key)) {
    count_cache(true);
    return materialize(*cached);
  }
  count_cache(false);

  const uint64_t gen = generation();
  const uint64_t now = clock_->now_ms();
  LoadAllResult all = store_->load_all(correlation_id);

  struct Scored {
    MemoryRecord record;
    double       score;
  };
  std::vector<Scored> matched;
  for (auto& r : all.records) {
    if (!filters.matches(r)) continue;
    if (!tokens.empty()) {
      const std::string content = lower(r.content);
      const std::set<std::string> themes = lowered(r.themes);
      bool all_match = true;
      for (const auto& tok : tokens) {
        if (!token_matches(content, themes, tok)) {
          all_match = false;
          break;
        }
      }
      if (!all_match) continue;
    }
    const double s = scorer_->score(r, tokens, now);
    matched.push_back(Scored{std::move(r), s});
  }
  std::sort(matched.begin(), matched.end(), [](const Scored& a, const Scored& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.record.reference_count != b.record.reference_count) {
      return a.record.reference_count > b.record.reference_count;
    }
    return a.record.id < b.record.id;
  });

  Slice slice;
  slice.info = make_page_info(page, page_size, matched.size());
  const uint64_t begin = static_cast<uint64_t>(page - 1) * page_size;
  for (uint64_t i = begin; i < matched.size() && i < begin + page_size; ++i) {
    slice.records.push_back(matched[i].record);
    slice.scores.push_back(matched[i].score);
  }
  if (all.unreadable_ids.empty()) fill_long(key, slice, gen);
  return materialize(slice);
}

Status RetrievalEngine::remove(const std::string& id, const std::string& correlation_id) {
  return store_->remove(id, correlation_id);
}

size_t RetrievalEngine::purge_expired() { return short_.purge_expired() + long_.purge_expired(); }

std::string RetrievalEngine::stats_to_json() const {
  auto render = [](const CacheStats& s) {
    std::ostringstream o;
    o << "{\"hits\":" << s.hits << ",\"misses\":" << s.misses << ",\"evictions\":" << s.evictions
      << ",\"expirations\":" << s.expirations << ",\"size\":" << s.size
      << ",\"capacity\":" << s.capacity << "}";
    return o.str();
  };
  return "{\"long\":" + render(long_.stats()) + ",\"short\":" + render(short_.stats()) + "}";
}

}  // namespace swarm
