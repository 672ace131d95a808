#include "swarm/memory_service.hpp"

#include <cstdint>
#include <variant>

#include "swarm/log.hpp"

namespace swarm {

namespace {

Result<uint32_t> paging_field(const jsonlite::Object& o, const std::string& key, uint32_t def,
                              const std::string& cid) {
  if (!jsonlite::has(o, key)) return def;
  const jsonlite::Value& v = o.at(key);
  if (std::holds_alternative<std::uint64_t>(v.v)) {
    const std::uint64_t n = std::get<std::uint64_t>(v.v);
    if (n > UINT32_MAX) {
      return make_error(ErrorKind::invalid_input, key + " is out of range", cid, {{"field", key}});
    }
    return static_cast<uint32_t>(n);
  }
  if (std::holds_alternative<double>(v.v) && std::get<double>(v.v) < 0) {
    // Negative numbers parse as double; report them like page < 1.
    return 0u;
  }
  return make_error(ErrorKind::invalid_input, key + " must be an integer", cid, {{"field", key}});
}

}  // namespace

Result<SearchFilters> search_filters_from_json(const std::string& json) {
  SearchFilters f;
  if (json.empty()) return f;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(json, &err);
  if (err) {
    return make_error(ErrorKind::invalid_input, "filters are not a JSON object", "",
                      {{"code", err->code}});
  }
  for (auto& t : jsonlite::get_string_array(o, "themes")) f.themes.insert(std::move(t));
  f.emotion                = jsonlite::get_string(o, "emotion");
  f.emotion_min            = jsonlite::get_double(o, "emotion_min", 0.0);
  f.emotion_max            = jsonlite::get_double(o, "emotion_max", 1.0);
  f.created_after_unix_ms  = jsonlite::get_u64(o, "created_after");
  f.created_before_unix_ms = jsonlite::get_u64(o, "created_before");
  f.owner                  = jsonlite::get_string(o, "owner");
  return f;
}

MemoryService::MemoryService(std::shared_ptr<RetrievalEngine> engine, std::string instance_id)
    : engine_(std::move(engine)), instance_id_(std::move(instance_id)) {}

Result<std::string> MemoryService::handle(const WorkerRequest& request) {
  handled_.fetch_add(1, std::memory_order_relaxed);
  const std::string& cid = request.ctx.correlation_id;

  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(request.payload, &err);
  if (err) {
    return make_error(ErrorKind::invalid_input, "request payload is not a JSON object", cid,
                      {{"code", err->code}, {"instance", instance_id_}});
  }
  const std::string op = jsonlite::get_string(o, "op");
  if (op.empty()) {
    return make_error(ErrorKind::missing_field, "request has no op", cid,
                      {{"field", "op"}, {"instance", instance_id_}});
  }
  if (request.ctx.cancelled()) {
    return make_error(ErrorKind::cancelled, "request cancelled before the worker ran it", cid,
                      {{"op", op}, {"instance", instance_id_}});
  }

  auto res = dispatch(op, o, cid);
  if (!res) {
    StandardError& e = res.error();
    if (e.correlation_id.empty()) e.correlation_id = cid;
    e.with_detail("instance", instance_id_).with_detail("op", op);
    log_debug("memory", instance_id_ + " " + op + " failed: " + to_string(e.kind) + ", cid=" + cid);
  }
  return res;
}

Result<std::string> MemoryService::dispatch(const std::string& op, const jsonlite::Object& o,
                                            const std::string& cid) {
  if (op == "put") {
    if (!jsonlite::has(o, "record")) {
      return make_error(ErrorKind::missing_field, "put needs a record", cid, {{"field", "record"}});
    }
    auto rec = record_from_json(jsonlite::to_json(o.at("record")));
    if (!rec) return rec.error();
    auto id = engine_->put(std::move(rec.value()), cid);
    if (!id) return id.error();
    jsonlite::Object out;
    out["id"] = id.value();
    return jsonlite::to_json(out);
  }

  if (op == "get") {
    const std::string id = jsonlite::get_string(o, "id");
    if (id.empty()) return make_error(ErrorKind::missing_field, "get needs an id", cid, {{"field", "id"}});
    auto view = engine_->get(id, jsonlite::get_bool(o, "reference", true), cid);
    if (!view) return view.error();
    return view.value().to_json();
  }

  if (op == "page" || op == "search") {
    auto page = paging_field(o, "page", 1, cid);
    if (!page) return page.error();
    auto size = paging_field(o, "page_size", 20, cid);
    if (!size) return size.error();

    if (op == "page") {
      SortKey sort = SortKey::created_desc;
      const std::string s = jsonlite::get_string(o, "sort");
      if (!s.empty()) {
        auto parsed = sort_key_from_string(s);
        if (!parsed) {
          return make_error(ErrorKind::invalid_input, "unknown sort key", cid, {{"sort", s}});
        }
        sort = *parsed;
      }
      auto result = engine_->get_page(page.value(), size.value(), sort, cid);
      if (!result) return result.error();
      return result.value().to_json();
    }

    std::string filters_json;
    if (jsonlite::has(o, "filters")) filters_json = jsonlite::to_json(o.at("filters"));
    auto filters = search_filters_from_json(filters_json);
    if (!filters) {
      StandardError e = filters.error();
      e.correlation_id = cid;
      return e;
    }
    auto result = engine_->search(jsonlite::get_string(o, "query"), filters.value(), page.value(),
                                  size.value(), cid);
    if (!result) return result.error();
    return result.value().to_json();
  }

  if (op == "delete") {
    const std::string id = jsonlite::get_string(o, "id");
    if (id.empty()) return make_error(ErrorKind::missing_field, "delete needs an id", cid, {{"field", "id"}});
    if (Status st = engine_->remove(id, cid)) return *st;
    jsonlite::Object out;
    out["deleted"] = id;
    return jsonlite::to_json(out);
  }

  if (op == "health") {
    jsonlite::Object out;
    out["instance"] = instance_id_;
    out["health"]   = to_string(health());
    out["handled"]  = requests_handled();
    return jsonlite::to_json(out);
  }

  return make_error(ErrorKind::invalid_input, "unknown op", cid, {{"op", op}});
}

WorkerHandler make_memory_handler(std::shared_ptr<MemoryService> service) {
  return [service](const WorkerRequest& req) { return service->handle(req); };
}

ProbeHandler make_memory_probe(std::shared_ptr<MemoryService> service) {
  return [service]() { return service->health(); };
}

}  // namespace swarm
