#pragma once

// swarm/memory_service.hpp - The "memory" role's worker.
//
// A MemoryService answers routed requests against one RetrievalEngine. The
// payload is a JSON object with an "op" field:
//
//   {"op":"put",    "record":{...}}                       -> {"id":"..."}
//   {"op":"get",    "id":"...", "reference":true}         -> record view
//   {"op":"page",   "page":1, "page_size":20, "sort":"created_desc"}
//   {"op":"search", "query":"...", "filters":{...}, "page":1, "page_size":20}
//   {"op":"delete", "id":"..."}                           -> {"deleted":"..."}
//   {"op":"health"}                                       -> {"instance":..., "health":...}
//
// Failures come back as the StandardError of the engine or store, tagged with
// the request's correlation id and this instance's id.
//
// Filter keys: themes (array), emotion, emotion_min, emotion_max,
// created_after, created_before, owner.

#include <atomic>
#include <memory>
#include <string>

#include "swarm/errors.hpp"
#include "swarm/jsonlite.hpp"
#include "swarm/registry.hpp"
#include "swarm/retrieval.hpp"
#include "swarm/transport.hpp"

namespace swarm {

// Parses the "filters" object of a search request.
Result<SearchFilters> search_filters_from_json(const std::string& json);

class MemoryService {
 public:
  MemoryService(std::shared_ptr<RetrievalEngine> engine, std::string instance_id);

  Result<std::string> handle(const WorkerRequest& request);

  // What the liveness probe reports; simulations flip this.
  HealthState health() const { return health_.load(std::memory_order_acquire); }
  void set_health(HealthState h) { health_.store(h, std::memory_order_release); }

  uint64_t requests_handled() const { return handled_.load(std::memory_order_relaxed); }
  const std::string& instance_id() const { return instance_id_; }

 private:
  Result<std::string> dispatch(const std::string& op, const jsonlite::Object& request,
                               const std::string& cid);

  std::shared_ptr<RetrievalEngine> engine_;
  std::string                      instance_id_;
  std::atomic<HealthState>         health_{HealthState::healthy};
  std::atomic<uint64_t>            handled_{0};
};

// Adapters for InProcessTransport::bind(). Both keep the service alive.
WorkerHandler make_memory_handler(std::shared_ptr<MemoryService> service);
ProbeHandler  make_memory_probe(std::shared_ptr<MemoryService> service);

}  // namespace swarm
