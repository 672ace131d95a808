#include "swarm/clock.hpp"
#include "swarm/context.hpp"
#include "swarm/errors.hpp"

#include <chrono>

namespace swarm {

uint64_t SystemClock::now_ms() const {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

std::shared_ptr<Clock> system_clock() {
  static std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
  return instance;
}

const std::string& ensure_correlation_id(RequestContext& ctx) {
  if (ctx.correlation_id.empty()) ctx.correlation_id = new_correlation_id();
  return ctx.correlation_id;
}

}  // namespace swarm
