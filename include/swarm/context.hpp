#pragma once

// swarm/context.hpp - Per-request context threaded through every hop.
//
// A RequestContext is created where a request enters the system and is
// passed unchanged through Router -> transport -> worker -> Store. It carries
// the correlation id, an absolute deadline and a cancellation token.
//
// INVARIANTS:
//   - correlation_id is assigned once (ensure_correlation_id) and never
//     rewritten downstream.
//   - Cancelling a token is sticky; it cannot be un-cancelled.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace swarm {

class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true, std::memory_order_release); }
  bool cancelled() const { return flag_->load(std::memory_order_acquire); }

 private:
  // Shared so that copies handed to workers observe the caller's cancel().
  std::shared_ptr<std::atomic<bool>> flag_;
};

struct RequestContext {
  std::string       correlation_id;
  uint64_t          deadline_unix_ms{0};  // 0 = no caller deadline
  CancellationToken cancel;

  bool cancelled() const { return cancel.cancelled(); }

  bool expired(uint64_t now_ms) const {
    return deadline_unix_ms != 0 && now_ms >= deadline_unix_ms;
  }

  // Milliseconds left before the deadline, capped at cap_ms.
  uint64_t remaining_ms(uint64_t now_ms, uint64_t cap_ms) const {
    if (deadline_unix_ms == 0) return cap_ms;
    if (now_ms >= deadline_unix_ms) return 0;
    const uint64_t left = deadline_unix_ms - now_ms;
    return left < cap_ms ? left : cap_ms;
  }
};

// Assigns a fresh correlation id if the context has none. Returns it.
const std::string& ensure_correlation_id(RequestContext& ctx);

}  // namespace swarm
