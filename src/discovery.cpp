// ============================================================================
// discovery.cpp: implementation for discovery.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "lanlight/discovery.hpp"

#include <utility>

namespace lanlight {

DiscoveryCoordinator::DiscoveryCoordinator(transport::ITransport& transport,
                                           DeviceRegistry& registry,
                                           RequestTracker& tracker,
                                           const Logger& log)
  : transport_(transport), registry_(registry), tracker_(tracker), log_(log) {}

// One untargeted, tagged GetService. It borrows a sequence number from the
// tracker so it never shadows a pending unicast request.
Status DiscoveryCoordinator::send_broadcast() {
  ++broadcasts_sent_;
  uint8_t seq = 0;
  if (!tracker_.allocate_sequence(seq)) return Status::Busy;
  const auto wire = encode(make_frame(tracker_.source(), HardwareId{}, seq,
                                      MessageType::GetService, {}, Reply::Response));
  if (transport_.broadcast(wire.data(), wire.size()) != transport::TxResult::Ok) {
    log_.warn("discovery_broadcast", "status=error reason=network_error");
    return Status::NetworkError;
  }
  log_.debug("discovery_broadcast", "seq=" + std::to_string(seq));
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// start()
// POLICY: a running window is closed as Cancelled first; the dedupe set is
//         reset so devices seen last time are reported again.
// ---------------------------------------------------------------------------
Status DiscoveryCoordinator::start(uint64_t now_ms, uint32_t window_ms, uint8_t broadcasts,
                                   FoundFn on_found, DoneFn on_done) {
  if (active_) close(Status::Cancelled);

  seen_.clear();
  found_            = 0;
  started_ms_       = now_ms;
  window_ms_        = window_ms;
  broadcasts_total_ = broadcasts ? broadcasts : 1;
  broadcasts_sent_  = 0;

  Status st = send_broadcast();
  if (st != Status::Ok) return st;

  on_found_ = std::move(on_found);
  on_done_  = std::move(on_done);
  active_   = true;
  return Status::Ok;
}

bool DiscoveryCoordinator::offer(const Frame& frame, const Endpoint& from, uint64_t now_ms) {
  if (!active_ || frame.type() != MessageType::StateService) return false;

  StateServicePayload svc;
  if (!StateServicePayload::unpack(frame.payload.data(), frame.payload.size(), svc)) return false;
  if (svc.service != StateServicePayload::SERVICE_UDP) return true;   // other services: ignore
  if (frame.header.target.is_zero()) return false;                    // no identity to key on

  const HardwareId& id = frame.header.target;
  if (!seen_.insert(id).second) return true;                          // duplicate in this window

  Endpoint ep{from.addr, svc.port ? static_cast<uint16_t>(svc.port) : from.port};
  Device& device = registry_.upsert(id, ep, now_ms);
  ++found_;
  log_.info("discovered", "id=" + id.to_string() + " addr=" + ep.to_string());
  if (on_found_) on_found_(device);
  return true;
}

// Broadcast i (0-based) is due at start + i * window / total.
void DiscoveryCoordinator::advance(uint64_t now_ms) {
  if (!active_) return;

  while (broadcasts_sent_ < broadcasts_total_) {
    uint64_t due = started_ms_ + static_cast<uint64_t>(window_ms_) * broadcasts_sent_ / broadcasts_total_;
    if (now_ms < due) break;
    send_broadcast();   // failures are logged; the window stays open
  }

  if (now_ms >= started_ms_ + window_ms_) close(Status::Ok);
}

void DiscoveryCoordinator::cancel() {
  if (active_) close(Status::Cancelled);
}

void DiscoveryCoordinator::close(Status st) {
  active_ = false;
  DoneFn done = std::move(on_done_);
  on_found_ = nullptr;
  on_done_  = nullptr;
  if (done) done(st, found_);
}

bool DiscoveryCoordinator::next_deadline(uint64_t& out) const {
  if (!active_) return false;
  out = started_ms_ + window_ms_;
  if (broadcasts_sent_ < broadcasts_total_) {
    uint64_t due = started_ms_ + static_cast<uint64_t>(window_ms_) * broadcasts_sent_ / broadcasts_total_;
    if (due < out) out = due;
  }
  return true;
}

} // namespace lanlight
