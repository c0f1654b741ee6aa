// ============================================================================
// request_tracker.cpp: implementation for request_tracker.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "lanlight/request_tracker.hpp"

#include <utility>

namespace lanlight {

RequestTracker::RequestTracker(transport::ITransport& transport, uint32_t source,
                               uint8_t first_sequence)
  : transport_(transport), source_(source), next_seq_(first_sequence) {}

bool RequestTracker::in_flight(uint8_t sequence) const {
  for (const auto& p : pending_)
    if (p.sequence == sequence) return true;
  return false;
}

// ---------------------------------------------------------------------------
// allocate_sequence()
// POLICY: walk forward from the counter, wrapping at 255, and take the first
//         number with no pending owner. The counter moves past what we hand out.
// OUT: false only if all 256 numbers are taken (cannot happen while
//      MAX_IN_FLIGHT < 256, kept for safety of the contract).
// ---------------------------------------------------------------------------
bool RequestTracker::allocate_sequence(uint8_t& out) {
  for (int tries = 0; tries < 256; ++tries) {
    uint8_t candidate = next_seq_++;
    if (!in_flight(candidate)) {
      out = candidate;
      return true;
    }
  }
  return false;
}

// ---------------------------------------------------------------------------
// send_request()
// PRE: payload matches the schema for `type`.
// POLICY: register before sending so a same-tick reply can never race past us;
//         a failed send rolls the entry back.
// OUT: Ok + ticket, or Busy / NetworkError with nothing left behind.
// ---------------------------------------------------------------------------
Status RequestTracker::send_request(const Endpoint& to, const HardwareId& target,
                                    MessageType type, const std::vector<uint8_t>& payload,
                                    MessageType expected, uint64_t now_ms,
                                    uint32_t timeout_ms, Completion done,
                                    RequestTicket* ticket) {
  if (pending_.full()) return Status::Busy;

  uint8_t seq = 0;
  if (!allocate_sequence(seq)) return Status::Busy;

  const Reply reply = (expected == MessageType::Acknowledgement) ? Reply::Ack : Reply::Response;
  const auto wire = encode(make_frame(source_, target, seq, type, payload, reply));

  PendingRequest p;
  p.id           = next_id_++;
  if (next_id_ == 0) next_id_ = 1;                 // 0 marks "no ticket"
  p.sequence     = seq;
  p.expected     = expected;
  p.has_deadline = (timeout_ms != NO_TIMEOUT);
  p.deadline_ms  = now_ms + timeout_ms;
  p.done         = std::move(done);
  const uint32_t id = p.id;
  pending_.push_back(std::move(p));

  if (transport_.send(to, wire.data(), wire.size()) != transport::TxResult::Ok) {
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
      if (it->id == id) { pending_.erase(it); break; }
    }
    return Status::NetworkError;
  }

  if (ticket) {
    ticket->id       = id;
    ticket->sequence = seq;
  }
  return Status::Ok;
}

// Remove first, then complete: the completion may touch the table.
void RequestTracker::finish(std::size_t index, Status st, const Frame& frame) {
  Completion done = std::move(pending_[index].done);
  pending_.erase(pending_.begin() + index);
  if (done) done(st, frame);
}

bool RequestTracker::resolve(const FrameHeader& header, Status decode_status, const Frame& frame) {
  if (header.source != source_) return false;

  const uint16_t ack = to_wire(MessageType::Acknowledgement);
  for (std::size_t i = 0; i < pending_.size(); ++i) {
    const PendingRequest& p = pending_[i];
    if (p.sequence != header.sequence) continue;

    if (header.type == to_wire(p.expected)) {
      finish(i, decode_status, frame);
      return true;
    }
    // An Acknowledgement while a State is wanted: consumed, still waiting.
    if (header.type == ack && decode_status == Status::Ok) return true;
    return false;
  }
  return false;
}

std::size_t RequestTracker::expire(uint64_t now_ms) {
  std::size_t fired = 0;
  static const Frame none{};
  std::size_t i = 0;
  while (i < pending_.size()) {
    const PendingRequest& p = pending_[i];
    if (p.has_deadline && now_ms >= p.deadline_ms) {
      finish(i, Status::Timeout, none);
      ++fired;
      i = 0;   // completion may have reshaped the table
      continue;
    }
    ++i;
  }
  return fired;
}

bool RequestTracker::cancel(const RequestTicket& ticket) {
  if (!ticket.valid()) return false;
  static const Frame none{};
  for (std::size_t i = 0; i < pending_.size(); ++i) {
    if (pending_[i].id == ticket.id) {
      finish(i, Status::Cancelled, none);
      return true;
    }
  }
  return false;
}

void RequestTracker::cancel_all() {
  static const Frame none{};
  while (!pending_.empty()) finish(0, Status::Cancelled, none);
}

bool RequestTracker::next_deadline(uint64_t& out) const {
  bool any = false;
  for (const auto& p : pending_) {
    if (!p.has_deadline) continue;
    if (!any || p.deadline_ms < out) out = p.deadline_ms;
    any = true;
  }
  return any;
}

} // namespace lanlight
