/**
 * @file request_tracker.hpp
 * @brief Sequence allocation, request/response correlation and per-request timeouts.
 *
 * PURPOSE
 * -------
 * Every unicast request a backend sends is registered here until exactly one of
 * these happens:
 *   - a frame with our source id and the request's sequence arrives,
 *   - its deadline passes (Status::Timeout),
 *   - the caller cancels it (Status::Cancelled).
 * The completion fires once, then the entry and its sequence slot are released.
 *
 * DESIGN
 * ------
 *  - One 8-bit counter per tracker (so per backend). It wraps 255 -> 0 and skips
 *    numbers still in flight, so no two pending entries share a sequence.
 *  - Fixed-capacity table (etl::vector, MAX_IN_FLIGHT). A full table refuses
 *    new requests with Status::Busy.
 *  - Deadlines are absolute milliseconds on the backend clock. A timeout of
 *    NO_TIMEOUT waits forever.
 *  - Matching is by (source, sequence) plus the reply type: the expected type
 *    or an Acknowledgement. Response order does not matter.
 *  - Completions run after the entry is removed, so a completion may issue new
 *    requests or cancel others.
 *
 * RESPONSE RULES
 * --------------
 *  - expected type, decode failed            -> completion(decode status)
 *  - expected type                           -> completion(Ok, frame)
 *  - Acknowledgement while a State is wanted -> consumed, keep waiting
 *  - any other type                          -> not ours, left to the caller
 *    (a late StateService answering a discovery broadcast whose sequence
 *    number has since been reused, for example)
 *
 * No retries happen here. A lost datagram surfaces as Timeout.
 */
#ifndef LANLIGHT_REQUEST_TRACKER_HPP
#define LANLIGHT_REQUEST_TRACKER_HPP

#include "lanlight/codec.hpp"
#include "lanlight/endpoint.hpp"
#include "lanlight/status.hpp"
#include "lanlight/transport/transport_base.hpp"

#include "etl/vector.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace lanlight {

struct RequestTicket {
  uint32_t id{0};        // 0 = never issued
  uint8_t  sequence{0};
  bool valid() const { return id != 0; }
};

class RequestTracker {
public:
  static constexpr std::size_t MAX_IN_FLIGHT = 64;
  static constexpr uint32_t    NO_TIMEOUT    = 0;

  /// `frame` is only meaningful when status is Ok.
  using Completion = std::function<void(Status, const Frame&)>;

  RequestTracker(transport::ITransport& transport, uint32_t source, uint8_t first_sequence);

  /**
   * @brief Build, send and register one request.
   * @return Ok when in flight (completion fires later), otherwise the reason it
   *         never left: Busy (table full) or NetworkError (send failed).
   */
  Status send_request(const Endpoint& to, const HardwareId& target, MessageType type,
                      const std::vector<uint8_t>& payload, MessageType expected,
                      uint64_t now_ms, uint32_t timeout_ms, Completion done,
                      RequestTicket* ticket = nullptr);

  /**
   * @brief Offer an inbound frame.
   * @return true if it belonged to a pending request (consumed), false if it is
   *         unsolicited as far as the tracker is concerned.
   */
  bool resolve(const FrameHeader& header, Status decode_status, const Frame& frame);

  /// Fail every entry whose deadline is <= now. Returns how many timed out.
  std::size_t expire(uint64_t now_ms);

  bool cancel(const RequestTicket& ticket);
  void cancel_all();

  /// Earliest pending deadline; false when nothing has one.
  bool next_deadline(uint64_t& out) const;

  /// Next free sequence number (also used for untracked broadcasts).
  bool allocate_sequence(uint8_t& out);

  std::size_t in_flight() const { return pending_.size(); }
  bool in_flight(uint8_t sequence) const;
  uint32_t source() const { return source_; }

private:
  struct PendingRequest {
    uint32_t    id{0};
    uint8_t     sequence{0};
    MessageType expected{MessageType::Acknowledgement};
    bool        has_deadline{false};
    uint64_t    deadline_ms{0};
    Completion  done;
  };

  void finish(std::size_t index, Status st, const Frame& frame);

  transport::ITransport& transport_;
  uint32_t source_;
  uint8_t  next_seq_;
  uint32_t next_id_{1};
  etl::vector<PendingRequest, MAX_IN_FLIGHT> pending_;
};

} // namespace lanlight

#endif // LANLIGHT_REQUEST_TRACKER_HPP
