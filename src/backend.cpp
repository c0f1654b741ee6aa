// ============================================================================
// backend.cpp: implementation for backend.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "lanlight/backend.hpp"
#include "lanlight/light.hpp"   // fade steps go through the device proxy

#include <utility>

namespace lanlight {

namespace {

uint32_t pick_seed(uint32_t configured) {
  if (configured) return configured;
  std::random_device rd;
  return rd();
}

uint32_t pick_source(uint32_t configured, std::mt19937& rng) {
  if (configured) return configured;
  uint32_t s = 0;
  while (s == 0) s = rng();   // 0 is reserved on the wire
  return s;
}

uint8_t pick_sequence(int configured, std::mt19937& rng) {
  if (configured >= 0 && configured <= 255) return static_cast<uint8_t>(configured);
  return static_cast<uint8_t>(rng() & 0xFF);
}

} // namespace

// Member order matters: rng_ feeds the tracker's source id and first sequence.
Backend::Backend(transport::ITransport& transport, const BackendConfig& cfg, Clock clock)
  : transport_(transport),
    cfg_(cfg),
    clock_(std::move(clock)),
    rng_(pick_seed(cfg.seed)),
    tracker_(transport, pick_source(cfg.source_id, rng_), pick_sequence(cfg.first_sequence, rng_)),
    discovery_(transport, registry_, tracker_, log_),
    fades_([this](const HardwareId& d, const ColorState& c, uint32_t tr, uint32_t to,
                  FadeScheduler::StatusFn done) {
             return issue_fade_step(d, c, tr, to, std::move(done));
           },
           FadeScheduler::Options{cfg.fade_step_ms, cfg.fade_max_steps}, log_),
    rx_buf_(MAX_DATAGRAM) {}

uint64_t Backend::current_ms() const {
  if (!clock_) return now_ms_;
  const uint64_t t = clock_();
  return t > now_ms_ ? t : now_ms_;
}

Status Backend::send_request(const Endpoint& to, const HardwareId& target, MessageType type,
                             const std::vector<uint8_t>& payload, MessageType expected,
                             uint32_t timeout_ms, RequestTracker::Completion done,
                             RequestTicket* ticket) {
  Status st = tracker_.send_request(to, target, type, payload, expected, current_ms(),
                                    timeout_ms, std::move(done), ticket);
  if (st == Status::Ok) {
    ++stats_.requests_sent;
  } else {
    log_.warn("request", std::string("status=error reason=") + to_string(st) +
                         " type=" + lanlight::to_string(type) + " to=" + to.to_string());
  }
  return st;
}

Status Backend::discover_lights(uint32_t window_ms, FoundFn on_found, DoneFn on_done) {
  return discovery_.start(current_ms(), window_ms, cfg_.discovery_broadcasts,
                          std::move(on_found), std::move(on_done));
}

// ---------------------------------------------------------------------------
// connect()
// Untargeted GetService sent straight to the host. The reply's header target
// is the hardware id; its payload names the service port.
// ---------------------------------------------------------------------------
Status Backend::connect(const Endpoint& host, uint32_t timeout_ms, ConnectFn done) {
  return send_request(host, HardwareId{}, MessageType::GetService, {}, MessageType::StateService,
                      timeout_ms,
                      [this, host, done](Status st, const Frame& f) {
                        if (st != Status::Ok) { done(Outcome<Device*>::failure(st)); return; }
                        StateServicePayload svc;
                        StateServicePayload::unpack(f.payload.data(), f.payload.size(), svc);
                        if (f.header.target.is_zero()) {
                          done(Outcome<Device*>::failure(Status::MalformedFrame));
                          return;
                        }
                        Endpoint ep{host.addr, svc.port ? static_cast<uint16_t>(svc.port) : host.port};
                        Device& d = registry_.upsert(f.header.target, ep, now_ms_);
                        done(Outcome<Device*>::success(&d));
                      });
}

// ---------------------------------------------------------------------------
// tick()
// PRE: now_ms from a monotonic clock.
// POLICY: bounded drain per call so a flood cannot starve timers.
// ---------------------------------------------------------------------------
void Backend::tick(uint64_t now_ms) {
  if (now_ms > now_ms_) now_ms_ = now_ms;   // backwards time ignored

  for (std::size_t n = 0; n < MAX_RX_PER_TICK; ++n) {
    std::size_t len = 0;
    Endpoint from;
    auto r = transport_.recv(rx_buf_.data(), rx_buf_.size(), len, from);
    if (r == transport::RxResult::None) break;
    if (r == transport::RxResult::Error) {
      log_.warn("recv", std::string("status=error transport=") + transport_.name());
      break;
    }
    dispatch(rx_buf_.data(), len, from);
  }

  stats_.timeouts += tracker_.expire(now_ms_);
  discovery_.advance(now_ms_);
  fades_.advance(now_ms_);
}

void Backend::dispatch(const uint8_t* data, std::size_t len, const Endpoint& from) {
  ++stats_.datagrams_in;

  FrameHeader header;
  if (!peek_header(data, len, header)) {
    ++stats_.dropped_malformed;
    log_.debug("drop", "reason=short len=" + std::to_string(len) + " from=" + from.to_string());
    return;
  }

  Frame frame;
  const Status st = decode(data, len, frame);

  if (tracker_.resolve(header, st, frame)) {
    if (st == Status::Ok) registry_.touch(header.target, now_ms_);
    return;
  }

  if (st != Status::Ok) {
    ++stats_.dropped_malformed;
    log_.warn("drop", std::string("reason=") + to_string(st) + " type=" +
                      std::to_string(header.type) + " from=" + from.to_string());
    return;
  }

  if (discovery_.offer(frame, from, now_ms_)) return;

  ++stats_.dropped_unsolicited;
  log_.debug("drop", "reason=unsolicited " + describe(frame) + " from=" + from.to_string());
}

Status Backend::issue_fade_step(const HardwareId& device, const ColorState& color,
                                uint32_t transition_ms, uint32_t timeout_ms,
                                FadeScheduler::StatusFn done) {
  Device* d = registry_.find(device);
  if (!d) return Status::ValidationError;
  return Light(*this, *d).set_color(color, timeout_ms, std::move(done), transition_ms);
}

bool Backend::next_deadline(uint64_t& out) const {
  bool any = false;
  uint64_t t = 0;
  if (tracker_.next_deadline(t))   { out = t; any = true; }
  if (discovery_.next_deadline(t)) { if (!any || t < out) out = t; any = true; }
  if (fades_.next_deadline(t))     { if (!any || t < out) out = t; any = true; }
  return any;
}

} // namespace lanlight
