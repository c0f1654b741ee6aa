/**
 * @file backend.hpp
 * @brief One protocol client instance: socket, sequence space, devices, fades.
 *
 * PURPOSE
 * -------
 * `Backend` ties the layers together and is the single cooperative scheduler
 * for them. All protocol state lives inside one instance; two backends never
 * share sequence numbers, pending requests or registries.
 *
 * ROLE
 * ----
 *  - Owns the request tracker, device registry, discovery coordinator and
 *    fade scheduler.
 *  - Borrows the transport (caller keeps it alive and opened).
 *  - `tick(now_ms)` is the only place callbacks run:
 *      1) drain readable datagrams and dispatch each one
 *      2) expire request deadlines
 *      3) advance the discovery window
 *      4) advance fades
 *
 * DISPATCH
 * --------
 *  - shorter than a header            -> dropped, counted as malformed
 *  - (source, sequence) of a pending  -> handed to that request, even when the
 *    request                            body fails to decode
 *  - other decode failure             -> dropped, counted as malformed
 *  - StateService during discovery    -> discovery coordinator
 *  - anything else                    -> dropped, counted as unsolicited
 *
 * OPERATIONAL NOTES
 * -----------------
 *  - Timers fire only inside tick(); backwards timestamps are ignored.
 *  - Deadlines and fade/discovery start times are taken from the clock passed
 *    to the constructor, so a call issued between ticks is timed from the
 *    moment it was made. Without a clock, the last tick time is used.
 *
 * EXAMPLE
 * @code
 *   lanlight::transport::LinuxUdp udp;
 *   udp.begin(lanlight::transport::Config{});
 *   lanlight::Backend backend(udp, lanlight::BackendConfig{}, lanlight::steady_now_ms);
 *   backend.discover_lights(1000,
 *       [](lanlight::Device& d) { std::cout << d.id.to_string() << "\n"; },
 *       [](lanlight::Status, std::size_t) {});
 *   for (;;) { udp.wait(50); backend.tick(lanlight::steady_now_ms()); }
 * @endcode
 */
#ifndef LANLIGHT_BACKEND_HPP
#define LANLIGHT_BACKEND_HPP

#include "lanlight/codec.hpp"
#include "lanlight/device_registry.hpp"
#include "lanlight/discovery.hpp"
#include "lanlight/fade.hpp"
#include "lanlight/log.hpp"
#include "lanlight/request_tracker.hpp"
#include "lanlight/transport/transport_base.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <vector>

namespace lanlight {

struct BackendConfig {
  uint32_t source_id{0};              // 0 = random non-zero
  int      first_sequence{-1};        // -1 = random, else 0..255
  uint8_t  discovery_broadcasts{3};   // GetService sends per window
  uint32_t fade_step_ms{100};
  uint16_t fade_max_steps{50};
  uint32_t seed{0};                   // 0 = seed from std::random_device
};

class Backend {
public:
  struct Stats {
    uint64_t datagrams_in{0};
    uint64_t dropped_malformed{0};
    uint64_t dropped_unsolicited{0};
    uint64_t requests_sent{0};
    uint64_t timeouts{0};
  };

  using FoundFn   = DiscoveryCoordinator::FoundFn;
  using DoneFn    = DiscoveryCoordinator::DoneFn;
  using ConnectFn = std::function<void(const Outcome<Device*>&)>;
  using Clock     = std::function<uint64_t()>;

  static constexpr std::size_t MAX_DATAGRAM     = 1024;
  static constexpr std::size_t MAX_RX_PER_TICK  = 256;

  Backend(transport::ITransport& transport, const BackendConfig& cfg = {}, Clock clock = {});

  Backend(const Backend&) = delete;
  Backend& operator=(const Backend&) = delete;

  // --- requests -----------------------------------------------------------
  Status send_request(const Endpoint& to, const HardwareId& target, MessageType type,
                      const std::vector<uint8_t>& payload, MessageType expected,
                      uint32_t timeout_ms, RequestTracker::Completion done,
                      RequestTicket* ticket = nullptr);
  bool cancel_request(const RequestTicket& ticket) { return tracker_.cancel(ticket); }

  // --- discovery ----------------------------------------------------------
  Status discover_lights(uint32_t window_ms, FoundFn on_found, DoneFn on_done);
  void stop_discovery() { discovery_.cancel(); }
  bool discovering() const { return discovery_.active(); }

  /// Unicast service query to a known host; registers the device on success.
  Status connect(const Endpoint& host, uint32_t timeout_ms, ConnectFn done);

  // --- scheduler ----------------------------------------------------------
  void tick(uint64_t now_ms);
  bool next_deadline(uint64_t& out) const;
  uint64_t now_ms() const { return now_ms_; }
  /// Clock reading for work issued right now; never behind the last tick.
  uint64_t current_ms() const;

  // --- accessors ----------------------------------------------------------
  DeviceRegistry&       registry()       { return registry_; }
  const DeviceRegistry& registry() const { return registry_; }
  FadeScheduler&        fades()          { return fades_; }
  RequestTracker&       tracker()        { return tracker_; }
  Logger&               logger()         { return log_; }
  const Stats&          stats() const    { return stats_; }
  uint32_t              source_id() const { return tracker_.source(); }

  uint32_t random_u32() { return rng_(); }

private:
  void dispatch(const uint8_t* data, std::size_t len, const Endpoint& from);
  Status issue_fade_step(const HardwareId& device, const ColorState& color,
                         uint32_t transition_ms, uint32_t timeout_ms,
                         FadeScheduler::StatusFn done);

  transport::ITransport& transport_;
  BackendConfig          cfg_;
  Clock                  clock_;
  Logger                 log_;
  std::mt19937           rng_;
  uint64_t               now_ms_{0};
  Stats                  stats_;

  DeviceRegistry       registry_;
  RequestTracker       tracker_;
  DiscoveryCoordinator discovery_;
  FadeScheduler        fades_;

  std::vector<uint8_t> rx_buf_;
};

} // namespace lanlight

#endif // LANLIGHT_BACKEND_HPP
