/**
 * @file discovery.hpp
 * @brief Broadcast service query + response collection over one time window.
 *
 * FLOW
 * ----
 *   start()  -> first GetService broadcast goes out immediately
 *   advance()-> remaining broadcasts spread evenly across the window,
 *               window close fires on_done(Ok, found)
 *   offer()  -> StateService frames: first sighting of a hardware id in this
 *               window is registered and handed to on_found right away;
 *               repeats are swallowed
 *
 * A new start() ends the current window (on_done(Cancelled, n)) and opens a
 * fresh one with an empty dedupe set. Devices are never expired here.
 */
#ifndef LANLIGHT_DISCOVERY_HPP
#define LANLIGHT_DISCOVERY_HPP

#include "lanlight/codec.hpp"
#include "lanlight/device_registry.hpp"
#include "lanlight/log.hpp"
#include "lanlight/request_tracker.hpp"
#include "lanlight/transport/transport_base.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>

namespace lanlight {

class DiscoveryCoordinator {
public:
  using FoundFn = std::function<void(Device&)>;
  using DoneFn  = std::function<void(Status, std::size_t found)>;

  DiscoveryCoordinator(transport::ITransport& transport, DeviceRegistry& registry,
                       RequestTracker& tracker, const Logger& log);

  /// NetworkError if the first broadcast cannot be sent; callbacks never fire then.
  Status start(uint64_t now_ms, uint32_t window_ms, uint8_t broadcasts,
               FoundFn on_found, DoneFn on_done);

  /// True if the frame was a service response consumed by an open window.
  bool offer(const Frame& frame, const Endpoint& from, uint64_t now_ms);

  void advance(uint64_t now_ms);
  void cancel();

  bool active() const { return active_; }
  bool next_deadline(uint64_t& out) const;

private:
  Status send_broadcast();
  void close(Status st);

  transport::ITransport& transport_;
  DeviceRegistry&        registry_;
  RequestTracker&        tracker_;
  const Logger&          log_;

  bool        active_{false};
  uint64_t    started_ms_{0};
  uint32_t    window_ms_{0};
  uint8_t     broadcasts_total_{1};
  uint8_t     broadcasts_sent_{0};
  std::size_t found_{0};
  std::set<HardwareId> seen_;
  FoundFn on_found_;
  DoneFn  on_done_;
};

} // namespace lanlight

#endif // LANLIGHT_DISCOVERY_HPP
