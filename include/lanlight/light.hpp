/**
 * @file light.hpp
 * @brief Per-device proxy: typed operations on one bulb, each one round trip.
 *
 * A `Light` is a cheap copyable handle {Backend*, Device*}. The Device record
 * belongs to the backend's registry; a Light never owns it.
 *
 * CALL CONTRACT
 * -------------
 *  - Every operation returns a Status right away:
 *      Ok        -> request is in flight, `done` fires exactly once from tick()
 *      otherwise -> rejected before I/O (ValidationError, Busy, NetworkError),
 *                   `done` is never called
 *  - `timeout_ms` is per call; RequestTracker::NO_TIMEOUT waits forever.
 *  - The device's current registry address is used as is. A stale address
 *    shows up as Timeout; re-discover to refresh it.
 *  - Successful responses refresh the registry's last-known power/color/label.
 *
 * Set operations ask for an Acknowledgement; get operations ask for the State
 * message and decode it.
 */
#ifndef LANLIGHT_LIGHT_HPP
#define LANLIGHT_LIGHT_HPP

#include "lanlight/backend.hpp"
#include "lanlight/color.hpp"
#include "lanlight/payloads.hpp"
#include "lanlight/status.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace lanlight {

class Light {
public:
  using StatusCallback = std::function<void(Status)>;
  template <typename T>
  using Callback = std::function<void(const Outcome<T>&)>;

  Light() = default;
  Light(Backend& backend, Device& device) : backend_(&backend), device_(&device) {}

  bool valid() const { return backend_ && device_; }
  const Device&     device()   const { return *device_; }
  const HardwareId& id()       const { return device_->id; }
  const Endpoint&   endpoint() const { return device_->endpoint; }

  // Echo round trip with a random 64-byte body; a mismatched echo is MalformedFrame.
  Status ping(uint32_t timeout_ms, StatusCallback done);

  Status get_power(uint32_t timeout_ms, Callback<PowerState> done);
  Status set_power(PowerState state, uint32_t timeout_ms, StatusCallback done);
  Status poweron(uint32_t timeout_ms, StatusCallback done)  { return set_power(PowerState::On, timeout_ms, std::move(done)); }
  Status poweroff(uint32_t timeout_ms, StatusCallback done) { return set_power(PowerState::Off, timeout_ms, std::move(done)); }

  Status get_color(uint32_t timeout_ms, Callback<ColorState> done);
  Status set_color(const ColorState& color, uint32_t timeout_ms, StatusCallback done,
                   uint32_t transition_ms = 0);

  /**
   * @brief Read the current color, then fade to `target` over `duration_ms`.
   * `timeout_ms` applies to the initial read and to every step.
   * A fade already running on this device is cancelled. From the moment this
   * returns Ok, cancel_fade() ends the new fade, even during the initial read.
   */
  Status fade_color(const ColorState& target, uint32_t duration_ms, uint32_t timeout_ms,
                    StatusCallback done);
  bool cancel_fade();

  Status get_label(uint32_t timeout_ms, Callback<Label> done);
  Status set_label(const std::string& label, uint32_t timeout_ms, StatusCallback done);

  Status get_version(uint32_t timeout_ms, Callback<VersionPayload> done);
  Status get_info(uint32_t timeout_ms, Callback<InfoPayload> done);
  Status get_host_info(uint32_t timeout_ms, Callback<DeviceInfoPayload> done);
  Status get_wifi_info(uint32_t timeout_ms, Callback<DeviceInfoPayload> done);
  Status get_host_firmware(uint32_t timeout_ms, Callback<FirmwarePayload> done);
  Status get_wifi_firmware(uint32_t timeout_ms, Callback<FirmwarePayload> done);
  Status get_location(uint32_t timeout_ms, Callback<MembershipPayload> done);
  Status get_group(uint32_t timeout_ms, Callback<MembershipPayload> done);

private:
  template <typename P>
  Status query(MessageType get, MessageType state, uint32_t timeout_ms, Callback<P> done);
  Status command(MessageType set, const std::vector<uint8_t>& payload, uint32_t timeout_ms,
                 StatusCallback done);

  Backend* backend_{nullptr};
  Device*  device_{nullptr};
};

} // namespace lanlight

#endif // LANLIGHT_LIGHT_HPP
