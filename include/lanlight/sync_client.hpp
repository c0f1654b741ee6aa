/**
 * @file sync_client.hpp
 * @brief Blocking wrapper: start one asynchronous call, run the loop until it lands.
 *
 * Results and status codes are exactly those of the asynchronous call. A call
 * rejected before I/O returns that rejection without running the loop.
 */
#ifndef LANLIGHT_SYNC_CLIENT_HPP
#define LANLIGHT_SYNC_CLIENT_HPP

#include "lanlight/backend.hpp"
#include "lanlight/event_loop.hpp"
#include "lanlight/light.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace lanlight {

class SyncClient {
public:
  SyncClient(transport::ITransport& transport, const BackendConfig& cfg = {},
             EventLoop::Clock clock = {});

  Backend&   backend() { return backend_; }
  EventLoop& loop()    { return loop_; }

  /// Every device seen in one window; `status` gets the discovery outcome.
  std::vector<Light> discover(uint32_t window_ms, Status* status = nullptr);
  Outcome<Light> connect(const Endpoint& host, uint32_t timeout_ms);

  Status ping(Light& light, uint32_t timeout_ms);

  Outcome<PowerState> get_power(Light& light, uint32_t timeout_ms);
  Status set_power(Light& light, PowerState state, uint32_t timeout_ms);
  Status poweron(Light& light, uint32_t timeout_ms)  { return set_power(light, PowerState::On, timeout_ms); }
  Status poweroff(Light& light, uint32_t timeout_ms) { return set_power(light, PowerState::Off, timeout_ms); }

  Outcome<ColorState> get_color(Light& light, uint32_t timeout_ms);
  Status set_color(Light& light, const ColorState& color, uint32_t timeout_ms,
                   uint32_t transition_ms = 0);
  Status fade_color(Light& light, const ColorState& target, uint32_t duration_ms,
                    uint32_t timeout_ms);

  Outcome<Label> get_label(Light& light, uint32_t timeout_ms);
  Status set_label(Light& light, const std::string& label, uint32_t timeout_ms);

  Outcome<VersionPayload>    get_version(Light& light, uint32_t timeout_ms);
  Outcome<InfoPayload>       get_info(Light& light, uint32_t timeout_ms);
  Outcome<DeviceInfoPayload> get_host_info(Light& light, uint32_t timeout_ms);
  Outcome<DeviceInfoPayload> get_wifi_info(Light& light, uint32_t timeout_ms);
  Outcome<FirmwarePayload>   get_host_firmware(Light& light, uint32_t timeout_ms);
  Outcome<FirmwarePayload>   get_wifi_firmware(Light& light, uint32_t timeout_ms);
  Outcome<MembershipPayload> get_location(Light& light, uint32_t timeout_ms);
  Outcome<MembershipPayload> get_group(Light& light, uint32_t timeout_ms);

private:
  Status await_status(const std::function<Status(Light::StatusCallback)>& start);

  template <typename T>
  Outcome<T> await_value(const std::function<Status(Light::Callback<T>)>& start) {
    bool landed = false;
    Outcome<T> result;
    backend_.tick(loop_.now());
    Status st = start([&](const Outcome<T>& o) { result = o; landed = true; });
    if (st != Status::Ok) return Outcome<T>::failure(st);
    loop_.run_until([&] { return landed; });
    return result;
  }

  Backend   backend_;
  EventLoop loop_;
};

} // namespace lanlight

#endif // LANLIGHT_SYNC_CLIENT_HPP
