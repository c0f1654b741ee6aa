// ============================================================================
// sync_client.cpp: blocking adapters over Light / Backend
// ============================================================================
#include "lanlight/sync_client.hpp"

namespace lanlight {

SyncClient::SyncClient(transport::ITransport& transport, const BackendConfig& cfg,
                       EventLoop::Clock clock)
  : backend_(transport, cfg, clock ? clock : EventLoop::Clock(steady_now_ms)),
    loop_(backend_, transport, std::move(clock)) {}

Status SyncClient::await_status(const std::function<Status(Light::StatusCallback)>& start) {
  bool landed = false;
  Status result = Status::Ok;
  backend_.tick(loop_.now());   // fresh clock for the deadline
  Status st = start([&](Status s) { result = s; landed = true; });
  if (st != Status::Ok) return st;
  loop_.run_until([&] { return landed; });
  return result;
}

std::vector<Light> SyncClient::discover(uint32_t window_ms, Status* status) {
  std::vector<Light> found;
  bool landed = false;
  Status result = Status::Ok;

  backend_.tick(loop_.now());
  Status st = backend_.discover_lights(window_ms,
      [&](Device& d) { found.emplace_back(backend_, d); },
      [&](Status s, std::size_t) { result = s; landed = true; });
  if (st != Status::Ok) {
    if (status) *status = st;
    return found;
  }
  loop_.run_until([&] { return landed; });
  if (status) *status = result;
  return found;
}

Outcome<Light> SyncClient::connect(const Endpoint& host, uint32_t timeout_ms) {
  bool landed = false;
  Outcome<Light> result;
  backend_.tick(loop_.now());
  Status st = backend_.connect(host, timeout_ms, [&](const Outcome<Device*>& o) {
    if (o.ok()) result = Outcome<Light>::success(Light(backend_, *o.value));
    else        result = Outcome<Light>::failure(o.status);
    landed = true;
  });
  if (st != Status::Ok) return Outcome<Light>::failure(st);
  loop_.run_until([&] { return landed; });
  return result;
}

Status SyncClient::ping(Light& light, uint32_t timeout_ms) {
  return await_status([&](Light::StatusCallback cb) { return light.ping(timeout_ms, std::move(cb)); });
}

Outcome<PowerState> SyncClient::get_power(Light& light, uint32_t timeout_ms) {
  return await_value<PowerState>([&](Light::Callback<PowerState> cb) {
    return light.get_power(timeout_ms, std::move(cb));
  });
}

Status SyncClient::set_power(Light& light, PowerState state, uint32_t timeout_ms) {
  return await_status([&](Light::StatusCallback cb) {
    return light.set_power(state, timeout_ms, std::move(cb));
  });
}

Outcome<ColorState> SyncClient::get_color(Light& light, uint32_t timeout_ms) {
  return await_value<ColorState>([&](Light::Callback<ColorState> cb) {
    return light.get_color(timeout_ms, std::move(cb));
  });
}

Status SyncClient::set_color(Light& light, const ColorState& color, uint32_t timeout_ms,
                             uint32_t transition_ms) {
  return await_status([&](Light::StatusCallback cb) {
    return light.set_color(color, timeout_ms, std::move(cb), transition_ms);
  });
}

Status SyncClient::fade_color(Light& light, const ColorState& target, uint32_t duration_ms,
                              uint32_t timeout_ms) {
  return await_status([&](Light::StatusCallback cb) {
    return light.fade_color(target, duration_ms, timeout_ms, std::move(cb));
  });
}

Outcome<Label> SyncClient::get_label(Light& light, uint32_t timeout_ms) {
  return await_value<Label>([&](Light::Callback<Label> cb) {
    return light.get_label(timeout_ms, std::move(cb));
  });
}

Status SyncClient::set_label(Light& light, const std::string& label, uint32_t timeout_ms) {
  return await_status([&](Light::StatusCallback cb) {
    return light.set_label(label, timeout_ms, std::move(cb));
  });
}

Outcome<VersionPayload> SyncClient::get_version(Light& light, uint32_t timeout_ms) {
  return await_value<VersionPayload>([&](Light::Callback<VersionPayload> cb) {
    return light.get_version(timeout_ms, std::move(cb));
  });
}

Outcome<InfoPayload> SyncClient::get_info(Light& light, uint32_t timeout_ms) {
  return await_value<InfoPayload>([&](Light::Callback<InfoPayload> cb) {
    return light.get_info(timeout_ms, std::move(cb));
  });
}

Outcome<DeviceInfoPayload> SyncClient::get_host_info(Light& light, uint32_t timeout_ms) {
  return await_value<DeviceInfoPayload>([&](Light::Callback<DeviceInfoPayload> cb) {
    return light.get_host_info(timeout_ms, std::move(cb));
  });
}

Outcome<DeviceInfoPayload> SyncClient::get_wifi_info(Light& light, uint32_t timeout_ms) {
  return await_value<DeviceInfoPayload>([&](Light::Callback<DeviceInfoPayload> cb) {
    return light.get_wifi_info(timeout_ms, std::move(cb));
  });
}

Outcome<FirmwarePayload> SyncClient::get_host_firmware(Light& light, uint32_t timeout_ms) {
  return await_value<FirmwarePayload>([&](Light::Callback<FirmwarePayload> cb) {
    return light.get_host_firmware(timeout_ms, std::move(cb));
  });
}

Outcome<FirmwarePayload> SyncClient::get_wifi_firmware(Light& light, uint32_t timeout_ms) {
  return await_value<FirmwarePayload>([&](Light::Callback<FirmwarePayload> cb) {
    return light.get_wifi_firmware(timeout_ms, std::move(cb));
  });
}

Outcome<MembershipPayload> SyncClient::get_location(Light& light, uint32_t timeout_ms) {
  return await_value<MembershipPayload>([&](Light::Callback<MembershipPayload> cb) {
    return light.get_location(timeout_ms, std::move(cb));
  });
}

Outcome<MembershipPayload> SyncClient::get_group(Light& light, uint32_t timeout_ms) {
  return await_value<MembershipPayload>([&](Light::Callback<MembershipPayload> cb) {
    return light.get_group(timeout_ms, std::move(cb));
  });
}

} // namespace lanlight
