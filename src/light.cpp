// ============================================================================
// light.cpp: implementation for light.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "lanlight/light.hpp"

#include <utility>

namespace lanlight {

// ---------------------------------------------------------------------------
// query<P>()
// Get* request, State reply decoded into P. The codec already checked the
// payload length against the schema, so unpack cannot come up short here.
// ---------------------------------------------------------------------------
template <typename P>
Status Light::query(MessageType get, MessageType state, uint32_t timeout_ms, Callback<P> done) {
  if (!valid()) return Status::ValidationError;
  return backend_->send_request(device_->endpoint, device_->id, get, {}, state, timeout_ms,
      [done](Status st, const Frame& f) {
        if (st != Status::Ok) { done(Outcome<P>::failure(st)); return; }
        P payload;
        if (!P::unpack(f.payload.data(), f.payload.size(), payload)) {
          done(Outcome<P>::failure(Status::MalformedFrame));
          return;
        }
        done(Outcome<P>::success(payload));
      });
}

Status Light::command(MessageType set, const std::vector<uint8_t>& payload, uint32_t timeout_ms,
                      StatusCallback done) {
  if (!valid()) return Status::ValidationError;
  return backend_->send_request(device_->endpoint, device_->id, set, payload,
                                MessageType::Acknowledgement, timeout_ms,
                                [done](Status st, const Frame&) { done(st); });
}

// --- ping -----------------------------------------------------------------
Status Light::ping(uint32_t timeout_ms, StatusCallback done) {
  if (!valid()) return Status::ValidationError;
  EchoPayload echo;
  for (std::size_t i = 0; i < echo.data.size(); i += 4) {
    uint32_t r = backend_->random_u32();
    for (std::size_t j = 0; j < 4; ++j) echo.data[i + j] = static_cast<uint8_t>(r >> (8 * j));
  }
  return backend_->send_request(device_->endpoint, device_->id, MessageType::EchoRequest,
                                to_bytes(echo), MessageType::EchoResponse, timeout_ms,
      [echo, done](Status st, const Frame& f) {
        if (st != Status::Ok) { done(st); return; }
        EchoPayload back;
        EchoPayload::unpack(f.payload.data(), f.payload.size(), back);
        done(back.data == echo.data ? Status::Ok : Status::MalformedFrame);
      });
}

// --- power ----------------------------------------------------------------
Status Light::get_power(uint32_t timeout_ms, Callback<PowerState> done) {
  Device* dev = device_;
  return query<PowerPayload>(MessageType::GetPower, MessageType::StatePower, timeout_ms,
      [dev, done](const Outcome<PowerPayload>& o) {
        if (!o.ok()) { done(Outcome<PowerState>::failure(o.status)); return; }
        PowerState p = power_from_level(o.value.level);
        dev->power = p;
        done(Outcome<PowerState>::success(p));
      });
}

Status Light::set_power(PowerState state, uint32_t timeout_ms, StatusCallback done) {
  Device* dev = device_;
  PowerPayload p;
  p.level = power_to_level(state);
  return command(MessageType::SetPower, to_bytes(p), timeout_ms,
      [dev, state, done](Status st) {
        if (st == Status::Ok) dev->power = state;
        done(st);
      });
}

// --- color ----------------------------------------------------------------
Status Light::get_color(uint32_t timeout_ms, Callback<ColorState> done) {
  Device* dev = device_;
  return query<LightStatePayload>(MessageType::LightGet, MessageType::LightState, timeout_ms,
      [dev, done](const Outcome<LightStatePayload>& o) {
        if (!o.ok()) { done(Outcome<ColorState>::failure(o.status)); return; }
        ColorState c = from_hsbk(o.value.color);
        dev->color = c;
        dev->power = power_from_level(o.value.power);
        dev->label = o.value.label;
        done(Outcome<ColorState>::success(c));
      });
}

// PRE: color validated here, before anything reaches the tracker.
Status Light::set_color(const ColorState& color, uint32_t timeout_ms, StatusCallback done,
                        uint32_t transition_ms) {
  if (validate(color) != Status::Ok) return Status::ValidationError;
  Device* dev = device_;
  SetColorPayload p;
  p.color       = to_hsbk(color);
  p.duration_ms = transition_ms;
  return command(MessageType::LightSetColor, to_bytes(p), timeout_ms,
      [dev, color, done](Status st) {
        if (st == Status::Ok) dev->color = color;
        done(st);
      });
}

// ---------------------------------------------------------------------------
// fade_color()
// Two phases: read the current color (one round trip), then hand the pair to
// the scheduler. The device is claimed before the read, so cancel_fade() or a
// newer fade during the read ends this one. A failed read ends the fade with
// the read's status.
// ---------------------------------------------------------------------------
Status Light::fade_color(const ColorState& target, uint32_t duration_ms, uint32_t timeout_ms,
                         StatusCallback done) {
  if (!valid() || validate(target) != Status::Ok) return Status::ValidationError;
  Backend* backend = backend_;
  const uint32_t claim = backend->fades().prepare(device_->id, std::move(done));
  if (claim == 0) return Status::Busy;

  Status st = get_color(timeout_ms,
      [backend, claim, target, duration_ms, timeout_ms](const Outcome<ColorState>& current) {
        if (!current.ok()) { backend->fades().abandon(claim, current.status); return; }
        backend->fades().launch(claim, current.value, target, duration_ms, timeout_ms,
                                backend->current_ms());
      });
  if (st != Status::Ok) backend->fades().release(claim);
  return st;
}

bool Light::cancel_fade() {
  return valid() && backend_->fades().cancel_device(device_->id);
}

// --- label ----------------------------------------------------------------
Status Light::get_label(uint32_t timeout_ms, Callback<Label> done) {
  Device* dev = device_;
  return query<LabelPayload>(MessageType::GetLabel, MessageType::StateLabel, timeout_ms,
      [dev, done](const Outcome<LabelPayload>& o) {
        if (!o.ok()) { done(Outcome<Label>::failure(o.status)); return; }
        dev->label = o.value.label;
        done(Outcome<Label>::success(o.value.label));
      });
}

Status Light::set_label(const std::string& label, uint32_t timeout_ms, StatusCallback done) {
  if (label.size() > LABEL_SIZE) return Status::ValidationError;
  Device* dev = device_;
  LabelPayload p;
  p.label.assign(label.c_str(), label.size());
  const Label stored = p.label;
  return command(MessageType::SetLabel, to_bytes(p), timeout_ms,
      [dev, stored, done](Status st) {
        if (st == Status::Ok) dev->label = stored;
        done(st);
      });
}

// --- device info ----------------------------------------------------------
Status Light::get_version(uint32_t timeout_ms, Callback<VersionPayload> done) {
  return query<VersionPayload>(MessageType::GetVersion, MessageType::StateVersion, timeout_ms, std::move(done));
}

Status Light::get_info(uint32_t timeout_ms, Callback<InfoPayload> done) {
  return query<InfoPayload>(MessageType::GetInfo, MessageType::StateInfo, timeout_ms, std::move(done));
}

Status Light::get_host_info(uint32_t timeout_ms, Callback<DeviceInfoPayload> done) {
  return query<DeviceInfoPayload>(MessageType::GetHostInfo, MessageType::StateHostInfo, timeout_ms, std::move(done));
}

Status Light::get_wifi_info(uint32_t timeout_ms, Callback<DeviceInfoPayload> done) {
  return query<DeviceInfoPayload>(MessageType::GetWifiInfo, MessageType::StateWifiInfo, timeout_ms, std::move(done));
}

Status Light::get_host_firmware(uint32_t timeout_ms, Callback<FirmwarePayload> done) {
  return query<FirmwarePayload>(MessageType::GetHostFirmware, MessageType::StateHostFirmware, timeout_ms, std::move(done));
}

Status Light::get_wifi_firmware(uint32_t timeout_ms, Callback<FirmwarePayload> done) {
  return query<FirmwarePayload>(MessageType::GetWifiFirmware, MessageType::StateWifiFirmware, timeout_ms, std::move(done));
}

Status Light::get_location(uint32_t timeout_ms, Callback<MembershipPayload> done) {
  return query<MembershipPayload>(MessageType::GetLocation, MessageType::StateLocation, timeout_ms, std::move(done));
}

Status Light::get_group(uint32_t timeout_ms, Callback<MembershipPayload> done) {
  return query<MembershipPayload>(MessageType::GetGroup, MessageType::StateGroup, timeout_ms, std::move(done));
}

} // namespace lanlight
