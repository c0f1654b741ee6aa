// ============================================================================
// payloads.cpp: pack/unpack for the typed payload schemas
// For field layouts see payloads.hpp and message_type.hpp.
// ============================================================================
#include "lanlight/payloads.hpp"
#include "lanlight/byte_order.hpp"

#include <cstring>

namespace lanlight {

using namespace le;

// ---------------------------------------------------------------------------
// Labels: fixed 32 bytes on the wire, NUL padded. Reading stops at the first
// NUL so padding never leaks into the string.
// ---------------------------------------------------------------------------
static void put_label(std::vector<uint8_t>& b, const Label& label) {
  std::size_t n = label.size();
  b.insert(b.end(), label.begin(), label.begin() + n);
  put_zeros(b, LABEL_SIZE - n);
}

static Label get_label(const uint8_t* p) {
  std::size_t n = 0;
  while (n < LABEL_SIZE && p[n] != 0) ++n;
  return Label(reinterpret_cast<const char*>(p), n);
}

// --- Hsbk -----------------------------------------------------------------
void Hsbk::pack(std::vector<uint8_t>& out) const {
  put_u16(out, hue);
  put_u16(out, saturation);
  put_u16(out, brightness);
  put_u16(out, kelvin);
}

bool Hsbk::unpack(const uint8_t* p, std::size_t len, Hsbk& out) {
  if (len < SIZE) return false;
  out.hue        = get_u16(p);
  out.saturation = get_u16(p + 2);
  out.brightness = get_u16(p + 4);
  out.kelvin     = get_u16(p + 6);
  return true;
}

// --- StateService ---------------------------------------------------------
void StateServicePayload::pack(std::vector<uint8_t>& out) const {
  put_u8(out, service);
  put_u32(out, port);
}

bool StateServicePayload::unpack(const uint8_t* p, std::size_t len, StateServicePayload& out) {
  if (len < SIZE) return false;
  out.service = p[0];
  out.port    = get_u32(p + 1);
  return true;
}

// --- Power ----------------------------------------------------------------
void PowerPayload::pack(std::vector<uint8_t>& out) const { put_u16(out, level); }

bool PowerPayload::unpack(const uint8_t* p, std::size_t len, PowerPayload& out) {
  if (len < SIZE) return false;
  out.level = get_u16(p);
  return true;
}

// --- Label ----------------------------------------------------------------
void LabelPayload::pack(std::vector<uint8_t>& out) const { put_label(out, label); }

bool LabelPayload::unpack(const uint8_t* p, std::size_t len, LabelPayload& out) {
  if (len < SIZE) return false;
  out.label = get_label(p);
  return true;
}

// --- Host/Wifi info: signal f32, tx u32, rx u32, 2 reserved ------------------
void DeviceInfoPayload::pack(std::vector<uint8_t>& out) const {
  put_f32(out, signal);
  put_u32(out, tx);
  put_u32(out, rx);
  put_zeros(out, 2);
}

bool DeviceInfoPayload::unpack(const uint8_t* p, std::size_t len, DeviceInfoPayload& out) {
  if (len < SIZE) return false;
  out.signal = get_f32(p);
  out.tx     = get_u32(p + 4);
  out.rx     = get_u32(p + 8);
  return true;
}

// --- Firmware: build u64, 8 reserved, version u32 ---------------------------
void FirmwarePayload::pack(std::vector<uint8_t>& out) const {
  put_u64(out, build);
  put_zeros(out, 8);
  put_u32(out, version);
}

bool FirmwarePayload::unpack(const uint8_t* p, std::size_t len, FirmwarePayload& out) {
  if (len < SIZE) return false;
  out.build   = get_u64(p);
  out.version = get_u32(p + 16);
  return true;
}

// --- Version --------------------------------------------------------------
void VersionPayload::pack(std::vector<uint8_t>& out) const {
  put_u32(out, vendor);
  put_u32(out, product);
  put_u32(out, version);
}

bool VersionPayload::unpack(const uint8_t* p, std::size_t len, VersionPayload& out) {
  if (len < SIZE) return false;
  out.vendor  = get_u32(p);
  out.product = get_u32(p + 4);
  out.version = get_u32(p + 8);
  return true;
}

// --- Info -----------------------------------------------------------------
void InfoPayload::pack(std::vector<uint8_t>& out) const {
  put_u64(out, time);
  put_u64(out, uptime);
  put_u64(out, downtime);
}

bool InfoPayload::unpack(const uint8_t* p, std::size_t len, InfoPayload& out) {
  if (len < SIZE) return false;
  out.time     = get_u64(p);
  out.uptime   = get_u64(p + 8);
  out.downtime = get_u64(p + 16);
  return true;
}

// --- Location / Group: id[16], label[32], updated_at u64 --------------------
void MembershipPayload::pack(std::vector<uint8_t>& out) const {
  out.insert(out.end(), id.begin(), id.end());
  put_label(out, label);
  put_u64(out, updated_at);
}

bool MembershipPayload::unpack(const uint8_t* p, std::size_t len, MembershipPayload& out) {
  if (len < SIZE) return false;
  std::memcpy(out.id.data(), p, out.id.size());
  out.label      = get_label(p + 16);
  out.updated_at = get_u64(p + 48);
  return true;
}

// --- Echo -----------------------------------------------------------------
void EchoPayload::pack(std::vector<uint8_t>& out) const {
  out.insert(out.end(), data.begin(), data.end());
}

bool EchoPayload::unpack(const uint8_t* p, std::size_t len, EchoPayload& out) {
  if (len < SIZE) return false;
  std::memcpy(out.data.data(), p, SIZE);
  return true;
}

// --- LightSetColor: reserved u8, HSBK, duration u32 -------------------------
void SetColorPayload::pack(std::vector<uint8_t>& out) const {
  put_u8(out, 0);
  color.pack(out);
  put_u32(out, duration_ms);
}

bool SetColorPayload::unpack(const uint8_t* p, std::size_t len, SetColorPayload& out) {
  if (len < SIZE) return false;
  Hsbk::unpack(p + 1, Hsbk::SIZE, out.color);
  out.duration_ms = get_u32(p + 9);
  return true;
}

// --- LightState: HSBK, reserved u16, power u16, label, 8 reserved -----------
void LightStatePayload::pack(std::vector<uint8_t>& out) const {
  color.pack(out);
  put_zeros(out, 2);
  put_u16(out, power);
  put_label(out, label);
  put_zeros(out, 8);
}

bool LightStatePayload::unpack(const uint8_t* p, std::size_t len, LightStatePayload& out) {
  if (len < SIZE) return false;
  Hsbk::unpack(p, Hsbk::SIZE, out.color);
  out.power = get_u16(p + 10);
  out.label = get_label(p + 12);
  return true;
}

} // namespace lanlight
