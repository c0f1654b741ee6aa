/**
 * @file payloads.hpp
 * @brief Typed payload schemas for every message the core produces or consumes.
 *
 * Each schema is a plain struct with:
 *   - `SIZE`   : exact encoded byte count,
 *   - `pack()` : appends SIZE bytes to a buffer,
 *   - `unpack()`: parses from a buffer; false if fewer than SIZE bytes.
 *
 * Reserved bytes are written as zero and ignored on read. Text fields are fixed
 * 32-byte NUL-padded arrays on the wire and `Label` (etl::string<32>) in memory.
 * Get* requests and Acknowledgement carry no payload and have no struct here.
 */
#ifndef LANLIGHT_PAYLOADS_HPP
#define LANLIGHT_PAYLOADS_HPP

#include "etl/string.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace lanlight {

constexpr std::size_t LABEL_SIZE = 32;
using Label = etl::string<LABEL_SIZE>;

/// Raw 16-bit color quadruple as carried on the wire.
struct Hsbk {
  static constexpr std::size_t SIZE = 8;
  uint16_t hue{0};
  uint16_t saturation{0};
  uint16_t brightness{0};
  uint16_t kelvin{0};

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, Hsbk& out);

  bool operator==(const Hsbk& o) const {
    return hue == o.hue && saturation == o.saturation &&
           brightness == o.brightness && kelvin == o.kelvin;
  }
  bool operator!=(const Hsbk& o) const { return !(*this == o); }
};

/// StateService: service 1 = UDP.
struct StateServicePayload {
  static constexpr std::size_t SIZE = 5;
  static constexpr uint8_t SERVICE_UDP = 1;
  uint8_t  service{SERVICE_UDP};
  uint32_t port{0};

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, StateServicePayload& out);
};

/// SetPower / StatePower.
struct PowerPayload {
  static constexpr std::size_t SIZE = 2;
  uint16_t level{0};

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, PowerPayload& out);
};

/// SetLabel / StateLabel.
struct LabelPayload {
  static constexpr std::size_t SIZE = LABEL_SIZE;
  Label label;

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, LabelPayload& out);
};

/// StateHostInfo / StateWifiInfo.
struct DeviceInfoPayload {
  static constexpr std::size_t SIZE = 14;
  float    signal{0.0f};
  uint32_t tx{0};
  uint32_t rx{0};

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, DeviceInfoPayload& out);
};

/// StateHostFirmware / StateWifiFirmware.
struct FirmwarePayload {
  static constexpr std::size_t SIZE = 20;
  uint64_t build{0};     // ns since epoch
  uint32_t version{0};   // major << 16 | minor

  uint16_t major() const { return static_cast<uint16_t>(version >> 16); }
  uint16_t minor() const { return static_cast<uint16_t>(version & 0xFFFF); }

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, FirmwarePayload& out);
};

struct VersionPayload {
  static constexpr std::size_t SIZE = 12;
  uint32_t vendor{0};
  uint32_t product{0};
  uint32_t version{0};

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, VersionPayload& out);
};

/// StateInfo: device clock and run times, all in nanoseconds.
struct InfoPayload {
  static constexpr std::size_t SIZE = 24;
  uint64_t time{0};
  uint64_t uptime{0};
  uint64_t downtime{0};

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, InfoPayload& out);
};

/// StateLocation / StateGroup.
struct MembershipPayload {
  static constexpr std::size_t SIZE = 56;
  std::array<uint8_t, 16> id{};
  Label    label;
  uint64_t updated_at{0};

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, MembershipPayload& out);
};

/// EchoRequest / EchoResponse.
struct EchoPayload {
  static constexpr std::size_t SIZE = 64;
  std::array<uint8_t, SIZE> data{};

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, EchoPayload& out);
};

struct SetColorPayload {
  static constexpr std::size_t SIZE = 13;
  Hsbk     color;
  uint32_t duration_ms{0};   // device-side transition time

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, SetColorPayload& out);
};

struct LightStatePayload {
  static constexpr std::size_t SIZE = 52;
  Hsbk     color;
  uint16_t power{0};
  Label    label;

  void pack(std::vector<uint8_t>& out) const;
  static bool unpack(const uint8_t* p, std::size_t len, LightStatePayload& out);
};

/// Encode any schema struct to a fresh buffer.
template <typename P>
std::vector<uint8_t> to_bytes(const P& payload) {
  std::vector<uint8_t> out;
  out.reserve(P::SIZE);
  payload.pack(out);
  return out;
}

} // namespace lanlight

#endif // LANLIGHT_PAYLOADS_HPP
