/**
 * @file hardware_id.hpp
 * @brief 8-byte device target field (6-byte MAC + 2 zero bytes on the wire).
 *
 * DESIGN
 * ------
 *  - Stored exactly as it appears in the frame header, byte for byte.
 *  - All-zero means "untargeted" (broadcast / service query).
 *  - Text form is lowercase colon-separated MAC: "d0:73:d5:01:02:03".
 *    The two trailing bytes are printed only when non-zero.
 *
 * EXAMPLE
 * @code
 *   lanlight::HardwareId id;
 *   lanlight::HardwareId::parse("d0:73:d5:01:02:03", id);
 *   id.to_string();   // "d0:73:d5:01:02:03"
 * @endcode
 */
#ifndef LANLIGHT_HARDWARE_ID_HPP
#define LANLIGHT_HARDWARE_ID_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lanlight {

struct HardwareId {
  static constexpr std::size_t SIZE = 8;

  std::array<uint8_t, SIZE> bytes{};   // zero-filled = untargeted

  bool is_zero() const;
  std::string to_string() const;

  // Accepts 6 or 8 hex pairs separated by ':' or '-'. Returns false on junk.
  static bool parse(const std::string& text, HardwareId& out);

  static HardwareId from_bytes(const uint8_t* p) {
    HardwareId id;
    for (std::size_t i = 0; i < SIZE; ++i) id.bytes[i] = p[i];
    return id;
  }

  bool operator==(const HardwareId& o) const { return bytes == o.bytes; }
  bool operator!=(const HardwareId& o) const { return bytes != o.bytes; }
  bool operator<(const HardwareId& o) const { return bytes < o.bytes; }
};

} // namespace lanlight

#endif // LANLIGHT_HARDWARE_ID_HPP
