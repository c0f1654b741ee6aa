/**
 * @file frame_header.hpp
 * @brief The fixed 36-byte header that prefixes every datagram.
 *
 * WIRE LAYOUT (little-endian throughout)
 * --------------------------------------
 * | Offset | Bytes | Field                                                   |
 * |--------|-------|---------------------------------------------------------|
 * | 0      | 2     | size: total frame length including this header          |
 * | 2      | 2     | protocol:12 | addressable:1 | tagged:1 | origin:2       |
 * | 4      | 4     | source: sender-chosen id, echoed by devices             |
 * | 8      | 8     | target: hardware id, zero for untargeted queries        |
 * | 16     | 6     | reserved                                                |
 * | 22     | 1     | res_required:1 | ack_required:1 | reserved:6 (bit 0 up) |
 * | 23     | 1     | sequence                                                |
 * | 24     | 8     | reserved                                                |
 * | 32     | 2     | message type                                            |
 * | 34     | 2     | reserved                                                |
 *
 * Example: a tagged GetService broadcast from source 0x6c636874, seq 1:
 *   24 00 00 34 74 68 63 6c 00.. (target) 00.. 00 01 00.. 02 00 00 00
 *
 * `pack()` writes every field as stored, `size` included; the codec is what
 * keeps `size` honest.
 */
#ifndef LANLIGHT_FRAME_HEADER_HPP
#define LANLIGHT_FRAME_HEADER_HPP

#include "lanlight/hardware_id.hpp"

#include <cstddef>
#include <cstdint>

namespace lanlight {

constexpr uint16_t PROTOCOL_NUMBER = 1024;

struct FrameHeader {
  static constexpr std::size_t SIZE = 36;

  uint16_t   size{SIZE};
  uint8_t    origin{0};             // 2 bits, always 0
  bool       tagged{false};         // set when target is zero
  bool       addressable{true};
  uint16_t   protocol{PROTOCOL_NUMBER};   // 12 bits
  uint32_t   source{0};
  HardwareId target{};
  bool       ack_required{false};
  bool       res_required{false};
  uint8_t    sequence{0};
  uint16_t   type{0};

  /// Write exactly SIZE bytes to out.
  void pack(uint8_t* out) const;

  /// Parse the first SIZE bytes. False if len < SIZE; fields untouched then.
  bool unpack(const uint8_t* in, std::size_t len);

  bool operator==(const FrameHeader& o) const;
  bool operator!=(const FrameHeader& o) const { return !(*this == o); }
};

} // namespace lanlight

#endif // LANLIGHT_FRAME_HEADER_HPP
