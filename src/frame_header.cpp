// -----------------------------------------------------------------------------
// @file frame_header.cpp
// @brief Byte-level pack/unpack of the 36-byte frame header.
//
// Bit fields are assembled by hand so the layout does not depend on compiler
// struct packing or host endianness.
// -----------------------------------------------------------------------------
#include "lanlight/frame_header.hpp"
#include "lanlight/byte_order.hpp"

#include <cstring>

namespace lanlight {

namespace {

// Offsets within the header (see table in frame_header.hpp).
constexpr std::size_t OFF_SIZE     = 0;
constexpr std::size_t OFF_PROTO    = 2;
constexpr std::size_t OFF_SOURCE   = 4;
constexpr std::size_t OFF_TARGET   = 8;
constexpr std::size_t OFF_FLAGS    = 22;
constexpr std::size_t OFF_SEQUENCE = 23;
constexpr std::size_t OFF_TYPE     = 32;

constexpr uint16_t PROTO_MASK       = 0x0FFF;
constexpr uint16_t BIT_ADDRESSABLE  = 1u << 12;
constexpr uint16_t BIT_TAGGED       = 1u << 13;
constexpr uint8_t  ORIGIN_SHIFT     = 14;
constexpr uint8_t  FLAG_RES         = 0x01;
constexpr uint8_t  FLAG_ACK         = 0x02;

inline void put16(uint8_t* p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>(v >> 8);
}
inline void put32(uint8_t* p, uint32_t v) {
  for (int i = 0; i < 4; ++i) p[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
}

} // namespace

void FrameHeader::pack(uint8_t* out) const {
  std::memset(out, 0, SIZE);                      // reserved ranges stay zero

  put16(out + OFF_SIZE, size);

  uint16_t proto = static_cast<uint16_t>(protocol & PROTO_MASK);
  if (addressable) proto |= BIT_ADDRESSABLE;
  if (tagged)      proto |= BIT_TAGGED;
  proto |= static_cast<uint16_t>((origin & 0x03) << ORIGIN_SHIFT);
  put16(out + OFF_PROTO, proto);

  put32(out + OFF_SOURCE, source);
  std::memcpy(out + OFF_TARGET, target.bytes.data(), HardwareId::SIZE);

  uint8_t flags = 0;
  if (res_required) flags |= FLAG_RES;
  if (ack_required) flags |= FLAG_ACK;
  out[OFF_FLAGS]    = flags;
  out[OFF_SEQUENCE] = sequence;

  put16(out + OFF_TYPE, type);
}

bool FrameHeader::unpack(const uint8_t* in, std::size_t len) {
  if (!in || len < SIZE) return false;

  size = le::get_u16(in + OFF_SIZE);

  uint16_t proto = le::get_u16(in + OFF_PROTO);
  protocol    = static_cast<uint16_t>(proto & PROTO_MASK);
  addressable = (proto & BIT_ADDRESSABLE) != 0;
  tagged      = (proto & BIT_TAGGED) != 0;
  origin      = static_cast<uint8_t>(proto >> ORIGIN_SHIFT);

  source = le::get_u32(in + OFF_SOURCE);
  target = HardwareId::from_bytes(in + OFF_TARGET);

  ack_required = (in[OFF_FLAGS] & FLAG_ACK) != 0;
  res_required = (in[OFF_FLAGS] & FLAG_RES) != 0;
  sequence     = in[OFF_SEQUENCE];
  type         = le::get_u16(in + OFF_TYPE);
  return true;
}

bool FrameHeader::operator==(const FrameHeader& o) const {
  return size == o.size && origin == o.origin && tagged == o.tagged &&
         addressable == o.addressable && protocol == o.protocol &&
         source == o.source && target == o.target &&
         ack_required == o.ack_required && res_required == o.res_required &&
         sequence == o.sequence && type == o.type;
}

} // namespace lanlight
