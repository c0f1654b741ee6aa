#pragma once
/**
 * @file byte_order.hpp
 * @brief Little-endian put/get helpers. The whole wire format is little-endian.
 */

#include <cstdint>
#include <cstring>
#include <vector>

namespace lanlight::le {

inline void put_u8(std::vector<uint8_t>& b, uint8_t v) { b.push_back(v); }

inline void put_u16(std::vector<uint8_t>& b, uint16_t v) {
  b.push_back(static_cast<uint8_t>(v & 0xFF));
  b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

inline void put_u32(std::vector<uint8_t>& b, uint32_t v) {
  for (int i = 0; i < 4; ++i) b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

inline void put_u64(std::vector<uint8_t>& b, uint64_t v) {
  for (int i = 0; i < 8; ++i) b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

inline void put_f32(std::vector<uint8_t>& b, float v) {
  uint32_t raw;
  std::memcpy(&raw, &v, sizeof(raw));
  put_u32(b, raw);
}

inline void put_zeros(std::vector<uint8_t>& b, std::size_t n) { b.insert(b.end(), n, 0); }

inline uint16_t get_u16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t get_u32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline uint64_t get_u64(const uint8_t* p) {
  return static_cast<uint64_t>(get_u32(p)) | (static_cast<uint64_t>(get_u32(p + 4)) << 32);
}

inline float get_f32(const uint8_t* p) {
  uint32_t raw = get_u32(p);
  float v;
  std::memcpy(&v, &raw, sizeof(v));
  return v;
}

} // namespace lanlight::le
