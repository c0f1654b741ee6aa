// ============================================================================
// hardware_id.cpp: implementation for hardware_id.hpp
// ============================================================================
#include "lanlight/hardware_id.hpp"

#include <cctype>

namespace lanlight {

static int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

bool HardwareId::is_zero() const {
  for (uint8_t b : bytes) if (b) return false;
  return true;
}

std::string HardwareId::to_string() const {
  static const char* digits = "0123456789abcdef";
  std::size_t n = (bytes[6] || bytes[7]) ? SIZE : 6;
  std::string out;
  out.reserve(n * 3);
  for (std::size_t i = 0; i < n; ++i) {
    if (i) out += ':';
    out += digits[bytes[i] >> 4];
    out += digits[bytes[i] & 0x0F];
  }
  return out;
}

// PRE: text like "d0:73:d5:01:02:03" (6 pairs) or 8 pairs; ':' or '-' separators.
// OUT: out filled, trailing bytes zeroed for the 6-pair form.
bool HardwareId::parse(const std::string& text, HardwareId& out) {
  HardwareId id;
  std::size_t count = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    if (count == SIZE || i + 1 >= text.size()) return false;
    int hi = hex_nibble(text[i]);
    int lo = hex_nibble(text[i + 1]);
    if (hi < 0 || lo < 0) return false;
    id.bytes[count++] = static_cast<uint8_t>((hi << 4) | lo);
    i += 2;
    if (i < text.size()) {
      if (text[i] != ':' && text[i] != '-') return false;
      ++i;
      if (i == text.size()) return false;   // trailing separator
    }
  }
  if (count != 6 && count != SIZE) return false;
  out = id;
  return true;
}

} // namespace lanlight
