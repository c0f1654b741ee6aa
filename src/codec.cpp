// ============================================================================
// codec.cpp: implementation for codec.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "lanlight/codec.hpp"

#include <algorithm> // std::copy
#include <iomanip>   // std::setw, std::setfill, std::hex
#include <sstream>   // describe() / to_hex()

namespace lanlight {

// ---------------------------------------------------------------------------
// make_frame()
// PRE: payload already packed for `type`.
// POLICY: zero target => tagged (broadcast-style); reply selects ack/res bits.
// OUT: frame whose size field already matches what encode() will produce.
// ---------------------------------------------------------------------------
Frame make_frame(uint32_t source, const HardwareId& target, uint8_t sequence,
                 MessageType type, std::vector<uint8_t> payload, Reply reply) {
  Frame f;
  f.header.source       = source;
  f.header.target       = target;
  f.header.tagged       = target.is_zero();
  f.header.sequence     = sequence;
  f.header.type         = to_wire(type);
  f.header.ack_required = (reply == Reply::Ack);
  f.header.res_required = (reply == Reply::Response);
  f.payload             = std::move(payload);
  f.header.size         = static_cast<uint16_t>(FrameHeader::SIZE + f.payload.size());
  return f;
}

// ---------------------------------------------------------------------------
// encode()
// The size field is recomputed here; whatever the caller left in
// frame.header.size is ignored.
// ---------------------------------------------------------------------------
std::vector<uint8_t> encode(const Frame& frame) {
  std::vector<uint8_t> out(FrameHeader::SIZE + frame.payload.size());
  FrameHeader h = frame.header;
  h.size = static_cast<uint16_t>(out.size());
  h.pack(out.data());
  std::copy(frame.payload.begin(), frame.payload.end(), out.begin() + FrameHeader::SIZE);
  return out;
}

bool peek_header(const uint8_t* data, std::size_t len, FrameHeader& out) {
  return out.unpack(data, len);
}

// ---------------------------------------------------------------------------
// decode()
// PRE: one complete datagram.
// POLICY: checks run cheapest-first; the first failure wins.
// OUT: Ok with `out` filled, else `out` is left unspecified.
// ---------------------------------------------------------------------------
Status decode(const uint8_t* data, std::size_t len, Frame& out, bool strict) {
  if (!data || len < FrameHeader::SIZE) return Status::MalformedFrame;

  FrameHeader h;
  h.unpack(data, len);
  if (h.size != len)                return Status::MalformedFrame;
  if (h.protocol != PROTOCOL_NUMBER) return Status::MalformedFrame;

  const std::size_t body = len - FrameHeader::SIZE;
  std::size_t expected = 0;
  if (payload_size(h.type, expected)) {
    if (body != expected) return Status::MalformedFrame;
  } else if (strict) {
    return Status::UnsupportedMessage;
  }

  out.header = h;
  out.payload.assign(data + FrameHeader::SIZE, data + len);
  return Status::Ok;
}

std::string describe(const Frame& frame) {
  std::ostringstream os;
  const char* name = to_string(frame.type());
  os << "type=";
  if (std::string(name) == "unknown") os << frame.header.type;
  else os << name;
  os << " seq=" << static_cast<unsigned>(frame.header.sequence)
     << " src=0x" << std::hex << std::setw(8) << std::setfill('0') << frame.header.source
     << std::dec
     << " target=" << frame.header.target.to_string()
     << " len=" << (FrameHeader::SIZE + frame.payload.size());
  if (frame.header.tagged)       os << " tagged";
  if (frame.header.ack_required) os << " ack";
  if (frame.header.res_required) os << " res";
  return os.str();
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::ostringstream os;
  os << std::uppercase << std::hex << std::setfill('0');
  for (uint8_t b : bytes) os << std::setw(2) << static_cast<unsigned>(b);
  return os.str();
}

bool from_hex(const std::string& text, std::vector<uint8_t>& out) {
  std::vector<uint8_t> bytes;
  int hi = -1;
  for (char c : text) {
    if (c == ' ' || c == ':') continue;
    int v;
    if      (c >= '0' && c <= '9') v = c - '0';
    else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
    else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
    else return false;
    if (hi < 0) { hi = v; continue; }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | v));
    hi = -1;
  }
  if (hi >= 0) return false;   // odd digit count
  out = std::move(bytes);
  return true;
}

} // namespace lanlight
