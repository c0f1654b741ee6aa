/**
 * @file codec.hpp
 * @brief Frame = header + payload bytes, and the encode/decode pair over it.
 *
 * PURPOSE
 * -------
 * Turn a `Frame` into the exact datagram the device expects and back again.
 * `decode(encode(f)) == f` for every frame built through `make_frame()`.
 *
 * DESIGN
 * ------
 *  - The payload is carried as raw bytes; typed views live in payloads.hpp and
 *    are applied by whoever knows the expected type.
 *  - `encode()` always rewrites `size` from the real length; a caller-provided
 *    size is never trusted.
 *  - `decode()` is strict by default:
 *      * buffer shorter than the header            -> MalformedFrame
 *      * header size field != buffer length       -> MalformedFrame
 *      * protocol number != 1024                   -> MalformedFrame
 *      * type has no schema (strict mode)          -> UnsupportedMessage
 *      * payload length != schema size             -> MalformedFrame
 *    With `strict=false` unknown types pass through with their raw payload.
 *  - `peek_header()` reads only the header so the receive path can still route
 *    a broken response to the request that caused it.
 *
 * EXAMPLE
 * @code
 *   auto f   = lanlight::make_frame(src, target, 7, lanlight::MessageType::GetPower);
 *   auto raw = lanlight::encode(f);
 *   lanlight::Frame back;
 *   auto st  = lanlight::decode(raw.data(), raw.size(), back);   // Status::Ok
 * @endcode
 */
#ifndef LANLIGHT_CODEC_HPP
#define LANLIGHT_CODEC_HPP

#include "lanlight/frame_header.hpp"
#include "lanlight/message_type.hpp"
#include "lanlight/status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lanlight {

struct Frame {
  FrameHeader          header;
  std::vector<uint8_t> payload;

  MessageType type() const { return static_cast<MessageType>(header.type); }

  bool operator==(const Frame& o) const { return header == o.header && payload == o.payload; }
  bool operator!=(const Frame& o) const { return !(*this == o); }
};

/// Request flags for make_frame().
enum class Reply : uint8_t { None = 0, Ack = 1, Response = 2 };

/**
 * @brief Build a frame with a consistent header.
 * `tagged` follows the target (zero target => tagged). `size` is filled in.
 */
Frame make_frame(uint32_t source, const HardwareId& target, uint8_t sequence,
                 MessageType type, std::vector<uint8_t> payload = {},
                 Reply reply = Reply::None);

std::vector<uint8_t> encode(const Frame& frame);

Status decode(const uint8_t* data, std::size_t len, Frame& out, bool strict = true);

inline Status decode(const std::vector<uint8_t>& data, Frame& out, bool strict = true) {
  return decode(data.data(), data.size(), out, strict);
}

/// Header-only parse. False if shorter than FrameHeader::SIZE.
bool peek_header(const uint8_t* data, std::size_t len, FrameHeader& out);

/// One-line summary for logs and tools: "type=StatePower seq=7 src=.. target=.. len=38".
std::string describe(const Frame& frame);

/// Uppercase hex, no separators.
std::string to_hex(const std::vector<uint8_t>& bytes);
/// Accepts upper/lower hex with optional spaces. False on odd length or junk.
bool from_hex(const std::string& text, std::vector<uint8_t>& out);

} // namespace lanlight

#endif // LANLIGHT_CODEC_HPP
