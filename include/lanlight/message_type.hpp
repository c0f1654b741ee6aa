/**
 * @file message_type.hpp
 * @brief Protocol message type numbers and their fixed payload sizes.
 *
 * | Type | Name               | Payload bytes |
 * |------|--------------------|---------------|
 * |  2   | GetService         | 0             |
 * |  3   | StateService       | 5             |
 * | 12   | GetHostInfo        | 0             |
 * | 13   | StateHostInfo      | 14            |
 * | 14   | GetHostFirmware    | 0             |
 * | 15   | StateHostFirmware  | 20            |
 * | 16   | GetWifiInfo        | 0             |
 * | 17   | StateWifiInfo      | 14            |
 * | 18   | GetWifiFirmware    | 0             |
 * | 19   | StateWifiFirmware  | 20            |
 * | 20   | GetPower           | 0             |
 * | 21   | SetPower           | 2             |
 * | 22   | StatePower         | 2             |
 * | 23   | GetLabel           | 0             |
 * | 24   | SetLabel           | 32            |
 * | 25   | StateLabel         | 32            |
 * | 32   | GetVersion         | 0             |
 * | 33   | StateVersion       | 12            |
 * | 34   | GetInfo            | 0             |
 * | 35   | StateInfo          | 24            |
 * | 45   | Acknowledgement    | 0             |
 * | 48   | GetLocation        | 0             |
 * | 50   | StateLocation      | 56            |
 * | 51   | GetGroup           | 0             |
 * | 53   | StateGroup         | 56            |
 * | 58   | EchoRequest        | 64            |
 * | 59   | EchoResponse       | 64            |
 * | 101  | LightGet           | 0             |
 * | 102  | LightSetColor      | 13            |
 * | 107  | LightState         | 52            |
 */
#ifndef LANLIGHT_MESSAGE_TYPE_HPP
#define LANLIGHT_MESSAGE_TYPE_HPP

#include <cstddef>
#include <cstdint>

namespace lanlight {

enum class MessageType : uint16_t {
  GetService        = 2,
  StateService      = 3,
  GetHostInfo       = 12,
  StateHostInfo     = 13,
  GetHostFirmware   = 14,
  StateHostFirmware = 15,
  GetWifiInfo       = 16,
  StateWifiInfo     = 17,
  GetWifiFirmware   = 18,
  StateWifiFirmware = 19,
  GetPower          = 20,
  SetPower          = 21,
  StatePower        = 22,
  GetLabel          = 23,
  SetLabel          = 24,
  StateLabel        = 25,
  GetVersion        = 32,
  StateVersion      = 33,
  GetInfo           = 34,
  StateInfo         = 35,
  Acknowledgement   = 45,
  GetLocation       = 48,
  StateLocation     = 50,
  GetGroup          = 51,
  StateGroup        = 53,
  EchoRequest       = 58,
  EchoResponse      = 59,
  LightGet          = 101,
  LightSetColor     = 102,
  LightState        = 107
};

/// Fixed payload size for a known type. Returns false when the type has no schema.
bool payload_size(uint16_t type, std::size_t& out);

/// Short name for logs ("StatePower"); "unknown" for unregistered types.
const char* to_string(MessageType t);

inline uint16_t to_wire(MessageType t) { return static_cast<uint16_t>(t); }

} // namespace lanlight

#endif // LANLIGHT_MESSAGE_TYPE_HPP
