// ============================================================================
// message_type.cpp: payload schema table
// ============================================================================
#include "lanlight/message_type.hpp"

namespace lanlight {

namespace {

struct TypeInfo {
  MessageType type;
  const char* name;
  std::size_t size;
};

// Keep in step with the table in message_type.hpp.
constexpr TypeInfo TYPES[] = {
  {MessageType::GetService,        "GetService",        0},
  {MessageType::StateService,      "StateService",      5},
  {MessageType::GetHostInfo,       "GetHostInfo",       0},
  {MessageType::StateHostInfo,     "StateHostInfo",     14},
  {MessageType::GetHostFirmware,   "GetHostFirmware",   0},
  {MessageType::StateHostFirmware, "StateHostFirmware", 20},
  {MessageType::GetWifiInfo,       "GetWifiInfo",       0},
  {MessageType::StateWifiInfo,     "StateWifiInfo",     14},
  {MessageType::GetWifiFirmware,   "GetWifiFirmware",   0},
  {MessageType::StateWifiFirmware, "StateWifiFirmware", 20},
  {MessageType::GetPower,          "GetPower",          0},
  {MessageType::SetPower,          "SetPower",          2},
  {MessageType::StatePower,        "StatePower",        2},
  {MessageType::GetLabel,          "GetLabel",          0},
  {MessageType::SetLabel,          "SetLabel",          32},
  {MessageType::StateLabel,        "StateLabel",        32},
  {MessageType::GetVersion,        "GetVersion",        0},
  {MessageType::StateVersion,      "StateVersion",      12},
  {MessageType::GetInfo,           "GetInfo",           0},
  {MessageType::StateInfo,         "StateInfo",         24},
  {MessageType::Acknowledgement,   "Acknowledgement",   0},
  {MessageType::GetLocation,       "GetLocation",       0},
  {MessageType::StateLocation,     "StateLocation",     56},
  {MessageType::GetGroup,          "GetGroup",          0},
  {MessageType::StateGroup,        "StateGroup",        56},
  {MessageType::EchoRequest,       "EchoRequest",       64},
  {MessageType::EchoResponse,      "EchoResponse",      64},
  {MessageType::LightGet,          "LightGet",          0},
  {MessageType::LightSetColor,     "LightSetColor",     13},
  {MessageType::LightState,        "LightState",        52},
};

const TypeInfo* lookup(uint16_t type) {
  for (const auto& t : TYPES)
    if (static_cast<uint16_t>(t.type) == type) return &t;
  return nullptr;
}

} // namespace

bool payload_size(uint16_t type, std::size_t& out) {
  const TypeInfo* t = lookup(type);
  if (!t) return false;
  out = t->size;
  return true;
}

const char* to_string(MessageType type) {
  const TypeInfo* t = lookup(static_cast<uint16_t>(type));
  return t ? t->name : "unknown";
}

} // namespace lanlight
