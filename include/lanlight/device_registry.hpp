/**
 * @file device_registry.hpp
 * @brief In-memory table of known devices, keyed by hardware id and by address.
 *
 * The registry owns every `Device` record. Records are created on the first
 * discovery/connect response and never removed, so `Device&` / `Device*`
 * handed out stay valid for the registry's lifetime (std::map nodes do not move).
 * Nothing here is persisted.
 */
#ifndef LANLIGHT_DEVICE_REGISTRY_HPP
#define LANLIGHT_DEVICE_REGISTRY_HPP

#include "lanlight/color.hpp"
#include "lanlight/endpoint.hpp"
#include "lanlight/hardware_id.hpp"
#include "lanlight/payloads.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace lanlight {

struct Device {
  HardwareId                id;
  Endpoint                  endpoint;       // may change between discoveries
  std::optional<PowerState> power;          // last known, empty until observed
  std::optional<ColorState> color;
  std::optional<Label>      label;
  uint64_t                  last_seen_ms{0};
};

class DeviceRegistry {
public:
  /// Insert or refresh. An address change re-keys the address index.
  Device& upsert(const HardwareId& id, const Endpoint& endpoint, uint64_t now_ms);

  Device*       find(const HardwareId& id);
  const Device* find(const HardwareId& id) const;
  Device*       find(const Endpoint& endpoint);

  /// Bump last_seen for a known device. False if the id is unknown.
  bool touch(const HardwareId& id, uint64_t now_ms);

  std::size_t size() const { return devices_.size(); }
  std::vector<const Device*> list() const;   // ordered by hardware id

private:
  std::map<HardwareId, Device>   devices_;
  std::map<Endpoint, HardwareId> by_endpoint_;
};

} // namespace lanlight

#endif // LANLIGHT_DEVICE_REGISTRY_HPP
