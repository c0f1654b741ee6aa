// ============================================================================
// device_registry.cpp: implementation for device_registry.hpp
// ============================================================================
#include "lanlight/device_registry.hpp"

namespace lanlight {

Device& DeviceRegistry::upsert(const HardwareId& id, const Endpoint& endpoint, uint64_t now_ms) {
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    Device d;
    d.id = id;
    d.endpoint = endpoint;
    it = devices_.emplace(id, d).first;
  } else if (it->second.endpoint != endpoint) {
    auto old = by_endpoint_.find(it->second.endpoint);
    if (old != by_endpoint_.end() && old->second == id) by_endpoint_.erase(old);
    it->second.endpoint = endpoint;
  }
  by_endpoint_[endpoint] = id;   // another device may have held this address before
  it->second.last_seen_ms = now_ms;
  return it->second;
}

Device* DeviceRegistry::find(const HardwareId& id) {
  auto it = devices_.find(id);
  return it == devices_.end() ? nullptr : &it->second;
}

const Device* DeviceRegistry::find(const HardwareId& id) const {
  auto it = devices_.find(id);
  return it == devices_.end() ? nullptr : &it->second;
}

Device* DeviceRegistry::find(const Endpoint& endpoint) {
  auto it = by_endpoint_.find(endpoint);
  if (it == by_endpoint_.end()) return nullptr;
  return find(it->second);
}

bool DeviceRegistry::touch(const HardwareId& id, uint64_t now_ms) {
  Device* d = find(id);
  if (!d) return false;
  if (now_ms > d->last_seen_ms) d->last_seen_ms = now_ms;
  return true;
}

std::vector<const Device*> DeviceRegistry::list() const {
  std::vector<const Device*> out;
  out.reserve(devices_.size());
  for (const auto& kv : devices_) out.push_back(&kv.second);
  return out;
}

} // namespace lanlight
