/**
 * @file endpoint.hpp
 * @brief IPv4 host:port pair used by transports and the device registry.
 *
 * Address is kept in host byte order; transports convert at the socket edge.
 */
#ifndef LANLIGHT_ENDPOINT_HPP
#define LANLIGHT_ENDPOINT_HPP

#include <cstdint>
#include <string>

namespace lanlight {

constexpr uint16_t DEFAULT_PORT = 56700;   // well-known protocol port

struct Endpoint {
  uint32_t addr{0};   // IPv4, host byte order
  uint16_t port{0};

  std::string host_string() const;   // "192.168.1.20"
  std::string to_string() const;     // "192.168.1.20:56700"

  // "a.b.c.d" or "a.b.c.d:port"; missing port falls back to default_port.
  static bool parse(const std::string& text, Endpoint& out,
                    uint16_t default_port = DEFAULT_PORT);

  bool operator==(const Endpoint& o) const { return addr == o.addr && port == o.port; }
  bool operator!=(const Endpoint& o) const { return !(*this == o); }
  bool operator<(const Endpoint& o) const {
    return addr < o.addr || (addr == o.addr && port < o.port);
  }
};

} // namespace lanlight

#endif // LANLIGHT_ENDPOINT_HPP
