// ============================================================================
// endpoint.cpp: implementation for endpoint.hpp
// ============================================================================
#include "lanlight/endpoint.hpp"

#include <arpa/inet.h>   // inet_pton / inet_ntop
#include <cstdlib>       // strtoul

namespace lanlight {

std::string Endpoint::host_string() const {
  in_addr a{};
  a.s_addr = htonl(addr);
  char buf[INET_ADDRSTRLEN] = {0};
  if (!::inet_ntop(AF_INET, &a, buf, sizeof(buf))) return "?";
  return buf;
}

std::string Endpoint::to_string() const {
  return host_string() + ":" + std::to_string(port);
}

bool Endpoint::parse(const std::string& text, Endpoint& out, uint16_t default_port) {
  std::string host = text;
  uint16_t port = default_port;

  auto colon = text.rfind(':');
  if (colon != std::string::npos) {
    host = text.substr(0, colon);
    const std::string p = text.substr(colon + 1);
    if (p.empty() || p.size() > 5) return false;
    char* end = nullptr;
    unsigned long v = std::strtoul(p.c_str(), &end, 10);
    if (*end != '\0' || v == 0 || v > 65535) return false;
    port = static_cast<uint16_t>(v);
  }

  in_addr a{};
  if (::inet_pton(AF_INET, host.c_str(), &a) != 1) return false;
  out.addr = ntohl(a.s_addr);
  out.port = port;
  return true;
}

} // namespace lanlight
