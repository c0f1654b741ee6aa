#pragma once
/**
 * @file transport_linux_udp.hpp
 * @brief Linux UDP datagram transport (header-only, non-blocking socket).
 *
 * One socket per backend. SO_BROADCAST is enabled so discovery can reach the
 * subnet. With `broadcast = "auto"` every IPv4 interface broadcast address is
 * targeted (getifaddrs), otherwise the configured dotted quad.
 *
 * Depends on: sys/socket.h, netinet/in.h, arpa/inet.h, ifaddrs.h, poll.h.
 */

#if !defined(__linux__)
#  error "transport_linux_udp.hpp is Linux-only."
#endif

#include "lanlight/transport/transport_base.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <vector>

namespace lanlight::transport {

/// IPv4 broadcast addresses of every interface that is up and not loopback.
inline std::vector<uint32_t> interface_broadcasts() {
  std::vector<uint32_t> out;
  ifaddrs* list = nullptr;
  if (::getifaddrs(&list) != 0) return out;
  for (ifaddrs* it = list; it; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) continue;
    if (!(it->ifa_flags & IFF_BROADCAST) || !it->ifa_broadaddr) continue;
    auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_broadaddr);
    out.push_back(ntohl(sin->sin_addr.s_addr));
  }
  ::freeifaddrs(list);
  return out;
}

class LinuxUdp : public ITransport {
public:
  LinuxUdp() = default;
  ~LinuxUdp() override { end(); }

  LinuxUdp(const LinuxUdp&) = delete;
  LinuxUdp& operator=(const LinuxUdp&) = delete;

  bool begin(const Config& cfg) override {
    end();
    broadcast_port_ = cfg.broadcast_port;

    targets_.clear();
    if (cfg.broadcast == "auto") {
      targets_ = interface_broadcasts();
      if (targets_.empty()) targets_.push_back(INADDR_BROADCAST);  // no interface info
    } else {
      in_addr a{};
      if (::inet_pton(AF_INET, cfg.broadcast.c_str(), &a) != 1) return false;
      targets_.push_back(ntohl(a.s_addr));
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) return false;

    int on = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) != 0 ||
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) != 0) {
      end();
      return false;
    }

    sockaddr_in local{};
    local.sin_family      = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port        = htons(cfg.bind_port);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) != 0) {
      end();
      return false;
    }

    int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
      end();
      return false;
    }
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  bool wait(int timeout_ms) override {
    if (fd_ < 0) return false;
    pollfd p{fd_, POLLIN, 0};
    int r = ::poll(&p, 1, timeout_ms);
    return r > 0 && (p.revents & POLLIN);
  }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, Endpoint& from) override {
    out_len = 0;
    if (fd_ < 0 || cap == 0) return RxResult::Error;
    sockaddr_in src{};
    socklen_t slen = sizeof(src);
    ssize_t r = ::recvfrom(fd_, out, cap, 0, reinterpret_cast<sockaddr*>(&src), &slen);
    if (r >= 0) {
      out_len   = static_cast<std::size_t>(r);
      from.addr = ntohl(src.sin_addr.s_addr);
      from.port = ntohs(src.sin_port);
      return RxResult::Ok;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
    return RxResult::Error;
  }

  TxResult send(const Endpoint& to, const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;
    sockaddr_in dst{};
    dst.sin_family      = AF_INET;
    dst.sin_addr.s_addr = htonl(to.addr);
    dst.sin_port        = htons(to.port);
    ssize_t w = ::sendto(fd_, data, len, 0, reinterpret_cast<sockaddr*>(&dst), sizeof(dst));
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return TxResult::Busy;
    return (w == static_cast<ssize_t>(len)) ? TxResult::Ok : TxResult::Error;
  }

  // Ok if at least one interface took the datagram.
  TxResult broadcast(const uint8_t* data, std::size_t len) override {
    TxResult best = TxResult::Error;
    for (uint32_t addr : targets_) {
      TxResult r = send(Endpoint{addr, broadcast_port_}, data, len);
      if (r == TxResult::Ok) best = TxResult::Ok;
      else if (r == TxResult::Busy && best != TxResult::Ok) best = TxResult::Busy;
    }
    return best;
  }

  const char* name() const override { return "linux-udp"; }

private:
  int fd_{-1};
  uint16_t broadcast_port_{DEFAULT_PORT};
  std::vector<uint32_t> targets_;
};

} // namespace lanlight::transport
