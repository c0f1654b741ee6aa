#pragma once
/**
 * @file transport_base.hpp
 * @brief Datagram transport interface the backend runs on.
 *
 * Header-only. The Linux UDP socket and the in-memory test transport both
 * implement it.
 */

#include "lanlight/endpoint.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace lanlight::transport {

// Return codes kept simple; the backend maps Error to Status::NetworkError.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

struct Config {
  uint16_t    bind_port{0};                       // 0 = ephemeral
  uint16_t    broadcast_port{DEFAULT_PORT};
  std::string broadcast{"255.255.255.255"};       // or "auto": every interface
};

/**
 * @brief Transport trait every backend can rely on.
 *
 * Contract:
 *  - begin(cfg) opens the socket; false leaves the transport closed.
 *  - wait(ms) blocks until a datagram is readable or ms elapse (-1 = forever).
 *  - recv() never blocks; RxResult::None when nothing is queued.
 *  - send()/broadcast() are fire-and-forget single datagrams.
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool      begin(const Config& cfg) = 0;
  virtual void      end() = 0;
  virtual bool      wait(int timeout_ms) = 0;
  virtual RxResult  recv(uint8_t* out, std::size_t cap, std::size_t& out_len, Endpoint& from) = 0;
  virtual TxResult  send(const Endpoint& to, const uint8_t* data, std::size_t len) = 0;
  virtual TxResult  broadcast(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
};

} // namespace lanlight::transport
