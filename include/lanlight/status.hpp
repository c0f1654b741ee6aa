/**
 * @file status.hpp
 * @brief Result codes shared by every lanlight layer.
 *
 * PURPOSE
 * -------
 * The protocol core never throws. Each fallible step reports a `Status`, and
 * calls that produce a value hand back an `Outcome<T>` carrying both.
 *
 * ROLE
 * ----
 *  - Codec:    MalformedFrame / UnsupportedMessage on decode.
 *  - Tracker:  Timeout, Cancelled, Busy, NetworkError on send.
 *  - Proxy:    ValidationError before any I/O.
 *
 * OPERATIONAL NOTES
 * -----------------
 *  - `to_string()` tokens are stable and appear in logs and CLI output as
 *    `reason=<token>`.
 */
#ifndef LANLIGHT_STATUS_HPP
#define LANLIGHT_STATUS_HPP

#include <cstdint>

namespace lanlight {

enum class Status : uint8_t {
  Ok = 0,
  MalformedFrame,      // structural violation while decoding
  Timeout,             // no matching response before the deadline
  ValidationError,     // caller value outside protocol range
  NetworkError,        // socket-level failure
  UnsupportedMessage,  // no payload schema for the message type
  Cancelled,           // request or fade cancelled by the caller
  Busy                 // no free sequence slot
};

const char* to_string(Status s);

/**
 * @brief A status plus the value it guards.
 * `value` is only meaningful when `ok()` holds.
 */
template <typename T>
struct Outcome {
  Status status{Status::Ok};
  T      value{};

  bool ok() const { return status == Status::Ok; }

  static Outcome failure(Status s) { Outcome o; o.status = s; return o; }
  static Outcome success(const T& v) { Outcome o; o.value = v; return o; }
};

} // namespace lanlight

#endif // LANLIGHT_STATUS_HPP
