/**
 * @file event_loop.hpp
 * @brief Drives a Backend against a clock: block on the socket, then tick.
 *
 * Each run_once():
 *   1) ask the backend for its next deadline,
 *   2) wait on the transport until readable or until that deadline
 *      (capped at max_wait_ms),
 *   3) tick the backend with the fresh clock value.
 *
 * The clock is injectable so tests can run the loop on simulated time.
 */
#ifndef LANLIGHT_EVENT_LOOP_HPP
#define LANLIGHT_EVENT_LOOP_HPP

#include "lanlight/backend.hpp"
#include "lanlight/transport/transport_base.hpp"

#include <cstdint>
#include <functional>

namespace lanlight {

/// Milliseconds from std::chrono::steady_clock.
uint64_t steady_now_ms();

class EventLoop {
public:
  using Clock = std::function<uint64_t()>;

  static constexpr int DEFAULT_MAX_WAIT_MS = 1000;

  EventLoop(Backend& backend, transport::ITransport& transport, Clock clock = {});

  uint64_t now() const { return clock_(); }

  void run_once(int max_wait_ms = DEFAULT_MAX_WAIT_MS);

  /// Tick, then keep running until `done()` holds.
  template <typename Done>
  void run_until(Done done) {
    backend_.tick(now());
    while (!done()) run_once();
  }

  /// Run for at least `ms` of clock time.
  void run_for(uint32_t ms);

private:
  Backend&               backend_;
  transport::ITransport& transport_;
  Clock                  clock_;
};

} // namespace lanlight

#endif // LANLIGHT_EVENT_LOOP_HPP
