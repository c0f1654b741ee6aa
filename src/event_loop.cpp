// ============================================================================
// event_loop.cpp: implementation for event_loop.hpp
// ============================================================================
#include "lanlight/event_loop.hpp"

#include <algorithm>
#include <chrono>

namespace lanlight {

uint64_t steady_now_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

EventLoop::EventLoop(Backend& backend, transport::ITransport& transport, Clock clock)
  : backend_(backend), transport_(transport), clock_(clock ? std::move(clock) : Clock(steady_now_ms)) {}

// ---------------------------------------------------------------------------
// run_once()
// POLICY: never sleep past the backend's next timer; a deadline already due
//         turns the wait into a non-blocking poll.
// ---------------------------------------------------------------------------
void EventLoop::run_once(int max_wait_ms) {
  int wait_ms = max_wait_ms;
  uint64_t deadline = 0;
  if (backend_.next_deadline(deadline)) {
    const uint64_t now = clock_();
    uint64_t left = deadline > now ? deadline - now : 0;
    wait_ms = static_cast<int>(std::min<uint64_t>(left, static_cast<uint64_t>(max_wait_ms)));
  }
  transport_.wait(wait_ms);
  backend_.tick(clock_());
}

void EventLoop::run_for(uint32_t ms) {
  const uint64_t end = clock_() + ms;
  backend_.tick(clock_());
  while (clock_() < end) {
    uint64_t left = end - clock_();
    run_once(static_cast<int>(std::min<uint64_t>(left, DEFAULT_MAX_WAIT_MS)));
  }
}

} // namespace lanlight
