/**
 * @file fade.hpp
 * @brief Client-side color transitions as a timed series of set_color calls.
 *
 * STATE MACHINE
 * -------------
 *   Idle --start()--> Running --final ack--> Completed   (done(Ok) / done(err))
 *                        \----cancel()----> Cancelled   (done(Cancelled))
 *
 * STEPPING
 * --------
 *  - steps N = ceil(duration / step_ms), clamped to [1, max_steps];
 *    interval = duration / N.
 *  - step k (1..N) is due at start + (k-1) * interval and applies
 *    interpolate(from, to, k/N) with a device-side transition of `interval`,
 *    so the bulb glides between steps and lands on the target at `duration`.
 *  - step N sends `to` itself, never an interpolated value.
 *  - if the loop falls behind, overdue intermediate steps collapse into the
 *    latest one; the final step is never skipped.
 *  - intermediate failures are logged and the fade carries on; the outcome of
 *    the final set_color is the fade's outcome.
 *  - starting a fade for a device that already has one cancels the old one,
 *    leaving the bulb wherever the last applied step put it.
 *
 * PREPARED FADES
 * --------------
 * A proxy fade first reads the bulb's current color. `prepare()` claims the
 * device for that read so cancel_device() and a newer fade can already see
 * it; `launch()` turns the claim into a running fade once the read lands.
 * A claim cancelled in between never launches.
 */
#ifndef LANLIGHT_FADE_HPP
#define LANLIGHT_FADE_HPP

#include "lanlight/color.hpp"
#include "lanlight/hardware_id.hpp"
#include "lanlight/log.hpp"
#include "lanlight/status.hpp"

#include "etl/deque.h"
#include "etl/vector.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

namespace lanlight {

enum class FadeState : uint8_t { Idle = 0, Running, Completed, Cancelled };

const char* to_string(FadeState s);

struct FadeTicket {
  uint32_t id{0};
  bool valid() const { return id != 0; }
};

class FadeScheduler {
public:
  static constexpr std::size_t MAX_FADES = 32;
  static constexpr std::size_t HISTORY   = 32;

  using StatusFn   = std::function<void(Status)>;
  using SetColorFn = std::function<Status(const HardwareId& device, const ColorState& color,
                                          uint32_t transition_ms, uint32_t timeout_ms,
                                          StatusFn done)>;

  struct Options {
    uint32_t step_ms{100};
    uint16_t max_steps{50};
  };

  FadeScheduler(SetColorFn issue, Options opts, const Logger& log);

  /**
   * @brief Begin a fade. The first step goes out on the next advance().
   * @return ValidationError for a bad endpoint color, Busy when the table is
   *         full, Ok otherwise (done fires exactly once later).
   */
  Status start(const HardwareId& device, const ColorState& from, const ColorState& to,
               uint32_t duration_ms, uint32_t timeout_ms, uint64_t now_ms,
               StatusFn done, FadeTicket* ticket = nullptr);

  /// Claim `device` ahead of start(). 0 when the table is full.
  uint32_t prepare(const HardwareId& device, StatusFn done);
  /// Start the fade claimed by `claim`. False if the claim was cancelled;
  /// a start() rejection is reported through the claim's done.
  bool launch(uint32_t claim, const ColorState& from, const ColorState& to,
              uint32_t duration_ms, uint32_t timeout_ms, uint64_t now_ms,
              FadeTicket* ticket = nullptr);
  /// End a claim with `st` (done fires) or silently (call was never accepted).
  void abandon(uint32_t claim, Status st);
  void release(uint32_t claim);

  bool cancel(const FadeTicket& ticket);
  bool cancel_device(const HardwareId& device);

  /// Running while the task exists, Completed/Cancelled for recently finished
  /// ones (last HISTORY), Idle for anything else.
  FadeState state(const FadeTicket& ticket) const;

  void advance(uint64_t now_ms);
  bool next_deadline(uint64_t& out) const;

  std::size_t running() const { return tasks_.size(); }
  std::size_t prepared() const { return claims_.size(); }
  uint16_t step_count(uint32_t duration_ms) const;

  const Options& options() const { return opts_; }
  void set_options(const Options& opts) { opts_ = opts; }

private:
  struct FadeTask {
    uint32_t   id{0};
    HardwareId device;
    ColorState from;
    ColorState to;
    uint64_t   start_ms{0};
    uint32_t   interval_ms{0};
    uint32_t   timeout_ms{0};
    uint16_t   steps{1};
    uint16_t   next_step{1};     // 1-based index of the next step to issue
    bool       final_sent{false};
    StatusFn   done;
  };

  struct Claim {
    uint32_t   id{0};
    HardwareId device;
    StatusFn   done;
  };

  bool take_claim(uint32_t id, Claim& out);
  void on_final(uint32_t id, Status st);
  void remember(uint32_t id, FadeState s);
  bool cancel_at(std::size_t index);

  SetColorFn    issue_;
  Options       opts_;
  const Logger& log_;
  uint32_t      next_id_{1};
  etl::vector<FadeTask, MAX_FADES> tasks_;
  etl::vector<Claim, MAX_FADES>    claims_;
  etl::deque<std::pair<uint32_t, FadeState>, HISTORY> history_;   // oldest first
};

} // namespace lanlight

#endif // LANLIGHT_FADE_HPP
