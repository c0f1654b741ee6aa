// ============================================================================
// fade.cpp: implementation for fade.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "lanlight/fade.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace lanlight {

const char* to_string(FadeState s) {
  switch (s) {
    case FadeState::Idle:      return "idle";
    case FadeState::Running:   return "running";
    case FadeState::Completed: return "completed";
    case FadeState::Cancelled: return "cancelled";
  }
  return "unknown";
}

FadeScheduler::FadeScheduler(SetColorFn issue, Options opts, const Logger& log)
  : issue_(std::move(issue)), opts_(opts), log_(log) {}

uint16_t FadeScheduler::step_count(uint32_t duration_ms) const {
  const uint32_t cap = std::max<uint32_t>(1, opts_.max_steps);
  if (duration_ms == 0 || opts_.step_ms == 0) return duration_ms == 0 ? 1 : static_cast<uint16_t>(cap);
  uint32_t n = (duration_ms + opts_.step_ms - 1) / opts_.step_ms;   // ceil
  return static_cast<uint16_t>(std::clamp<uint32_t>(n, 1, cap));
}

// ---------------------------------------------------------------------------
// start()
// PRE: from = the device's current color, to = requested target.
// POLICY: one fade per device; an older one is cancelled before this one is
//         queued. Nothing is sent here, the first step goes out on advance().
// ---------------------------------------------------------------------------
Status FadeScheduler::start(const HardwareId& device, const ColorState& from, const ColorState& to,
                            uint32_t duration_ms, uint32_t timeout_ms, uint64_t now_ms,
                            StatusFn done, FadeTicket* ticket) {
  if (validate(to) != Status::Ok) return Status::ValidationError;

  cancel_device(device);
  if (tasks_.full()) return Status::Busy;

  FadeTask t;
  t.id          = next_id_++;
  if (next_id_ == 0) next_id_ = 1;
  t.device      = device;
  t.from        = from;
  t.to          = to;
  t.start_ms    = now_ms;
  t.steps       = step_count(duration_ms);
  t.interval_ms = duration_ms / t.steps;
  t.timeout_ms  = timeout_ms;
  t.done        = std::move(done);
  if (ticket) ticket->id = t.id;
  tasks_.push_back(std::move(t));

  log_.debug("fade_start", "device=" + device.to_string() +
                           " steps=" + std::to_string(tasks_.back().steps) +
                           " duration_ms=" + std::to_string(duration_ms));
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// advance()
// POLICY: at most one set_color per task per call; if several steps are
//         overdue only the latest is sent. A final step that cannot even be
//         sent ends the fade with that status.
// ---------------------------------------------------------------------------
void FadeScheduler::advance(uint64_t now_ms) {
  std::vector<std::pair<StatusFn, Status>> finished;

  std::size_t i = 0;
  while (i < tasks_.size()) {
    FadeTask& t = tasks_[i];
    const uint64_t due = t.start_ms + static_cast<uint64_t>(t.interval_ms) * (t.next_step - 1);
    if (t.final_sent || now_ms < due) { ++i; continue; }

    uint16_t k = t.steps;
    if (t.interval_ms > 0) {
      uint64_t reached = 1 + (now_ms - t.start_ms) / t.interval_ms;
      k = static_cast<uint16_t>(std::min<uint64_t>(reached, t.steps));
    }
    k = std::max(k, t.next_step);
    t.next_step = static_cast<uint16_t>(k + 1);

    if (k == t.steps) {
      t.final_sent = true;
      const uint32_t id = t.id;
      Status st = issue_(t.device, t.to, t.interval_ms, t.timeout_ms,
                         [this, id](Status s) { on_final(id, s); });
      if (st != Status::Ok) {
        remember(id, FadeState::Completed);
        finished.emplace_back(std::move(t.done), st);
        tasks_.erase(tasks_.begin() + i);
        continue;
      }
    } else {
      const ColorState c = interpolate(t.from, t.to, static_cast<double>(k) / t.steps);
      const std::string dev = t.device.to_string();
      const Logger& log = log_;
      Status st = issue_(t.device, c, t.interval_ms, t.timeout_ms,
                         [&log, dev](Status s) {
                           if (s != Status::Ok)
                             log.warn("fade_step", "device=" + dev + " reason=" + to_string(s));
                         });
      if (st != Status::Ok) log_.warn("fade_step", "device=" + dev + " reason=" + to_string(st));
    }
    ++i;
  }

  for (auto& f : finished)
    if (f.first) f.first(f.second);
}

void FadeScheduler::on_final(uint32_t id, Status st) {
  for (std::size_t i = 0; i < tasks_.size(); ++i) {
    if (tasks_[i].id != id) continue;
    StatusFn done = std::move(tasks_[i].done);
    log_.debug("fade_end", "device=" + tasks_[i].device.to_string() + " status=" + to_string(st));
    tasks_.erase(tasks_.begin() + i);
    remember(id, FadeState::Completed);
    if (done) done(st);
    return;
  }
  // cancelled while the final step was in flight: nothing left to report
}

bool FadeScheduler::cancel_at(std::size_t index) {
  StatusFn done = std::move(tasks_[index].done);
  remember(tasks_[index].id, FadeState::Cancelled);
  tasks_.erase(tasks_.begin() + index);
  if (done) done(Status::Cancelled);
  return true;
}

bool FadeScheduler::cancel(const FadeTicket& ticket) {
  for (std::size_t i = 0; i < tasks_.size(); ++i)
    if (tasks_[i].id == ticket.id) return cancel_at(i);
  return false;
}

// A device has at most one claim or one task, never both.
bool FadeScheduler::cancel_device(const HardwareId& device) {
  for (std::size_t i = 0; i < claims_.size(); ++i) {
    if (claims_[i].device != device) continue;
    StatusFn done = std::move(claims_[i].done);
    remember(claims_[i].id, FadeState::Cancelled);
    claims_.erase(claims_.begin() + i);
    if (done) done(Status::Cancelled);
    return true;
  }
  for (std::size_t i = 0; i < tasks_.size(); ++i)
    if (tasks_[i].device == device) return cancel_at(i);
  return false;
}

// ---------------------------------------------------------------------------
// prepare() / launch()
// POLICY: a claim takes a fade id up front and cancels whatever the device
//         had, exactly as start() would. launch() reuses the claim's done.
// ---------------------------------------------------------------------------
uint32_t FadeScheduler::prepare(const HardwareId& device, StatusFn done) {
  cancel_device(device);
  if (claims_.full()) return 0;

  Claim c;
  c.id     = next_id_++;
  if (next_id_ == 0) next_id_ = 1;
  c.device = device;
  c.done   = std::move(done);
  const uint32_t id = c.id;
  claims_.push_back(std::move(c));
  return id;
}

bool FadeScheduler::take_claim(uint32_t id, Claim& out) {
  for (std::size_t i = 0; i < claims_.size(); ++i) {
    if (claims_[i].id != id) continue;
    out = std::move(claims_[i]);
    claims_.erase(claims_.begin() + i);
    return true;
  }
  return false;
}

bool FadeScheduler::launch(uint32_t claim, const ColorState& from, const ColorState& to,
                           uint32_t duration_ms, uint32_t timeout_ms, uint64_t now_ms,
                           FadeTicket* ticket) {
  Claim c;
  if (!take_claim(claim, c)) return false;
  StatusFn done = c.done;
  Status st = start(c.device, from, to, duration_ms, timeout_ms, now_ms, std::move(c.done), ticket);
  if (st != Status::Ok && done) done(st);
  return true;
}

void FadeScheduler::abandon(uint32_t claim, Status st) {
  Claim c;
  if (!take_claim(claim, c)) return;
  remember(c.id, FadeState::Completed);
  if (c.done) c.done(st);
}

void FadeScheduler::release(uint32_t claim) {
  Claim c;
  take_claim(claim, c);
}

FadeState FadeScheduler::state(const FadeTicket& ticket) const {
  for (const auto& t : tasks_)
    if (t.id == ticket.id) return FadeState::Running;
  for (const auto& h : history_)
    if (h.first == ticket.id) return h.second;
  return FadeState::Idle;
}

void FadeScheduler::remember(uint32_t id, FadeState s) {
  if (history_.full()) history_.pop_front();
  history_.push_back(std::make_pair(id, s));
}

bool FadeScheduler::next_deadline(uint64_t& out) const {
  bool any = false;
  for (const auto& t : tasks_) {
    if (t.final_sent) continue;
    uint64_t due = t.start_ms + static_cast<uint64_t>(t.interval_ms) * (t.next_step - 1);
    if (!any || due < out) out = due;
    any = true;
  }
  return any;
}

} // namespace lanlight
