#pragma once

#include <cstdint>

/*
  Rate

  Fixed-period scheduler on a millisecond clock.

  Two ways to use it:
  - ready(now_ms): polled gate, true once per period (display refresh)
  - start(now_ms) + remainingMs(now_ms): "sleep to cadence" for a loop that
    does variable work per period (control cycle)

  Safe across uint32_t rollover because of the signed subtraction trick.
*/

class Rate {
public:
  explicit Rate(uint32_t period_ms = 1000) { setPeriodMs(period_ms); }

  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  // Returns true when it's time to run. If true, it schedules the next tick.
  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms;      // run immediately on first call
      _initialized = true;
    }

    if ((int32_t)(now_ms - _next_ms) >= 0) {
      _next_ms = now_ms + _period_ms;
      return true;
    }
    return false;
  }

  // Marks the start of a period; the next deadline is now + period.
  void start(uint32_t now_ms) {
    _next_ms = now_ms + _period_ms;
    _initialized = true;
  }

  // Time left until the current period ends (0 if already overrun).
  uint32_t remainingMs(uint32_t now_ms) const {
    if (!_initialized) return 0;
    const int32_t left = (int32_t)(_next_ms - now_ms);
    return (left > 0) ? (uint32_t)left : 0;
  }

  // Forget the schedule so the next ready() fires immediately.
  void reset() { _initialized = false; }

  uint32_t periodMs() const { return _period_ms; }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  bool _initialized = false;
};
