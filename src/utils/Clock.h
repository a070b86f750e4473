#pragma once

#include <cstdint>
#include <ctime>

/*
  Clock

  Time source for everything that schedules or timestamps.
  The controller uses SteadyClock; tests substitute a manual clock whose
  sleepMs() advances time instantly.
*/

class Clock {
public:
  virtual ~Clock() = default;

  // Monotonic milliseconds (wraps like millis()).
  virtual uint32_t nowMs() const = 0;

  // Wall-clock seconds, for timestamps written to the collection log.
  virtual std::time_t wallTime() const = 0;

  virtual void sleepMs(uint32_t ms) = 0;
};

class SteadyClock : public Clock {
public:
  SteadyClock();

  uint32_t nowMs() const override;
  std::time_t wallTime() const override;
  void sleepMs(uint32_t ms) override;

private:
  int64_t _origin_ms;
};
