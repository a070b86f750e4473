#include "utils/Clock.h"

#include <chrono>
#include <thread>

static int64_t steadyMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

SteadyClock::SteadyClock()
: _origin_ms(steadyMs())
{
}

uint32_t SteadyClock::nowMs() const {
  return (uint32_t)(steadyMs() - _origin_ms);
}

std::time_t SteadyClock::wallTime() const {
  return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

void SteadyClock::sleepMs(uint32_t ms) {
  if (ms == 0) return;
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
