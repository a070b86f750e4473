#include "utils/Hold.h"

bool holdFor(Clock& clock, const CancelToken& cancel, uint32_t duration_ms, uint32_t slice_ms) {
  if (slice_ms == 0) slice_ms = 1;

  const uint32_t start_ms = clock.nowMs();

  while (true) {
    if (cancel.requested()) return false;

    const uint32_t elapsed = clock.nowMs() - start_ms;
    if (elapsed >= duration_ms) return true;

    const uint32_t left = duration_ms - elapsed;
    clock.sleepMs(left < slice_ms ? left : slice_ms);
  }
}
