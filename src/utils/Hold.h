#pragma once

#include <atomic>
#include <cstdint>

#include "utils/Clock.h"

/*
  CancelToken

  Operator-interrupt flag. request() is async-signal-safe (lock-free atomic
  store), so the SIGINT/SIGTERM handler may call it directly.
*/

class CancelToken {
public:
  void request() { _cancelled.store(true); }
  bool requested() const { return _cancelled.load(); }
  void clear() { _cancelled.store(false); }

private:
  std::atomic<bool> _cancelled{false};
};

/*
  holdFor

  Scheduled, cancellable delay: sleeps in slices of slice_ms and checks the
  token at every slice boundary. No other I/O happens while holding.

  Returns:
    - true if the full duration elapsed
    - false if cancellation was observed (possibly before sleeping at all)
*/
bool holdFor(Clock& clock, const CancelToken& cancel, uint32_t duration_ms, uint32_t slice_ms);
