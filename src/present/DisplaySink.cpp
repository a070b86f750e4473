#include "present/DisplaySink.h"

#include "utils/Log.h"

static const char* TAG = "Display";

DisplaySink::DisplaySink(TextPanel& panel, const Clock& clock, const DisplayParams& params)
: _panel(panel),
  _clock(clock),
  _alert_hold_ms(params.alert_hold_ms),
  _refresh(params.refresh_ms)
{
}

bool DisplaySink::alertHolding() const {
  if (!_has_shown) return false;
  if (displayPriority(_shown.kind) != DisplayPriority::ALERT) return false;
  return (uint32_t)(_clock.nowMs() - _shown_ms) < _alert_hold_ms;
}

void DisplaySink::render_(const DisplayEvent& e) {
  if (!_panel.show(e.line1, e.line2)) {
    _panel_errors++;
    AMLAC_LOGW(TAG, "panel write failed (%lu)", (unsigned long)_panel_errors);
  }

  _shown = e;
  _has_shown = true;
  _shown_ms = _clock.nowMs();

  AMLAC_LOGD(TAG, "%s: %s / %s", displayKindName(e.kind), e.line1, e.line2);
}

void DisplaySink::post(const DisplayEvent& e) {
  const DisplayPriority p = displayPriority(e.kind);

  if (p == DisplayPriority::ALERT) {
    _has_pending = false;
    render_(e);
    return;
  }

  if (p == DisplayPriority::STATUS && !alertHolding()) {
    _has_pending = false;
    render_(e);
    return;
  }

  _pending = e;
  _has_pending = true;
}

void DisplaySink::tick() {
  if (!_has_pending) return;
  if (alertHolding()) return;

  // Status pages waited only for the alert; routine pages also wait for the cadence
  if (displayPriority(_pending.kind) == DisplayPriority::ROUTINE &&
      !_refresh.ready(_clock.nowMs())) {
    return;
  }

  _has_pending = false;
  render_(_pending);
}
