#pragma once

#include <cstdint>

#include "config/RobotConfig.h"
#include "present/DisplayEvent.h"
#include "present/TextPanel.h"
#include "utils/Clock.h"
#include "utils/Rate.h"

/*
===============================================================================
  DisplaySink.h
===============================================================================

  PURPOSE
  -------
  Prioritizing front for the TextPanel.

    post(e)  offer an event (see DisplayEvent.h for the priority rules)
    tick()   render the pending routine page when the refresh Rate fires and
             no alert is holding the panel

  Only the newest pending page is kept; older ones are dropped.
===============================================================================
*/

class DisplaySink {
public:
  DisplaySink(TextPanel& panel, const Clock& clock, const DisplayParams& params);

  void post(const DisplayEvent& e);
  void tick();

  bool hasShown() const { return _has_shown; }
  const DisplayEvent& shown() const { return _shown; }

  bool hasPending() const { return _has_pending; }

  // True while an alert is inside its hold window
  bool alertHolding() const;

private:
  void render_(const DisplayEvent& e);

  TextPanel& _panel;
  const Clock& _clock;
  uint32_t _alert_hold_ms;

  Rate _refresh;

  DisplayEvent _shown;
  bool _has_shown = false;
  uint32_t _shown_ms = 0;

  DisplayEvent _pending;
  bool _has_pending = false;

  uint32_t _panel_errors = 0;
};
