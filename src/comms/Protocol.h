#pragma once

#include <cstddef>
#include <string>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the Controller <-> Motor board wire protocol.

  Wire format:
    - Newline-delimited JSON (one object per line)
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Controller -> Board)
=============================================================================*/

// Returns one command JSON line (includes trailing '\n')
std::string encodeCommandLine(const CommandFrame& cmd);

const char* collectorModeName(CollectorMode mode);


/*=============================================================================
  DECODE (Board -> Controller)
=============================================================================*/

/*
  Attempts to parse one telemetry JSON line.

  Returns:
    - true if decoded into out (and out.valid will be true)
    - false if not a valid telemetry frame or parse failed
*/
bool decodeTelemetryLine(const char* line, TelemetryFrame& out);

}  // namespace protocol
