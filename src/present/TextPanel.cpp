#include "present/TextPanel.h"

#include <cstring>

bool ConsolePanel::show(const char* line1, const char* line2) {
  char text[sizeof(_last)];
  snprintf(text, sizeof(text), "%s | %s", line1, line2);

  if (strcmp(text, _last) == 0) return true;
  memcpy(_last, text, sizeof(_last));

  if (fprintf(_out, "[LCD] %s\n", text) < 0) return false;
  fflush(_out);
  return true;
}
