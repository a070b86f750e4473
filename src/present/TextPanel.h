#pragma once

#include <cstdio>

/*
  TextPanel

  Two-line character display. show() replaces both lines.

  ConsolePanel prints to a stdio stream ("[LCD] line1 | line2"), and only
  when the content changes, so a headless run keeps a readable trace.
*/

class TextPanel {
public:
  virtual ~TextPanel() = default;
  virtual bool show(const char* line1, const char* line2) = 0;
};

class ConsolePanel : public TextPanel {
public:
  explicit ConsolePanel(FILE* out = stdout) : _out(out) {}

  bool show(const char* line1, const char* line2) override;

private:
  FILE* _out;
  char _last[64] = {0};
};
