#include "utils/Log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace {

std::atomic<uint8_t> g_level(static_cast<uint8_t>(LogLevel::INFO));

// Serializes lines from the inference worker and the loop
std::mutex g_write_mutex;

const std::chrono::steady_clock::time_point g_start = std::chrono::steady_clock::now();

char levelChar(LogLevel level) {
  switch (level) {
    case LogLevel::ERROR: return 'E';
    case LogLevel::WARN:  return 'W';
    case LogLevel::INFO:  return 'I';
    case LogLevel::DEBUG: return 'D';
    default:              return '?';
  }
}

}  // namespace

namespace logging {

void setLevel(LogLevel level) {
  g_level.store(static_cast<uint8_t>(level));
}

LogLevel level() {
  return static_cast<LogLevel>(g_level.load());
}

bool parseLevel(const char* s, LogLevel& out) {
  if (!s) return false;
  if (strcmp(s, "none") == 0)  { out = LogLevel::NONE;  return true; }
  if (strcmp(s, "error") == 0) { out = LogLevel::ERROR; return true; }
  if (strcmp(s, "warn") == 0)  { out = LogLevel::WARN;  return true; }
  if (strcmp(s, "info") == 0)  { out = LogLevel::INFO;  return true; }
  if (strcmp(s, "debug") == 0) { out = LogLevel::DEBUG; return true; }
  return false;
}

void write(LogLevel level, const char* tag, const char* fmt, ...) {
  char msg[256];

  va_list args;
  va_start(args, fmt);
  vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  const auto elapsed = std::chrono::steady_clock::now() - g_start;
  const long long ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

  std::lock_guard<std::mutex> lock(g_write_mutex);
  fprintf(stderr, "%c (%lld) %s: %s\n", levelChar(level), ms, tag ? tag : "-", msg);
  fflush(stderr);
}

}  // namespace logging
