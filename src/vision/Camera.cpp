#include "vision/Camera.h"

#include <cctype>
#include <cstdio>

#include "utils/Log.h"

static const char* TAG = "Camera";

// Guard against a corrupt header asking for a huge allocation
static constexpr int MAX_DIMENSION = 4096;

// Reads one unsigned header token, skipping whitespace and '#' comments.
static bool readHeaderInt(const std::vector<uint8_t>& b, size_t& pos, int& out) {
  while (pos < b.size()) {
    if (b[pos] == '#') {
      while (pos < b.size() && b[pos] != '\n') pos++;
    } else if (isspace(b[pos])) {
      pos++;
    } else {
      break;
    }
  }

  if (pos >= b.size() || !isdigit(b[pos])) return false;

  long v = 0;
  while (pos < b.size() && isdigit(b[pos])) {
    v = v * 10 + (b[pos] - '0');
    if (v > 65535) return false;
    pos++;
  }
  out = (int)v;
  return true;
}

bool PpmFileCamera::decodePpm(const std::vector<uint8_t>& bytes, Image& out) {
  if (bytes.size() < 2 || bytes[0] != 'P' || bytes[1] != '6') return false;

  size_t pos = 2;
  int w = 0, h = 0, maxval = 0;
  if (!readHeaderInt(bytes, pos, w) ||
      !readHeaderInt(bytes, pos, h) ||
      !readHeaderInt(bytes, pos, maxval)) {
    return false;
  }
  if (w <= 0 || h <= 0 || w > MAX_DIMENSION || h > MAX_DIMENSION) return false;
  if (maxval != 255) return false;

  // Exactly one whitespace byte separates the header from the raster
  if (pos >= bytes.size() || !isspace(bytes[pos])) return false;
  pos++;

  const size_t n = (size_t)w * h * 3;
  if (bytes.size() - pos < n) return false;

  out.width = w;
  out.height = h;
  out.channels = 3;
  out.data.assign(bytes.begin() + pos, bytes.begin() + pos + n);
  return true;
}

bool PpmFileCamera::capture(Image& out) {
  FILE* f = fopen(_path.c_str(), "rb");
  if (!f) {
    AMLAC_LOGD(TAG, "no frame at %s", _path.c_str());
    return false;
  }

  std::vector<uint8_t> bytes;
  uint8_t chunk[16384];
  size_t n;
  while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0) {
    bytes.insert(bytes.end(), chunk, chunk + n);
  }
  const bool read_err = ferror(f) != 0;
  fclose(f);

  if (read_err) {
    AMLAC_LOGW(TAG, "read error on %s", _path.c_str());
    return false;
  }

  if (!decodePpm(bytes, out)) {
    AMLAC_LOGW(TAG, "%s is not a P6/255 image", _path.c_str());
    return false;
  }
  return true;
}
