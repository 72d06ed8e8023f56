/**
 * @file vscreen_pixels.cpp
 * @brief Implementation for vscreen_pixels.hpp (layout tables and decoders).
 *
 * Notes:
 * - Layout descriptions live in the header. This file is the "how".
 * - Every decoder trusts that vscreen_decode_frame() already checked the
 *   buffer length, so the inner loops carry no bounds checks.
 */

#include "vscreen_pixels.hpp"

#include <cstring>

namespace {

// Index == DisplayMode value.
const char* const kModeNames[MODE_COUNT] = {
  "mono",
  "mono_hlsb",
  "rgb565",
  "rgb565_be",
  "rgb888",
  "gray8",
};

inline uint32_t argb(uint8_t r, uint8_t g, uint8_t b) {
  return 0xFF000000u | (static_cast<uint32_t>(r) << 16) |
         (static_cast<uint32_t>(g) << 8) | static_cast<uint32_t>(b);
}

/*------------------------------------------------------------------------------
  decode_mono_pages
  -----------------
  SSD1306 page layout. Each byte is a vertical run of 8 pixels.

  Phases:
  1) Walk pages top to bottom, columns left to right.
  2) Fan each byte out into 8 rows of the current page.
------------------------------------------------------------------------------*/
void decode_mono_pages(const uint8_t* raw, int w, int h, uint32_t fg, uint32_t bg, uint32_t* out) {
  const int pages = h / 8;
  for (int page = 0; page < pages; ++page) {
    for (int x = 0; x < w; ++x) {
      const uint8_t byte = raw[page * w + x];
      for (int bit = 0; bit < 8; ++bit) {
        const int y = page * 8 + bit;
        out[y * w + x] = (byte & (1u << bit)) ? fg : bg;
      }
    }
  }
}

// Row-major 1bpp, MSB leftmost, rows padded to whole bytes.
void decode_mono_hlsb(const uint8_t* raw, int w, int h, uint32_t fg, uint32_t bg, uint32_t* out) {
  const int stride = (w + 7) / 8;
  for (int y = 0; y < h; ++y) {
    const uint8_t* row = raw + y * stride;
    for (int x = 0; x < w; ++x) {
      const bool lit = row[x >> 3] & (0x80u >> (x & 7));
      out[y * w + x] = lit ? fg : bg;
    }
  }
}

// 16bpp. `swap` selects big-endian words (byte-swapped relative to the core).
void decode_rgb565(const uint8_t* raw, int w, int h, bool swap, uint32_t* out) {
  const size_t n = static_cast<size_t>(w) * static_cast<size_t>(h);
  for (size_t i = 0; i < n; ++i) {
    const uint8_t lo = raw[2 * i];
    const uint8_t hi = raw[2 * i + 1];
    const uint16_t v = swap ? static_cast<uint16_t>((lo << 8) | hi)
                            : static_cast<uint16_t>((hi << 8) | lo);
    out[i] = vscreen_rgb565_to_argb(v);
  }
}

void decode_rgb888(const uint8_t* raw, int w, int h, uint32_t* out) {
  const size_t n = static_cast<size_t>(w) * static_cast<size_t>(h);
  for (size_t i = 0; i < n; ++i) {
    out[i] = argb(raw[3 * i], raw[3 * i + 1], raw[3 * i + 2]);
  }
}

void decode_gray8(const uint8_t* raw, int w, int h, uint32_t* out) {
  const size_t n = static_cast<size_t>(w) * static_cast<size_t>(h);
  for (size_t i = 0; i < n; ++i) {
    out[i] = argb(raw[i], raw[i], raw[i]);
  }
}

} // namespace

bool vscreen_mode_from_name(const char* name, DisplayMode& out) {
  if (!name) return false;
  for (int m = 0; m < MODE_COUNT; ++m) {
    if (strcmp(name, kModeNames[m]) == 0) {
      out = static_cast<DisplayMode>(m);
      return true;
    }
  }
  return false;
}

const char* vscreen_mode_name(DisplayMode mode) {
  return (mode < MODE_COUNT) ? kModeNames[mode] : "?";
}

bool vscreen_geometry_ok(DisplayMode mode, int w, int h) {
  if (mode >= MODE_COUNT) return false;
  if (w < 1 || w > VSCREEN_MAX_DIM) return false;
  if (h < 1 || h > VSCREEN_MAX_DIM) return false;
  if (mode == MODE_MONO && (h % 8) != 0) return false;   // whole pages only
  return true;
}

size_t vscreen_frame_bytes(DisplayMode mode, int w, int h) {
  if (!vscreen_geometry_ok(mode, w, h)) return 0;
  const size_t pixels = static_cast<size_t>(w) * static_cast<size_t>(h);
  switch (mode) {
    case MODE_MONO:      return pixels / 8;
    case MODE_MONO_HLSB: return static_cast<size_t>((w + 7) / 8) * static_cast<size_t>(h);
    case MODE_RGB565:
    case MODE_RGB565_BE: return pixels * 2;
    case MODE_RGB888:    return pixels * 3;
    case MODE_GRAY8:     return pixels;
    default:             return 0;
  }
}

uint32_t vscreen_rgb565_to_argb(uint16_t v) {
  const uint8_t r = static_cast<uint8_t>(((v >> 11) & 0x1F) << 3);
  const uint8_t g = static_cast<uint8_t>(((v >> 5) & 0x3F) << 2);
  const uint8_t b = static_cast<uint8_t>((v & 0x1F) << 3);
  return argb(r, g, b);
}

/*------------------------------------------------------------------------------
  vscreen_decode_frame
  --------------------
  Validate inputs once, then hand off to the per-layout decoder.

  Invariants:
  - Never read more than vscreen_frame_bytes() from raw.
  - Never write more than w*h pixels to out.
  - On failure, out is untouched.
------------------------------------------------------------------------------*/
bool vscreen_decode_frame(DisplayMode mode, const uint8_t* raw, size_t raw_len,
                          int w, int h, uint32_t fg, uint32_t bg, uint32_t* out) {
  if (!raw || !out) return false;
  const size_t need = vscreen_frame_bytes(mode, w, h);
  if (need == 0 || raw_len < need) return false;

  switch (mode) {
    case MODE_MONO:      decode_mono_pages(raw, w, h, fg, bg, out); break;
    case MODE_MONO_HLSB: decode_mono_hlsb(raw, w, h, fg, bg, out);  break;
    case MODE_RGB565:    decode_rgb565(raw, w, h, false, out);      break;
    case MODE_RGB565_BE: decode_rgb565(raw, w, h, true, out);       break;
    case MODE_RGB888:    decode_rgb888(raw, w, h, out);             break;
    case MODE_GRAY8:     decode_gray8(raw, w, h, out);              break;
    default:             return false;
  }
  return true;
}
