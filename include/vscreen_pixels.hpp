#pragma once
/**
 * @page vs-pixels Virtual Screen Pixel Decoding
 * @file vscreen_pixels.hpp
 * @brief Turn a raw framebuffer dump into 0xAARRGGBB pixels.
 *
 * Overview
 * --------
 * The target firmware keeps its display RAM somewhere in SRAM in whatever
 * layout its panel driver expects. This module knows a handful of those
 * layouts and converts a byte-for-byte copy of that RAM into a flat array of
 * 32-bit ARGB pixels, row-major, top-left first. The window and the snapshot
 * writer only ever see the ARGB array.
 *
 * Where This Fits
 * ---------------
 * - Bytes come from vscreen_probe_read() (probe module).
 * - Pixels go to vscreen_window_present() or vscreen_snapshot_write_ppm().
 * - No I/O here. Everything is pure and safe to unit test.
 *
 * Supported Layouts
 * -----------------
 * MODE_MONO (SSD1306 / SH1106 page layout)
 *   height/8 pages, each `width` bytes. One byte is a vertical strip of 8
 *   pixels, LSB on top:
 *
 *        byte vram[page * width + x]
 *        bit 0 -> (x, page*8 + 0)
 *        bit 7 -> (x, page*8 + 7)
 *
 * MODE_MONO_HLSB (Adafruit GFXcanvas1 / ST7920 style)
 *   One row after another, (width+7)/8 bytes per row, MSB is leftmost.
 *
 * MODE_RGB565 / MODE_RGB565_BE
 *   16 bits per pixel, row-major. _BE swaps the two bytes of every word, which
 *   is how most SPI TFT drivers keep their buffers so DMA can push them raw.
 *   Channels expand by plain shifts (R5<<3, G6<<2, B5<<3).
 *
 * MODE_RGB888
 *   3 bytes per pixel in R, G, B order.
 *
 * MODE_GRAY8
 *   1 byte per pixel, 0 = black, 255 = white.
 *
 * Failure Modes
 * -------------
 * - Invalid geometry or a short buffer: vscreen_decode_frame() returns false
 *   and leaves the output untouched.
 */

#include <cstddef>
#include <cstdint>

enum DisplayMode : uint8_t {
  MODE_MONO      = 0,
  MODE_MONO_HLSB = 1,
  MODE_RGB565    = 2,
  MODE_RGB565_BE = 3,
  MODE_RGB888    = 4,
  MODE_GRAY8     = 5,
  MODE_COUNT
};

/** Largest width or height accepted anywhere in the tool. */
static constexpr int VSCREEN_MAX_DIM = 4096;

/**
 * @brief Look up a mode by its command-line name ("mono", "rgb565", ...).
 * @return true and sets @p out on a match; false for unknown names.
 */
bool vscreen_mode_from_name(const char* name, DisplayMode& out);

/** @brief Command-line name of @p mode, or "?" for out-of-range values. */
const char* vscreen_mode_name(DisplayMode mode);

/**
 * @brief Check that @p w x @p h is drawable in @p mode.
 *
 * Both dimensions must be 1..VSCREEN_MAX_DIM. MODE_MONO additionally needs
 * the height to be a whole number of 8-pixel pages.
 */
bool vscreen_geometry_ok(DisplayMode mode, int w, int h);

/**
 * @brief Bytes of target memory one frame occupies.
 * @return 0 if the geometry is not valid for the mode.
 */
size_t vscreen_frame_bytes(DisplayMode mode, int w, int h);

/** @brief Expand one RGB565 word to opaque 0xAARRGGBB. */
uint32_t vscreen_rgb565_to_argb(uint16_t v);

/**
 * @brief Decode a raw dump into @p out (w*h pixels, row-major).
 *
 * @param mode    Framebuffer layout.
 * @param raw     Bytes read from the target.
 * @param raw_len Number of valid bytes in @p raw. Extra bytes are ignored.
 * @param w, h    Display geometry in pixels.
 * @param fg, bg  Lit / unlit colors for the monochrome modes (ignored otherwise).
 * @param out     Destination, at least w*h entries.
 * @return false if the geometry is invalid or @p raw_len is short.
 */
bool vscreen_decode_frame(DisplayMode mode, const uint8_t* raw, size_t raw_len,
                          int w, int h, uint32_t fg, uint32_t bg, uint32_t* out);
