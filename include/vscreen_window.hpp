#pragma once
/**
 * @page vs-window Virtual Screen Window (SDL2)
 * @file vscreen_window.hpp
 * @brief Minimal window that shows a device-sized ARGB frame, scaled up.
 *
 * Overview
 * --------
 * This header declares a tiny, reliable presentation shim. It exists for one
 * reason: keep the emulated panel simple so the rest of the tool never talks
 * directly to SDL. One window, one streaming texture, one present call. No
 * widgets, no overlays, no theme engine. Draw and push.
 *
 * Where This Fits
 * ---------------
 * - Transport lives elsewhere (vscreen_probe.*).
 * - The read/render loop lives elsewhere (vscreen_session.*). It reaches this
 *   module only through the DisplayOps table from vscreen_window_ops().
 * - This module is presentation only. It should be safe to ignore or replace.
 *
 * Philosophy
 * ----------
 * - The window has the fixed size width*scale x height*scale, like the panel
 *   it stands in for. It is not resizable.
 * - Scaling is nearest-neighbor so single pixels stay crisp squares.
 * - All functions are safe to call after a failed begin(); they no-op.
 *
 * Keys
 * ----
 * - S        request a snapshot (the session saves vscreen-NNN.ppm)
 * - Esc / Q  close, same as the window's close button
 *
 * Dependencies
 * ------------
 * - SDL2 (video subsystem only).
 *
 * Failure Modes
 * -------------
 * - No display server (headless box, SSH without X forwarding):
 *   vscreen_window_begin() returns false with the SDL reason in the log.
 *   Use --snapshot there instead.
 */

#include "vscreen_session.hpp"

#include <cstdint>

/**
 * @brief Open the window and create its texture.
 *
 * @param title Window caption.
 * @param w, h  Source image size in pixels.
 * @param scale Window pixels per source pixel.
 * @return true if the window is up and presents will have effect.
 */
bool vscreen_window_begin(const char* title, int w, int h, int scale);

/**
 * @brief Upload a full frame (w*h ARGB pixels from begin()) and show it.
 * @details No-op when begin() has not succeeded.
 */
void vscreen_window_present(const uint32_t* argb);

/**
 * @brief Pump window events.
 * @param snapshot Set to true if S was pressed since the last call.
 * @return false once the user closed the window (or pressed Esc/Q).
 */
bool vscreen_window_poll(bool& snapshot);

/** @brief Destroy the window. Safe to call repeatedly. */
void vscreen_window_end();

/** @brief DisplayOps table bound to the functions above. */
const DisplayOps* vscreen_window_ops();
