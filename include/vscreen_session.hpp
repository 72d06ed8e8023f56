#pragma once
/**
 * @page vs-session Virtual Screen Session (read/render loop)
 * @file vscreen_session.hpp
 * @brief Ties probe, discovery, decoding and output into one run.
 *
 * Overview
 * --------
 * This module is the operational core. It owns the frame buffers, drives the
 * probe, and hands decoded frames to a display. Think of it as the control
 * desk between transport (vscreen_probe) and presentation (vscreen_window or
 * a snapshot file). It keeps the loop readable and the borders clean.
 *
 * Run Sequence
 * ------------
 * 1) Open the probe session (J-Link or OpenOCD, per cfg.probe).
 * 2) Resolve the framebuffer address: --address, else RTT discovery.
 *    Logged as "D-VRAM (display data buffer) reported at: 0x...".
 * 3a) Headless (cfg.snapshot_path set, or no display given): read one frame,
 *     retrying up to cfg.retries times, write it as PPM, stop.
 * 3b) Windowed: every 1000/fps ms read, decode, present. A failed read keeps
 *     the previous image and is retried on the next tick. More than
 *     cfg.retries failures in a row ends the run with an error.
 * 4) Close the display and the probe on every exit path.
 *
 * Snapshots
 * ---------
 * In windowed mode the S key saves the frame on screen (the last good one
 * if the current read failed) as <cfg.snapshot_dir>/vscreen-NNN.ppm. Numbers
 * start at 000 each run and skip files that already exist.
 *
 * Display Seam
 * ------------
 * The session never includes SDL. It talks to a DisplayOps table, filled by
 * vscreen_window.cpp in the real binary and by a recorder in tests. Passing
 * nullptr forces headless mode.
 *
 * Exit Codes
 * ----------
 *   VSCREEN_EXIT_OK      clean finish (window closed, Ctrl-C, snapshot written)
 *   VSCREEN_EXIT_FAILURE probe, discovery, read or write failure
 *   VSCREEN_EXIT_USAGE   bad command line (returned by main, not the session)
 */

#include "vscreen_config.hpp"

#include <cstdint>

enum VscreenExit {
  VSCREEN_EXIT_OK      = 0,
  VSCREEN_EXIT_FAILURE = 1,
  VSCREEN_EXIT_USAGE   = 2
};

/**
 * @struct DisplayOps
 * @brief Presentation backend used by the windowed loop.
 */
struct DisplayOps {
  /** Create the output surface for a w x h image shown at `scale`. */
  bool (*begin)(const char* title, int w, int h, int scale);

  /** Show one full frame of w*h ARGB pixels. */
  void (*present)(const uint32_t* argb);

  /**
   * Pump input. Returns false once the user wants out. Sets @p snapshot
   * when a snapshot was requested since the last poll.
   */
  bool (*poll)(bool& snapshot);

  /** Tear the surface down. Safe after a failed begin(). */
  void (*end)();
};

/** Window title used for the emulated screen. */
static constexpr const char* VSCREEN_WINDOW_TITLE = "Virtual Screen";

/**
 * @brief Run one session to completion.
 * @param display Presentation backend, or nullptr for headless.
 * @return A VscreenExit value.
 */
int vscreen_session_run(const VscreenConfig& cfg, const DisplayOps* display);

/**
 * @brief Ask a running session to finish after the current step.
 *
 * Async-signal-safe; main() calls it from its SIGINT/SIGTERM handler.
 */
void vscreen_session_request_stop();

/** @brief Frames presented by the last (or current) run. */
uint32_t vscreen_session_frames();
