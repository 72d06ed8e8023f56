/**
 * @page vs-main Virtual Screen Entry
 * @file main.cpp
 * @brief Minimal entry point: parse options, wire signals, run one session.
 *
 * Purpose
 * -------
 * This file is intentionally boring. It turns argv into a VscreenConfig,
 * installs Ctrl-C handling, and hands control to the session with the SDL
 * window as its display. All heavy lifting lives in modules that can be
 * tested or swapped without touching main().
 *
 * What This File Does
 * -------------------
 * 1) Fills defaults and parses the command line (vscreen_config.*).
 * 2) Sets the log level (-v / -q).
 * 3) Routes SIGINT/SIGTERM to vscreen_session_request_stop() so the probe
 *    is always closed cleanly.
 * 4) Runs the session (vscreen_session.*) with the window backend
 *    (vscreen_window.*), or headless when --snapshot is given.
 *
 * Bench Setup
 * -----------
 * Firmware side, once the display buffer exists:
 *
 *     SEGGER_RTT_printf(0, "D-VRAM: 0x%08X\n", (unsigned)vram);
 *
 * Host side:
 *
 *     vscreen STM32F103C8                         # 128x64 mono over J-Link SWD
 *     vscreen STM32F411CE -d rgb565 --width 160 --height 128 -s 3
 *     vscreen nrf52840_xxaa -p openocd -a 0x20004000 --snapshot frame.ppm
 *
 * Exit Codes
 * ----------
 *   0 ok, 1 runtime failure, 2 usage error.
 */

#include "vscreen_config.hpp"    // vscreen_config_defaults, vscreen_config_parse, vscreen_config_usage
#include "vscreen_log.hpp"       // vscreen_log_set_level, VS_LOGW
#include "vscreen_session.hpp"   // vscreen_session_run, vscreen_session_request_stop
#include "vscreen_window.hpp"    // vscreen_window_ops

#include <csignal>
#include <cstdio>
#include <cstring>

static void on_signal(int) {
  vscreen_session_request_stop();
}

int main(int argc, char** argv) {
  // 1) Options
  VscreenConfig cfg;
  vscreen_config_defaults(cfg);
  char err[192] = "";
  switch (vscreen_config_parse(argc, argv, cfg, err, sizeof(err))) {
    case CONFIG_HELP:
      vscreen_config_usage(stdout, argv[0]);
      return VSCREEN_EXIT_OK;
    case CONFIG_ERROR:
      fprintf(stderr, "%s: %s\n", argv[0], err);
      fprintf(stderr, "Try '%s --help' for more information.\n", argv[0]);
      return VSCREEN_EXIT_USAGE;
    case CONFIG_OK:
      break;
  }

  // 2) Logging
  vscreen_log_set_level(cfg.log_level);

  // 3) Signals
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  if (sigaction(SIGINT, &sa, nullptr) != 0 || sigaction(SIGTERM, &sa, nullptr) != 0) {
    VS_LOGW("main", "signal handlers not installed; Ctrl-C will not close the probe cleanly");
  }

  // 4) Session (headless when --snapshot is set; the session checks)
  return vscreen_session_run(cfg, vscreen_window_ops());
}
