#pragma once
/**
 * @page vs-config Virtual Screen Configuration (defaults + command line)
 * @file vscreen_config.hpp
 * @brief One settings struct, its defaults, the argv parser and validators.
 *
 * Overview
 * --------
 * Everything the tool can be told lives in VscreenConfig. main() fills it
 * with defaults, lets the command line overwrite fields, and only then hands
 * it to the session. Values are validated while parsing, so nothing past this
 * module ever sees an out-of-range width, a zero fps or an unknown mode.
 *
 * Rules
 * -----
 * - The MCU name is stored upper-cased (J-Link device names are matched that
 *   way).
 * - Interface and display names are trimmed and lower-cased before lookup,
 *   so " SWD " and "RGB565" are accepted.
 * - Numbers are decimal unless noted. Addresses and colors are hex, with or
 *   without a 0x prefix.
 * - On error the parser writes a one-line reason into the caller's buffer and
 *   returns CONFIG_ERROR. It never prints and never exits.
 *
 * Typical Usage
 * -------------
 * @code
 * VscreenConfig cfg;
 * vscreen_config_defaults(cfg);
 * char err[160];
 * switch (vscreen_config_parse(argc, argv, cfg, err, sizeof(err))) {
 *   case CONFIG_HELP:  vscreen_config_usage(stdout, argv[0]); return 0;
 *   case CONFIG_ERROR: fprintf(stderr, "%s\n", err);         return 2;
 *   case CONFIG_OK:    break;
 * }
 * @endcode
 */

#include "vscreen_log.hpp"
#include "vscreen_pixels.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>

/** Physical debug interface requested from the probe. */
enum DebugInterface : uint8_t {
  IFACE_SWD  = 0,
  IFACE_JTAG = 1
};

/** Which debug transport carries the memory reads. */
enum ProbeKind : uint8_t {
  PROBE_JLINK   = 0,
  PROBE_OPENOCD = 1
};

enum ConfigResult {
  CONFIG_OK,
  CONFIG_HELP,
  CONFIG_ERROR
};

// Defaults.
static constexpr int      VSCREEN_DEFAULT_WIDTH        = 128;
static constexpr int      VSCREEN_DEFAULT_HEIGHT       = 64;
static constexpr int      VSCREEN_DEFAULT_FPS          = 60;
static constexpr int      VSCREEN_DEFAULT_SCALE        = 2;
static constexpr uint32_t VSCREEN_DEFAULT_FG           = 0xFFFFFFFFu;
static constexpr uint32_t VSCREEN_DEFAULT_BG           = 0xFF000000u;
static constexpr uint32_t VSCREEN_DEFAULT_RTT_TIMEOUT  = 5000;       // ms
static constexpr uint32_t VSCREEN_DEFAULT_RTT_SEARCH   = 0x20000000u;
static constexpr uint32_t VSCREEN_DEFAULT_RTT_SPAN     = 0x10000u;
static constexpr uint32_t VSCREEN_DEFAULT_SPEED_KHZ    = 4000;
static constexpr uint16_t VSCREEN_DEFAULT_OPENOCD_PORT = 6666;       // TCL RPC
static constexpr uint16_t VSCREEN_DEFAULT_RTT_PORT     = 9090;
static constexpr int      VSCREEN_DEFAULT_RETRIES      = 5;

// Limits enforced by the parser.
static constexpr int VSCREEN_MAX_FPS     = 240;
static constexpr int VSCREEN_MAX_SCALE   = 16;
static constexpr int VSCREEN_MAX_RETRIES = 1000;
static constexpr int VSCREEN_MAX_RTT_CH  = 15;

struct VscreenConfig {
  char           mcu[64];            // upper-cased device name
  DebugInterface iface;
  ProbeKind      probe;
  DisplayMode    mode;
  int            width;
  int            height;
  int            fps;
  int            scale;

  bool           has_address;        // true => skip RTT discovery
  uint32_t       address;

  uint32_t       fg;                 // 0xAARRGGBB, mono modes only
  uint32_t       bg;

  int            rtt_channel;
  uint32_t       rtt_timeout_ms;     // 0 = wait forever
  uint32_t       rtt_search_addr;    // OpenOCD control block search range
  uint32_t       rtt_search_size;

  uint32_t       speed_khz;
  uint32_t       serial_no;          // J-Link serial, 0 = first found
  char           jlink_lib[256];
  char           openocd_host[128];
  uint16_t       openocd_port;
  uint16_t       rtt_port;

  int            retries;            // consecutive failed reads before giving up
  char           snapshot_path[256]; // non-empty => headless single frame
  char           snapshot_dir[256];  // where the S key saves; empty = cwd
  VsLogLevel     log_level;
};

/** @brief Reset every field to its documented default. */
void vscreen_config_defaults(VscreenConfig& cfg);

/**
 * @brief Parse argv into @p cfg (which should already hold defaults).
 *
 * @param err     Receives a one-line reason on CONFIG_ERROR.
 * @param err_len Size of @p err in bytes.
 * @return CONFIG_OK, CONFIG_HELP (-h seen) or CONFIG_ERROR.
 *
 * @note Resets getopt state, so it is safe to call more than once.
 */
ConfigResult vscreen_config_parse(int argc, char** argv, VscreenConfig& cfg,
                                  char* err, size_t err_len);

/** @brief Print usage text to @p out. */
void vscreen_config_usage(FILE* out, const char* prog);

/** @brief Frame size in bytes for the configured mode and geometry. */
size_t vscreen_config_frame_bytes(const VscreenConfig& cfg);

/** @brief Poll period in milliseconds derived from fps (at least 1). */
uint32_t vscreen_config_interval_ms(const VscreenConfig& cfg);

// Lower-level helpers, exposed for tests.

/** Parse "0x1234" or "1234" as a 32-bit hex value. Whole string must match. */
bool vscreen_parse_hex_u32(const char* s, uint32_t& out);

/** Parse a decimal integer in [lo, hi]. Whole string must match. */
bool vscreen_parse_int_range(const char* s, long lo, long hi, long& out);

/** Parse "RRGGBB" (optionally "#RRGGBB" or "0xRRGGBB") into opaque ARGB. */
bool vscreen_parse_color(const char* s, uint32_t& out);

/** Copy @p src into @p dst (size @p n), trimmed of whitespace, lower-cased. */
void vscreen_normalize_name(const char* src, char* dst, size_t n);
