// vscreen_config.cpp - implementation for vscreen_config.hpp
// See vscreen_config.hpp for the option table and usage patterns.

#include "vscreen_config.hpp"

#include <getopt.h>             // getopt_long (GNU, permutes argv so <mcu> can go anywhere)
#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdlib>
#include <cstring>

// ============================================================================
// Small helpers
// ============================================================================

// set_err() - printf into the caller's error buffer, if they gave us one.
static void set_err(char* err, size_t err_len, const char* fmt, ...) {
  if (!err || err_len == 0) return;
  va_list args;
  va_start(args, fmt);
  vsnprintf(err, err_len, fmt, args);
  va_end(args);
}

// copy_bounded() - strncpy that always terminates.
static void copy_bounded(char* dst, size_t n, const char* src) {
  if (n == 0) return;
  strncpy(dst, src ? src : "", n - 1);
  dst[n - 1] = '\0';
}

void vscreen_normalize_name(const char* src, char* dst, size_t n) {
  if (!dst || n == 0) return;
  dst[0] = '\0';
  if (!src) return;

  while (*src && isspace(static_cast<unsigned char>(*src))) ++src;   // leading
  size_t len = strlen(src);
  while (len > 0 && isspace(static_cast<unsigned char>(src[len - 1]))) --len;  // trailing
  if (len >= n) len = n - 1;

  for (size_t i = 0; i < len; ++i) {
    dst[i] = static_cast<char>(tolower(static_cast<unsigned char>(src[i])));
  }
  dst[len] = '\0';
}

bool vscreen_parse_hex_u32(const char* s, uint32_t& out) {
  if (!s) return false;
  while (isspace(static_cast<unsigned char>(*s))) ++s;
  if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s += 2;

  // Only hex digits, then optional trailing blanks. strtoull alone would
  // take a second "0x", a sign or inner spaces.
  const char* end = s;
  while (isxdigit(static_cast<unsigned char>(*end))) ++end;
  if (end == s) return false;                 // also rejects "" and "-1"
  const char* tail = end;
  while (isspace(static_cast<unsigned char>(*tail))) ++tail;
  if (*tail != '\0') return false;
  if (end - s > 8) {
    while (s < end && *s == '0') ++s;         // leading zeros do not count
    if (end - s > 8) return false;
  }

  uint32_t v = 0;
  for (const char* p = s; p < end; ++p) {
    const int c = tolower(static_cast<unsigned char>(*p));
    v = (v << 4) | static_cast<uint32_t>(isdigit(c) ? c - '0' : c - 'a' + 10);
  }
  out = v;
  return true;
}

bool vscreen_parse_int_range(const char* s, long lo, long hi, long& out) {
  if (!s || !*s) return false;
  errno = 0;
  char* end = nullptr;
  long v = strtol(s, &end, 10);
  if (errno != 0 || !end || *end != '\0') return false;
  if (v < lo || v > hi) return false;
  out = v;
  return true;
}

bool vscreen_parse_color(const char* s, uint32_t& out) {
  if (!s) return false;
  if (*s == '#') ++s;
  const char* digits = s;
  if (digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) digits += 2;
  for (int i = 0; i < 6; ++i) {               // exactly RRGGBB
    if (!isxdigit(static_cast<unsigned char>(digits[i]))) return false;
  }
  if (digits[6] != '\0') return false;
  uint32_t rgb = 0;
  if (!vscreen_parse_hex_u32(digits, rgb)) return false;
  out = 0xFF000000u | rgb;
  return true;
}

/*------------------------------------------------------------------------------
  split_host_port
  ---------------
  Accepts "host", "host:port", "[v6addr]" and "[v6addr]:port". The port keeps
  its prior value when absent. A bare IPv6 literal is ambiguous ("::1" could
  end in a port) and is refused with a hint.
------------------------------------------------------------------------------*/
static bool split_host_port(const char* s, char* host, size_t host_len, uint16_t& port,
                            char* err, size_t err_len) {
  if (!s || !*s) {
    set_err(err, err_len, "--openocd: expected host[:port], got ''");
    return false;
  }

  const char* name = s;
  size_t n = 0;
  const char* rest = nullptr;       // text after the host part

  if (s[0] == '[') {
    const char* close = strchr(s, ']');
    if (!close || close == s + 1) {
      set_err(err, err_len, "--openocd: unterminated or empty [address] in '%s'", s);
      return false;
    }
    name = s + 1;
    n = static_cast<size_t>(close - name);
    rest = close + 1;
    if (*rest != '\0' && *rest != ':') {
      set_err(err, err_len, "--openocd: expected ':' after ']' in '%s'", s);
      return false;
    }
  } else {
    const char* colon = strchr(s, ':');
    if (colon && strchr(colon + 1, ':')) {
      set_err(err, err_len, "--openocd: IPv6 addresses need brackets, e.g. [::1]:6666 (got '%s')", s);
      return false;
    }
    n = colon ? static_cast<size_t>(colon - s) : strlen(s);
    rest = s + n;
  }

  if (n == 0 || n >= host_len) {
    set_err(err, err_len, "--openocd: host empty or too long in '%s'", s);
    return false;
  }

  long p = port;
  if (*rest == ':' && !vscreen_parse_int_range(rest + 1, 1, 65535, p)) {
    set_err(err, err_len, "--openocd: port must be 1..65535, got '%s'", rest + 1);
    return false;
  }

  memcpy(host, name, n);
  host[n] = '\0';
  port = static_cast<uint16_t>(p);
  return true;
}

// split_range() - "<hex addr>:<hex size>" for the RTT search window.
static bool split_range(const char* s, uint32_t& addr, uint32_t& size) {
  if (!s) return false;
  const char* colon = strchr(s, ':');
  if (!colon) return false;
  char head[32];
  size_t n = static_cast<size_t>(colon - s);
  if (n == 0 || n >= sizeof(head)) return false;
  memcpy(head, s, n);
  head[n] = '\0';
  uint32_t a = 0, z = 0;
  if (!vscreen_parse_hex_u32(head, a) || !vscreen_parse_hex_u32(colon + 1, z) || z == 0) return false;
  addr = a;
  size = z;
  return true;
}

// ============================================================================
// Defaults
// ============================================================================

void vscreen_config_defaults(VscreenConfig& cfg) {
  memset(&cfg, 0, sizeof(cfg));
  cfg.iface           = IFACE_SWD;
  cfg.probe           = PROBE_JLINK;
  cfg.mode            = MODE_MONO;
  cfg.width           = VSCREEN_DEFAULT_WIDTH;
  cfg.height          = VSCREEN_DEFAULT_HEIGHT;
  cfg.fps             = VSCREEN_DEFAULT_FPS;
  cfg.scale           = VSCREEN_DEFAULT_SCALE;
  cfg.has_address     = false;
  cfg.address         = 0;
  cfg.fg              = VSCREEN_DEFAULT_FG;
  cfg.bg              = VSCREEN_DEFAULT_BG;
  cfg.rtt_channel     = 0;
  cfg.rtt_timeout_ms  = VSCREEN_DEFAULT_RTT_TIMEOUT;
  cfg.rtt_search_addr = VSCREEN_DEFAULT_RTT_SEARCH;
  cfg.rtt_search_size = VSCREEN_DEFAULT_RTT_SPAN;
  cfg.speed_khz       = VSCREEN_DEFAULT_SPEED_KHZ;
  cfg.serial_no       = 0;
  copy_bounded(cfg.jlink_lib, sizeof(cfg.jlink_lib), "libjlinkarm.so");
  copy_bounded(cfg.openocd_host, sizeof(cfg.openocd_host), "127.0.0.1");
  cfg.openocd_port    = VSCREEN_DEFAULT_OPENOCD_PORT;
  cfg.rtt_port        = VSCREEN_DEFAULT_RTT_PORT;
  cfg.retries         = VSCREEN_DEFAULT_RETRIES;
  cfg.log_level       = VS_LOG_INFO;
}

// ============================================================================
// Parser
// ============================================================================

// Long-only options get ids above the printable range.
enum LongOpt {
  OPT_WIDTH = 256,
  OPT_HEIGHT,
  OPT_FG,
  OPT_BG,
  OPT_RTT_CHANNEL,
  OPT_RTT_TIMEOUT,
  OPT_RTT_SEARCH,
  OPT_SPEED,
  OPT_SERIAL,
  OPT_JLINK_LIB,
  OPT_OPENOCD,
  OPT_RTT_PORT,
  OPT_RETRIES,
  OPT_SNAPSHOT,
  OPT_SNAPSHOT_DIR
};

static const struct option kLongOpts[] = {
  {"interface",   required_argument, nullptr, 'i'},
  {"probe",       required_argument, nullptr, 'p'},
  {"display",     required_argument, nullptr, 'd'},
  {"fps",         required_argument, nullptr, 'f'},
  {"scale",       required_argument, nullptr, 's'},
  {"address",     required_argument, nullptr, 'a'},
  {"verbose",     no_argument,       nullptr, 'v'},
  {"quiet",       no_argument,       nullptr, 'q'},
  {"help",        no_argument,       nullptr, 'h'},
  {"width",       required_argument, nullptr, OPT_WIDTH},
  {"height",      required_argument, nullptr, OPT_HEIGHT},
  {"fg",          required_argument, nullptr, OPT_FG},
  {"bg",          required_argument, nullptr, OPT_BG},
  {"rtt-channel", required_argument, nullptr, OPT_RTT_CHANNEL},
  {"rtt-timeout", required_argument, nullptr, OPT_RTT_TIMEOUT},
  {"rtt-search",  required_argument, nullptr, OPT_RTT_SEARCH},
  {"speed",       required_argument, nullptr, OPT_SPEED},
  {"serial",      required_argument, nullptr, OPT_SERIAL},
  {"jlink-lib",   required_argument, nullptr, OPT_JLINK_LIB},
  {"openocd",     required_argument, nullptr, OPT_OPENOCD},
  {"rtt-port",    required_argument, nullptr, OPT_RTT_PORT},
  {"retries",     required_argument, nullptr, OPT_RETRIES},
  {"snapshot",    required_argument, nullptr, OPT_SNAPSHOT},
  {"snapshot-dir", required_argument, nullptr, OPT_SNAPSHOT_DIR},
  {nullptr, 0, nullptr, 0}
};

/*------------------------------------------------------------------------------
  vscreen_config_parse
  --------------------
  Phases:
  1) Reset getopt so repeated calls (tests) start from argv[1].
  2) Walk options; each one validates its own value before storing it.
  3) Take exactly one positional argument as the MCU name.
  4) Cross-field checks (mode vs geometry).

  Invariant: cfg fields are only written with values that passed validation.
------------------------------------------------------------------------------*/
ConfigResult vscreen_config_parse(int argc, char** argv, VscreenConfig& cfg,
                                  char* err, size_t err_len) {
  // Phase 1
  optind = 0;        // GNU: 0 forces a full re-initialization
  opterr = 0;        // we report errors ourselves (leading ':' in optstring)

  char name[32];
  long v = 0;
  uint32_t u = 0;

  // Phase 2
  for (;;) {
    int opt = getopt_long(argc, argv, ":i:p:d:f:s:a:vqh", kLongOpts, nullptr);
    if (opt == -1) break;

    switch (opt) {
      case 'h':
        return CONFIG_HELP;

      case 'v':
        cfg.log_level = VS_LOG_DEBUG;
        break;

      case 'q':
        cfg.log_level = VS_LOG_WARN;
        break;

      case 'i':
        vscreen_normalize_name(optarg, name, sizeof(name));
        if (strcmp(name, "swd") == 0)       cfg.iface = IFACE_SWD;
        else if (strcmp(name, "jtag") == 0) cfg.iface = IFACE_JTAG;
        else {
          set_err(err, err_len, "--interface: expected swd or jtag, got '%s'", optarg);
          return CONFIG_ERROR;
        }
        break;

      case 'p':
        vscreen_normalize_name(optarg, name, sizeof(name));
        if (strcmp(name, "jlink") == 0 || strcmp(name, "j-link") == 0) cfg.probe = PROBE_JLINK;
        else if (strcmp(name, "openocd") == 0)                          cfg.probe = PROBE_OPENOCD;
        else {
          set_err(err, err_len, "--probe: expected jlink or openocd, got '%s'", optarg);
          return CONFIG_ERROR;
        }
        break;

      case 'd': {
        DisplayMode m;
        vscreen_normalize_name(optarg, name, sizeof(name));
        if (!vscreen_mode_from_name(name, m)) {
          set_err(err, err_len,
                  "--display: unknown mode '%s' (mono, mono_hlsb, rgb565, rgb565_be, rgb888, gray8)",
                  optarg);
          return CONFIG_ERROR;
        }
        cfg.mode = m;
        break;
      }

      case OPT_WIDTH:
        if (!vscreen_parse_int_range(optarg, 1, VSCREEN_MAX_DIM, v)) {
          set_err(err, err_len, "--width: expected 1..%d, got '%s'", VSCREEN_MAX_DIM, optarg);
          return CONFIG_ERROR;
        }
        cfg.width = static_cast<int>(v);
        break;

      case OPT_HEIGHT:
        if (!vscreen_parse_int_range(optarg, 1, VSCREEN_MAX_DIM, v)) {
          set_err(err, err_len, "--height: expected 1..%d, got '%s'", VSCREEN_MAX_DIM, optarg);
          return CONFIG_ERROR;
        }
        cfg.height = static_cast<int>(v);
        break;

      case 'f':
        if (!vscreen_parse_int_range(optarg, 1, VSCREEN_MAX_FPS, v)) {
          set_err(err, err_len, "--fps: expected 1..%d, got '%s'", VSCREEN_MAX_FPS, optarg);
          return CONFIG_ERROR;
        }
        cfg.fps = static_cast<int>(v);
        break;

      case 's':
        if (!vscreen_parse_int_range(optarg, 1, VSCREEN_MAX_SCALE, v)) {
          set_err(err, err_len, "--scale: expected 1..%d, got '%s'", VSCREEN_MAX_SCALE, optarg);
          return CONFIG_ERROR;
        }
        cfg.scale = static_cast<int>(v);
        break;

      case 'a':
        if (!vscreen_parse_hex_u32(optarg, u)) {
          set_err(err, err_len, "--address: expected a hex address, got '%s'", optarg);
          return CONFIG_ERROR;
        }
        cfg.address = u;
        cfg.has_address = true;
        break;

      case OPT_FG:
      case OPT_BG:
        if (!vscreen_parse_color(optarg, u)) {
          set_err(err, err_len, "--%s: expected RRGGBB, got '%s'", opt == OPT_FG ? "fg" : "bg", optarg);
          return CONFIG_ERROR;
        }
        (opt == OPT_FG ? cfg.fg : cfg.bg) = u;
        break;

      case OPT_RTT_CHANNEL:
        if (!vscreen_parse_int_range(optarg, 0, VSCREEN_MAX_RTT_CH, v)) {
          set_err(err, err_len, "--rtt-channel: expected 0..%d, got '%s'", VSCREEN_MAX_RTT_CH, optarg);
          return CONFIG_ERROR;
        }
        cfg.rtt_channel = static_cast<int>(v);
        break;

      case OPT_RTT_TIMEOUT:
        if (!vscreen_parse_int_range(optarg, 0, 3600000L, v)) {
          set_err(err, err_len, "--rtt-timeout: expected 0..3600000 ms, got '%s'", optarg);
          return CONFIG_ERROR;
        }
        cfg.rtt_timeout_ms = static_cast<uint32_t>(v);
        break;

      case OPT_RTT_SEARCH:
        if (!split_range(optarg, cfg.rtt_search_addr, cfg.rtt_search_size)) {
          set_err(err, err_len, "--rtt-search: expected <addr>:<size> in hex, got '%s'", optarg);
          return CONFIG_ERROR;
        }
        break;

      case OPT_SPEED:
        if (!vscreen_parse_int_range(optarg, 1, 100000L, v)) {
          set_err(err, err_len, "--speed: expected 1..100000 kHz, got '%s'", optarg);
          return CONFIG_ERROR;
        }
        cfg.speed_khz = static_cast<uint32_t>(v);
        break;

      case OPT_SERIAL:
        if (!vscreen_parse_int_range(optarg, 0, 0x7FFFFFFFL, v)) {
          set_err(err, err_len, "--serial: expected a J-Link serial number, got '%s'", optarg);
          return CONFIG_ERROR;
        }
        cfg.serial_no = static_cast<uint32_t>(v);
        break;

      case OPT_JLINK_LIB:
        if (!optarg[0] || strlen(optarg) >= sizeof(cfg.jlink_lib)) {
          set_err(err, err_len, "--jlink-lib: path empty or too long");
          return CONFIG_ERROR;
        }
        copy_bounded(cfg.jlink_lib, sizeof(cfg.jlink_lib), optarg);
        break;

      case OPT_OPENOCD:
        if (!split_host_port(optarg, cfg.openocd_host, sizeof(cfg.openocd_host), cfg.openocd_port,
                             err, err_len)) {
          return CONFIG_ERROR;
        }
        break;

      case OPT_RTT_PORT:
        if (!vscreen_parse_int_range(optarg, 1, 65535, v)) {
          set_err(err, err_len, "--rtt-port: expected 1..65535, got '%s'", optarg);
          return CONFIG_ERROR;
        }
        cfg.rtt_port = static_cast<uint16_t>(v);
        break;

      case OPT_RETRIES:
        if (!vscreen_parse_int_range(optarg, 0, VSCREEN_MAX_RETRIES, v)) {
          set_err(err, err_len, "--retries: expected 0..%d, got '%s'", VSCREEN_MAX_RETRIES, optarg);
          return CONFIG_ERROR;
        }
        cfg.retries = static_cast<int>(v);
        break;

      case OPT_SNAPSHOT:
        if (!optarg[0] || strlen(optarg) >= sizeof(cfg.snapshot_path)) {
          set_err(err, err_len, "--snapshot: path empty or too long");
          return CONFIG_ERROR;
        }
        copy_bounded(cfg.snapshot_path, sizeof(cfg.snapshot_path), optarg);
        break;

      case OPT_SNAPSHOT_DIR:
        // Leave room for "/vscreen-NNN.ppm".
        if (!optarg[0] || strlen(optarg) + 20 >= sizeof(cfg.snapshot_dir)) {
          set_err(err, err_len, "--snapshot-dir: path empty or too long");
          return CONFIG_ERROR;
        }
        copy_bounded(cfg.snapshot_dir, sizeof(cfg.snapshot_dir), optarg);
        break;

      case ':':
        set_err(err, err_len, "option '%s' needs a value", argv[optind - 1]);
        return CONFIG_ERROR;

      default:   // '?'
        if (optopt > 0 && optopt < 256) set_err(err, err_len, "unknown option '-%c'", optopt);
        else                            set_err(err, err_len, "unknown option '%s'", argv[optind - 1]);
        return CONFIG_ERROR;
    }
  }

  // Phase 3: positional <mcu>
  if (optind >= argc) {
    set_err(err, err_len, "missing <mcu> (target device name, e.g. STM32F103C8)");
    return CONFIG_ERROR;
  }
  if (argc - optind > 1) {
    set_err(err, err_len, "unexpected argument '%s'", argv[optind + 1]);
    return CONFIG_ERROR;
  }
  const char* mcu = argv[optind];
  size_t mcu_len = strlen(mcu);
  if (mcu_len == 0 || mcu_len >= sizeof(cfg.mcu)) {
    set_err(err, err_len, "<mcu>: name empty or longer than %zu characters", sizeof(cfg.mcu) - 1);
    return CONFIG_ERROR;
  }
  for (size_t i = 0; i <= mcu_len; ++i) {
    cfg.mcu[i] = static_cast<char>(toupper(static_cast<unsigned char>(mcu[i])));
  }

  // Phase 4: mono pages are 8 rows tall
  if (!vscreen_geometry_ok(cfg.mode, cfg.width, cfg.height)) {
    set_err(err, err_len, "--height: %s needs a multiple of 8, got %d",
            vscreen_mode_name(cfg.mode), cfg.height);
    return CONFIG_ERROR;
  }

  return CONFIG_OK;
}

void vscreen_config_usage(FILE* out, const char* prog) {
  fprintf(out,
          "Usage: %s <mcu> [options]\n"
          "Show a microcontroller's framebuffer, read over a debug probe, in a window.\n"
          "\n"
          "The firmware must print its framebuffer address over RTT as\n"
          "  D-VRAM: 0x20001000\n"
          "or the address must be given with --address.\n"
          "\n"
          "  -i, --interface swd|jtag     debug interface (default swd)\n"
          "  -p, --probe jlink|openocd    transport (default jlink)\n"
          "  -d, --display <mode>         mono, mono_hlsb, rgb565, rgb565_be, rgb888, gray8 (default mono)\n"
          "      --width <n>              display width (default %d)\n"
          "      --height <n>             display height (default %d)\n"
          "  -f, --fps <n>                refresh rate (default %d)\n"
          "  -s, --scale <n>              window pixels per display pixel (default %d)\n"
          "  -a, --address <hex>          framebuffer address, skips RTT discovery\n"
          "      --fg RRGGBB, --bg RRGGBB mono colors (default FFFFFF on 000000)\n"
          "      --rtt-channel <n>        RTT up-channel (default 0)\n"
          "      --rtt-timeout <ms>       wait for D-VRAM, 0 = forever (default %u)\n"
          "      --rtt-search <a>:<size>  OpenOCD RTT search range (default 0x%08X:0x%X)\n"
          "      --speed <kHz>            probe clock (default %u)\n"
          "      --serial <n>             J-Link serial number (default first found)\n"
          "      --jlink-lib <path>       J-Link library (default libjlinkarm.so)\n"
          "      --openocd <host:port>    OpenOCD TCL server, IPv6 as [addr]:port (default 127.0.0.1:%u)\n"
          "      --rtt-port <n>           OpenOCD RTT server port (default %u)\n"
          "      --retries <n>            failed reads tolerated in a row (default %d)\n"
          "      --snapshot <file.ppm>    read one frame, save it, exit\n"
          "      --snapshot-dir <dir>     where the S key saves vscreen-NNN.ppm (default .)\n"
          "  -v, --verbose / -q, --quiet  more / less logging\n"
          "  -h, --help                   this text\n"
          "\n"
          "Window keys: S saves a snapshot, Esc or Q quits.\n",
          prog ? prog : "vscreen",
          VSCREEN_DEFAULT_WIDTH, VSCREEN_DEFAULT_HEIGHT, VSCREEN_DEFAULT_FPS, VSCREEN_DEFAULT_SCALE,
          static_cast<unsigned>(VSCREEN_DEFAULT_RTT_TIMEOUT),
          static_cast<unsigned>(VSCREEN_DEFAULT_RTT_SEARCH), static_cast<unsigned>(VSCREEN_DEFAULT_RTT_SPAN),
          static_cast<unsigned>(VSCREEN_DEFAULT_SPEED_KHZ),
          static_cast<unsigned>(VSCREEN_DEFAULT_OPENOCD_PORT),
          static_cast<unsigned>(VSCREEN_DEFAULT_RTT_PORT),
          VSCREEN_DEFAULT_RETRIES);
}

size_t vscreen_config_frame_bytes(const VscreenConfig& cfg) {
  return vscreen_frame_bytes(cfg.mode, cfg.width, cfg.height);
}

uint32_t vscreen_config_interval_ms(const VscreenConfig& cfg) {
  if (cfg.fps <= 0) return 1000;
  uint32_t ms = 1000u / static_cast<uint32_t>(cfg.fps);
  return ms ? ms : 1;
}
