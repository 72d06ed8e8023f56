/**
 * @file vscreen_jlink.cpp
 * @brief SEGGER J-Link backend for the probe layer.
 *
 * Notes:
 * - The J-Link DLL (libjlinkarm.so) ships with the J-Link Software Pack and is
 *   loaded at runtime with dlopen(), the same way SEGGER's own tools and most
 *   third-party front ends bind to it. No SDK headers are needed to build.
 * - Only the handful of exports we call are resolved. Prototypes follow the
 *   DLL's C ABI (all integers are 32-bit, strings are char*).
 * - Connection order matters: select emulator, open, select interface, set
 *   device, set speed, connect. Reversing TIF and device makes some targets
 *   refuse the connect.
 */

#include "vscreen_probe.hpp"
#include "vscreen_log.hpp"

#include <dlfcn.h>      // dlopen / dlsym / dlclose
#include <chrono>
#include <cstdio>
#include <cstring>

namespace {

const char* kTag = "jlink";

// Values the DLL expects for JLINKARM_TIF_Select().
constexpr int kTifJtag = 0;
constexpr int kTifSwd  = 1;

// JLINK_RTTERMINAL_Control() commands.
constexpr unsigned kRttCmdStart = 0;
constexpr unsigned kRttCmdStop  = 1;

// Argument block for kRttCmdStart. Address 0 lets the DLL search for the
// "SEGGER RTT" control block itself.
struct RttStart {
  uint32_t config_block_address;
  uint32_t reserved[3];
};

// Exported entry points (C ABI).
typedef const char* (*FnOpen)();
typedef void        (*FnClose)();
typedef int         (*FnEmuSelectByUsbSn)(unsigned serial);
typedef int         (*FnExecCommand)(const char* cmd, char* err, int err_len);
typedef int         (*FnTifSelect)(int tif);
typedef void        (*FnSetSpeed)(unsigned khz);
typedef int         (*FnConnect)();
typedef int         (*FnReadMem)(unsigned addr, unsigned num_bytes, void* data);
typedef void        (*FnGetString)(char* buf, int buf_len);
typedef int         (*FnRttControl)(unsigned cmd, void* arg);
typedef int         (*FnRttRead)(unsigned index, char* buf, unsigned buf_len);

struct JLinkApi {
  FnOpen             open;
  FnClose            close;
  FnEmuSelectByUsbSn select_by_sn;
  FnExecCommand      exec_command;
  FnTifSelect        tif_select;
  FnSetSpeed         set_speed;
  FnConnect          connect;
  FnReadMem          read_mem;
  FnGetString        firmware_string;
  FnGetString        product_name;
  FnRttControl       rtt_control;
  FnRttRead          rtt_read;
};

void*    g_lib = nullptr;      // dlopen handle
JLinkApi g_api;                // resolved exports, valid while g_lib != nullptr
bool     g_open = false;       // JLINKARM_Open succeeded
bool     g_rtt = false;        // RTT started, must be stopped on close
char     g_desc[192] = "J-Link";

typedef std::chrono::steady_clock Clock;
Clock::time_point g_rtt_since;                   // when RTT was started
int      g_rtt_grace_ms = VSCREEN_JLINK_RTT_GRACE_MS;

// resolve() - look up one export; log the name if the DLL lacks it.
template <typename Fn>
bool resolve(const char* name, Fn& out) {
  out = reinterpret_cast<Fn>(dlsym(g_lib, name));
  if (!out) {
    VS_LOGE(kTag, "%s not exported by the J-Link library", name);
    return false;
  }
  return true;
}

/*------------------------------------------------------------------------------
  load_library
  ------------
  Phases:
  1) dlopen() the path from --jlink-lib (bare names go through the loader path).
  2) Resolve every export; bail out if any is missing.

  Invariant: on false, g_lib is null and nothing stays mapped.
------------------------------------------------------------------------------*/
bool load_library(const char* path) {
  g_lib = dlopen(path, RTLD_NOW | RTLD_LOCAL);
  if (!g_lib) {
    const char* why = dlerror();
    VS_LOGE(kTag, "cannot load %s: %s", path, why ? why : "unknown error");
    VS_LOGE(kTag, "install the J-Link Software Pack or pass --jlink-lib <path>");
    return false;
  }

  bool ok = true;
  ok = resolve("JLINKARM_Open",                g_api.open)            && ok;
  ok = resolve("JLINKARM_Close",               g_api.close)           && ok;
  ok = resolve("JLINKARM_EMU_SelectByUSBSN",   g_api.select_by_sn)    && ok;
  ok = resolve("JLINKARM_ExecCommand",         g_api.exec_command)    && ok;
  ok = resolve("JLINKARM_TIF_Select",          g_api.tif_select)      && ok;
  ok = resolve("JLINKARM_SetSpeed",            g_api.set_speed)       && ok;
  ok = resolve("JLINKARM_Connect",             g_api.connect)         && ok;
  ok = resolve("JLINKARM_ReadMem",             g_api.read_mem)        && ok;
  ok = resolve("JLINKARM_GetFirmwareString",   g_api.firmware_string) && ok;
  ok = resolve("JLINKARM_EMU_GetProductName",  g_api.product_name)    && ok;
  ok = resolve("JLINK_RTTERMINAL_Control",     g_api.rtt_control)     && ok;
  ok = resolve("JLINK_RTTERMINAL_Read",        g_api.rtt_read)        && ok;

  if (!ok) {
    dlclose(g_lib);
    g_lib = nullptr;
  }
  return ok;
}

void jlink_close() {
  if (g_lib) {
    if (g_rtt) g_api.rtt_control(kRttCmdStop, nullptr);
    if (g_open) g_api.close();
    dlclose(g_lib);
  }
  g_lib = nullptr;
  g_open = false;
  g_rtt = false;
}

/*------------------------------------------------------------------------------
  jlink_open
  ----------
  Phases:
  1) Load the DLL.
  2) Select the emulator by serial (if asked) and open it.
  3) Select SWD/JTAG, name the device, set the clock, connect.
  4) Capture product + firmware strings for the log.

  Any failure unwinds through jlink_close().
------------------------------------------------------------------------------*/
bool jlink_open(const VscreenConfig& cfg) {
  // Phase 1
  if (!load_library(cfg.jlink_lib)) return false;

  // Phase 2
  if (cfg.serial_no != 0 && g_api.select_by_sn(cfg.serial_no) < 0) {
    VS_LOGE(kTag, "no J-Link with serial number %u", (unsigned)cfg.serial_no);
    jlink_close();
    return false;
  }
  const char* open_err = g_api.open();
  if (open_err) {
    VS_LOGE(kTag, "open failed: %s", open_err);
    jlink_close();
    return false;
  }
  g_open = true;

  // Phase 3
  const int tif = (cfg.iface == IFACE_JTAG) ? kTifJtag : kTifSwd;
  if (g_api.tif_select(tif) != 0) {
    VS_LOGE(kTag, "adapter refused the %s interface", tif == kTifJtag ? "JTAG" : "SWD");
    jlink_close();
    return false;
  }

  char cmd[96];
  char err[256] = "";
  snprintf(cmd, sizeof(cmd), "Device = %s", cfg.mcu);
  g_api.exec_command(cmd, err, sizeof(err));
  if (err[0]) {
    VS_LOGE(kTag, "unknown device %s: %s", cfg.mcu, err);
    jlink_close();
    return false;
  }

  g_api.set_speed(cfg.speed_khz);
  if (g_api.connect() < 0) {
    VS_LOGE(kTag, "could not connect to %s (check wiring, power and --interface)", cfg.mcu);
    jlink_close();
    return false;
  }

  // Phase 4
  char product[64] = "";
  char firmware[128] = "";
  g_api.product_name(product, sizeof(product));
  g_api.firmware_string(firmware, sizeof(firmware));
  snprintf(g_desc, sizeof(g_desc), "%s (%s) connected to %s",
           product[0] ? product : "J-Link", firmware[0] ? firmware : "unknown firmware", cfg.mcu);
  return true;
}

bool jlink_read(uint32_t addr, uint8_t* buf, size_t len) {
  if (!g_open) return false;
  if (len > 0xFFFFFFFFu) return false;
  if (g_api.read_mem(addr, static_cast<unsigned>(len), buf) != 0) {
    VS_LOGW(kTag, "read of %zu bytes at 0x%08X failed", len, (unsigned)addr);
    return false;
  }
  return true;
}

bool jlink_rtt_start(const VscreenConfig& cfg) {
  (void)cfg;   // the DLL finds the control block on its own
  if (!g_open) return false;
  RttStart arg;
  memset(&arg, 0, sizeof(arg));
  if (g_api.rtt_control(kRttCmdStart, &arg) < 0) {
    VS_LOGE(kTag, "RTT start failed");
    return false;
  }
  g_rtt = true;
  g_rtt_since = Clock::now();
  return true;
}

int jlink_rtt_read(int channel, uint8_t* buf, size_t cap) {
  if (!g_rtt || channel < 0) return -1;
  const unsigned n = cap > 0xFFFFu ? 0xFFFFu : static_cast<unsigned>(cap);
  int got = g_api.rtt_read(static_cast<unsigned>(channel), reinterpret_cast<char*>(buf), n);
  if (got >= 0) return got;

  // Right after start a negative count means the DLL is still searching for
  // the control block. Past the grace window it is a real error.
  if (Clock::now() - g_rtt_since < std::chrono::milliseconds(g_rtt_grace_ms)) return 0;
  VS_LOGE(kTag, "RTT read on channel %d failed (%d); is RTT compiled into the firmware?", channel, got);
  return -1;
}

const char* jlink_describe() {
  return g_desc;
}

const ProbeOps kJLinkOps = {
  "jlink",
  jlink_open,
  jlink_close,
  jlink_read,
  jlink_rtt_start,
  jlink_rtt_read,
  jlink_describe,
};

} // namespace

void vscreen_jlink_set_rtt_grace(int ms) {
  g_rtt_grace_ms = ms >= 0 ? ms : VSCREEN_JLINK_RTT_GRACE_MS;
}

const ProbeOps* vscreen_jlink_ops() {
  return &kJLinkOps;
}
