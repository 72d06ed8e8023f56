// -----------------------------------------------------------------------------
// vscreen_probe.cpp
// Implementation of the backend dispatch declared in vscreen_probe.hpp.
//
// Notes:
//  * See vscreen_probe.hpp for the lifecycle and the ProbeOps contract.
//  * This file only routes calls and tracks "is a session open". The real
//    work lives in vscreen_jlink.cpp and vscreen_openocd.cpp.
// -----------------------------------------------------------------------------

#include "vscreen_probe.hpp"
#include "vscreen_log.hpp"

static const char* kTag = "probe";

// Caller-installed table (tests). Wins over cfg.probe when set.
static const ProbeOps* g_override = nullptr;

// Table of the open session, or nullptr when closed.
static const ProbeOps* g_ops = nullptr;

// Copy of the settings the session was opened with (RTT start needs them).
static VscreenConfig g_cfg;

void vscreen_probe_set_ops(const ProbeOps* ops) {
  g_override = ops;
}

// -----------------------------------------------------------------------------
// Open a session
// - Pick the table (override first, then cfg.probe)
// - Let the backend connect; on success latch it and log what we talked to
// -----------------------------------------------------------------------------
bool vscreen_probe_begin(const VscreenConfig& cfg) {
  if (g_ops) vscreen_probe_end();          // one session at a time

  const ProbeOps* ops = g_override;
  if (!ops) ops = (cfg.probe == PROBE_OPENOCD) ? vscreen_openocd_ops() : vscreen_jlink_ops();

  VS_LOGD(kTag, "opening %s session for %s over %s", ops->name, cfg.mcu,
          cfg.iface == IFACE_JTAG ? "JTAG" : "SWD");
  if (!ops->open(cfg)) {
    VS_LOGE(kTag, "could not open %s session", ops->name);
    return false;
  }

  g_ops = ops;
  g_cfg = cfg;
  VS_LOGI(kTag, "%s", ops->describe());
  return true;
}

bool vscreen_probe_available() {
  return g_ops != nullptr;
}

const char* vscreen_probe_name() {
  return g_ops ? g_ops->name : "none";
}

bool vscreen_probe_read(uint32_t addr, uint8_t* buf, size_t len) {
  if (!g_ops || !buf) return false;
  if (len == 0) return true;
  if ((uint64_t)addr + len > 0x100000000ull) {      // would wrap the 32-bit address space
    VS_LOGE(kTag, "read of %zu bytes at 0x%08X runs past 0xFFFFFFFF", len, (unsigned)addr);
    return false;
  }
  return g_ops->read_memory(addr, buf, len);
}

bool vscreen_probe_rtt_start() {
  if (!g_ops) return false;
  return g_ops->rtt_start(g_cfg);
}

int vscreen_probe_rtt_read(int channel, uint8_t* buf, size_t cap) {
  if (!g_ops || !buf || cap == 0) return -1;
  return g_ops->rtt_read(channel, buf, cap);
}

void vscreen_probe_end() {
  if (!g_ops) return;
  VS_LOGD(kTag, "closing %s session", g_ops->name);
  g_ops->close();
  g_ops = nullptr;
}
