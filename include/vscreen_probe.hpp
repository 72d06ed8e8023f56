#pragma once
/**
 * @page vs-probe Virtual Screen Probe Layer (debug transport glue)
 * @file vscreen_probe.hpp
 * @brief One narrow API over J-Link and OpenOCD: open, read memory, read RTT, close.
 *
 * Overview
 * --------
 * This module is the narrow waist between the read/render loop and whatever
 * actually talks to the target. The session never knows which tool is on the
 * other side; it opens a session, reads N bytes at address A, optionally pulls
 * RTT text, and closes. Each backend fills in a ProbeOps table of plain
 * function pointers and keeps its own state private.
 *
 * Where It Sits
 * -------------
 * - Below: vscreen_jlink.* (SEGGER J-Link shared library, loaded at runtime)
 *   and vscreen_openocd.* (OpenOCD TCL RPC over TCP).
 * - Above: vscreen_rtt.* (address discovery) and vscreen_session.* (loop).
 *
 * Lifecycle
 * ---------
 *   vscreen_probe_begin(cfg)   -> picks backend, opens + connects
 *   vscreen_probe_read(...)    -> any number of times
 *   vscreen_probe_rtt_start()  -> once, only if the address must be discovered
 *   vscreen_probe_rtt_read()   -> poll until the announcement shows up
 *   vscreen_probe_end()        -> close; safe to call more than once
 *
 * Overrides
 * ---------
 * vscreen_probe_set_ops(ops) replaces the backend choice with a caller-owned
 * table. Tests use it to put a fake target behind the real session code. Pass
 * nullptr to go back to choosing by cfg.probe.
 *
 * Failure Modes
 * -------------
 * - Every call is a clean no-op returning false / -1 when no session is open.
 * - Backends log the reason for a failure; callers decide whether to retry.
 */

#include "vscreen_config.hpp"

#include <cstddef>
#include <cstdint>

/**
 * @struct ProbeOps
 * @brief Backend function table. All members are required.
 */
struct ProbeOps {
  const char* name;

  /** Open the adapter and connect to the target named in cfg. */
  bool (*open)(const VscreenConfig& cfg);

  /** Disconnect and release everything open() acquired. */
  void (*close)();

  /** Read @p len bytes starting at @p addr into @p buf. */
  bool (*read_memory)(uint32_t addr, uint8_t* buf, size_t len);

  /** Start RTT so rtt_read() can return data. */
  bool (*rtt_start)(const VscreenConfig& cfg);

  /** Non-blocking RTT read. Returns bytes read, 0 if none pending, -1 on error. */
  int (*rtt_read)(int channel, uint8_t* buf, size_t cap);

  /** Human-readable adapter/firmware line for the log. Never null. */
  const char* (*describe)();
};

/** @brief Use @p ops instead of the backend named by cfg.probe (nullptr restores). */
void vscreen_probe_set_ops(const ProbeOps* ops);

/** @brief Open a session. Logs the adapter description on success. */
bool vscreen_probe_begin(const VscreenConfig& cfg);

/** @brief True between a successful begin() and end(). */
bool vscreen_probe_available();

/** @brief Name of the active backend ("jlink", "openocd", ...) or "none". */
const char* vscreen_probe_name();

/** @brief Read target memory. False when closed or on transport error. */
bool vscreen_probe_read(uint32_t addr, uint8_t* buf, size_t len);

/** @brief Start RTT on the open session. */
bool vscreen_probe_rtt_start();

/** @brief Poll one RTT up-channel. Bytes read, 0 if none, -1 on error or closed. */
int vscreen_probe_rtt_read(int channel, uint8_t* buf, size_t cap);

/** @brief Close the session. Safe to call repeatedly. */
void vscreen_probe_end();

/** @brief J-Link backend table (vscreen_jlink.cpp). */
const ProbeOps* vscreen_jlink_ops();

/** How long after RTT start a failing J-Link RTT read still counts as "not found yet". */
static constexpr int VSCREEN_JLINK_RTT_GRACE_MS = 2000;

/** @brief Change the J-Link RTT grace window (negative restores the default). */
void vscreen_jlink_set_rtt_grace(int ms);

/** @brief OpenOCD backend table (vscreen_openocd.cpp). */
const ProbeOps* vscreen_openocd_ops();
