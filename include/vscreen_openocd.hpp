#pragma once
/**
 * @file vscreen_openocd.hpp
 * @brief Reply parsing for the OpenOCD TCL RPC backend.
 *
 * The backend itself is reached through vscreen_openocd_ops() (see
 * vscreen_probe.hpp). These helpers are the pure parts of it, exposed so the
 * reply grammar can be tested without a running OpenOCD.
 *
 * TCL RPC framing: each command is sent as text followed by 0x1A; the reply
 * is text terminated by 0x1A. `read_memory <addr> 8 <n>` answers with n
 * hex tokens separated by spaces ("0x12 0xff 0x0 ...").
 */

#include <cstddef>
#include <cstdint>

/** Terminator byte for TCL RPC commands and replies. */
static constexpr char VSCREEN_OPENOCD_EOM = 0x1A;

/** Largest read issued in a single read_memory command. */
static constexpr size_t VSCREEN_OPENOCD_CHUNK = 4096;

/** How long one TCL command may take before it counts as lost. */
static constexpr int VSCREEN_OPENOCD_REPLY_TIMEOUT_MS = 3000;

/**
 * @brief Change the per-command reply timeout (tests use a short one).
 *
 * A reply that misses the timeout is still owed by OpenOCD. The backend
 * remembers it and discards it before the next command is sent, so later
 * replies are never paired with the wrong command.
 */
void vscreen_openocd_set_reply_timeout(int ms);

/**
 * @brief Parse a read_memory reply into bytes.
 *
 * @param reply  Reply text (terminator already stripped, NUL-terminated).
 * @param out    Destination for @p expect bytes.
 * @param expect Exact number of tokens required.
 * @return false on any non-hex token, a value above 0xFF, or a count mismatch.
 */
bool vscreen_openocd_parse_bytes(const char* reply, uint8_t* out, size_t expect);

/**
 * @brief Format a read_memory command for @p count bytes at @p addr.
 * @return Characters written (excluding NUL), or 0 if @p cap was too small.
 */
size_t vscreen_openocd_format_read(char* buf, size_t cap, uint32_t addr, size_t count);
