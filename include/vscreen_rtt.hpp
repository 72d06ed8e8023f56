#pragma once
/**
 * @page vs-rtt Virtual Screen Framebuffer Discovery (RTT announcement)
 * @file vscreen_rtt.hpp
 * @brief Find the framebuffer address the firmware prints over SEGGER RTT.
 *
 * Contract With the Firmware
 * --------------------------
 * Early in boot the firmware writes one line to an RTT up-channel
 * (channel 0 unless --rtt-channel says otherwise):
 *
 *     D-VRAM: 0x20001000
 *
 * The prefix is case-sensitive and must start the line. The address is hex,
 * with or without 0x. Anything else on the channel (other log lines, "\r\n"
 * endings, partial writes split across polls) is tolerated.
 *
 * Typical firmware side:
 * @code
 * SEGGER_RTT_printf(0, "D-VRAM: 0x%08X\n", (unsigned)display_buffer);
 * @endcode
 *
 * Failure Modes
 * -------------
 * - RTT never starts, the line never arrives before --rtt-timeout, or the
 *   probe drops: vscreen_rtt_discover() returns false and logs the expected
 *   format so the firmware author knows what to add.
 */

#include "vscreen_config.hpp"

#include <csignal>
#include <cstddef>
#include <cstdint>

/** Line prefix the firmware uses to announce its framebuffer. */
static constexpr const char* VSCREEN_VRAM_PREFIX = "D-VRAM:";

/**
 * @brief Scan @p text (not necessarily NUL-terminated) for the announcement.
 *
 * Lines are split on '\n'. Only complete lines (terminated by '\n') are
 * considered, except when @p final is true, in which case a trailing partial
 * line is parsed too.
 *
 * @return true and sets @p addr on the first well-formed announcement.
 */
bool vscreen_rtt_parse_vram(const char* text, size_t len, uint32_t& addr, bool final = false);

/**
 * @brief Start RTT on the open probe and wait for the announcement.
 *
 * Polls the configured channel, accumulating text across polls, until the
 * line is found or cfg.rtt_timeout_ms elapses (0 = no limit).
 *
 * @param stop Optional flag; discovery gives up early once it reads non-zero
 *             (set from a signal handler).
 */
bool vscreen_rtt_discover(const VscreenConfig& cfg, uint32_t& addr,
                          volatile std::sig_atomic_t* stop = nullptr);
