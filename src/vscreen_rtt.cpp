// vscreen_rtt.cpp - implementation for vscreen_rtt.hpp
// See vscreen_rtt.hpp for the firmware contract.

#include "vscreen_rtt.hpp"
#include "vscreen_probe.hpp"
#include "vscreen_log.hpp"

#include <cctype>
#include <chrono>
#include <cstring>
#include <thread>

static const char* kTag = "rtt";

// Poll period while waiting for the announcement.
static constexpr int kPollMs = 20;

// Text kept between polls; older complete lines are dropped once scanned.
static constexpr size_t kWindow = 1024;

// parse_line() - one line without its '\n'. Accepts "D-VRAM: 0x...", "D-VRAM:0x...".
static bool parse_line(const char* line, size_t len, uint32_t& addr) {
  const size_t plen = strlen(VSCREEN_VRAM_PREFIX);
  if (len < plen || memcmp(line, VSCREEN_VRAM_PREFIX, plen) != 0) return false;

  char value[32];
  size_t n = len - plen;
  if (n >= sizeof(value)) return false;
  memcpy(value, line + plen, n);
  value[n] = '\0';

  // Strip trailing "\r" and blanks so CRLF firmware works.
  while (n > 0 && isspace(static_cast<unsigned char>(value[n - 1]))) value[--n] = '\0';
  return vscreen_parse_hex_u32(value, addr);
}

bool vscreen_rtt_parse_vram(const char* text, size_t len, uint32_t& addr, bool final) {
  if (!text) return false;
  size_t start = 0;
  for (size_t i = 0; i < len; ++i) {
    if (text[i] != '\n') continue;
    if (parse_line(text + start, i - start, addr)) return true;
    start = i + 1;
  }
  return final && start < len && parse_line(text + start, len - start, addr);
}

/*------------------------------------------------------------------------------
  vscreen_rtt_discover
  --------------------
  Phases:
  1) Start RTT on the open session.
  2) Poll the channel, appending to a small window buffer.
  3) After each poll, scan complete lines; keep only the unfinished tail.
  4) Give up on timeout, stop request or transport error.

  Tradeoffs:
  - The window is bounded. A line longer than the window is discarded; the
    announcement is short so this never costs us the line we want.
------------------------------------------------------------------------------*/
bool vscreen_rtt_discover(const VscreenConfig& cfg, uint32_t& addr, volatile std::sig_atomic_t* stop) {
  // Phase 1
  if (!vscreen_probe_rtt_start()) {
    VS_LOGE(kTag, "RTT could not be started on %s", vscreen_probe_name());
    return false;
  }
  VS_LOGI(kTag, "waiting for '%s <address>' on channel %d", VSCREEN_VRAM_PREFIX, cfg.rtt_channel);

  typedef std::chrono::steady_clock Clock;
  const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(cfg.rtt_timeout_ms);

  char window[kWindow];
  size_t used = 0;

  for (;;) {
    if (stop && *stop) return false;

    // Phase 2
    int n = vscreen_probe_rtt_read(cfg.rtt_channel, reinterpret_cast<uint8_t*>(window + used),
                                   sizeof(window) - used);
    if (n < 0) {
      VS_LOGE(kTag, "RTT read failed");
      return false;
    }
    used += static_cast<size_t>(n);

    // Phase 3
    if (n > 0) {
      if (vscreen_rtt_parse_vram(window, used, addr)) return true;

      const char* nl = static_cast<const char*>(memrchr(window, '\n', used));
      if (nl) {
        size_t keep = used - static_cast<size_t>(nl + 1 - window);
        memmove(window, nl + 1, keep);
        used = keep;
      } else if (used == sizeof(window)) {
        used = 0;   // runaway line, drop it
      }
      // More may already be pending; a chatty target still hits the deadline.
      if (cfg.rtt_timeout_ms == 0 || Clock::now() < deadline) continue;
    }

    // Phase 4
    if (cfg.rtt_timeout_ms != 0 && Clock::now() >= deadline) {
      if (vscreen_rtt_parse_vram(window, used, addr, true)) return true;   // unterminated last line
      VS_LOGE(kTag, "no framebuffer announcement within %u ms", (unsigned)cfg.rtt_timeout_ms);
      VS_LOGE(kTag, "the firmware must print its display buffer address over RTT as");
      VS_LOGE(kTag, "  D-VRAM: <address>     e.g. 'D-VRAM: 0xDEADBEEF'");
      VS_LOGE(kTag, "or pass the address with --address");
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kPollMs));
  }
}
