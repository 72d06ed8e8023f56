// vscreen_session.cpp - implementation for vscreen_session.hpp
// See vscreen_session.hpp for the run sequence and exit codes.

#include "vscreen_session.hpp"
#include "vscreen_log.hpp"
#include "vscreen_pixels.hpp"
#include "vscreen_probe.hpp"
#include "vscreen_rtt.hpp"
#include "vscreen_snapshot.hpp"

#include <unistd.h>             // access

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <thread>
#include <vector>

static const char* kTag = "session";

// Set from signal context; polled once per tick.
static volatile std::sig_atomic_t g_stop = 0;

static uint32_t g_frames = 0;           // frames presented in the current run
static unsigned g_snapshot_seq = 0;     // next S-key snapshot number, per run

typedef std::chrono::steady_clock Clock;

void vscreen_session_request_stop() {
  g_stop = 1;
}

uint32_t vscreen_session_frames() {
  return g_frames;
}

// ============================================================================
// Helpers
// ============================================================================

// resolve_address() - --address wins; otherwise ask the firmware over RTT.
static bool resolve_address(const VscreenConfig& cfg, uint32_t& addr) {
  if (cfg.has_address) {
    addr = cfg.address;
    VS_LOGI(kTag, "D-VRAM (display data buffer) given at: 0x%X", (unsigned)addr);
    return true;
  }
  if (!vscreen_rtt_discover(cfg, addr, &g_stop)) return false;
  VS_LOGI(kTag, "D-VRAM (display data buffer) reported at: 0x%X", (unsigned)addr);
  return true;
}

// read_and_decode() - one probe read straight into a decoded frame.
static bool read_and_decode(const VscreenConfig& cfg, uint32_t addr,
                            std::vector<uint8_t>& raw, std::vector<uint32_t>& pixels) {
  if (!vscreen_probe_read(addr, raw.data(), raw.size())) return false;
  return vscreen_decode_frame(cfg.mode, raw.data(), raw.size(), cfg.width, cfg.height,
                              cfg.fg, cfg.bg, pixels.data());
}

/*------------------------------------------------------------------------------
  save_snapshot
  -------------
  S key: write the frame on screen to <snapshot_dir>/vscreen-NNN.ppm, taking
  the first number not already on disk so earlier runs are not overwritten.
------------------------------------------------------------------------------*/
static void save_snapshot(const VscreenConfig& cfg, const std::vector<uint32_t>& pixels) {
  const char* dir = cfg.snapshot_dir[0] ? cfg.snapshot_dir : ".";
  const size_t dir_len = strlen(dir);
  const char* sep = (dir_len > 0 && dir[dir_len - 1] == '/') ? "" : "/";

  char path[320];
  for (;;) {
    if (g_snapshot_seq > 999) {
      VS_LOGW(kTag, "snapshot not saved: %s already holds vscreen-000..999.ppm", dir);
      return;
    }
    snprintf(path, sizeof(path), "%s%svscreen-%03u.ppm", dir, sep, g_snapshot_seq++);
    if (access(path, F_OK) != 0) break;
  }

  if (vscreen_snapshot_write_ppm(path, cfg.width, cfg.height, pixels.data())) {
    VS_LOGI(kTag, "snapshot saved to %s", path);
  } else {
    VS_LOGW(kTag, "snapshot not saved");
  }
}

/*------------------------------------------------------------------------------
  run_headless
  ------------
  Read one frame (up to retries+1 attempts, one poll interval apart) and
  write it to cfg.snapshot_path.
------------------------------------------------------------------------------*/
static int run_headless(const VscreenConfig& cfg, uint32_t addr,
                        std::vector<uint8_t>& raw, std::vector<uint32_t>& pixels) {
  const std::chrono::milliseconds interval(vscreen_config_interval_ms(cfg));

  for (int attempt = 0; attempt <= cfg.retries; ++attempt) {
    if (g_stop) return VSCREEN_EXIT_OK;
    if (read_and_decode(cfg, addr, raw, pixels)) {
      if (!vscreen_snapshot_write_ppm(cfg.snapshot_path, cfg.width, cfg.height, pixels.data())) {
        return VSCREEN_EXIT_FAILURE;
      }
      g_frames = 1;
      return VSCREEN_EXIT_OK;
    }
    VS_LOGW(kTag, "frame read failed (attempt %d of %d)", attempt + 1, cfg.retries + 1);
    if (attempt < cfg.retries) std::this_thread::sleep_for(interval);
  }
  VS_LOGE(kTag, "giving up after %d failed reads", cfg.retries + 1);
  return VSCREEN_EXIT_FAILURE;
}

/*------------------------------------------------------------------------------
  run_windowed
  ------------
  Fixed-rate loop. Each tick: pump input, read, decode, present.

  Invariants:
  - A failed read never presents garbage; the last good frame stays up.
  - `failures` counts consecutive misses and resets on the first success.
  - Ticks are scheduled on an absolute timeline; if we fall behind by more
    than a tick we re-anchor instead of bursting to catch up.
------------------------------------------------------------------------------*/
static int run_windowed(const VscreenConfig& cfg, uint32_t addr, const DisplayOps* display,
                        std::vector<uint8_t>& raw, std::vector<uint32_t>& pixels) {
  if (!display->begin(VSCREEN_WINDOW_TITLE, cfg.width, cfg.height, cfg.scale)) {
    display->end();
    return VSCREEN_EXIT_FAILURE;
  }

  // Start from the background color so the first failed read shows something sane.
  for (size_t i = 0; i < pixels.size(); ++i) pixels[i] = cfg.bg;
  display->present(pixels.data());

  const Clock::duration interval = std::chrono::milliseconds(vscreen_config_interval_ms(cfg));
  Clock::time_point next = Clock::now();
  Clock::time_point stats_at = next;
  uint32_t stats_frames = 0;
  const bool stats_on = vscreen_log_level() >= VS_LOG_DEBUG;      // fps line only with -v

  int rc = VSCREEN_EXIT_OK;
  int failures = 0;

  while (!g_stop) {
    bool snapshot = false;
    if (!display->poll(snapshot)) break;                 // window closed

    if (read_and_decode(cfg, addr, raw, pixels)) {
      failures = 0;
      display->present(pixels.data());
      ++g_frames;
      ++stats_frames;
    } else if (++failures > cfg.retries) {
      VS_LOGE(kTag, "giving up after %d failed reads in a row", failures);
      rc = VSCREEN_EXIT_FAILURE;
      break;
    } else {
      VS_LOGW(kTag, "frame read failed (%d of %d allowed)", failures, cfg.retries);
    }

    if (snapshot) save_snapshot(cfg, pixels);

    const Clock::time_point now = Clock::now();
    if (stats_on && now - stats_at >= std::chrono::seconds(5)) {
      const double secs = std::chrono::duration<double>(now - stats_at).count();
      VS_LOGD(kTag, "%.1f fps (target %d)", stats_frames / secs, cfg.fps);
      stats_at = now;
      stats_frames = 0;
    }

    next += interval;
    if (next < now) next = now;                          // fell behind, re-anchor
    else std::this_thread::sleep_until(next);
  }

  display->end();
  return rc;
}

// ============================================================================
// Public entry
// ============================================================================

/*------------------------------------------------------------------------------
  vscreen_session_run
  -------------------
  Phases:
  1) Open probe.
  2) Resolve framebuffer address and check the frame fits in 32-bit space.
  3) Size buffers and dispatch to headless or windowed.
  4) Close probe.
------------------------------------------------------------------------------*/
int vscreen_session_run(const VscreenConfig& cfg, const DisplayOps* display) {
  g_stop = 0;
  g_frames = 0;
  g_snapshot_seq = 0;

  const size_t frame_bytes = vscreen_config_frame_bytes(cfg);
  if (frame_bytes == 0) {
    VS_LOGE(kTag, "%dx%d is not a valid %s geometry", cfg.width, cfg.height, vscreen_mode_name(cfg.mode));
    return VSCREEN_EXIT_FAILURE;
  }
  const bool headless = cfg.snapshot_path[0] != '\0' || display == nullptr;
  if (headless && cfg.snapshot_path[0] == '\0') {
    VS_LOGE(kTag, "no display available; use --snapshot <file.ppm>");
    return VSCREEN_EXIT_FAILURE;
  }

  // Phase 1
  if (!vscreen_probe_begin(cfg)) return VSCREEN_EXIT_FAILURE;

  // Phase 2
  uint32_t addr = 0;
  if (!resolve_address(cfg, addr)) {
    vscreen_probe_end();
    return g_stop ? VSCREEN_EXIT_OK : VSCREEN_EXIT_FAILURE;
  }
  if (static_cast<uint64_t>(addr) + frame_bytes > 0x100000000ull) {
    VS_LOGE(kTag, "a %zu byte frame at 0x%X runs past the end of memory", frame_bytes, (unsigned)addr);
    vscreen_probe_end();
    return VSCREEN_EXIT_FAILURE;
  }
  VS_LOGI(kTag, "%s %dx%d, %zu bytes per frame, %d fps",
          vscreen_mode_name(cfg.mode), cfg.width, cfg.height, frame_bytes, cfg.fps);

  // Phase 3
  std::vector<uint8_t> raw(frame_bytes);
  std::vector<uint32_t> pixels(static_cast<size_t>(cfg.width) * static_cast<size_t>(cfg.height));

  int rc = headless ? run_headless(cfg, addr, raw, pixels)
                    : run_windowed(cfg, addr, display, raw, pixels);

  // Phase 4
  vscreen_probe_end();
  VS_LOGD(kTag, "%u frames shown", (unsigned)g_frames);
  return rc;
}
