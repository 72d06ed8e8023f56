// vscreen_snapshot.cpp - implementation for vscreen_snapshot.hpp

#include "vscreen_snapshot.hpp"
#include "vscreen_log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

static const char* kTag = "snapshot";

/*------------------------------------------------------------------------------
  vscreen_snapshot_write_ppm
  --------------------------
  Phases:
  1) Validate arguments and open the file.
  2) Header, then one row at a time (row buffer keeps fwrite calls few).
  3) Close and check; on any failure remove the partial file.
------------------------------------------------------------------------------*/
bool vscreen_snapshot_write_ppm(const char* path, int w, int h, const uint32_t* argb) {
  // Phase 1
  if (!path || !*path || !argb || w <= 0 || h <= 0) return false;

  FILE* fp = fopen(path, "wb");
  if (!fp) {
    VS_LOGE(kTag, "cannot create %s: %s", path, strerror(errno));
    return false;
  }

  // Phase 2
  bool ok = fprintf(fp, "P6\n%d %d\n255\n", w, h) > 0;

  std::vector<uint8_t> row(static_cast<size_t>(w) * 3);
  for (int y = 0; ok && y < h; ++y) {
    const uint32_t* src = argb + static_cast<size_t>(y) * static_cast<size_t>(w);
    for (int x = 0; x < w; ++x) {
      row[3 * x]     = static_cast<uint8_t>(src[x] >> 16);
      row[3 * x + 1] = static_cast<uint8_t>(src[x] >> 8);
      row[3 * x + 2] = static_cast<uint8_t>(src[x]);
    }
    ok = fwrite(row.data(), 1, row.size(), fp) == row.size();
  }

  // Phase 3
  if (fclose(fp) != 0) ok = false;
  if (!ok) {
    VS_LOGE(kTag, "write to %s failed", path);
    remove(path);
    return false;
  }
  VS_LOGI(kTag, "saved %dx%d frame to %s", w, h, path);
  return true;
}
