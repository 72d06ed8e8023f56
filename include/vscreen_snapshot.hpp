#pragma once
/**
 * @file vscreen_snapshot.hpp
 * @brief Save a decoded frame as a binary PPM (P6) image.
 *
 * PPM keeps the tool free of image codecs and opens in every viewer and in
 * ImageMagick/ffmpeg for conversion. Alpha is dropped.
 *
 *   "P6\n<w> <h>\n255\n" followed by w*h*3 bytes of R,G,B.
 */

#include <cstdint>

/**
 * @brief Write @p w x @p h ARGB pixels to @p path.
 * @return false on bad arguments or any I/O error (partial files are removed).
 */
bool vscreen_snapshot_write_ppm(const char* path, int w, int h, const uint32_t* argb);
