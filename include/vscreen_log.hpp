#pragma once
/**
 * @file vscreen_log.hpp
 * @brief Tagged printf-style logging to stderr.
 *
 * Every line goes out as "[tag] message". The level is global and set once
 * from the command line (-v / -q). Keep calls cheap: formatting only happens
 * when the level lets the line through.
 *
 * Usage
 * -----
 * @code
 * VS_LOGI("jlink", "connected to %s", cfg.mcu);
 * VS_LOGD("session", "frame %lu read in %u ms", n, ms);
 * @endcode
 */

#include <cstdarg>

enum VsLogLevel {
  VS_LOG_ERROR = 0,
  VS_LOG_WARN  = 1,
  VS_LOG_INFO  = 2,
  VS_LOG_DEBUG = 3
};

/** Set the most verbose level that will be printed (default VS_LOG_INFO). */
void vscreen_log_set_level(VsLogLevel level);

/** Current level. */
VsLogLevel vscreen_log_level();

/** Print one line if @p level is enabled. A trailing newline is added. */
void vscreen_log_printf(VsLogLevel level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

#define VS_LOGE(tag, fmt, ...) vscreen_log_printf(VS_LOG_ERROR, tag, fmt, ##__VA_ARGS__)
#define VS_LOGW(tag, fmt, ...) vscreen_log_printf(VS_LOG_WARN,  tag, fmt, ##__VA_ARGS__)
#define VS_LOGI(tag, fmt, ...) vscreen_log_printf(VS_LOG_INFO,  tag, fmt, ##__VA_ARGS__)
#define VS_LOGD(tag, fmt, ...) vscreen_log_printf(VS_LOG_DEBUG, tag, fmt, ##__VA_ARGS__)
