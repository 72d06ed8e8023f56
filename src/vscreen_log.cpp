// vscreen_log.cpp - implementation for vscreen_log.hpp

#include "vscreen_log.hpp"

#include <cstdio>
#include <cstring>

static VsLogLevel s_level = VS_LOG_INFO;   // INFO unless -v / -q says otherwise

void vscreen_log_set_level(VsLogLevel level) {
  s_level = level;
}

VsLogLevel vscreen_log_level() {
  return s_level;
}

// Lines are composed into one buffer so a single fputs() keeps them whole
// even if something else writes to stderr in between.
void vscreen_log_printf(VsLogLevel level, const char* tag, const char* fmt, ...) {
  if (level > s_level) return;

  char line[512];
  int n = snprintf(line, sizeof(line), "[%s] ", tag ? tag : "vscreen");
  if (n < 0) return;
  size_t off = (static_cast<size_t>(n) < sizeof(line) - 2) ? static_cast<size_t>(n) : sizeof(line) - 2;

  va_list args;
  va_start(args, fmt);
  vsnprintf(line + off, sizeof(line) - off - 1, fmt, args);   // leave room for '\n'
  va_end(args);

  size_t len = strlen(line);
  line[len++] = '\n';
  line[len] = '\0';
  fputs(line, stderr);
}
