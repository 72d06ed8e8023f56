/**
 * @file vscreen_openocd.cpp
 * @brief OpenOCD backend for the probe layer (TCL RPC over TCP).
 *
 * Notes:
 * - OpenOCD must already be running with the adapter and target configured,
 *   e.g. `openocd -f interface/jlink.cfg -c "transport select swd" -f target/stm32f1x.cfg`.
 *   Its TCL RPC server listens on 6666 by default.
 * - The adapter transport is fixed by OpenOCD's config once it is running;
 *   --interface is only reported here.
 * - RTT data cannot be pulled through TCL RPC. We ask OpenOCD to serve the
 *   channel on its own TCP port and read that socket without blocking.
 */

#include "vscreen_openocd.hpp"
#include "vscreen_probe.hpp"
#include "vscreen_log.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

const char* kTag = "openocd";

constexpr int kConnectRetries = 10;       // RTT server can take a moment to listen

int  g_tcl = -1;                          // TCL RPC socket
int  g_rtt = -1;                          // RTT channel socket (after rtt_start)
bool g_rtt_started = false;               // OpenOCD-side RTT running, needs stop
uint16_t g_rtt_port = 0;
char g_desc[192] = "OpenOCD";
char g_reply[32768];                      // one TCL reply at a time
int  g_reply_timeout_ms = VSCREEN_OPENOCD_REPLY_TIMEOUT_MS;
unsigned g_owed = 0;                      // replies still due for timed-out commands

// tcp_connect() - blocking connect to host:port. Returns fd or -1.
int tcp_connect(const char* host, uint16_t port) {
  char service[8];
  snprintf(service, sizeof(service), "%u", (unsigned)port);

  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  struct addrinfo* res = nullptr;
  int rc = getaddrinfo(host, service, &hints, &res);
  if (rc != 0) {
    VS_LOGE(kTag, "cannot resolve %s: %s", host, gai_strerror(rc));
    return -1;
  }

  int fd = -1;
  for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;
    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
    close(fd);
    fd = -1;
  }
  freeaddrinfo(res);

  if (fd >= 0) {
    int one = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {   // small request/response
      VS_LOGD(kTag, "TCP_NODELAY not set: %s", strerror(errno));
    }
  }
  return fd;
}

bool send_all(int fd, const char* data, size_t len) {
  while (len > 0) {
    ssize_t n = send(fd, data, len, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      VS_LOGE(kTag, "send failed: %s", strerror(errno));
      return false;
    }
    data += n;
    len -= static_cast<size_t>(n);
  }
  return true;
}

// Outcome of waiting for one 0x1A-terminated reply.
enum ReplyResult : uint8_t {
  REPLY_OK,
  REPLY_OVERFLOW,     // reply consumed up to its EOM, but did not fit g_reply
  REPLY_TIMEOUT,      // nothing complete yet; OpenOCD still owes this reply
  REPLY_CLOSED        // socket error or EOF
};

/*------------------------------------------------------------------------------
  read_reply
  ----------
  Collect one reply into g_reply (NUL-terminated, EOM stripped).

  Invariant: bytes are only consumed up to and including the EOM, so the
  next reply starts at the next recv().
------------------------------------------------------------------------------*/
ReplyResult read_reply() {
  size_t used = 0;
  bool overflow = false;
  for (;;) {
    struct pollfd pfd;
    pfd.fd = g_tcl;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int pr = poll(&pfd, 1, g_reply_timeout_ms);
    if (pr < 0 && errno == EINTR) continue;
    if (pr < 0) return REPLY_CLOSED;
    if (pr == 0) return REPLY_TIMEOUT;

    // Peek first so nothing past the EOM is taken off the socket.
    char chunk[4096];
    ssize_t n = recv(g_tcl, chunk, sizeof(chunk), MSG_PEEK);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return REPLY_CLOSED;

    const char* eom = static_cast<const char*>(memchr(chunk, VSCREEN_OPENOCD_EOM, static_cast<size_t>(n)));
    const size_t take = eom ? static_cast<size_t>(eom - chunk) + 1 : static_cast<size_t>(n);
    ssize_t got = recv(g_tcl, chunk, take, 0);
    if (got != static_cast<ssize_t>(take)) return REPLY_CLOSED;

    const size_t body = eom ? take - 1 : take;
    for (size_t k = 0; k < body; ++k) {
      if (used + 1 < sizeof(g_reply)) g_reply[used++] = chunk[k];
      else overflow = true;
    }
    if (eom) {
      g_reply[used] = '\0';
      return overflow ? REPLY_OVERFLOW : REPLY_OK;
    }
  }
}

// drain_owed() - discard replies to commands that timed out earlier.
bool drain_owed() {
  while (g_owed > 0) {
    ReplyResult r = read_reply();
    if (r == REPLY_TIMEOUT) {
      VS_LOGW(kTag, "OpenOCD still busy with an earlier command");
      return false;
    }
    if (r == REPLY_CLOSED) return false;
    --g_owed;
    VS_LOGD(kTag, "discarded late reply (%u still owed)", g_owed);
  }
  return true;
}

/*------------------------------------------------------------------------------
  tcl_command
  -----------
  Send one command and collect its reply into g_reply.

  Invariants:
  - Replies stay paired with their commands. A timed-out command leaves its
    reply owed; it is read and dropped before the next command goes out.
  - An oversized reply is consumed up to its EOM and reported as failure.
  - A closed socket is fatal for the session (caller sees false).
------------------------------------------------------------------------------*/
bool tcl_command(const char* cmd) {
  if (g_tcl < 0) return false;
  if (!drain_owed()) return false;

  if (!send_all(g_tcl, cmd, strlen(cmd))) return false;
  const char eom = VSCREEN_OPENOCD_EOM;
  if (!send_all(g_tcl, &eom, 1)) return false;

  switch (read_reply()) {
    case REPLY_OK:
      return true;
    case REPLY_OVERFLOW:
      VS_LOGE(kTag, "reply to '%.40s' too large", cmd);
      return false;
    case REPLY_TIMEOUT:
      ++g_owed;
      VS_LOGE(kTag, "no reply to '%.40s' within %d ms", cmd, g_reply_timeout_ms);
      return false;
    case REPLY_CLOSED:
    default:
      VS_LOGE(kTag, "connection closed by OpenOCD");
      return false;
  }
}

// tcl_ok() - run `cmd` under Tcl `catch`, so success is the literal reply "0".
bool tcl_ok(const char* cmd) {
  char wrapped[512];
  int n = snprintf(wrapped, sizeof(wrapped), "catch {%s}", cmd);
  if (n < 0 || static_cast<size_t>(n) >= sizeof(wrapped)) return false;
  if (!tcl_command(wrapped)) return false;
  if (strcmp(g_reply, "0") != 0) {
    VS_LOGE(kTag, "'%s' failed", cmd);
    return false;
  }
  return true;
}

void close_fd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

void openocd_close() {
  close_fd(g_rtt);
  if (g_tcl >= 0 && g_rtt_started) {
    char cmd[64];
    snprintf(cmd, sizeof(cmd), "rtt server stop %u", (unsigned)g_rtt_port);
    if (!tcl_ok(cmd)) VS_LOGD(kTag, "RTT server was not running");
    if (!tcl_ok("rtt stop")) VS_LOGD(kTag, "RTT was not running");
  }
  g_rtt_started = false;
  g_owed = 0;
  close_fd(g_tcl);
}

/*------------------------------------------------------------------------------
  openocd_open
  ------------
  Phases:
  1) Connect to the TCL RPC port.
  2) Ask for `version` (proves the server is OpenOCD and alive).
  3) Build the description line for the log.
------------------------------------------------------------------------------*/
bool openocd_open(const VscreenConfig& cfg) {
  // Phase 1
  g_tcl = tcp_connect(cfg.openocd_host, cfg.openocd_port);
  if (g_tcl < 0) {
    VS_LOGE(kTag, "cannot reach OpenOCD at %s:%u (is it running with its TCL port enabled?)",
            cfg.openocd_host, (unsigned)cfg.openocd_port);
    return false;
  }

  // Phase 2
  if (!tcl_command("version")) {
    openocd_close();
    return false;
  }

  // Phase 3
  snprintf(g_desc, sizeof(g_desc), "%s at %s:%u, target %s (transport from OpenOCD config, %s requested)",
           g_reply[0] ? g_reply : "OpenOCD", cfg.openocd_host, (unsigned)cfg.openocd_port, cfg.mcu,
           cfg.iface == IFACE_JTAG ? "JTAG" : "SWD");
  return true;
}

bool openocd_read(uint32_t addr, uint8_t* buf, size_t len) {
  char cmd[64];
  while (len > 0) {
    const size_t n = len < VSCREEN_OPENOCD_CHUNK ? len : VSCREEN_OPENOCD_CHUNK;
    if (vscreen_openocd_format_read(cmd, sizeof(cmd), addr, n) == 0) return false;
    if (!tcl_command(cmd)) return false;
    if (!vscreen_openocd_parse_bytes(g_reply, buf, n)) {
      VS_LOGW(kTag, "read at 0x%08X: %.80s", (unsigned)addr, g_reply);
      return false;
    }
    addr += static_cast<uint32_t>(n);
    buf += n;
    len -= n;
  }
  return true;
}

/*------------------------------------------------------------------------------
  openocd_rtt_start
  -----------------
  Phases:
  1) rtt setup over the configured RAM window, then rtt start.
  2) rtt server start on cfg.rtt_port for the requested channel.
  3) Connect to that port (retry briefly while OpenOCD opens it).
------------------------------------------------------------------------------*/
bool openocd_rtt_start(const VscreenConfig& cfg) {
  if (g_tcl < 0) return false;

  // Phase 1
  char cmd[128];
  snprintf(cmd, sizeof(cmd), "rtt setup 0x%08X 0x%X \"SEGGER RTT\"",
           (unsigned)cfg.rtt_search_addr, (unsigned)cfg.rtt_search_size);
  if (!tcl_ok(cmd)) return false;
  if (!tcl_ok("rtt start")) return false;
  g_rtt_started = true;

  // Phase 2
  g_rtt_port = cfg.rtt_port;
  snprintf(cmd, sizeof(cmd), "rtt server start %u %d", (unsigned)cfg.rtt_port, cfg.rtt_channel);
  if (!tcl_ok(cmd)) return false;

  // Phase 3
  for (int attempt = 0; attempt < kConnectRetries && g_rtt < 0; ++attempt) {
    g_rtt = tcp_connect(cfg.openocd_host, cfg.rtt_port);
    if (g_rtt < 0) usleep(100 * 1000);
  }
  if (g_rtt < 0) {
    VS_LOGE(kTag, "cannot connect to RTT server on port %u", (unsigned)cfg.rtt_port);
    return false;
  }
  return true;
}

// The RTT socket already carries a single channel; `channel` was fixed at start.
int openocd_rtt_read(int channel, uint8_t* buf, size_t cap) {
  (void)channel;
  if (g_rtt < 0) return -1;
  ssize_t n = recv(g_rtt, buf, cap, MSG_DONTWAIT);
  if (n > 0) return static_cast<int>(n);
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return 0;
  VS_LOGE(kTag, "RTT connection lost");
  close_fd(g_rtt);
  return -1;
}

const char* openocd_describe() {
  return g_desc;
}

const ProbeOps kOpenOcdOps = {
  "openocd",
  openocd_open,
  openocd_close,
  openocd_read,
  openocd_rtt_start,
  openocd_rtt_read,
  openocd_describe,
};

} // namespace

// ============================================================================
// Reply helpers (pure)
// ============================================================================

bool vscreen_openocd_parse_bytes(const char* reply, uint8_t* out, size_t expect) {
  if (!reply || !out) return false;
  const char* p = reply;
  size_t count = 0;

  for (;;) {
    while (*p && isspace(static_cast<unsigned char>(*p))) ++p;
    if (!*p) break;
    if (count == expect) return false;                     // more tokens than asked for

    const char* tok = p;
    if (tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X')) tok += 2;
    if (!isxdigit(static_cast<unsigned char>(*tok))) return false;

    char* end = nullptr;
    unsigned long v = strtoul(tok, &end, 16);
    if (end == tok || (*end && !isspace(static_cast<unsigned char>(*end)))) return false;
    if (v > 0xFF) return false;

    out[count++] = static_cast<uint8_t>(v);
    p = end;
  }
  return count == expect;
}

size_t vscreen_openocd_format_read(char* buf, size_t cap, uint32_t addr, size_t count) {
  if (!buf || cap == 0) return 0;
  int n = snprintf(buf, cap, "read_memory 0x%08X 8 %zu", (unsigned)addr, count);
  if (n < 0 || static_cast<size_t>(n) >= cap) return 0;
  return static_cast<size_t>(n);
}

void vscreen_openocd_set_reply_timeout(int ms) {
  g_reply_timeout_ms = ms > 0 ? ms : VSCREEN_OPENOCD_REPLY_TIMEOUT_MS;
}

const ProbeOps* vscreen_openocd_ops() {
  return &kOpenOcdOps;
}
