// test_openocd.cpp - TCL RPC reply parsing, command formatting, and the
// backend talking to a loopback server.

#include "fake_openocd.hpp"
#include "vscreen_openocd.hpp"
#include "vscreen_probe.hpp"
#include "vscreen_rtt.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

TEST(OpenOcdReply, ParsesHexTokens) {
  uint8_t out[3] = {0, 0, 0};
  ASSERT_TRUE(vscreen_openocd_parse_bytes("0x12 0xff 0x00", out, 3));
  EXPECT_EQ(out[0], 0x12);
  EXPECT_EQ(out[1], 0xFF);
  EXPECT_EQ(out[2], 0x00);
}

TEST(OpenOcdReply, BarePrefixlessAndExtraWhitespace) {
  uint8_t out[4] = {0, 0, 0, 0};
  ASSERT_TRUE(vscreen_openocd_parse_bytes("  a 0B\t7f\n 80 \n", out, 4));
  EXPECT_EQ(out[0], 0x0A);
  EXPECT_EQ(out[1], 0x0B);
  EXPECT_EQ(out[2], 0x7F);
  EXPECT_EQ(out[3], 0x80);
}

TEST(OpenOcdReply, CountMustMatch) {
  uint8_t out[4];
  EXPECT_FALSE(vscreen_openocd_parse_bytes("0x01 0x02", out, 3));
  EXPECT_FALSE(vscreen_openocd_parse_bytes("0x01 0x02 0x03 0x04", out, 3));
  EXPECT_TRUE(vscreen_openocd_parse_bytes("", out, 0));
}

TEST(OpenOcdReply, RejectsErrorsAndWideValues) {
  uint8_t out[4];
  EXPECT_FALSE(vscreen_openocd_parse_bytes("Error: Failed to read memory at 0x20000000", out, 4));
  EXPECT_FALSE(vscreen_openocd_parse_bytes("0x100", out, 1));
  EXPECT_FALSE(vscreen_openocd_parse_bytes("0x1g", out, 1));
  EXPECT_FALSE(vscreen_openocd_parse_bytes(nullptr, out, 1));
}

TEST(OpenOcdCommand, FormatsReadMemory) {
  char cmd[64];
  const size_t n = vscreen_openocd_format_read(cmd, sizeof(cmd), 0x20000000u, 1024);
  EXPECT_EQ(n, strlen("read_memory 0x20000000 8 1024"));
  EXPECT_STREQ(cmd, "read_memory 0x20000000 8 1024");
}

TEST(OpenOcdCommand, TooSmallBuffer) {
  char cmd[8];
  EXPECT_EQ(vscreen_openocd_format_read(cmd, sizeof(cmd), 0x20000000u, 16), 0u);
  EXPECT_EQ(vscreen_openocd_format_read(nullptr, 0, 0, 16), 0u);
}

TEST(OpenOcdCommand, Terminator) {
  EXPECT_EQ(VSCREEN_OPENOCD_EOM, '\x1a');
  EXPECT_GT(VSCREEN_OPENOCD_CHUNK, 0u);
}

// ============================================================================
// Backend against a loopback server
// ============================================================================

class OpenOcdBackend : public ::testing::Test {
protected:
  void SetUp() override {
    vscreen_probe_set_ops(nullptr);
    vscreen_config_defaults(cfg);
    cfg.probe = PROBE_OPENOCD;
    strcpy(cfg.mcu, "STM32F103C8");
    vscreen_openocd_set_reply_timeout(1000);
  }

  void TearDown() override {
    vscreen_probe_end();
    server.stop();
    vscreen_openocd_set_reply_timeout(0);
  }

  void start_server() {
    ASSERT_TRUE(server.start());
    strcpy(cfg.openocd_host, "127.0.0.1");
    cfg.openocd_port = server.tcl_port();
    cfg.rtt_port = server.rtt_port();
  }

  // Count of commands equal to `cmd`.
  int sent(const std::string& cmd) const {
    int n = 0;
    for (const std::string& c : server.commands()) n += (c == cmd);
    return n;
  }

  static bool matches_target(uint32_t addr, const uint8_t* buf, size_t len) {
    for (size_t i = 0; i < len; ++i) {
      if (buf[i] != fake_openocd::Server::byte_at(addr + static_cast<uint32_t>(i))) return false;
    }
    return true;
  }

  VscreenConfig cfg;
  fake_openocd::Server server;
};

TEST_F(OpenOcdBackend, OpenAsksForVersion) {
  start_server();
  ASSERT_TRUE(vscreen_probe_begin(cfg));
  EXPECT_STREQ(vscreen_probe_name(), "openocd");
  const std::vector<std::string> cmds = server.commands();
  ASSERT_EQ(cmds.size(), 1u);
  EXPECT_EQ(cmds[0], "version");
}

TEST_F(OpenOcdBackend, UnreachableServer) {
  start_server();
  server.stop();
  EXPECT_FALSE(vscreen_probe_begin(cfg));
  EXPECT_FALSE(vscreen_probe_available());
}

TEST_F(OpenOcdBackend, LargeReadIsSplitIntoChunks) {
  start_server();
  ASSERT_TRUE(vscreen_probe_begin(cfg));

  const size_t len = 2 * VSCREEN_OPENOCD_CHUNK + 100;
  std::vector<uint8_t> buf(len, 0xEE);
  ASSERT_TRUE(vscreen_probe_read(0x20000000u, buf.data(), len));
  EXPECT_TRUE(matches_target(0x20000000u, buf.data(), len));

  const std::vector<std::string> cmds = server.commands();
  ASSERT_EQ(cmds.size(), 4u);
  EXPECT_EQ(cmds[1], "read_memory 0x20000000 8 4096");
  EXPECT_EQ(cmds[2], "read_memory 0x20001000 8 4096");
  EXPECT_EQ(cmds[3], "read_memory 0x20002000 8 100");
}

TEST_F(OpenOcdBackend, ErrorReplyFailsTheRead) {
  server.fail_on = "0x20001000";
  start_server();
  ASSERT_TRUE(vscreen_probe_begin(cfg));

  std::vector<uint8_t> buf(2 * VSCREEN_OPENOCD_CHUNK);
  EXPECT_FALSE(vscreen_probe_read(0x20000000u, buf.data(), buf.size()));
  EXPECT_EQ(sent("read_memory 0x20001000 8 4096"), 1);

  // The session survives; other addresses still read.
  uint8_t small[8];
  ASSERT_TRUE(vscreen_probe_read(0x20004000u, small, sizeof(small)));
  EXPECT_TRUE(matches_target(0x20004000u, small, sizeof(small)));
}

TEST_F(OpenOcdBackend, LateReplyIsNotPairedWithNextCommand) {
  vscreen_openocd_set_reply_timeout(300);
  server.first_read_delay_ms = 450;
  start_server();
  ASSERT_TRUE(vscreen_probe_begin(cfg));

  const size_t len = 2 * VSCREEN_OPENOCD_CHUNK;
  std::vector<uint8_t> buf(len, 0);
  EXPECT_FALSE(vscreen_probe_read(0x20000000u, buf.data(), len));     // first chunk timed out

  // The late reply to the first chunk must be dropped, not handed to the
  // next command. Every page of the fake target holds different bytes.
  std::fill(buf.begin(), buf.end(), 0);
  ASSERT_TRUE(vscreen_probe_read(0x20000000u, buf.data(), len));
  EXPECT_TRUE(matches_target(0x20000000u, buf.data(), VSCREEN_OPENOCD_CHUNK));
  EXPECT_TRUE(matches_target(0x20001000u, buf.data() + VSCREEN_OPENOCD_CHUNK, VSCREEN_OPENOCD_CHUNK));

  uint8_t tail[4];
  ASSERT_TRUE(vscreen_probe_read(0x20003000u, tail, sizeof(tail)));
  EXPECT_TRUE(matches_target(0x20003000u, tail, sizeof(tail)));
}

TEST_F(OpenOcdBackend, RttStartsServerAndStreamsText) {
  server.rtt_text = "boot\nD-VRAM: 0x20000800\n";
  start_server();
  cfg.rtt_channel = 1;
  cfg.rtt_timeout_ms = 2000;
  cfg.rtt_search_addr = 0x20000000u;
  cfg.rtt_search_size = 0x8000u;
  ASSERT_TRUE(vscreen_probe_begin(cfg));

  uint32_t addr = 0;
  ASSERT_TRUE(vscreen_rtt_discover(cfg, addr));
  EXPECT_EQ(addr, 0x20000800u);

  const std::vector<std::string> cmds = server.commands();
  ASSERT_GE(cmds.size(), 4u);
  EXPECT_EQ(cmds[1], "catch {rtt setup 0x20000000 0x8000 \"SEGGER RTT\"}");
  EXPECT_EQ(cmds[2], "catch {rtt start}");
  char start[64];
  snprintf(start, sizeof(start), "catch {rtt server start %u 1}", (unsigned)server.rtt_port());
  EXPECT_EQ(cmds[3], start);

  vscreen_probe_end();
  char stop[64];
  snprintf(stop, sizeof(stop), "catch {rtt server stop %u}", (unsigned)server.rtt_port());
  EXPECT_EQ(sent(stop), 1);
  EXPECT_EQ(sent("catch {rtt stop}"), 1);
}

TEST_F(OpenOcdBackend, FailedCatchStopsRttStart) {
  server.fail_on = "rtt start";
  start_server();
  ASSERT_TRUE(vscreen_probe_begin(cfg));

  EXPECT_FALSE(vscreen_probe_rtt_start());
  EXPECT_EQ(sent("catch {rtt setup 0x20000000 0x10000 \"SEGGER RTT\"}"), 1);
  EXPECT_EQ(sent("catch {rtt start}"), 1);
  for (const std::string& c : server.commands()) {
    EXPECT_EQ(c.find("rtt server start"), std::string::npos) << c;
  }
  uint8_t buf[8];
  EXPECT_EQ(vscreen_probe_rtt_read(0, buf, sizeof(buf)), -1);
}

TEST_F(OpenOcdBackend, LostRttConnectionIsAnError) {
  start_server();
  ASSERT_TRUE(vscreen_probe_begin(cfg));
  ASSERT_TRUE(vscreen_probe_rtt_start());

  uint8_t buf[8];
  EXPECT_EQ(vscreen_probe_rtt_read(0, buf, sizeof(buf)), 0);    // nothing sent yet
  server.stop();

  int rc = 0;
  for (int i = 0; i < 100 && rc == 0; ++i) {
    rc = vscreen_probe_rtt_read(0, buf, sizeof(buf));
    if (rc == 0) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(rc, -1);
}
