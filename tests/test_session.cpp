// test_session.cpp - full runs against the fake probe and fake display.

#include "fake_probe.hpp"
#include "vscreen_probe.hpp"
#include "vscreen_session.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace {

const uint32_t kBase = 0x20000000u;

std::string slurp(const std::string& path) {
  std::string data;
  FILE* fp = fopen(path.c_str(), "rb");
  if (!fp) return data;
  char buf[256];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), fp)) > 0) data.append(buf, n);
  fclose(fp);
  return data;
}

class Session : public ::testing::Test {
protected:
  void SetUp() override {
    fake_probe::reset();
    fake_display::reset();
    vscreen_probe_set_ops(fake_probe::ops());

    // 16x8 mono: one page, 16 bytes, at kBase + 0x10.
    vscreen_config_defaults(cfg);
    strcpy(cfg.mcu, "TESTCHIP");
    cfg.width = 16;
    cfg.height = 8;
    cfg.fps = 240;
    cfg.retries = 2;
    cfg.has_address = true;
    cfg.address = kBase + 0x10;
    cfg.rtt_timeout_ms = 200;

    fake_probe::state().base = kBase;
    fake_probe::state().memory.assign(0x40, 0);
    fake_probe::state().memory[0x10 + 3] = 0x01;     // pixel (3, 0)

    snapshot = ::testing::TempDir() + "vscreen_session_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".ppm";
    remove(snapshot.c_str());
  }

  void TearDown() override {
    vscreen_probe_end();
    vscreen_probe_set_ops(nullptr);
    remove(snapshot.c_str());
  }

  void headless() {
    strcpy(cfg.snapshot_path, snapshot.c_str());
  }

  // Private S-key directory per test, so parallel ctest runs do not collide.
  std::string snapshot_dir(const char* name) {
    const std::string dir = ::testing::TempDir() + name;
    if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) ADD_FAILURE() << "mkdir " << dir;
    strcpy(cfg.snapshot_dir, dir.c_str());
    return dir + "/";
  }

  VscreenConfig cfg;
  std::string snapshot;
};

} // namespace

TEST_F(Session, HeadlessWritesOneDecodedFrame) {
  headless();
  ASSERT_EQ(vscreen_session_run(cfg, nullptr), VSCREEN_EXIT_OK);

  EXPECT_EQ(vscreen_session_frames(), 1u);
  EXPECT_EQ(fake_probe::state().last_addr, kBase + 0x10);
  EXPECT_EQ(fake_probe::state().last_len, 16u);
  EXPECT_EQ(fake_probe::state().close_count, 1);
  EXPECT_FALSE(vscreen_probe_available());

  const std::string data = slurp(snapshot);
  const std::string header = "P6\n16 8\n255\n";
  ASSERT_EQ(data.size(), header.size() + 16 * 8 * 3);
  const unsigned char* px = reinterpret_cast<const unsigned char*>(data.data() + header.size());
  EXPECT_EQ(px[3 * 3], 0xFF);     // (3, 0) lit
  EXPECT_EQ(px[0], 0x00);         // (0, 0) dark
  EXPECT_EQ(px[3 * (16 + 3)], 0x00);  // (3, 1) dark
}

TEST_F(Session, HeadlessDiscoversAddressOverRtt) {
  headless();
  cfg.has_address = false;
  fake_probe::state().rtt_text = "booting\nD-VRAM: 0x20000010\n";

  ASSERT_EQ(vscreen_session_run(cfg, nullptr), VSCREEN_EXIT_OK);
  EXPECT_EQ(fake_probe::state().last_channel, 0);
  EXPECT_EQ(fake_probe::state().last_addr, 0x20000010u);
}

TEST_F(Session, MissingAnnouncementFails) {
  headless();
  cfg.has_address = false;
  fake_probe::state().rtt_text = "no address here\n";

  EXPECT_EQ(vscreen_session_run(cfg, nullptr), VSCREEN_EXIT_FAILURE);
  EXPECT_EQ(fake_probe::state().read_count, 0);
  EXPECT_EQ(fake_probe::state().close_count, 1);
}

TEST_F(Session, HeadlessRetriesTransientFailures) {
  headless();
  fake_probe::state().fail_reads = 2;

  ASSERT_EQ(vscreen_session_run(cfg, nullptr), VSCREEN_EXIT_OK);
  EXPECT_EQ(fake_probe::state().read_count, 3);
  EXPECT_FALSE(slurp(snapshot).empty());
}

TEST_F(Session, HeadlessGivesUpAfterRetries) {
  headless();
  cfg.retries = 1;
  fake_probe::state().fail_reads = 5;

  EXPECT_EQ(vscreen_session_run(cfg, nullptr), VSCREEN_EXIT_FAILURE);
  EXPECT_EQ(fake_probe::state().read_count, 2);
  EXPECT_EQ(fake_probe::state().close_count, 1);
  EXPECT_TRUE(slurp(snapshot).empty());
}

TEST_F(Session, ProbeOpenFailure) {
  headless();
  fake_probe::state().fail_open = true;
  EXPECT_EQ(vscreen_session_run(cfg, nullptr), VSCREEN_EXIT_FAILURE);
  EXPECT_EQ(fake_probe::state().read_count, 0);
}

TEST_F(Session, NoDisplayAndNoSnapshot) {
  EXPECT_EQ(vscreen_session_run(cfg, nullptr), VSCREEN_EXIT_FAILURE);
  EXPECT_EQ(fake_probe::state().open_count, 0);
}

TEST_F(Session, FrameMustFitAddressSpace) {
  headless();
  cfg.address = 0xFFFFFFF8u;
  EXPECT_EQ(vscreen_session_run(cfg, nullptr), VSCREEN_EXIT_FAILURE);
  EXPECT_EQ(fake_probe::state().read_count, 0);
  EXPECT_EQ(fake_probe::state().close_count, 1);
}

TEST_F(Session, InvalidGeometryFailsBeforeOpening) {
  headless();
  cfg.height = 12;     // not whole mono pages
  EXPECT_EQ(vscreen_session_run(cfg, nullptr), VSCREEN_EXIT_FAILURE);
  EXPECT_EQ(fake_probe::state().open_count, 0);
}

TEST_F(Session, WindowedPresentsUntilClosed) {
  fake_display::state().polls_left = 3;

  ASSERT_EQ(vscreen_session_run(cfg, fake_display::ops()), VSCREEN_EXIT_OK);

  const fake_display::State& d = fake_display::state();
  EXPECT_EQ(d.begin_count, 1);
  EXPECT_EQ(d.end_count, 1);
  EXPECT_EQ(d.title, "Virtual Screen");
  EXPECT_EQ(d.w, 16);
  EXPECT_EQ(d.h, 8);
  EXPECT_EQ(d.scale, 2);
  EXPECT_EQ(d.present_count, 1 + 3);       // background, then one per tick
  EXPECT_EQ(vscreen_session_frames(), 3u);
  EXPECT_EQ(fake_probe::state().read_count, 3);
  EXPECT_EQ(fake_probe::state().close_count, 1);

  ASSERT_EQ(d.last_frame.size(), 16u * 8u);
  EXPECT_EQ(d.last_frame[3], cfg.fg);
  EXPECT_EQ(d.last_frame[0], cfg.bg);
}

TEST_F(Session, WindowedToleratesFailuresWithinBudget) {
  fake_display::state().polls_left = 5;
  fake_probe::state().fail_reads = 2;       // == retries

  ASSERT_EQ(vscreen_session_run(cfg, fake_display::ops()), VSCREEN_EXIT_OK);
  EXPECT_EQ(fake_display::state().present_count, 1 + 3);
  EXPECT_EQ(vscreen_session_frames(), 3u);
}

TEST_F(Session, WindowedGivesUpOnConsecutiveFailures) {
  fake_display::state().polls_left = 100;
  fake_probe::state().fail_all_reads = true;

  EXPECT_EQ(vscreen_session_run(cfg, fake_display::ops()), VSCREEN_EXIT_FAILURE);
  EXPECT_EQ(fake_probe::state().read_count, cfg.retries + 1);
  EXPECT_EQ(fake_display::state().present_count, 1);    // background only
  EXPECT_EQ(fake_display::state().end_count, 1);
  EXPECT_EQ(fake_probe::state().close_count, 1);
  for (uint32_t p : fake_display::state().last_frame) EXPECT_EQ(p, cfg.bg);
}

TEST_F(Session, WindowedBeginFailure) {
  fake_display::state().fail_begin = true;

  EXPECT_EQ(vscreen_session_run(cfg, fake_display::ops()), VSCREEN_EXIT_FAILURE);
  EXPECT_EQ(fake_display::state().end_count, 1);
  EXPECT_EQ(fake_probe::state().read_count, 0);
  EXPECT_EQ(fake_probe::state().close_count, 1);
}

TEST_F(Session, SnapshotKeySavesLastGoodFrame) {
  const std::string shot = snapshot_dir("vscreen_snap_good") + "vscreen-000.ppm";
  remove(shot.c_str());
  fake_display::state().polls_left = 3;
  fake_display::state().snapshot_at = 1;    // S pressed before the second tick

  ASSERT_EQ(vscreen_session_run(cfg, fake_display::ops()), VSCREEN_EXIT_OK);

  const std::string data = slurp(shot);
  remove(shot.c_str());
  const std::string header = "P6\n16 8\n255\n";
  ASSERT_EQ(data.size(), header.size() + 16 * 8 * 3);
  EXPECT_EQ(data.substr(0, header.size()), header);
  const unsigned char* px = reinterpret_cast<const unsigned char*>(data.data() + header.size());
  EXPECT_EQ(px[3 * 3], 0xFF);     // (3, 0) lit
  EXPECT_EQ(px[0], 0x00);
}

TEST_F(Session, SnapshotKeyAfterFailedReadKeepsPreviousImage) {
  const std::string shot = snapshot_dir("vscreen_snap_failed") + "vscreen-000.ppm";
  remove(shot.c_str());
  fake_display::state().polls_left = 2;
  fake_display::state().snapshot_at = 0;
  fake_probe::state().fail_reads = 1;       // first tick has nothing to show yet

  ASSERT_EQ(vscreen_session_run(cfg, fake_display::ops()), VSCREEN_EXIT_OK);

  const std::string data = slurp(shot);
  remove(shot.c_str());
  const std::string header = "P6\n16 8\n255\n";
  ASSERT_EQ(data.size(), header.size() + 16 * 8 * 3);
  for (size_t i = header.size(); i < data.size(); ++i) {
    ASSERT_EQ(static_cast<unsigned char>(data[i]), 0x00) << "byte " << i;   // background only
  }
}

TEST_F(Session, SnapshotKeySkipsExistingFiles) {
  const std::string dir = snapshot_dir("vscreen_snap_skip");
  const std::string first = dir + "vscreen-000.ppm";
  const std::string second = dir + "vscreen-001.ppm";
  remove(second.c_str());
  FILE* fp = fopen(first.c_str(), "wb");
  ASSERT_NE(fp, nullptr);
  fputs("keep", fp);
  fclose(fp);
  fake_display::state().polls_left = 2;
  fake_display::state().snapshot_at = 1;

  ASSERT_EQ(vscreen_session_run(cfg, fake_display::ops()), VSCREEN_EXIT_OK);

  EXPECT_EQ(slurp(first), "keep");
  EXPECT_FALSE(slurp(second).empty());
  remove(first.c_str());
  remove(second.c_str());
}

TEST_F(Session, SnapshotPathForcesHeadless) {
  headless();
  ASSERT_EQ(vscreen_session_run(cfg, fake_display::ops()), VSCREEN_EXIT_OK);
  EXPECT_EQ(fake_display::state().begin_count, 0);
  EXPECT_FALSE(slurp(snapshot).empty());
}
