// test_snapshot.cpp - binary PPM output.

#include "vscreen_snapshot.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

namespace {

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

} // namespace

TEST(Snapshot, WritesHeaderAndRgbTriples) {
  const std::string path = ::testing::TempDir() + "vscreen_snapshot_2x2.ppm";
  const uint32_t argb[4] = {0xFF112233u, 0xFFAABBCCu, 0xFF000000u, 0x80FFFFFFu};

  ASSERT_TRUE(vscreen_snapshot_write_ppm(path.c_str(), 2, 2, argb));

  const std::string data = slurp(path);
  const std::string header = "P6\n2 2\n255\n";
  ASSERT_EQ(data.size(), header.size() + 12);
  EXPECT_EQ(data.substr(0, header.size()), header);

  const std::string body(
      "\x11\x22\x33\xAA\xBB\xCC"
      "\x00\x00\x00\xFF\xFF\xFF", 12);
  EXPECT_EQ(data.substr(header.size()), body);   // alpha dropped
  remove(path.c_str());
}

TEST(Snapshot, RejectsBadArguments) {
  const uint32_t px = 0;
  const std::string path = ::testing::TempDir() + "vscreen_snapshot_bad.ppm";
  EXPECT_FALSE(vscreen_snapshot_write_ppm(nullptr, 1, 1, &px));
  EXPECT_FALSE(vscreen_snapshot_write_ppm("", 1, 1, &px));
  EXPECT_FALSE(vscreen_snapshot_write_ppm(path.c_str(), 0, 1, &px));
  EXPECT_FALSE(vscreen_snapshot_write_ppm(path.c_str(), 1, 1, nullptr));
}

TEST(Snapshot, UnwritablePathFails) {
  const uint32_t px = 0;
  EXPECT_FALSE(vscreen_snapshot_write_ppm("/nonexistent-vscreen-dir/frame.ppm", 1, 1, &px));
}
