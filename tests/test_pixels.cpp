// test_pixels.cpp - framebuffer layouts and color expansion.

#include "vscreen_pixels.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

const uint32_t kFg = 0xFFFFFFFFu;
const uint32_t kBg = 0xFF000000u;

uint32_t at(const std::vector<uint32_t>& px, int w, int x, int y) {
  return px[static_cast<size_t>(y) * w + x];
}

} // namespace

TEST(Pixels, ModeNamesRoundTrip) {
  for (int m = 0; m < MODE_COUNT; ++m) {
    DisplayMode parsed = MODE_COUNT;
    ASSERT_TRUE(vscreen_mode_from_name(vscreen_mode_name(static_cast<DisplayMode>(m)), parsed));
    EXPECT_EQ(parsed, m);
  }
  DisplayMode unused;
  EXPECT_FALSE(vscreen_mode_from_name("rgb444", unused));
  EXPECT_FALSE(vscreen_mode_from_name(nullptr, unused));
  EXPECT_STREQ(vscreen_mode_name(MODE_COUNT), "?");
}

TEST(Pixels, FrameBytesPerLayout) {
  EXPECT_EQ(vscreen_frame_bytes(MODE_MONO, 128, 64), 1024u);
  EXPECT_EQ(vscreen_frame_bytes(MODE_MONO_HLSB, 10, 2), 4u);
  EXPECT_EQ(vscreen_frame_bytes(MODE_RGB565, 160, 128), 40960u);
  EXPECT_EQ(vscreen_frame_bytes(MODE_RGB565_BE, 2, 2), 8u);
  EXPECT_EQ(vscreen_frame_bytes(MODE_RGB888, 2, 2), 12u);
  EXPECT_EQ(vscreen_frame_bytes(MODE_GRAY8, 3, 3), 9u);
}

TEST(Pixels, RejectsBadGeometry) {
  EXPECT_EQ(vscreen_frame_bytes(MODE_MONO, 128, 60), 0u);     // partial page
  EXPECT_EQ(vscreen_frame_bytes(MODE_RGB565, 0, 10), 0u);
  EXPECT_EQ(vscreen_frame_bytes(MODE_GRAY8, VSCREEN_MAX_DIM + 1, 1), 0u);
  EXPECT_TRUE(vscreen_geometry_ok(MODE_MONO_HLSB, 10, 3));
  EXPECT_TRUE(vscreen_geometry_ok(MODE_RGB565, 128, 60));
}

TEST(Pixels, MonoPagesMapBitsToRows) {
  const int w = 4, h = 16;
  std::vector<uint8_t> raw(vscreen_frame_bytes(MODE_MONO, w, h), 0);
  ASSERT_EQ(raw.size(), 8u);
  raw[0] = 0x80;                 // page 0, column 0, bit 7 -> row 7
  raw[1 * w + 2] = 0x05;         // page 1, column 2, bits 0 and 2 -> rows 8 and 10

  std::vector<uint32_t> px(static_cast<size_t>(w) * h, 0);
  ASSERT_TRUE(vscreen_decode_frame(MODE_MONO, raw.data(), raw.size(), w, h, kFg, kBg, px.data()));

  EXPECT_EQ(at(px, w, 0, 7), kFg);
  EXPECT_EQ(at(px, w, 0, 6), kBg);
  EXPECT_EQ(at(px, w, 2, 8), kFg);
  EXPECT_EQ(at(px, w, 2, 9), kBg);
  EXPECT_EQ(at(px, w, 2, 10), kFg);
  EXPECT_EQ(at(px, w, 3, 8), kBg);

  int lit = 0;
  for (uint32_t p : px) lit += (p == kFg);
  EXPECT_EQ(lit, 3);
}

TEST(Pixels, MonoUsesGivenColors) {
  const uint8_t raw[8] = {0x01, 0, 0, 0, 0, 0, 0, 0};
  std::vector<uint32_t> px(8 * 8, 0);
  ASSERT_TRUE(vscreen_decode_frame(MODE_MONO, raw, sizeof(raw), 8, 8,
                                   0xFF00FF00u, 0xFF202020u, px.data()));
  EXPECT_EQ(px[0], 0xFF00FF00u);
  EXPECT_EQ(px[1], 0xFF202020u);
}

TEST(Pixels, MonoHlsbIsMsbFirstAndIgnoresPadding) {
  const int w = 10, h = 2;
  // Row 0: x=0 and x=9 lit. Row 1: only a padding bit (x=15) set.
  const uint8_t raw[4] = {0x80, 0x40, 0x00, 0x01};
  std::vector<uint32_t> px(static_cast<size_t>(w) * h, 0);
  ASSERT_TRUE(vscreen_decode_frame(MODE_MONO_HLSB, raw, sizeof(raw), w, h, kFg, kBg, px.data()));

  EXPECT_EQ(at(px, w, 0, 0), kFg);
  EXPECT_EQ(at(px, w, 1, 0), kBg);
  EXPECT_EQ(at(px, w, 8, 0), kBg);
  EXPECT_EQ(at(px, w, 9, 0), kFg);
  for (int x = 0; x < w; ++x) EXPECT_EQ(at(px, w, x, 1), kBg) << "x=" << x;
}

TEST(Pixels, Rgb565ExpandsByShifting) {
  EXPECT_EQ(vscreen_rgb565_to_argb(0xF800), 0xFFF80000u);
  EXPECT_EQ(vscreen_rgb565_to_argb(0x07E0), 0xFF00FC00u);
  EXPECT_EQ(vscreen_rgb565_to_argb(0x001F), 0xFF0000F8u);
  EXPECT_EQ(vscreen_rgb565_to_argb(0xFFFF), 0xFFF8FCF8u);
  EXPECT_EQ(vscreen_rgb565_to_argb(0x0000), 0xFF000000u);
}

TEST(Pixels, Rgb565ByteOrder) {
  const uint8_t le[4] = {0x00, 0xF8, 0x1F, 0x00};   // red, blue
  const uint8_t be[4] = {0xF8, 0x00, 0x00, 0x1F};
  uint32_t out_le[2] = {0, 0};
  uint32_t out_be[2] = {0, 0};

  ASSERT_TRUE(vscreen_decode_frame(MODE_RGB565, le, sizeof(le), 2, 1, kFg, kBg, out_le));
  ASSERT_TRUE(vscreen_decode_frame(MODE_RGB565_BE, be, sizeof(be), 2, 1, kFg, kBg, out_be));

  EXPECT_EQ(out_le[0], 0xFFF80000u);
  EXPECT_EQ(out_le[1], 0xFF0000F8u);
  EXPECT_EQ(out_be[0], out_le[0]);
  EXPECT_EQ(out_be[1], out_le[1]);
}

TEST(Pixels, Rgb888AndGray8) {
  const uint8_t rgb[3] = {0x12, 0x34, 0x56};
  const uint8_t gray[1] = {0x80};
  uint32_t out = 0;

  ASSERT_TRUE(vscreen_decode_frame(MODE_RGB888, rgb, sizeof(rgb), 1, 1, kFg, kBg, &out));
  EXPECT_EQ(out, 0xFF123456u);
  ASSERT_TRUE(vscreen_decode_frame(MODE_GRAY8, gray, sizeof(gray), 1, 1, kFg, kBg, &out));
  EXPECT_EQ(out, 0xFF808080u);
}

TEST(Pixels, ShortBufferLeavesOutputUntouched) {
  const uint8_t raw[3] = {0xFF, 0xFF, 0xFF};
  std::vector<uint32_t> px(4, 0xDEADBEEFu);

  EXPECT_FALSE(vscreen_decode_frame(MODE_RGB565, raw, sizeof(raw), 2, 1, kFg, kBg, px.data()));
  EXPECT_FALSE(vscreen_decode_frame(MODE_MONO, raw, sizeof(raw), 2, 12, kFg, kBg, px.data()));
  EXPECT_FALSE(vscreen_decode_frame(MODE_GRAY8, nullptr, 4, 2, 2, kFg, kBg, px.data()));
  EXPECT_FALSE(vscreen_decode_frame(MODE_GRAY8, raw, sizeof(raw), 1, 1, kFg, kBg, nullptr));
  for (uint32_t p : px) EXPECT_EQ(p, 0xDEADBEEFu);
}
