#include <gtest/gtest.h>
#include "framebuffer.hpp"

TEST(Framebuffer, StartsBlank) {
    Framebuffer fb;
    EXPECT_EQ(fb.lit_count(), 0);
}

TEST(Framebuffer, SetPixelTogglesAndReportsErase) {
    Framebuffer fb;
    EXPECT_FALSE(fb.set_pixel(3, 4));
    EXPECT_EQ(fb.get(3, 4), 1);
    EXPECT_TRUE(fb.set_pixel(3, 4));
    EXPECT_EQ(fb.get(3, 4), 0);
}

TEST(Framebuffer, TwiceRestoresLitPixel) {
    Framebuffer fb;
    fb.set_pixel(10, 10);
    EXPECT_TRUE(fb.set_pixel(10, 10));
    EXPECT_FALSE(fb.set_pixel(10, 10));
    EXPECT_EQ(fb.get(10, 10), 1);
}

TEST(Framebuffer, WrapsPastRightEdge) {
    Framebuffer fb;
    fb.set_pixel(64, 10);
    EXPECT_EQ(fb.get(0, 10), 1);
    EXPECT_EQ(fb.lit_count(), 1);
    EXPECT_TRUE(fb.set_pixel(0, 10));
}

TEST(Framebuffer, WrapsPastLeftEdge) {
    Framebuffer fb;
    fb.set_pixel(-1, 10);
    EXPECT_EQ(fb.get(63, 10), 1);
    EXPECT_TRUE(fb.set_pixel(63, 10));
}

TEST(Framebuffer, WrapsVertically) {
    Framebuffer fb;
    fb.set_pixel(5, 32);
    fb.set_pixel(6, -1);
    EXPECT_EQ(fb.get(5, 0), 1);
    EXPECT_EQ(fb.get(6, 31), 1);
}

TEST(Framebuffer, WrapIsOneSided) {
    Framebuffer fb;
    // 200 - 64 is still off-screen: clipped, nothing drawn
    EXPECT_FALSE(fb.set_pixel(200, 3));
    EXPECT_FALSE(fb.set_pixel(3, 100));
    EXPECT_EQ(fb.lit_count(), 0);
    // 127 wraps once to 63
    fb.set_pixel(127, 3);
    EXPECT_EQ(fb.get(63, 3), 1);
}

TEST(Framebuffer, Clear) {
    Framebuffer fb;
    for (int i = 0; i < 20; ++i) fb.set_pixel(i, i);
    EXPECT_EQ(fb.lit_count(), 20);
    fb.clear();
    EXPECT_EQ(fb.lit_count(), 0);
}
