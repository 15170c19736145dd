// include/framebuffer.hpp
#pragma once
#include <cstdint>
#include <array>

// 64x32 monochrome display. Pixels are toggled, never set directly.
struct Framebuffer {
    static constexpr int WIDTH  = 64;
    static constexpr int HEIGHT = 32;

    std::array<uint8_t, WIDTH * HEIGHT> pixels{};

    // XOR one pixel. Each coordinate wraps once (x == 64 -> 0, x == -1 -> 63);
    // anything still off-screen is clipped. Returns true if the pixel was erased.
    bool set_pixel(int x, int y);
    void clear();

    uint8_t get(int x, int y) const { return pixels[x + y * WIDTH]; }
    int     lit_count() const;
};
