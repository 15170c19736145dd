#include "framebuffer.hpp"
#include <algorithm>

bool Framebuffer::set_pixel(int x, int y) {
    if (x >= WIDTH) x -= WIDTH;
    else if (x < 0) x += WIDTH;

    if (y >= HEIGHT) y -= HEIGHT;
    else if (y < 0) y += HEIGHT;

    if (x < 0 || x >= WIDTH || y < 0 || y >= HEIGHT) return false;

    uint8_t& p = pixels[x + y * WIDTH];
    p ^= 1;
    return p == 0;
}

void Framebuffer::clear() {
    pixels.fill(0);
}

int Framebuffer::lit_count() const {
    return static_cast<int>(std::count(pixels.begin(), pixels.end(), uint8_t{1}));
}
