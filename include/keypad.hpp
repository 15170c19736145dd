// include/keypad.hpp
#pragma once
#include <cstdint>
#include <array>

// Held-state of the 16-key hex keypad.
struct Keypad {
    static constexpr int KEY_COUNT = 16;

    std::array<bool, KEY_COUNT> held{};

    bool is_pressed(uint8_t key) const { return key < KEY_COUNT && held[key]; }
    void set(uint8_t key, bool down) { if (key < KEY_COUNT) held[key] = down; }
    void release_all() { held.fill(false); }
};
