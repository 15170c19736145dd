// include/host.hpp
#pragma once

struct Framebuffer;

// Output side of a host. Input arrives through CPU::key_down / CPU::key_up.
struct Speaker {
    virtual ~Speaker() = default;
    virtual void play(double frequency_hz) = 0; // no-op if already playing
    virtual void stop() = 0;
};

struct Renderer {
    virtual ~Renderer() = default;
    virtual void render(const Framebuffer& fb) = 0;
};
