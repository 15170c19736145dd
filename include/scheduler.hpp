// include/scheduler.hpp
#pragma once
#include <chrono>
#include "cpu.hpp"
#include "host.hpp"

// Drives the CPU at a fixed 60 Hz frame rate. Late frames are dropped, not replayed.
struct Scheduler {
    using Clock = std::chrono::steady_clock;

    static constexpr int    FRAME_RATE    = 60;
    static constexpr int    DEFAULT_SPEED = 10;
    static constexpr double TONE_HZ       = 40.0;

    int               speed{DEFAULT_SPEED};   // instructions per frame
    Clock::duration   interval{std::chrono::duration_cast<Clock::duration>(
                          std::chrono::duration<double>(1.0 / FRAME_RATE))};
    Clock::time_point then{};
    uint64_t          frames{0};

    Scheduler(CPU& cpu, Speaker& speaker, Renderer& renderer)
        : m_cpu(cpu), m_speaker(speaker), m_renderer(renderer) {}

    void start(Clock::time_point now) { then = now; }

    // Host callback; runs one frame if a full interval has passed since the last one.
    bool tick(Clock::time_point now);

    // One frame of work regardless of wall-clock time.
    void frame();

private:
    CPU&      m_cpu;
    Speaker&  m_speaker;
    Renderer& m_renderer;
};
