#include "scheduler.hpp"

bool Scheduler::tick(Clock::time_point now) {
    if (now - then < interval) return false;
    then = now;
    frame();
    return true;
}

void Scheduler::frame() {
    for (int i = 0; i < speed && m_cpu.running(); ++i)
        m_cpu.step_instr();

    if (m_cpu.running()) m_cpu.tick_timers();

    if (m_cpu.sound_timer > 0) m_speaker.play(TONE_HZ);
    else m_speaker.stop();

    m_renderer.render(m_cpu.display);
    ++frames;
}
