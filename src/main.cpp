// src/main.cpp
// Headless runner: executes a ROM for a fixed number of frames and prints the result.
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <cstdint>

#include "cpu.hpp"
#include "options.hpp"
#include "scheduler.hpp"

namespace {

struct SilentSpeaker : Speaker {
    bool     on{false};
    uint64_t beep_frames{0};
    void play(double) override { on = true; ++beep_frames; }
    void stop() override { on = false; }
};

struct LastFrame : Renderer {
    Framebuffer fb;
    void render(const Framebuffer& f) override { fb = f; }
};

std::string hex16(uint16_t v){ std::ostringstream o; o<<std::hex<<std::setw(4)<<std::setfill('0')<<int(v); return o.str(); }
std::string hex8(uint8_t v){ std::ostringstream o; o<<std::hex<<std::setw(2)<<std::setfill('0')<<int(v); return o.str(); }

void print_regs(const CPU& c){
    std::cout << "PC="<<hex16(c.PC)
              << "  I="<<hex16(c.I)
              << "  DT="<<hex8(c.delay_timer)
              << "  ST="<<hex8(c.sound_timer)
              << "  depth="<<c.stack.size()
              << "  mode="<<(c.mode == ExecMode::AwaitingKey ? "KEY" : "RUN") << "\n";
    for (int r = 0; r < CPU::REG_COUNT; ++r) {
        std::cout << "V" << std::hex << std::uppercase << r << std::nouppercase
                  << "=" << hex8(c.V[r]) << (r % 8 == 7 ? "\n" : "  ");
    }
}

void print_display(const Framebuffer& fb){
    std::cout << '+' << std::string(Framebuffer::WIDTH, '-') << "+\n";
    for (int y = 0; y < Framebuffer::HEIGHT; ++y) {
        std::cout << '|';
        for (int x = 0; x < Framebuffer::WIDTH; ++x)
            std::cout << (fb.get(x, y) ? '#' : ' ');
        std::cout << "|\n";
    }
    std::cout << '+' << std::string(Framebuffer::WIDTH, '-') << "+\n";
}

} // namespace

int main(int argc, char** argv){
    Options opt;
    std::string err;
    if (!parse_options(std::vector<std::string>(argv + 1, argv + argc), opt, err)) {
        std::cerr << "[chip8] " << err << "\n" << usage_text();
        return 1;
    }

    CPU cpu;
    if (!boot(cpu, opt)) return 1;

    SilentSpeaker speaker;
    LastFrame     screen;
    Scheduler     sched(cpu, speaker, screen);
    sched.speed = opt.speed;

    for (int f = 0; f < opt.frames && !cpu.halted; ++f)
        sched.frame();

    print_display(screen.fb);
    print_regs(cpu);
    std::cout << std::dec << "frames=" << sched.frames
              << "  tone frames=" << speaker.beep_frames << "\n";

    if (cpu.halted) {
        std::cerr << "[chip8] halted: " << fault_name(cpu.fault)
                  << " (opcode " << hex16(cpu.fault_opcode)
                  << " at " << hex16(cpu.fault_pc) << ")\n";
        return 2;
    }
    if (cpu.mode == ExecMode::AwaitingKey)
        std::cout << "waiting for key into V" << std::hex << std::uppercase << int(cpu.wait_reg) << "\n";
    return 0;
}
