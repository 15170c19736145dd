// include/cpu.hpp
#pragma once
#include <cstdint>
#include <array>
#include <vector>
#include <random>
#include "framebuffer.hpp"
#include "keypad.hpp"
#include "opcode.hpp"

enum class ExecMode { Running, AwaitingKey };

enum class Fault {
    None,
    UnknownOpcode,
    StackUnderflow,
    StackOverflow,
    MemoryOutOfRange
};

const char* fault_name(Fault f);

struct CPU {
    // Memory map
    static constexpr size_t   MEM_SIZE      = 4096;
    static constexpr uint16_t FONT_BEGIN    = 0x000;
    static constexpr uint16_t PROG_BEGIN    = 0x200;
    static constexpr size_t   STACK_DEPTH   = 16;
    static constexpr int      GLYPH_BYTES   = 5;
    static constexpr int      REG_COUNT     = 16;

    // Registers
    std::array<uint8_t, REG_COUNT> V{};   // V0-VF, VF doubles as carry/borrow/collision
    uint16_t I{0};
    uint16_t PC{PROG_BEGIN};
    std::vector<uint16_t> stack;          // saved return addresses, at most STACK_DEPTH
    uint8_t  delay_timer{0};
    uint8_t  sound_timer{0};

    // Memory
    std::array<uint8_t, MEM_SIZE> mem{};

    // Peripherals
    Framebuffer display;
    Keypad      keypad;

    // Control state
    ExecMode mode{ExecMode::Running};
    uint8_t  wait_reg{0};     // register receiving the key while AwaitingKey
    bool     halted{false};
    Fault    fault{Fault::None};
    uint16_t fault_pc{0};     // address of the instruction that faulted
    uint16_t fault_opcode{0};

    std::mt19937 rng{std::random_device{}()};

    // API
    void reset();
    void seed(uint32_t s) { rng.seed(s); }
    void load_fonts();
    bool load_program(const std::vector<uint8_t>& bytes, uint16_t origin = PROG_BEGIN);

    bool running() const { return !halted && mode == ExecMode::Running; }

    // Run controls
    void step_instr();               // fetch at PC and execute
    void execute(uint16_t opcode);   // PC += 2, then decode and dispatch
    void tick_timers();              // one 60 Hz timer decrement

    // Keyboard
    void key_down(uint8_t key);
    void key_up(uint8_t key);

private:
    void dispatch(const Instruction& in);
    void raise(Fault f, uint16_t opcode);
    bool in_range(uint32_t addr, uint32_t len) const { return addr + len <= MEM_SIZE; }
    void draw_sprite(const Instruction& in);
};
