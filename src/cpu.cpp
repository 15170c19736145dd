#include "cpu.hpp"
#include <algorithm>

// 16 hex digit glyphs, 5 rows each, loaded at FONT_BEGIN
static constexpr std::array<uint8_t, 80> FONT = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

const char* fault_name(Fault f) {
    switch (f) {
        case Fault::None:             return "none";
        case Fault::UnknownOpcode:    return "unknown opcode";
        case Fault::StackUnderflow:   return "stack underflow";
        case Fault::StackOverflow:    return "stack overflow";
        case Fault::MemoryOutOfRange: return "memory out of range";
    }
    return "?";
}

void CPU::reset() {
    V.fill(0);
    I = 0;
    PC = PROG_BEGIN;
    stack.clear();
    delay_timer = sound_timer = 0;
    mem.fill(0);
    display.clear();
    keypad.release_all();
    mode = ExecMode::Running;
    wait_reg = 0;
    halted = false;
    fault = Fault::None;
    fault_pc = fault_opcode = 0;
    load_fonts();
}

void CPU::load_fonts() {
    std::copy(FONT.begin(), FONT.end(), mem.begin() + FONT_BEGIN);
}

bool CPU::load_program(const std::vector<uint8_t>& bytes, uint16_t origin) {
    if (!in_range(origin, static_cast<uint32_t>(bytes.size()))) return false;
    std::copy(bytes.begin(), bytes.end(), mem.begin() + origin);
    return true;
}

void CPU::raise(Fault f, uint16_t opcode) {
    halted = true;
    fault = f;
    fault_opcode = opcode;
}

void CPU::step_instr() {
    if (!running()) return;
    if (!in_range(PC, 2)) {
        fault_pc = PC;
        raise(Fault::MemoryOutOfRange, 0);
        return;
    }
    uint16_t opcode = static_cast<uint16_t>(mem[PC] << 8 | mem[PC + 1]);
    execute(opcode);
}

void CPU::execute(uint16_t opcode) {
    fault_pc = PC;
    PC += 2;
    dispatch(decode(opcode));
}

void CPU::tick_timers() {
    if (delay_timer > 0) --delay_timer;
    if (sound_timer > 0) --sound_timer;
}

void CPU::key_down(uint8_t key) {
    if (key >= Keypad::KEY_COUNT) return;
    keypad.set(key, true);
    if (mode == ExecMode::AwaitingKey) {
        V[wait_reg] = key;
        mode = ExecMode::Running;
    }
}

void CPU::key_up(uint8_t key) {
    keypad.set(key, false);
}

void CPU::draw_sprite(const Instruction& in) {
    if (!in_range(I, in.n)) {
        raise(Fault::MemoryOutOfRange, in.raw);
        return;
    }
    V[0xF] = 0;
    for (int row = 0; row < in.n; ++row) {
        uint8_t sprite = mem[I + row];
        for (int col = 0; col < 8; ++col) {
            // Column origin is Vy, not Vx. Kept as the reference machine behaves.
            if ((sprite & 0x80) && display.set_pixel(V[in.y] + col, V[in.y] + row))
                V[0xF] = 1;
            sprite = static_cast<uint8_t>(sprite << 1);
        }
    }
}

void CPU::dispatch(const Instruction& in) {
    uint8_t& vx = V[in.x];
    uint8_t& vy = V[in.y];

    switch (in.op) {
        case Op::SYS: break;
        case Op::CLS: display.clear(); break;
        case Op::RET:
            if (stack.empty()) { raise(Fault::StackUnderflow, in.raw); break; }
            PC = stack.back();
            stack.pop_back();
            break;
        case Op::JP: PC = in.nnn; break;
        case Op::CALL:
            if (stack.size() >= STACK_DEPTH) { raise(Fault::StackOverflow, in.raw); break; }
            stack.push_back(PC);
            PC = in.nnn;
            break;

        case Op::SE_BYTE:  if (vx == in.kk) PC += 2; break;
        case Op::SNE_BYTE: if (vx != in.kk) PC += 2; break;
        case Op::SE_REG:   if (vx == vy) PC += 2; break;
        case Op::SNE_REG:  if (vx != vy) PC += 2; break;

        case Op::LD_BYTE:  vx = in.kk; break;
        case Op::ADD_BYTE: vx = static_cast<uint8_t>(vx + in.kk); break;

        case Op::LD_REG: vx = vy; break;
        case Op::OR:     vx |= vy; break;
        case Op::AND:    vx &= vy; break;
        case Op::XOR:    vx ^= vy; break;
        case Op::ADD_REG: {
            uint16_t sum = static_cast<uint16_t>(vx + vy);
            V[0xF] = sum > 0xFF ? 1 : 0;
            vx = static_cast<uint8_t>(sum);
            break;
        }
        case Op::SUB:
            V[0xF] = vx > vy ? 1 : 0;
            vx = static_cast<uint8_t>(vx - vy);
            break;
        case Op::SHR:
            V[0xF] = vx & 0x01;
            vx = static_cast<uint8_t>(vx >> 1);
            break;
        case Op::SUBN:
            V[0xF] = vy > vx ? 1 : 0;
            vx = static_cast<uint8_t>(vy - vx);
            break;
        case Op::SHL:
            V[0xF] = vx & 0x80; // MSB as-is, not normalized to 1
            vx = static_cast<uint8_t>(vx << 1);
            break;

        case Op::LD_I:  I = in.nnn; break;
        case Op::JP_V0: PC = static_cast<uint16_t>(in.nnn + V[0]); break;
        case Op::RND:
            vx = static_cast<uint8_t>(std::uniform_int_distribution<int>(0, 0xFF)(rng) & in.kk);
            break;
        case Op::DRW: draw_sprite(in); break;

        case Op::SKP:  if (keypad.is_pressed(vx)) PC += 2; break;
        case Op::SKNP: if (!keypad.is_pressed(vx)) PC += 2; break;

        case Op::LD_VX_DT: vx = delay_timer; break;
        case Op::LD_VX_K:
            mode = ExecMode::AwaitingKey;
            wait_reg = in.x;
            break;
        case Op::LD_DT_VX: delay_timer = vx; break;
        case Op::LD_ST_VX: sound_timer = vx; break;
        case Op::ADD_I_VX: I = static_cast<uint16_t>(I + vx); break;
        case Op::LD_F_VX:  I = static_cast<uint16_t>(vx * GLYPH_BYTES); break;
        case Op::LD_B_VX:
            if (!in_range(I, 3)) { raise(Fault::MemoryOutOfRange, in.raw); break; }
            mem[I]     = vx / 100;
            mem[I + 1] = (vx / 10) % 10;
            mem[I + 2] = vx % 10;
            break;
        case Op::LD_MEM_VX:
            if (!in_range(I, in.x + 1u)) { raise(Fault::MemoryOutOfRange, in.raw); break; }
            for (int r = 0; r <= in.x; ++r) mem[I + r] = V[r];
            break;
        case Op::LD_VX_MEM:
            if (!in_range(I, in.x + 1u)) { raise(Fault::MemoryOutOfRange, in.raw); break; }
            for (int r = 0; r <= in.x; ++r) V[r] = mem[I + r];
            break;

        case Op::Unknown:
            raise(Fault::UnknownOpcode, in.raw);
            break;
    }
}
