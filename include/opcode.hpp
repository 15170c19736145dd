// include/opcode.hpp
#pragma once
#include <cstdint>

enum class Op {
    SYS,      // 0nnn
    CLS,      // 00E0
    RET,      // 00EE
    JP,       // 1nnn
    CALL,     // 2nnn
    SE_BYTE,  // 3xkk
    SNE_BYTE, // 4xkk
    SE_REG,   // 5xy0
    LD_BYTE,  // 6xkk
    ADD_BYTE, // 7xkk
    LD_REG,   // 8xy0
    OR,       // 8xy1
    AND,      // 8xy2
    XOR,      // 8xy3
    ADD_REG,  // 8xy4
    SUB,      // 8xy5
    SHR,      // 8xy6
    SUBN,     // 8xy7
    SHL,      // 8xyE
    SNE_REG,  // 9xy0
    LD_I,     // Annn
    JP_V0,    // Bnnn
    RND,      // Cxkk
    DRW,      // Dxyn
    SKP,      // Ex9E
    SKNP,     // ExA1
    LD_VX_DT, // Fx07
    LD_VX_K,  // Fx0A
    LD_DT_VX, // Fx15
    LD_ST_VX, // Fx18
    ADD_I_VX, // Fx1E
    LD_F_VX,  // Fx29
    LD_B_VX,  // Fx33
    LD_MEM_VX, // Fx55
    LD_VX_MEM, // Fx65
    Unknown
};

// Opcode plus every field it can carry; which fields matter depends on op.
struct Instruction {
    Op       op{Op::Unknown};
    uint16_t raw{0};
    uint8_t  x{0};    // (raw & 0x0F00) >> 8
    uint8_t  y{0};    // (raw & 0x00F0) >> 4
    uint8_t  kk{0};   // raw & 0x00FF
    uint16_t nnn{0};  // raw & 0x0FFF
    uint8_t  n{0};    // raw & 0x000F
};

Instruction decode(uint16_t opcode);
