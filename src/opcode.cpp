#include "opcode.hpp"

static Op decode_op(uint16_t opcode) {
    switch (opcode & 0xF000) {
        case 0x0000:
            if (opcode == 0x00E0) return Op::CLS;
            if (opcode == 0x00EE) return Op::RET;
            return Op::SYS;
        case 0x1000: return Op::JP;
        case 0x2000: return Op::CALL;
        case 0x3000: return Op::SE_BYTE;
        case 0x4000: return Op::SNE_BYTE;
        case 0x5000: return Op::SE_REG;
        case 0x6000: return Op::LD_BYTE;
        case 0x7000: return Op::ADD_BYTE;
        case 0x8000:
            switch (opcode & 0x000F) {
                case 0x0: return Op::LD_REG;
                case 0x1: return Op::OR;
                case 0x2: return Op::AND;
                case 0x3: return Op::XOR;
                case 0x4: return Op::ADD_REG;
                case 0x5: return Op::SUB;
                case 0x6: return Op::SHR;
                case 0x7: return Op::SUBN;
                case 0xE: return Op::SHL;
                default:  return Op::Unknown;
            }
        case 0x9000: return Op::SNE_REG;
        case 0xA000: return Op::LD_I;
        case 0xB000: return Op::JP_V0;
        case 0xC000: return Op::RND;
        case 0xD000: return Op::DRW;
        case 0xE000:
            switch (opcode & 0x00FF) {
                case 0x9E: return Op::SKP;
                case 0xA1: return Op::SKNP;
                default:   return Op::Unknown;
            }
        case 0xF000:
            switch (opcode & 0x00FF) {
                case 0x07: return Op::LD_VX_DT;
                case 0x0A: return Op::LD_VX_K;
                case 0x15: return Op::LD_DT_VX;
                case 0x18: return Op::LD_ST_VX;
                case 0x1E: return Op::ADD_I_VX;
                case 0x29: return Op::LD_F_VX;
                case 0x33: return Op::LD_B_VX;
                case 0x55: return Op::LD_MEM_VX;
                case 0x65: return Op::LD_VX_MEM;
                default:   return Op::Unknown;
            }
    }
    return Op::Unknown;
}

Instruction decode(uint16_t opcode) {
    Instruction in;
    in.op  = decode_op(opcode);
    in.raw = opcode;
    in.x   = static_cast<uint8_t>((opcode & 0x0F00) >> 8);
    in.y   = static_cast<uint8_t>((opcode & 0x00F0) >> 4);
    in.kk  = static_cast<uint8_t>(opcode & 0x00FF);
    in.nnn = static_cast<uint16_t>(opcode & 0x0FFF);
    in.n   = static_cast<uint8_t>(opcode & 0x000F);
    return in;
}
