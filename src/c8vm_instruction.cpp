#include "c8vm_instruction.hpp"

#include "c8vm_prelude.hpp"

namespace c8vm {

namespace {

std::optional<instruction_kind> decode_0x0NNN(const uint16_t opcode)
{
    switch (opcode) {
        case 0x00E0:
            return instruction_kind::cls;
        case 0x00EE:
            return instruction_kind::ret;
        default:
            // 0NNN (call RCA 1802 machine code) can't be emulated
            return std::nullopt;
    }
}

std::optional<instruction_kind> decode_0x8XYN(const uint16_t opcode)
{
    switch (opcode & 0x000F) {
        case 0x0000:
            return instruction_kind::ld_vx_vy;
        case 0x0001:
            return instruction_kind::or_vx_vy;
        case 0x0002:
            return instruction_kind::and_vx_vy;
        case 0x0003:
            return instruction_kind::xor_vx_vy;
        case 0x0004:
            return instruction_kind::add_vx_vy;
        case 0x0005:
            return instruction_kind::sub_vx_vy;
        case 0x0006:
            return instruction_kind::shr_vx;
        case 0x0007:
            return instruction_kind::subn_vx_vy;
        case 0x000E:
            return instruction_kind::shl_vx;
        default:
            return std::nullopt;
    }
}

std::optional<instruction_kind> decode_0xEXNN(const uint16_t opcode)
{
    switch (opcode & 0x00FF) {
        case 0x009E:
            return instruction_kind::skp_vx;
        case 0x00A1:
            return instruction_kind::sknp_vx;
        default:
            return std::nullopt;
    }
}

std::optional<instruction_kind> decode_0xFXNN(const uint16_t opcode)
{
    switch (opcode & 0x00FF) {
        case 0x0007:
            return instruction_kind::ld_vx_dt;
        case 0x000A:
            return instruction_kind::ld_vx_k;
        case 0x0015:
            return instruction_kind::ld_dt_vx;
        case 0x0018:
            return instruction_kind::ld_st_vx;
        case 0x001E:
            return instruction_kind::add_i_vx;
        case 0x0029:
            return instruction_kind::ld_f_vx;
        case 0x0033:
            return instruction_kind::ld_b_vx;
        case 0x0055:
            return instruction_kind::ld_mem_vx;
        case 0x0065:
            return instruction_kind::ld_vx_mem;
        default:
            return std::nullopt;
    }
}

std::optional<instruction_kind> decode_kind(const uint16_t opcode)
{
    switch (opcode & 0xF000) {
        case 0x0000:
            return decode_0x0NNN(opcode);
        case 0x1000:
            return instruction_kind::jp;
        case 0x2000:
            return instruction_kind::call;
        case 0x3000:
            return instruction_kind::se_vx_kk;
        case 0x4000:
            return instruction_kind::sne_vx_kk;
        case 0x5000:
            if ((opcode & 0x000F) != 0) return std::nullopt;
            return instruction_kind::se_vx_vy;
        case 0x6000:
            return instruction_kind::ld_vx_kk;
        case 0x7000:
            return instruction_kind::add_vx_kk;
        case 0x8000:
            return decode_0x8XYN(opcode);
        case 0x9000:
            if ((opcode & 0x000F) != 0) return std::nullopt;
            return instruction_kind::sne_vx_vy;
        case 0xA000:
            return instruction_kind::ld_i_nnn;
        case 0xB000:
            return instruction_kind::jp_v0_nnn;
        case 0xC000:
            return instruction_kind::rnd_vx_kk;
        case 0xD000:
            return instruction_kind::drw;
        case 0xE000:
            return decode_0xEXNN(opcode);
        case 0xF000:
            return decode_0xFXNN(opcode);
        default:
            return std::nullopt;
    }
}

} // namespace

std::optional<instruction> decode(uint16_t opcode)
{
    const auto kind = decode_kind(opcode);
    if (!kind) return std::nullopt;

    instruction instr;
    instr.kind = *kind;
    instr.opcode = opcode;
    instr.x = (uint8_t)ith_hex_digit<1>(opcode);
    instr.y = (uint8_t)ith_hex_digit<2>(opcode);
    instr.n = (uint8_t)ith_hex_digit<3>(opcode);
    instr.kk = opcode & 0x00FF;
    instr.nnn = opcode & 0x0FFF;
    return instr;
}

} // namespace c8vm
