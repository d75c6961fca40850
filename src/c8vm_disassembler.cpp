#include "c8vm_disassembler.hpp"

#include <cstdio>

namespace c8vm::disassembler {

namespace {

template <typename... Args>
std::string format(const char* fmt, Args... args)
{
    const int size = snprintf(nullptr, 0, fmt, args...) + 1; // Extra space for '\0'
    if (size <= 1) return std::string();

    std::string line(size, '\0');
    snprintf(line.data(), size, fmt, args...);
    line.pop_back();
    return line;
}

} // namespace

std::string disassemble(const instruction& instr)
{
    const unsigned X = instr.x;
    const unsigned Y = instr.y;
    const unsigned N = instr.n;
    const unsigned KK = instr.kk;
    const unsigned NNN = instr.nnn;

    switch (instr.kind) {
        case instruction_kind::cls:
            return "CLS";
        case instruction_kind::ret:
            return "RET";
        case instruction_kind::jp:
            return format("JP 0x%03X", NNN);
        case instruction_kind::call:
            return format("CALL 0x%03X", NNN);
        case instruction_kind::se_vx_kk:
            return format("SE V%01X, 0x%02X", X, KK);
        case instruction_kind::sne_vx_kk:
            return format("SNE V%01X, 0x%02X", X, KK);
        case instruction_kind::se_vx_vy:
            return format("SE V%01X, V%01X", X, Y);
        case instruction_kind::ld_vx_kk:
            return format("LD V%01X, 0x%02X", X, KK);
        case instruction_kind::add_vx_kk:
            return format("ADD V%01X, 0x%02X", X, KK);
        case instruction_kind::ld_vx_vy:
            return format("LD V%01X, V%01X", X, Y);
        case instruction_kind::or_vx_vy:
            return format("OR V%01X, V%01X", X, Y);
        case instruction_kind::and_vx_vy:
            return format("AND V%01X, V%01X", X, Y);
        case instruction_kind::xor_vx_vy:
            return format("XOR V%01X, V%01X", X, Y);
        case instruction_kind::add_vx_vy:
            return format("ADD V%01X, V%01X", X, Y);
        case instruction_kind::sub_vx_vy:
            return format("SUB V%01X, V%01X", X, Y);
        case instruction_kind::shr_vx:
            return format("SHR V%01X", X);
        case instruction_kind::subn_vx_vy:
            return format("SUBN V%01X, V%01X", X, Y);
        case instruction_kind::shl_vx:
            return format("SHL V%01X", X);
        case instruction_kind::sne_vx_vy:
            return format("SNE V%01X, V%01X", X, Y);
        case instruction_kind::ld_i_nnn:
            return format("LD I, 0x%03X", NNN);
        case instruction_kind::jp_v0_nnn:
            return format("JP V0, 0x%03X", NNN);
        case instruction_kind::rnd_vx_kk:
            return format("RND V%01X, 0x%02X", X, KK);
        case instruction_kind::drw:
            return format("DRW V%01X, V%01X, 0x%01X", X, Y, N);
        case instruction_kind::skp_vx:
            return format("SKP V%01X", X);
        case instruction_kind::sknp_vx:
            return format("SKNP V%01X", X);
        case instruction_kind::ld_vx_dt:
            return format("LD V%01X, DT", X);
        case instruction_kind::ld_vx_k:
            return format("LD V%01X, K", X);
        case instruction_kind::ld_dt_vx:
            return format("LD DT, V%01X", X);
        case instruction_kind::ld_st_vx:
            return format("LD ST, V%01X", X);
        case instruction_kind::add_i_vx:
            return format("ADD I, V%01X", X);
        case instruction_kind::ld_f_vx:
            return format("LD F, V%01X", X);
        case instruction_kind::ld_b_vx:
            return format("LD B, V%01X", X);
        case instruction_kind::ld_mem_vx:
            return format("LD [I], V%01X", X);
        case instruction_kind::ld_vx_mem:
            return format("LD V%01X, [I]", X);
    }

    return format("DW 0x%04X", (unsigned)instr.opcode);
}

std::string disassemble(uint16_t opcode)
{
    const auto instr = decode(opcode);
    if (!instr) return format("DW 0x%04X", (unsigned)opcode);
    return disassemble(*instr);
}

std::vector<std::string> disassemble_rom(const uint8_t* rom, size_t size_bytes, uint16_t origin)
{
    std::vector<std::string> listing;
    listing.reserve(size_bytes / 2 + 1);

    size_t i = 0;
    for (; i + 1 < size_bytes; i += 2) {
        const uint16_t opcode = (rom[i] << 8) | rom[i + 1];
        listing.push_back(format("0x%04X  %04X  %s", (unsigned)(origin + i), (unsigned)opcode,
                                 disassemble(opcode).c_str()));
    }

    if (i < size_bytes) {
        listing.push_back(format("0x%04X  %02X    DB 0x%02X", (unsigned)(origin + i),
                                 (unsigned)rom[i], (unsigned)rom[i]));
    }

    return listing;
}

} // namespace c8vm::disassembler
