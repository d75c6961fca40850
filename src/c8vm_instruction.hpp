#pragma once

#include <cstdint>
#include <optional>

namespace c8vm {

// see http://devernay.free.fr/hacks/chip8/C8TECH10.HTM#3.1
enum class instruction_kind : uint8_t {
    cls,        // 00E0
    ret,        // 00EE
    jp,         // 1NNN
    call,       // 2NNN
    se_vx_kk,   // 3XKK
    sne_vx_kk,  // 4XKK
    se_vx_vy,   // 5XY0
    ld_vx_kk,   // 6XKK
    add_vx_kk,  // 7XKK
    ld_vx_vy,   // 8XY0
    or_vx_vy,   // 8XY1
    and_vx_vy,  // 8XY2
    xor_vx_vy,  // 8XY3
    add_vx_vy,  // 8XY4
    sub_vx_vy,  // 8XY5
    shr_vx,     // 8XY6
    subn_vx_vy, // 8XY7
    shl_vx,     // 8XYE
    sne_vx_vy,  // 9XY0
    ld_i_nnn,   // ANNN
    jp_v0_nnn,  // BNNN
    rnd_vx_kk,  // CXKK
    drw,        // DXYN
    skp_vx,     // EX9E
    sknp_vx,    // EXA1
    ld_vx_dt,   // FX07
    ld_vx_k,    // FX0A
    ld_dt_vx,   // FX15
    ld_st_vx,   // FX18
    add_i_vx,   // FX1E
    ld_f_vx,    // FX29
    ld_b_vx,    // FX33
    ld_mem_vx,  // FX55
    ld_vx_mem,  // FX65
};

struct instruction {
    instruction_kind kind;
    uint16_t opcode; // raw 16 bit word
    uint8_t x;       // -X--
    uint8_t y;       // --Y-
    uint8_t n;       // ---N
    uint8_t kk;      // --KK
    uint16_t nnn;    // -NNN
};

// Returns nothing if the opcode isn't part of the CHIP-8 instruction set.
std::optional<instruction> decode(uint16_t opcode);

} // namespace c8vm
