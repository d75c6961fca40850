#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "c8vm_instruction.hpp"

namespace c8vm::disassembler {

// Cowgod style mnemonic, e.g. "DRW V1, V2, 0x5"
std::string disassemble(const instruction& instr);

// Same as above, unknown opcodes come out as a raw data word ("DW 0x0123").
std::string disassemble(uint16_t opcode);

// One line per 16 bit word: "0x0200  00E0  CLS". A trailing odd byte is listed as a DB.
std::vector<std::string> disassemble_rom(const uint8_t* rom, size_t size_bytes,
                                         uint16_t origin);

} // namespace c8vm::disassembler
