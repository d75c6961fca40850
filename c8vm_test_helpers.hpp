#pragma once

#include <cstdint>
#include <initializer_list>
#include <vector>

// Lay out opcodes big endian, as they appear in a ROM image.
inline std::vector<uint8_t> assemble(std::initializer_list<uint16_t> opcodes)
{
    std::vector<uint8_t> rom;
    rom.reserve(opcodes.size() * 2);
    for (const uint16_t opcode : opcodes) {
        rom.push_back(opcode >> 8);
        rom.push_back(opcode & 0xFF);
    }
    return rom;
}
