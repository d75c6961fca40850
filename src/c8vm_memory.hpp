#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "c8vm_prelude.hpp"

namespace c8vm {

// 4KB of byte addressable RAM. The interpreter area [0x000, 0x200) holds the
// hex font, programs are loaded at 0x200.
class memory {
    uint8_t bytes[memory_size_bytes];

public:
    memory(void);

    // Zero everything and reload the font.
    void reset(void);

    // Copy a program to rom_memory_offset. Fails if it doesn't fit.
    bool load_rom(const uint8_t* rom, size_t size_bytes);

    static constexpr bool in_bounds(uint32_t addr) { return addr < memory_size_bytes; }

    std::optional<uint8_t> read(uint32_t addr) const;
    bool write(uint32_t addr, uint8_t value);

    // address of the 5 byte sprite for hex digit `digit` (0x0 - 0xF)
    static constexpr uint16_t font_address(uint8_t digit)
    {
        return font_glyph_bytes * (digit & 0x0F);
    }

    const uint8_t* data(void) const { return bytes; }
};

} // namespace c8vm
