#include "c8vm_memory.hpp"

#include <cstring>

namespace c8vm {

namespace {

constexpr uint8_t c8vm_fontset[fontset_size_bytes] = {
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
    0xF0, 0x80, 0xF0, 0x80, 0x80  // F
};

} // namespace

memory::memory(void) { reset(); }

void memory::reset(void)
{
    memset(bytes, 0, sizeof(uint8_t) * memory_size_bytes);
    memcpy(bytes, c8vm_fontset, sizeof(uint8_t) * fontset_size_bytes);
}

bool memory::load_rom(const uint8_t* rom, size_t size_bytes)
{
    if (size_bytes > allowed_rom_memory) return false;
    if (size_bytes > 0) memcpy(bytes + rom_memory_offset, rom, size_bytes);
    return true;
}

std::optional<uint8_t> memory::read(uint32_t addr) const
{
    if (!in_bounds(addr)) return std::nullopt;
    return bytes[addr];
}

bool memory::write(uint32_t addr, uint8_t value)
{
    if (!in_bounds(addr)) return false;
    bytes[addr] = value;
    return true;
}

} // namespace c8vm
