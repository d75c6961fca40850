#pragma once

#include <chrono>
#include <cstdint>
#include <type_traits>

namespace c8vm {

constexpr auto memory_size_bytes = 4096;
constexpr auto rom_memory_offset = 0x200;
constexpr auto allowed_rom_memory = memory_size_bytes - rom_memory_offset;
constexpr auto fontset_size_bytes = 80;
constexpr auto font_glyph_bytes = 5;
constexpr auto display_grid_width = 64;
constexpr auto display_grid_height = 32;
constexpr auto pixel_count = display_grid_width * display_grid_height;
constexpr auto max_stack_depth = 16;
constexpr auto user_input_key_count = 16;
constexpr auto register_count = 16;
constexpr auto timer_frequency_Hz = 60.0;
constexpr auto instruction_history_size = 12;
constexpr auto default_step_rate_Hz = 550.0;
constexpr auto step_rate_increment_Hz = 50.0;
constexpr auto min_step_rate_Hz = 50.0;
constexpr auto max_step_rate_Hz = 5000.0;

// Monotonic clock for pacing and the 60Hz timers. Wall clock adjustments must not
// expire or stall a timer.
using clock = std::conditional<std::chrono::high_resolution_clock::is_steady,
                               std::chrono::high_resolution_clock,
                               std::chrono::steady_clock>::type;

static_assert(clock::is_steady, "c8vm::clock must be monotonic");

// Extract individual digits from the hex representation.
// ith_hex_digit<0>(0xABCD) = A
// ith_hex_digit<1>(0xABCD) = B
// ith_hex_digit<2>(0xABCD) = C
// ith_hex_digit<3>(0xABCD) = D
template <uint16_t index>
constexpr uint16_t ith_hex_digit(uint16_t opcode)
{
    static_assert(index >= 0 && index <= 3);
    constexpr uint16_t offset = 12 - index * 4;
    constexpr uint16_t mask = 0x000F << offset;
    return (mask & opcode) >> offset;
}

} // namespace c8vm
