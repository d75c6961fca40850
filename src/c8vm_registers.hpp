#pragma once

#include <cstdint>
#include <cstring>
#include <optional>

#include "c8vm_prelude.hpp"

namespace c8vm {

// see https://en.wikipedia.org/wiki/CHIP-8#Virtual_machine_description
// The delay/sound timers are not in here, they live in timer::timer_cell.
struct register_file {
    uint8_t V[register_count];
    uint16_t stack_trace[max_stack_depth];
    uint16_t idx; // index register
    uint16_t pc;  // program counter
    uint16_t sp;  // stack "pointer", i.e. current call depth

    // set while an FX0A instruction is stalled waiting for a key
    std::optional<uint8_t> register_awaiting_input;

    void reset(void)
    {
        memset(V, 0, sizeof(uint8_t) * register_count);
        memset(stack_trace, 0, sizeof(uint16_t) * max_stack_depth);
        idx = 0;
        pc = rom_memory_offset;
        sp = 0;
        register_awaiting_input.reset();
    }
};

} // namespace c8vm
