#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "c8vm_display.hpp"
#include "c8vm_instruction.hpp"
#include "c8vm_keypad.hpp"
#include "c8vm_memory.hpp"
#include "c8vm_registers.hpp"
#include "c8vm_timer.hpp"

namespace c8vm {

enum class fault_kind : uint8_t {
    unknown_opcode,
    stack_overflow,
    stack_underflow,
    memory_out_of_bounds,
};

const char* to_string(fault_kind kind);

// A fatal condition raised while executing an instruction. Once raised the cpu is
// halted for good.
struct fault {
    fault_kind kind;
    uint16_t opcode;  // offending instruction (0 if it couldn't even be fetched)
    uint16_t pc;      // address of the offending instruction
    uint32_t address; // offending memory address, only meaningful for memory_out_of_bounds
};

std::string describe(const fault& f);

struct step_result {
    bool display_changed = false;
    bool halted = false;
    std::optional<fault> error;
};

struct cpu_options {
    // wrap sprites around the screen edges instead of clipping them (needed by BLITZ)
    bool wrapping_enabled = false;
};

class cpu {
    memory mem;
    display gfx;
    keypad input;
    register_file regs;
    timer::timer_cell& timers;
    const cpu_options options;

    std::optional<fault> halt_reason;
    std::deque<uint16_t> instr_history; // most recent first
    uint64_t cycles_emulated;

    cpu(timer::timer_cell& timers, const cpu_options& options);

    std::optional<fault> execute(const instruction& instr, uint16_t instr_pc);

public:
    // Returns nullptr if the ROM doesn't fit in memory.
    static std::unique_ptr<cpu> create(const uint8_t* rom, size_t rom_size_bytes,
                                       const cpu_options& options, timer::timer_cell& timers);
    static std::unique_ptr<cpu> create(const std::vector<uint8_t>& rom,
                                       const cpu_options& options, timer::timer_cell& timers);

    // Fetch, decode and execute exactly one instruction.
    step_result step(void);

    void set_key_pressed(uint8_t key_id, bool pressed) { input.set_key_pressed(key_id, pressed); }

    const display& get_display(void) const { return gfx; }
    void mark_display_presented(void) { gfx.mark_presented(); }

    bool is_halted(void) const { return halt_reason.has_value(); }
    const std::optional<fault>& get_halt_reason(void) const { return halt_reason; }

    bool is_beeping(void) const { return timers.read_sound() > 0; }

    const register_file& registers(void) const { return regs; }
    const memory& get_memory(void) const { return mem; }
    const timer::timer_cell& get_timers(void) const { return timers; }
    const std::deque<uint16_t>& history(void) const { return instr_history; }
    uint64_t cycles(void) const { return cycles_emulated; }
};

} // namespace c8vm
