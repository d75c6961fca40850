#include "c8vm_cpu.hpp"

#include <cstdio>
#include <cstdlib>

#include "c8vm_disassembler.hpp"
#include "c8vm_log.hpp"

namespace c8vm {

const char* to_string(fault_kind kind)
{
    switch (kind) {
        case fault_kind::unknown_opcode:
            return "unknown op-code";
        case fault_kind::stack_overflow:
            return "stack overflow";
        case fault_kind::stack_underflow:
            return "stack underflow";
        case fault_kind::memory_out_of_bounds:
            return "out of bounds memory access";
    }
    return "unknown fault";
}

std::string describe(const fault& f)
{
    char buf[128];

    if (f.kind == fault_kind::memory_out_of_bounds) {
        snprintf(buf, sizeof(buf), "%s (address 0x%04X) by 0x%04X [%s] at 0x%04X",
                 to_string(f.kind), (unsigned)f.address, (unsigned)f.opcode,
                 disassembler::disassemble(f.opcode).c_str(), (unsigned)f.pc);
    }
    else {
        snprintf(buf, sizeof(buf), "%s 0x%04X [%s] at 0x%04X", to_string(f.kind),
                 (unsigned)f.opcode, disassembler::disassemble(f.opcode).c_str(),
                 (unsigned)f.pc);
    }

    return buf;
}

cpu::cpu(timer::timer_cell& timers, const cpu_options& options)
    : timers(timers), options(options), cycles_emulated(0)
{
    regs.reset();
}

std::unique_ptr<cpu> cpu::create(const uint8_t* rom, size_t rom_size_bytes,
                                 const cpu_options& options, timer::timer_cell& timers)
{
    auto vm = std::unique_ptr<cpu>(new cpu(timers, options));

    if (!vm->mem.load_rom(rom, rom_size_bytes)) {
        log::error("ROM of %zu bytes doesn't fit in CHIP-8 memory (%d bytes available)",
                   rom_size_bytes, allowed_rom_memory);
        return nullptr;
    }

    timers.write_delay(0);
    timers.write_sound(0);

    return vm;
}

std::unique_ptr<cpu> cpu::create(const std::vector<uint8_t>& rom, const cpu_options& options,
                                 timer::timer_cell& timers)
{
    return create(rom.data(), rom.size(), options, timers);
}

step_result cpu::step(void)
{
    step_result result;

    if (halt_reason) {
        result.halted = true;
        result.error = halt_reason;
        return result;
    }

    const uint16_t instr_pc = regs.pc;
    const auto hi = mem.read(instr_pc);
    const auto lo = mem.read(instr_pc + 1u);

    if (!hi || !lo) {
        halt_reason = fault{fault_kind::memory_out_of_bounds, 0, instr_pc,
                            hi ? instr_pc + 1u : instr_pc};
        result.halted = true;
        result.error = halt_reason;
        return result;
    }

    const uint16_t opcode = (*hi << 8) | *lo;

    instr_history.push_front(opcode);
    if (instr_history.size() > instruction_history_size) instr_history.pop_back();

    // pc always points at the next instruction while executing the current one
    regs.pc += 2;

    const uint64_t revision_before = gfx.current_revision();

    const auto instr = decode(opcode);
    std::optional<fault> err;

    if (!instr) {
        err = fault{fault_kind::unknown_opcode, opcode, instr_pc, 0};
    }
    else {
        if (log::trace_enabled()) {
            log::trace("0x%04X  %04X  %s", (unsigned)instr_pc, (unsigned)opcode,
                       disassembler::disassemble(*instr).c_str());
        }
        err = execute(*instr, instr_pc);
    }

    cycles_emulated++;

    if (err) {
        halt_reason = err;
        result.halted = true;
        result.error = err;
    }

    result.display_changed = gfx.current_revision() != revision_before;

    return result;
}

std::optional<fault> cpu::execute(const instruction& instr, const uint16_t instr_pc)
{
    uint8_t& Vx = regs.V[instr.x];
    uint8_t& Vy = regs.V[instr.y];
    uint8_t& Vf = regs.V[0xF];
    const uint8_t KK = instr.kk;
    const uint16_t NNN = instr.nnn;

    auto out_of_bounds = [&](uint32_t addr) -> std::optional<fault> {
        return fault{fault_kind::memory_out_of_bounds, instr.opcode, instr_pc, addr};
    };

    switch (instr.kind) {
        case instruction_kind::cls: { // 00E0: clear screen
            gfx.clear();
            break;
        }
        case instruction_kind::ret: { // 00EE: return from a subroutine
            if (regs.sp == 0) {
                return fault{fault_kind::stack_underflow, instr.opcode, instr_pc, 0};
            }
            regs.sp--;
            regs.pc = regs.stack_trace[regs.sp];
            break;
        }
        case instruction_kind::jp: { // 1NNN: jump to address NNN
            regs.pc = NNN;
            break;
        }
        case instruction_kind::call: { // 2NNN: call subroutine at address NNN
            if (regs.sp >= max_stack_depth) {
                return fault{fault_kind::stack_overflow, instr.opcode, instr_pc, 0};
            }
            regs.stack_trace[regs.sp] = regs.pc;
            regs.sp++;
            regs.pc = NNN;
            break;
        }
        case instruction_kind::se_vx_kk: { // 3XKK: skip next instruction if VX == KK
            if (Vx == KK) regs.pc += 2;
            break;
        }
        case instruction_kind::sne_vx_kk: { // 4XKK: skip next instruction if VX != KK
            if (Vx != KK) regs.pc += 2;
            break;
        }
        case instruction_kind::se_vx_vy: { // 5XY0: skip next instruction if VX == VY
            if (Vx == Vy) regs.pc += 2;
            break;
        }
        case instruction_kind::ld_vx_kk: { // 6XKK
            Vx = KK;
            break;
        }
        case instruction_kind::add_vx_kk: { // 7XKK: add KK to VX (carry flag untouched)
            Vx += KK;
            break;
        }
        case instruction_kind::ld_vx_vy: { // 8XY0
            Vx = Vy;
            break;
        }
        case instruction_kind::or_vx_vy: { // 8XY1
            Vx |= Vy;
            break;
        }
        case instruction_kind::and_vx_vy: { // 8XY2
            Vx &= Vy;
            break;
        }
        case instruction_kind::xor_vx_vy: { // 8XY3
            Vx ^= Vy;
            break;
        }
        // 8XYN writes VF after VX, so with X = F the flag wins
        case instruction_kind::add_vx_vy: { // 8XY4: add VY to VX, VF = carry
            const bool carry = Vy > 0xFF - Vx;
            Vx += Vy;
            Vf = carry ? 1 : 0;
            break;
        }
        case instruction_kind::sub_vx_vy: { // 8XY5: VX -= VY, VF = NOT borrow
            const bool no_borrow = Vx >= Vy;
            Vx -= Vy;
            Vf = no_borrow ? 1 : 0;
            break;
        }
        case instruction_kind::shr_vx: { // 8XY6: VX >>= 1, VF = shifted out bit
            const uint8_t lsb = Vx & 0x01;
            Vx >>= 1;
            Vf = lsb;
            break;
        }
        case instruction_kind::subn_vx_vy: { // 8XY7: VX = VY - VX, VF = NOT borrow
            const bool no_borrow = Vy >= Vx;
            Vx = Vy - Vx;
            Vf = no_borrow ? 1 : 0;
            break;
        }
        case instruction_kind::shl_vx: { // 8XYE: VX <<= 1, VF = shifted out bit
            const uint8_t msb = (Vx & 0x80) >> 7;
            Vx <<= 1;
            Vf = msb;
            break;
        }
        case instruction_kind::sne_vx_vy: { // 9XY0: skip next instruction if VX != VY
            if (Vx != Vy) regs.pc += 2;
            break;
        }
        case instruction_kind::ld_i_nnn: { // ANNN
            regs.idx = NNN;
            break;
        }
        case instruction_kind::jp_v0_nnn: { // BNNN: jump to location V0 + NNN
            regs.pc = regs.V[0] + NNN;
            break;
        }
        case instruction_kind::rnd_vx_kk: { // CXKK: random byte AND KK
            Vx = (rand() & 255) & KK;
            break;
        }
        case instruction_kind::drw: { // DXYN: XOR an N row sprite from [I] at (VX, VY)
            const uint32_t x0 = Vx;
            const uint32_t y0 = Vy;
            const uint32_t rows = instr.n;

            if (rows > 0 && !memory::in_bounds(regs.idx + rows - 1)) {
                return out_of_bounds(regs.idx + rows - 1);
            }

            bool collision = false;

            for (uint32_t row = 0; row < rows; row++) {
                const uint8_t sprite_bits = *mem.read(regs.idx + row);

                for (uint32_t col = 0; col < 8; col++) {
                    const bool bit = ((sprite_bits >> (7 - col)) & 0x01) != 0;
                    if (gfx.xor_pixel(x0 + col, y0 + row, bit, options.wrapping_enabled)) {
                        collision = true;
                    }
                }
            }

            Vf = collision ? 1 : 0;
            break;
        }
        case instruction_kind::skp_vx: { // EX9E: skip next instruction if VXth key is pressed
            if (input.is_pressed(Vx)) regs.pc += 2;
            break;
        }
        case instruction_kind::sknp_vx: { // EXA1: skip next instruction if VXth key is NOT
                                          // pressed
            if (!input.is_pressed(Vx)) regs.pc += 2;
            break;
        }
        case instruction_kind::ld_vx_dt: { // FX07
            Vx = timers.read_delay();
            break;
        }
        case instruction_kind::ld_vx_k: { // FX0A: wait for a key press, store it in VX.
                                          // Without a key we rewind the pc so this same
                                          // instruction runs again on the next step.
            const auto key_id = input.first_pressed();
            if (!key_id) {
                regs.register_awaiting_input = instr.x;
                regs.pc -= 2;
                break;
            }
            Vx = *key_id;
            regs.register_awaiting_input.reset();
            break;
        }
        case instruction_kind::ld_dt_vx: { // FX15
            timers.write_delay(Vx);
            break;
        }
        case instruction_kind::ld_st_vx: { // FX18
            timers.write_sound(Vx);
            break;
        }
        case instruction_kind::add_i_vx: { // FX1E: VF is not affected, I saturates at 0xFFFF
            const uint32_t sum = regs.idx + Vx;
            regs.idx = sum > 0xFFFF ? 0xFFFF : sum;
            break;
        }
        case instruction_kind::ld_f_vx: { // FX29: point I at the font sprite for digit VX
            regs.idx = memory::font_address(Vx);
            break;
        }
        case instruction_kind::ld_b_vx: { // FX33: store BCD representation of VX at I
            const uint32_t I = regs.idx;
            if (!memory::in_bounds(I + 2)) return out_of_bounds(I + 2);
            const uint8_t digits[3] = {(uint8_t)(Vx / 100), (uint8_t)((Vx / 10) % 10),
                                       (uint8_t)(Vx % 10)};
            for (uint32_t i = 0; i < 3; i++) {
                if (!mem.write(I + i, digits[i])) return out_of_bounds(I + i);
            }
            break;
        }
        case instruction_kind::ld_mem_vx: { // FX55: store V0..VX at I, I unchanged
            const uint32_t I = regs.idx;
            if (!memory::in_bounds(I + instr.x)) return out_of_bounds(I + instr.x);
            for (uint32_t i = 0; i <= instr.x; i++) {
                if (!mem.write(I + i, regs.V[i])) return out_of_bounds(I + i);
            }
            break;
        }
        case instruction_kind::ld_vx_mem: { // FX65: load V0..VX from I, I unchanged
            const uint32_t I = regs.idx;
            if (!memory::in_bounds(I + instr.x)) return out_of_bounds(I + instr.x);
            for (uint32_t i = 0; i <= instr.x; i++) {
                regs.V[i] = *mem.read(I + i);
            }
            break;
        }
    }

    return std::nullopt;
}

} // namespace c8vm
