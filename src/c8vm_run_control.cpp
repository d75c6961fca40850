#include "c8vm_run_control.hpp"

namespace c8vm {

run_control::run_control(double rate_Hz) : step_clock(rate_Hz), paused(false) {}

void run_control::change_rate(int increments)
{
    step_clock.set_rate(timer::adjust_step_rate(step_clock.rate_Hz(), increments));
}

uint32_t run_control::due_steps(bool halted, clock::time_point now)
{
    const uint32_t due = step_clock.consume_ready_cycles(max_steps_per_frame, now);

    if (paused || halted) return 0;

    return due;
}

bool run_control::should_beep(const cpu& vm) const
{
    return !paused && !vm.is_halted() && vm.is_beeping();
}

uint32_t run_steps(cpu& vm, uint32_t max_steps)
{
    uint32_t steps = 0;

    while (steps < max_steps) {
        const step_result result = vm.step();
        steps++;
        if (result.error) break;
    }

    return steps;
}

} // namespace c8vm
