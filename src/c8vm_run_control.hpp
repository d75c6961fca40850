#pragma once

#include <cstdint>

#include "c8vm_cpu.hpp"
#include "c8vm_prelude.hpp"
#include "c8vm_timer.hpp"

namespace c8vm {

// Pause state and step rate of the driver loop, and what they mean for the cpu each
// frame. Knows nothing about the window.
class run_control {
    timer::cycle step_clock;
    bool paused;

public:
    static constexpr uint32_t max_steps_per_frame = 1024;

    explicit run_control(double rate_Hz = default_step_rate_Hz);

    bool is_paused(void) const { return paused; }
    void toggle_pause(void) { paused = !paused; }

    double rate_Hz(void) const { return step_clock.rate_Hz(); }
    // Only the cpu speeds up or slows down, the timers stay at 60Hz.
    void change_rate(int increments);

    // Steps owed since the last frame. Time spent paused or halted is thrown away
    // so resuming doesn't burst through a backlog.
    uint32_t due_steps(bool halted, clock::time_point now = clock::now());

    bool should_beep(const cpu& vm) const;
};

// Step `vm` up to `max_steps` times, stopping after the first fault.
// Returns the number of step() calls made.
uint32_t run_steps(cpu& vm, uint32_t max_steps);

} // namespace c8vm
