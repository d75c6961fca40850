#include "c8vm_timer.hpp"

#include <cmath>
#include <system_error>

#include "c8vm_log.hpp"

using namespace std::chrono;

namespace c8vm::timer {

cycle::cycle(double rate_Hz) : cycle_duration(1.0 / rate_Hz), last_cycle_start(clock::now()) {}

void cycle::set_rate(double rate_Hz) { cycle_duration = duration<double>(1.0 / rate_Hz); }

uint32_t cycle::consume_ready_cycles(uint32_t max_cycles, clock::time_point now)
{
    const auto elapsed = duration_cast<duration<double>>(now - last_cycle_start);
    const double ncycles_d = floor(elapsed / cycle_duration);

    if (ncycles_d < 1.0) return 0;

    // too far behind to catch up, drop the backlog
    if (ncycles_d > max_cycles) {
        last_cycle_start = now;
        return max_cycles;
    }

    const auto ncycles = (uint32_t)ncycles_d;
    last_cycle_start += duration_cast<clock::duration>(ncycles * cycle_duration);
    return ncycles;
}

double adjust_step_rate(double rate_Hz, int increments)
{
    const double adjusted = rate_Hz + increments * step_rate_increment_Hz;
    if (adjusted < min_step_rate_Hz) return min_step_rate_Hz;
    if (adjusted > max_step_rate_Hz) return max_step_rate_Hz;
    return adjusted;
}

namespace {

void count_down(uint8_t& value, clock::time_point& last_update, clock::time_point now)
{
    if (value == 0) {
        last_update = now;
        return;
    }

    const double nticks_d = floor((now - last_update) / timer_cell::period);
    if (nticks_d < 1.0) return;

    if (nticks_d >= value) {
        value = 0;
        last_update = now;
        return;
    }

    const auto nticks = (uint8_t)nticks_d;
    value -= nticks;
    last_update += duration_cast<clock::duration>(nticks * timer_cell::period);
}

} // namespace

uint8_t timer_cell::read_delay(void) const
{
    std::lock_guard<std::mutex> lock(mutex);
    return delay.value;
}

uint8_t timer_cell::read_sound(void) const
{
    std::lock_guard<std::mutex> lock(mutex);
    return sound.value;
}

void timer_cell::write_delay(uint8_t new_val, clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex);
    delay.value = new_val;
    delay.last_update = now;
}

void timer_cell::write_sound(uint8_t new_val, clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex);
    sound.value = new_val;
    sound.last_update = now;
}

void timer_cell::tick(clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex);
    count_down(delay.value, delay.last_update, now);
    count_down(sound.value, sound.last_update, now);
}

timer_thread::timer_thread(timer_cell& timers) : timers(timers), ticks_elapsed(0) {}

timer_thread::~timer_thread() { stop(); }

void timer_thread::start(void)
{
    if (worker.joinable()) return;

    stop_requested.unset();
    worker = std::thread(&timer_thread::run, this);
}

void timer_thread::stop(void)
{
    if (!worker.joinable()) return;

    stop_requested.set();
    worker.join();
    log::info("timer thread stopped after %llu ticks", (unsigned long long)ticks_elapsed);
}

void timer_thread::run(void)
{
    const auto tick_period = duration_cast<clock::duration>(timer_cell::period);
    auto next_tick = clock::now() + tick_period;

    while (!stop_requested.wait_until(true, next_tick)) {
        try {
            timers.tick();
        }
        catch (const std::system_error& e) {
            log::warn("timer tick skipped: %s", e.what());
        }

        ticks_elapsed++;
        next_tick += tick_period;

        // resynchronize instead of bursting through missed ticks after a long stall
        const auto now = clock::now();
        if (next_tick + tick_period < now) next_tick = now + tick_period;
    }
}

} // namespace c8vm::timer
