#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

#include "c8vm_flag.hpp"
#include "c8vm_prelude.hpp"

namespace c8vm::timer {

// Fixed rate pacing for the emulation loop. The rate can be changed while running.
class cycle {
    std::chrono::duration<double> cycle_duration;
    clock::time_point last_cycle_start;

public:
    cycle(double rate_Hz);

    double rate_Hz(void) const { return 1.0 / cycle_duration.count(); }
    void set_rate(double rate_Hz);

    // Number of whole cycles elapsed since the last call, clamped to `max_cycles`.
    // Leftover time carries over to the next call.
    uint32_t consume_ready_cycles(uint32_t max_cycles, clock::time_point now = clock::now());
};

// Move the emulation rate up or down by `increments` steps of step_rate_increment_Hz,
// staying within [min_step_rate_Hz, max_step_rate_Hz].
double adjust_step_rate(double rate_Hz, int increments);

// The delay and sound timers. This is the only state shared between the cpu and
// the timer thread, so every access goes through the mutex.
class timer_cell {
    struct countdown {
        uint8_t value = 0;
        clock::time_point last_update = clock::now();
    };

    mutable std::mutex mutex;
    countdown delay;
    countdown sound;

public:
    static constexpr auto period = std::chrono::duration<double>(1.0 / timer_frequency_Hz);

    uint8_t read_delay(void) const;
    uint8_t read_sound(void) const;

    void write_delay(uint8_t new_val, clock::time_point now = clock::now());
    void write_sound(uint8_t new_val, clock::time_point now = clock::now());

    // Decrement each nonzero timer once per full period elapsed since it was last
    // written or decremented.
    void tick(clock::time_point now = clock::now());
};

// Drives a timer_cell at 60Hz from its own thread.
class timer_thread {
    timer_cell& timers;
    sync_flag stop_requested;
    std::thread worker;
    std::atomic<uint64_t> ticks_elapsed;

    void run(void);

public:
    explicit timer_thread(timer_cell& timers);
    ~timer_thread();

    timer_thread(const timer_thread&) = delete;
    timer_thread& operator=(const timer_thread&) = delete;

    void start(void);
    void stop(void);

    bool is_running(void) const { return worker.joinable(); }
    uint64_t ticks(void) const { return ticks_elapsed; }
};

} // namespace c8vm::timer
