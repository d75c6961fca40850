#include <catch2/catch.hpp>

#include "c8vm_cpu.hpp"
#include "c8vm_run_control.hpp"
#include "c8vm_test_helpers.hpp"

using namespace c8vm;
using namespace std::chrono;

TEST_CASE("due steps follow the step rate", "[driver]")
{
    const auto before = clock::now();
    run_control control(100.0);

    REQUIRE(control.due_steps(false, before + milliseconds(35)) == 3);
    REQUIRE(control.due_steps(false, before + milliseconds(45)) == 1);

    // a stall is capped at one frame's worth of steps
    REQUIRE(control.due_steps(false, before + seconds(20)) == run_control::max_steps_per_frame);
}

TEST_CASE("no steps while paused", "[driver]")
{
    const auto before = clock::now();
    run_control control(100.0);

    control.toggle_pause();
    REQUIRE(control.is_paused());
    REQUIRE(control.due_steps(false, before + milliseconds(500)) == 0);

    // time spent paused is not owed afterwards
    control.toggle_pause();
    REQUIRE_FALSE(control.is_paused());
    REQUIRE(control.due_steps(false, before + milliseconds(505)) == 0);
    REQUIRE(control.due_steps(false, before + milliseconds(515)) == 1);
}

TEST_CASE("no steps once halted", "[driver]")
{
    const auto before = clock::now();
    run_control control(100.0);

    REQUIRE(control.due_steps(true, before + milliseconds(500)) == 0);
}

TEST_CASE("rate changes are clamped and leave the timers alone", "[driver][timer]")
{
    timer::timer_cell timers;
    const auto t0 = clock::now();
    timers.write_delay(30, t0);

    run_control control;
    REQUIRE(control.rate_Hz() == Approx(default_step_rate_Hz));

    control.change_rate(2);
    REQUIRE(control.rate_Hz() == Approx(650.0));
    control.change_rate(-1000);
    REQUIRE(control.rate_Hz() == Approx(min_step_rate_Hz));
    control.change_rate(1000);
    REQUIRE(control.rate_Hz() == Approx(max_step_rate_Hz));

    timers.tick(t0 + milliseconds(170));
    REQUIRE(timers.read_delay() == 20);
}

TEST_CASE("run_steps stops at the first fault", "[driver]")
{
    timer::timer_cell timers;
    auto vm = cpu::create(assemble({0x6001, 0x7001, 0x0000, 0x7001}), cpu_options{}, timers);
    REQUIRE(vm);

    REQUIRE(run_steps(*vm, 100) == 3);
    REQUIRE(vm->is_halted());
    REQUIRE(vm->registers().V[0] == 2);
    REQUIRE(vm->cycles() == 3);

    REQUIRE(run_steps(*vm, 0) == 0);
}

TEST_CASE("run_steps runs exactly the due steps", "[driver]")
{
    timer::timer_cell timers;
    auto vm = cpu::create(assemble({0x7001, 0x1200}), cpu_options{}, timers);
    REQUIRE(vm);

    REQUIRE(run_steps(*vm, 10) == 10);
    REQUIRE(vm->registers().V[0] == 5);
    REQUIRE_FALSE(vm->is_halted());
}

TEST_CASE("the beep follows the sound timer", "[driver][audio]")
{
    timer::timer_cell timers;
    auto vm = cpu::create(assemble({0x6010, 0xF018, 0x1204}), cpu_options{}, timers);
    REQUIRE(vm);

    run_control control;
    REQUIRE_FALSE(control.should_beep(*vm));

    run_steps(*vm, 2);
    REQUIRE(control.should_beep(*vm));

    control.toggle_pause();
    REQUIRE_FALSE(control.should_beep(*vm));
    control.toggle_pause();

    timers.write_sound(0);
    REQUIRE_FALSE(control.should_beep(*vm));
}

TEST_CASE("a fault silences the beep", "[driver][audio]")
{
    timer::timer_cell timers;
    auto vm = cpu::create(assemble({0x60FF, 0xF018, 0x0000}), cpu_options{}, timers);
    REQUIRE(vm);

    run_control control;
    REQUIRE(run_steps(*vm, 10) == 3);

    REQUIRE(vm->is_halted());
    REQUIRE(timers.read_sound() == 0xFF);
    REQUIRE_FALSE(control.should_beep(*vm));
}
