#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "c8vm_audio.hpp"
#include "c8vm_cpu.hpp"
#include "c8vm_glfw.hpp"
#include "c8vm_options.hpp"
#include "c8vm_run_control.hpp"
#include "c8vm_timer.hpp"

namespace c8vm {

// The driver loop: ties the cpu to the window, the keyboard, the beeper and the
// 60Hz timer thread.
class emulator {
    timer::timer_cell timers;
    timer::timer_thread countdown_thread; // joined before `timers` goes away
    std::unique_ptr<cpu> vm;
    std::unique_ptr<glfw::graphics_context> gfx;
    std::unique_ptr<audio::audio_context> audio; // may be null, we then run silently
    run_control control;
    bool halt_reported;

    emulator(void);

    void on_key(int key, bool pressed);
    void run_due_steps(void);
    void update_beep(void);
    void update_title(void);

public:
    // Returns nullptr if the ROM doesn't fit or the window can't be opened.
    static std::unique_ptr<emulator> create(const options& opts, const std::vector<uint8_t>& rom);

    ~emulator();

    // Runs until the window is closed. Returns false if the cpu hit a fatal error.
    bool run(void);
};

} // namespace c8vm
