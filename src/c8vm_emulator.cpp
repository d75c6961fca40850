#include "c8vm_emulator.hpp"

#include <cstdio>
#include <string>

#include <GLFW/glfw3.h>

#include "c8vm_log.hpp"

namespace c8vm {

emulator::emulator(void)
    : countdown_thread(timers), control(default_step_rate_Hz), halt_reported(false)
{
}

emulator::~emulator() { countdown_thread.stop(); }

std::unique_ptr<emulator> emulator::create(const options& opts, const std::vector<uint8_t>& rom)
{
    auto emu = std::unique_ptr<emulator>(new emulator());

    cpu_options cpu_opts;
    cpu_opts.wrapping_enabled = opts.wrapping_enabled;

    emu->vm = cpu::create(rom, cpu_opts, emu->timers);
    if (!emu->vm) return nullptr;

    emu->gfx = glfw::graphics_context::create(opts.show_debug_panel, opts.font_path);
    if (!emu->gfx) return nullptr;

    emu->gfx->key_handler = [e = emu.get()](int key, bool pressed) { e->on_key(key, pressed); };

    emu->audio = audio::audio_context::create();
    if (!emu->audio) log::warn("no audio device available, running without sound");

    return emu;
}

void emulator::on_key(int key, bool pressed)
{
    if (const auto key_id = glfw::keypad_index(key)) {
        vm->set_key_pressed(*key_id, pressed);
        return;
    }

    if (!pressed) return;

    switch (key) {
        case GLFW_KEY_ESCAPE:
            gfx->request_close();
            break;
        case GLFW_KEY_SPACE:
            control.toggle_pause();
            log::info("%s", control.is_paused() ? "paused" : "resumed");
            update_title();
            break;
        case GLFW_KEY_UP:
        case GLFW_KEY_DOWN: {
            control.change_rate(key == GLFW_KEY_UP ? 1 : -1);
            log::info("emulation rate: %.0f Hz", control.rate_Hz());
            update_title();
            break;
        }
        default:
            break;
    }
}

void emulator::run_due_steps(void)
{
    run_steps(*vm, control.due_steps(vm->is_halted()));

    if (vm->is_halted() && !halt_reported) {
        log::error("cpu halted: %s", describe(*vm->get_halt_reason()).c_str());
        log::error("the display is frozen, close the window to quit");
        halt_reported = true;

        if (audio) audio->stop_beep();
        countdown_thread.stop();

        update_title();
    }
}

void emulator::update_beep(void)
{
    if (!audio) return;

    if (control.should_beep(*vm)) {
        audio->start_beep();
    }
    else {
        audio->stop_beep();
    }
}

void emulator::update_title(void)
{
    char title[128];

    if (vm->is_halted()) {
        snprintf(title, sizeof(title), "CHIP-8 VM - halted: %s",
                 to_string(vm->get_halt_reason()->kind));
    }
    else {
        snprintf(title, sizeof(title), "CHIP-8 VM - %.0f Hz%s", control.rate_Hz(),
                 control.is_paused() ? " (paused)" : "");
    }

    gfx->set_title(title);
}

bool emulator::run(void)
{
    countdown_thread.start();
    update_title();

    while (!gfx->should_close()) {
        gfx->poll_events();

        run_due_steps();
        update_beep();

        gfx->draw(*vm, control.is_paused());
        vm->mark_display_presented();
    }

    if (audio) audio->stop_beep();
    countdown_thread.stop();

    log::info("terminating VM after %llu cycles", (unsigned long long)vm->cycles());

    return !vm->is_halted();
}

} // namespace c8vm
