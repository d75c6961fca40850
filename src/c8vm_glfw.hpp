#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct GLFWwindow;

namespace c8vm {
class cpu;
}

namespace c8vm::glfw {

// COSMAC VIP keypad laid out on the left of a QWERTY keyboard:
//  1 2 3 4      1 2 3 C
//  Q W E R  ->  4 5 6 D
//  A S D F      7 8 9 E
//  Z X C V      A 0 B F
std::optional<uint8_t> keypad_index(int glfw_key);

struct graphics_context {
    static constexpr auto GRID_CELL_PIXELS = 10;
    static constexpr auto DEBUG_GLYPH_PIXELS = 3;

    GLFWwindow* emu_window = nullptr;
    int window_width_pixels = 0;
    int window_height_pixels = 0;
    bool show_debug_panel = false;

    // called with (glfw key, pressed) for every key press and release
    std::function<void(int, bool)> key_handler;

    // Returns nullptr if the window or the OpenGL context couldn't be set up.
    static std::unique_ptr<graphics_context> create(bool show_debug_panel,
                                                    const std::string& font_path);

    ~graphics_context();

    void poll_events(void);
    bool should_close(void) const;
    void request_close(void);
    void set_title(const std::string& title);

    void draw(const c8vm::cpu& vm, bool paused);

private:
    graphics_context() = default;

    void fill_rect(float x, float y, float w, float h) const;
    void draw_screen(const c8vm::cpu& vm) const;
    void draw_debug_panel(const c8vm::cpu& vm) const;
    void draw_hex(const c8vm::cpu& vm, float x, float y, uint32_t value, int digits) const;
};

} // namespace c8vm::glfw
