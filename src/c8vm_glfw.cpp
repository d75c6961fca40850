#include "c8vm_glfw.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

#include <GL/glew.h>    // http://glew.sourceforge.net/
#include <GLFW/glfw3.h> // https://www.glfw.org/

#include "c8vm_config.h"
#include "c8vm_cpu.hpp"
#include "c8vm_log.hpp"

namespace c8vm::glfw {

namespace {

constexpr auto GAME_WIDTH_PIXELS = display_grid_width * graphics_context::GRID_CELL_PIXELS;
constexpr auto GAME_HEIGHT_PIXELS = display_grid_height * graphics_context::GRID_CELL_PIXELS;
constexpr auto GLYPH_ADVANCE = 5; // 4 glyph columns + 1 blank, in glyph pixels
constexpr auto LINE_ADVANCE = 7;  // 5 glyph rows + 2 blank, in glyph pixels

void key_callback(GLFWwindow* win, int key, int /* scancode */, int action, int /* mods */)
{
    if (action == GLFW_REPEAT) return;

    auto ctx = static_cast<graphics_context*>(glfwGetWindowUserPointer(win));
    if (ctx == nullptr || !ctx->key_handler) return;

    ctx->key_handler(key, action == GLFW_PRESS);
}

} // namespace

std::optional<uint8_t> keypad_index(int glfw_key)
{
    switch (glfw_key) {
        case GLFW_KEY_1:
            return 0x1;
        case GLFW_KEY_2:
            return 0x2;
        case GLFW_KEY_3:
            return 0x3;
        case GLFW_KEY_4:
            return 0xC;
        case GLFW_KEY_Q:
            return 0x4;
        case GLFW_KEY_W:
            return 0x5;
        case GLFW_KEY_E:
            return 0x6;
        case GLFW_KEY_R:
            return 0xD;
        case GLFW_KEY_A:
            return 0x7;
        case GLFW_KEY_S:
            return 0x8;
        case GLFW_KEY_D:
            return 0x9;
        case GLFW_KEY_F:
            return 0xE;
        case GLFW_KEY_Z:
            return 0xA;
        case GLFW_KEY_X:
            return 0x0;
        case GLFW_KEY_C:
            return 0xB;
        case GLFW_KEY_V:
            return 0xF;
        default:
            return std::nullopt;
    }
}

std::unique_ptr<graphics_context> graphics_context::create(bool show_debug_panel,
                                                           const std::string& font_path)
{
    if (glfwInit() != GLFW_TRUE) {
        log::error("failed to initialize glfw!");
        return nullptr;
    }

    // from here on the destructor takes care of glfwTerminate()
    auto ctx = std::unique_ptr<graphics_context>(new graphics_context());
    ctx->show_debug_panel = show_debug_panel;
    ctx->window_width_pixels = show_debug_panel ? 2 * GAME_WIDTH_PIXELS : GAME_WIDTH_PIXELS;
    ctx->window_height_pixels = GAME_HEIGHT_PIXELS;

#ifdef __APPLE__
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
#endif

    glfwWindowHint(GLFW_RESIZABLE, GL_FALSE);

    char window_name_buffer[64];
    snprintf(window_name_buffer, sizeof(window_name_buffer), "CHIP-8 VM (version %d.%d)",
             C8VM_VERSION_MAJOR, C8VM_VERSION_MINOR);

    ctx->emu_window = glfwCreateWindow(ctx->window_width_pixels, ctx->window_height_pixels,
                                       window_name_buffer, NULL, NULL);

    if (ctx->emu_window == nullptr) {
        log::error("failed to create a %dx%d window", ctx->window_width_pixels,
                   ctx->window_height_pixels);
        return nullptr;
    }

    glfwMakeContextCurrent(ctx->emu_window);
    glMatrixMode(GL_MODELVIEW);
    glLoadIdentity();
    glDisable(GL_DEPTH_TEST);

    glClearColor(0.0, 0.0, 0.0, 1.0);

    const GLenum err = glewInit();
    if (err != GLEW_OK) {
        log::error("GLEW error: %s", (const char*)glewGetErrorString(err));
        return nullptr;
    }

    const GLubyte* renderer = glGetString(GL_RENDERER); // get renderer string
    const GLubyte* version = glGetString(GL_VERSION);   // version as a string
    log::info("OpenGL renderer device: %s", (const char*)renderer);
    log::info("OpenGL version supported: %s", (const char*)version);

    glfwSetWindowUserPointer(ctx->emu_window, ctx.get());
    glfwSetKeyCallback(ctx->emu_window, key_callback);

    glfwSwapInterval(1); // enable vertical sync

    if (show_debug_panel) {
        std::error_code ec;
        if (!std::filesystem::exists(font_path, ec)) {
            log::warn("debug panel font not found: %s", font_path.c_str());
        }
        log::info("debug panel text is drawn with the interpreter's hex glyphs");
    }

    return ctx;
}

graphics_context::~graphics_context()
{
    if (this->emu_window) glfwDestroyWindow(this->emu_window);
    glfwTerminate();
}

void graphics_context::poll_events(void) { glfwPollEvents(); }

bool graphics_context::should_close(void) const { return glfwWindowShouldClose(emu_window); }

void graphics_context::request_close(void) { glfwSetWindowShouldClose(emu_window, GLFW_TRUE); }

void graphics_context::set_title(const std::string& title)
{
    glfwSetWindowTitle(emu_window, title.c_str());
}

// x, y, w, h in window pixels, origin at the top left
void graphics_context::fill_rect(float x, float y, float w, float h) const
{
    const float sx = 2.f / window_width_pixels;
    const float sy = 2.f / window_height_pixels;
    const float x0 = -1.f + x * sx;
    const float y0 = 1.f - y * sy;

    glBegin(GL_QUADS);
    {
        glVertex2f(x0, y0);
        glVertex2f(x0 + w * sx, y0);
        glVertex2f(x0 + w * sx, y0 - h * sy);
        glVertex2f(x0, y0 - h * sy);
    }
    glEnd();
}

void graphics_context::draw_screen(const c8vm::cpu& vm) const
{
    const bool* const gfx_buffer = vm.get_display().pixels();

    glColor3f(0.7734375, 0.16796875, 0.96875);

    for (auto iy = 0; iy < display_grid_height; iy++) {
        for (auto ix = 0; ix < display_grid_width; ix++) {
            if (gfx_buffer[iy * display_grid_width + ix]) {
                fill_rect(ix * GRID_CELL_PIXELS, iy * GRID_CELL_PIXELS, GRID_CELL_PIXELS,
                          GRID_CELL_PIXELS);
            }
        }
    }
}

void graphics_context::draw_hex(const c8vm::cpu& vm, float x, float y, uint32_t value,
                                int digits) const
{
    constexpr float P = DEBUG_GLYPH_PIXELS;
    const uint8_t* font = vm.get_memory().data();

    for (int i = 0; i < digits; i++) {
        const uint8_t nibble = (value >> (4 * (digits - 1 - i))) & 0x0F;
        const uint16_t glyph = memory::font_address(nibble);

        for (int row = 0; row < font_glyph_bytes; row++) {
            const uint8_t bits = font[glyph + row];
            for (int col = 0; col < 4; col++) {
                if ((bits >> (7 - col)) & 0x01) {
                    fill_rect(x + (i * GLYPH_ADVANCE + col) * P, y + row * P, P, P);
                }
            }
        }
    }
}

// Layout, one hex field per slot:
//   V0 .. V7
//   V8 .. VF
//   I  PC  SP  DT  ST
//   stack[0] .. stack[7]
//   stack[8] .. stack[15]
//   last 12 opcodes, most recent first
void graphics_context::draw_debug_panel(const c8vm::cpu& vm) const
{
    constexpr float P = DEBUG_GLYPH_PIXELS;
    constexpr float x0 = GAME_WIDTH_PIXELS + 2 * P;
    const register_file& regs = vm.registers();

    auto line_y = [](int line) { return 2 * P + line * LINE_ADVANCE * P; };

    glColor3f(0.2, 0.2, 0.2);
    fill_rect(GAME_WIDTH_PIXELS, 0, 2, GAME_HEIGHT_PIXELS);

    glColor3f(0.7578125, 0.22265625, 0.21875);
    for (auto i = 0; i < register_count; i++) {
        draw_hex(vm, x0 + (i % 8) * 3 * GLYPH_ADVANCE * P, line_y(i / 8), regs.V[i], 2);
    }

    glColor3f(0.96484375, 0.62109375, 0.47265625);
    float x = x0;
    draw_hex(vm, x, line_y(2), regs.idx, 4);
    x += 5 * GLYPH_ADVANCE * P;
    draw_hex(vm, x, line_y(2), regs.pc, 4);
    x += 5 * GLYPH_ADVANCE * P;
    draw_hex(vm, x, line_y(2), regs.sp, 2);
    x += 3 * GLYPH_ADVANCE * P;
    draw_hex(vm, x, line_y(2), vm.get_timers().read_delay(), 2);
    x += 3 * GLYPH_ADVANCE * P;
    draw_hex(vm, x, line_y(2), vm.get_timers().read_sound(), 2);

    for (auto i = 0; i < max_stack_depth; i++) {
        if (i < regs.sp) {
            glColor3f(0.5, 0.8, 0.5);
        }
        else { // unused slot
            glColor3f(0.25, 0.3, 0.25);
        }
        draw_hex(vm, x0 + (i % 8) * 5 * GLYPH_ADVANCE * P, line_y(4 + i / 8),
                 regs.stack_trace[i], 4);
    }

    glColor3f(0.6, 0.6, 0.9);
    int i = 0;
    for (const uint16_t opcode : vm.history()) {
        draw_hex(vm, x0 + (i % 8) * 5 * GLYPH_ADVANCE * P, line_y(7 + i / 8), opcode, 4);
        i++;
    }
}

void graphics_context::draw(const c8vm::cpu& vm, bool paused)
{
    glClear(GL_COLOR_BUFFER_BIT);

    draw_screen(vm);

    if (show_debug_panel) draw_debug_panel(vm);

    if (paused) {
        // two bars in the top right corner
        glColor3f(0.9, 0.9, 0.9);
        fill_rect(GAME_WIDTH_PIXELS - 30, 10, 6, 18);
        fill_rect(GAME_WIDTH_PIXELS - 18, 10, 6, 18);
    }

    glfwSwapBuffers(emu_window);
}

} // namespace c8vm::glfw
