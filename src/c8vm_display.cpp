#include "c8vm_display.hpp"

#include <cstring>

namespace c8vm {

display::display(void) : dirty(false), revision(0)
{
    memset(gfx, false, sizeof(bool) * pixel_count);
}

void display::clear(void)
{
    bool any_lit = false;
    for (auto i = 0; i < pixel_count; i++) {
        if (gfx[i]) {
            any_lit = true;
            break;
        }
    }

    if (!any_lit) return;

    memset(gfx, false, sizeof(bool) * pixel_count);
    dirty = true;
    revision++;
}

bool display::xor_pixel(uint32_t x, uint32_t y, bool value, bool wrapping_enabled)
{
    if (wrapping_enabled) {
        x %= display_grid_width;
        y %= display_grid_height;
    }
    else if (x >= display_grid_width || y >= display_grid_height) {
        return false;
    }

    if (!value) return false;

    bool& pixel_state = gfx[y * display_grid_width + x];
    const bool collision = pixel_state;
    pixel_state = !pixel_state;

    dirty = true;
    revision++;

    return collision;
}

} // namespace c8vm
