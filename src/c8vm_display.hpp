#pragma once

#include <cstdint>

#include "c8vm_prelude.hpp"

namespace c8vm {

// 64x32 monochrome frame buffer, row major.
class display {
    bool gfx[pixel_count];
    bool dirty;
    uint64_t revision; // bumped every time a pixel changes

public:
    display(void);

    // Turn every pixel off. Only marks the buffer dirty if something was lit.
    void clear(void);

    // XOR one pixel onto the grid. Returns true if a lit pixel was turned off.
    // Out of range coordinates either wrap around the edges or are dropped.
    bool xor_pixel(uint32_t x, uint32_t y, bool value, bool wrapping_enabled);

    bool pixel(uint32_t x, uint32_t y) const
    {
        return gfx[(y % display_grid_height) * display_grid_width + (x % display_grid_width)];
    }

    const bool* pixels(void) const { return gfx; }

    bool is_dirty(void) const { return dirty; }
    void mark_presented(void) { dirty = false; }

    uint64_t current_revision(void) const { return revision; }
};

} // namespace c8vm
