#pragma once

#include <cstdint>
#include <optional>

#include "c8vm_prelude.hpp"

namespace c8vm {

// State of the 16 key hex keypad:
//  1 2 3 C
//  4 5 6 D
//  7 8 9 E
//  A 0 B F
class keypad {
    bool input[user_input_key_count];

public:
    keypad(void);

    void reset(void);

    // Keys outside [0x0, 0xF] are ignored.
    void set_key_pressed(uint8_t key_id, bool pressed);

    // Keys outside [0x0, 0xF] are never pressed.
    bool is_pressed(uint8_t key_id) const
    {
        return key_id < user_input_key_count && input[key_id];
    }

    // lowest numbered key currently held down, if any
    std::optional<uint8_t> first_pressed(void) const;
};

} // namespace c8vm
