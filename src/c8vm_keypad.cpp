#include "c8vm_keypad.hpp"

#include <cstring>

namespace c8vm {

keypad::keypad(void) { reset(); }

void keypad::reset(void) { memset(input, false, sizeof(bool) * user_input_key_count); }

void keypad::set_key_pressed(uint8_t key_id, bool pressed)
{
    if (key_id >= user_input_key_count) return;
    input[key_id] = pressed;
}

std::optional<uint8_t> keypad::first_pressed(void) const
{
    for (uint8_t key_id = 0; key_id < user_input_key_count; key_id++) {
        if (input[key_id]) return key_id;
    }
    return std::nullopt;
}

} // namespace c8vm
