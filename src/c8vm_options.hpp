#pragma once

#include <cstdio>
#include <optional>
#include <string>

namespace c8vm {

struct options {
    std::string rom_path;
    bool wrapping_enabled = false;
    std::string font_path = "font.ttf";
    bool show_debug_panel = false;
    bool trace = false;
    bool disassemble = false;
    bool show_help = false;
    bool show_version = false;
};

// c8vm [options] <rom>
// Prints what went wrong and returns nothing on malformed input.
std::optional<options> parse_command_line(int argc, const char* const argv[]);

void print_usage(FILE* out, const char* program_name);
void print_version(FILE* out);

} // namespace c8vm
