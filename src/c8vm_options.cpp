#include "c8vm_options.hpp"

#include <cstring>

#include "c8vm_config.h"
#include "c8vm_log.hpp"

namespace c8vm {

namespace {

bool is_flag(const char* arg, const char* short_name, const char* long_name)
{
    return (short_name != nullptr && strcmp(arg, short_name) == 0) ||
           strcmp(arg, long_name) == 0;
}

} // namespace

std::optional<options> parse_command_line(int argc, const char* const argv[])
{
    options opts;
    bool have_rom = false;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (is_flag(arg, "-h", "--help")) {
            opts.show_help = true;
        }
        else if (is_flag(arg, "-V", "--version")) {
            opts.show_version = true;
        }
        else if (is_flag(arg, "-w", "--wrapping_enabled")) {
            opts.wrapping_enabled = true;
        }
        else if (is_flag(arg, "-d", "--debug")) {
            opts.show_debug_panel = true;
        }
        else if (is_flag(arg, "-t", "--trace")) {
            opts.trace = true;
        }
        else if (is_flag(arg, nullptr, "--disassemble")) {
            opts.disassemble = true;
        }
        else if (is_flag(arg, "-f", "--font_path")) {
            if (i + 1 >= argc) {
                log::error("%s expects a path", arg);
                return std::nullopt;
            }
            opts.font_path = argv[++i];
        }
        else if (strncmp(arg, "--font_path=", 12) == 0) {
            opts.font_path = arg + 12;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            log::error("unknown option: %s", arg);
            return std::nullopt;
        }
        else if (have_rom) {
            log::error("unexpected argument: %s (ROM already given as %s)", arg,
                       opts.rom_path.c_str());
            return std::nullopt;
        }
        else {
            opts.rom_path = arg;
            have_rom = true;
        }
    }

    if (opts.font_path.empty()) {
        log::error("--font_path can't be empty");
        return std::nullopt;
    }

    if (!have_rom && !opts.show_help && !opts.show_version) {
        log::error("missing ROM path");
        return std::nullopt;
    }

    return opts;
}

void print_usage(FILE* out, const char* program_name)
{
    fprintf(out,
            "usage: %s [options] <rom>\n"
            "\n"
            "options:\n"
            "  -w, --wrapping_enabled  wrap sprites around the screen edges (needed by BLITZ)\n"
            "  -f, --font_path <path>  checked at start-up only, the debug panel always draws\n"
            "                          with the built-in hex glyphs (default: font.ttf)\n"
            "  -d, --debug             show the debug panel next to the screen\n"
            "  -t, --trace             log every executed instruction\n"
            "      --disassemble       print a listing of the ROM and exit\n"
            "  -h, --help              show this message and exit\n"
            "  -V, --version           show the version and exit\n"
            "\n"
            "controls:\n"
            "  1234/QWER/ASDF/ZXCV     CHIP-8 keypad\n"
            "  space                   pause/resume\n"
            "  up/down                 raise/lower emulation speed\n"
            "  escape                  quit\n",
            program_name);
}

void print_version(FILE* out)
{
    fprintf(out, "c8vm %d.%d\n", C8VM_VERSION_MAJOR, C8VM_VERSION_MINOR);
}

} // namespace c8vm
