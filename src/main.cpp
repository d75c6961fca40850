/****************************** LICENSE *************************************
Copyright (c) 2020 Zachary A. Meadows

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
******************************************************************************/

/*
A CHIP-8 virtual machine: the interpreter runs at a user adjustable rate while the
delay and sound timers count down at a fixed 60Hz on their own thread.
See https://en.wikipedia.org/wiki/CHIP-8
or http://devernay.free.fr/hacks/chip8/C8TECH10.HTM for more details.
*/

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>

#include "c8vm_config.h"
#include "c8vm_disassembler.hpp"
#include "c8vm_emulator.hpp"
#include "c8vm_log.hpp"
#include "c8vm_options.hpp"
#include "c8vm_rom.hpp"

int main(int argc, char* argv[])
{
    const auto opts = c8vm::parse_command_line(argc, argv);
    if (!opts) {
        c8vm::print_usage(stderr, argv[0]);
        return EXIT_FAILURE;
    }

    if (opts->show_help) {
        c8vm::print_usage(stdout, argv[0]);
        return EXIT_SUCCESS;
    }

    if (opts->show_version) {
        c8vm::print_version(stdout);
        return EXIT_SUCCESS;
    }

    c8vm::log::set_trace_enabled(opts->trace);

    const std::string rom_path = c8vm::rom::resolve_path(opts->rom_path, C8VM_ASSETS_DIR);
    const auto rom = c8vm::rom::load_file(rom_path);
    if (!rom) return EXIT_FAILURE;

    if (opts->disassemble) {
        const auto listing =
            c8vm::disassembler::disassemble_rom(rom->data(), rom->size(), c8vm::rom_memory_offset);
        for (const auto& line : listing) {
            printf("%s\n", line.c_str());
        }
        return EXIT_SUCCESS;
    }

    // seed the random number generator
    srand((unsigned)time(NULL));

    auto emu = c8vm::emulator::create(*opts, *rom);
    if (!emu) return EXIT_FAILURE;

    return emu->run() ? EXIT_SUCCESS : EXIT_FAILURE;
}
