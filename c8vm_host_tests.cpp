#include <catch2/catch.hpp>

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "c8vm_options.hpp"
#include "c8vm_prelude.hpp"
#include "c8vm_rom.hpp"

using namespace c8vm;

namespace fs = std::filesystem;

namespace {

template <size_t N>
std::optional<options> parse(const char* const (&argv)[N])
{
    return parse_command_line((int)N, argv);
}

fs::path write_temp_file(const std::string& name, const std::vector<uint8_t>& contents)
{
    const fs::path path = fs::temp_directory_path() / name;
    FILE* f = fopen(path.string().c_str(), "wb");
    REQUIRE(f != nullptr);
    if (!contents.empty()) {
        REQUIRE(fwrite(contents.data(), 1, contents.size(), f) == contents.size());
    }
    fclose(f);
    return path;
}

} // namespace

TEST_CASE("command line defaults", "[options]")
{
    const char* const argv[] = {"c8vm", "PONG"};
    const auto opts = parse(argv);

    REQUIRE(opts);
    REQUIRE(opts->rom_path == "PONG");
    REQUIRE_FALSE(opts->wrapping_enabled);
    REQUIRE(opts->font_path == "font.ttf");
    REQUIRE_FALSE(opts->show_debug_panel);
    REQUIRE_FALSE(opts->trace);
    REQUIRE_FALSE(opts->disassemble);
}

TEST_CASE("command line flags", "[options]")
{
    SECTION("long forms")
    {
        const char* const argv[] = {"c8vm", "--wrapping_enabled", "--font_path",
                                    "mono.ttf", "--debug", "--trace", "BLITZ"};
        const auto opts = parse(argv);
        REQUIRE(opts);
        REQUIRE(opts->rom_path == "BLITZ");
        REQUIRE(opts->wrapping_enabled);
        REQUIRE(opts->font_path == "mono.ttf");
        REQUIRE(opts->show_debug_panel);
        REQUIRE(opts->trace);
    }

    SECTION("short forms")
    {
        const char* const argv[] = {"c8vm", "BLITZ", "-w", "-f", "mono.ttf", "-d", "-t"};
        const auto opts = parse(argv);
        REQUIRE(opts);
        REQUIRE(opts->rom_path == "BLITZ");
        REQUIRE(opts->wrapping_enabled);
        REQUIRE(opts->font_path == "mono.ttf");
        REQUIRE(opts->show_debug_panel);
        REQUIRE(opts->trace);
    }

    SECTION("--font_path=value")
    {
        const char* const argv[] = {"c8vm", "--font_path=/usr/share/fonts/a.ttf", "TETRIS"};
        const auto opts = parse(argv);
        REQUIRE(opts);
        REQUIRE(opts->font_path == "/usr/share/fonts/a.ttf");
    }

    SECTION("--disassemble")
    {
        const char* const argv[] = {"c8vm", "--disassemble", "TETRIS"};
        const auto opts = parse(argv);
        REQUIRE(opts);
        REQUIRE(opts->disassemble);
    }
}

TEST_CASE("help and version don't need a ROM", "[options]")
{
    const char* const help[] = {"c8vm", "--help"};
    const auto help_opts = parse(help);
    REQUIRE(help_opts);
    REQUIRE(help_opts->show_help);

    const char* const version[] = {"c8vm", "-V"};
    const auto version_opts = parse(version);
    REQUIRE(version_opts);
    REQUIRE(version_opts->show_version);
}

TEST_CASE("malformed command lines are rejected", "[options]")
{
    SECTION("no ROM")
    {
        const char* const argv[] = {"c8vm", "-w"};
        REQUIRE_FALSE(parse(argv));
    }

    SECTION("unknown option")
    {
        const char* const argv[] = {"c8vm", "--fullscreen", "PONG"};
        REQUIRE_FALSE(parse(argv));
    }

    SECTION("two ROMs")
    {
        const char* const argv[] = {"c8vm", "PONG", "TETRIS"};
        REQUIRE_FALSE(parse(argv));
    }

    SECTION("font path without a value")
    {
        const char* const argv[] = {"c8vm", "PONG", "--font_path"};
        REQUIRE_FALSE(parse(argv));
    }

    SECTION("empty font path")
    {
        const char* const argv[] = {"c8vm", "--font_path=", "PONG"};
        REQUIRE_FALSE(parse(argv));
    }
}

TEST_CASE("ROM files are read whole", "[rom]")
{
    const std::vector<uint8_t> program = {0x00, 0xE0, 0x12, 0x00, 0xAB};
    const auto path = write_temp_file("c8vm_test_rom.ch8", program);

    const auto rom = rom::load_file(path.string());
    REQUIRE(rom);
    REQUIRE(*rom == program);

    fs::remove(path);
}

TEST_CASE("unreadable ROM files are reported", "[rom]")
{
    SECTION("missing file")
    {
        REQUIRE_FALSE(rom::load_file("/nonexistent/c8vm/rom.ch8"));
    }

    SECTION("too big")
    {
        const std::vector<uint8_t> program(allowed_rom_memory + 1, 0x00);
        const auto path = write_temp_file("c8vm_test_big_rom.ch8", program);
        REQUIRE_FALSE(rom::load_file(path.string()));
        fs::remove(path);
    }

    SECTION("largest ROM that fits")
    {
        const std::vector<uint8_t> program(allowed_rom_memory, 0x00);
        const auto path = write_temp_file("c8vm_test_max_rom.ch8", program);
        const auto rom = rom::load_file(path.string());
        REQUIRE(rom);
        REQUIRE(rom->size() == (size_t)allowed_rom_memory);
        fs::remove(path);
    }
}

TEST_CASE("ROM paths fall back to the assets directory", "[rom]")
{
    const fs::path assets = fs::temp_directory_path() / "c8vm_test_assets";
    fs::create_directories(assets / "roms");
    const auto rom_path = write_temp_file("c8vm_test_assets/roms/PONG", {0x12, 0x00});

    REQUIRE(fs::equivalent(rom::resolve_path("PONG", assets.string()), rom_path));

    // existing paths are used as given
    REQUIRE(rom::resolve_path(rom_path.string(), "/nonexistent") == rom_path.string());

    fs::remove_all(assets);
}

TEST_CASE("usage explains what --font_path does", "[options]")
{
    FILE* out = tmpfile();
    REQUIRE(out != nullptr);

    print_usage(out, "c8vm");
    rewind(out);

    std::string usage;
    char buf[256];
    while (fgets(buf, sizeof(buf), out) != nullptr) {
        usage += buf;
    }
    fclose(out);

    REQUIRE(usage.find("--font_path") != std::string::npos);
    REQUIRE(usage.find("built-in hex glyphs") != std::string::npos);
}
