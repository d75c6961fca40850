#include "c8vm_rom.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

#include "c8vm_defer.hpp"
#include "c8vm_log.hpp"
#include "c8vm_prelude.hpp"

namespace fs = std::filesystem;

namespace c8vm::rom {

std::optional<std::vector<uint8_t>> load_file(const std::string& rom_path)
{
    FILE* rom_file = fopen(rom_path.c_str(), "rb");

    if (rom_file == nullptr) {
        log::error("failed to load ROM from file: %s", rom_path.c_str());
        return std::nullopt;
    }
    C8VM_Defer(fclose(rom_file));

    if (fseek(rom_file, 0, SEEK_END) != 0) {
        log::error("error seeking through input ROM file: %s", rom_path.c_str());
        return std::nullopt;
    }
    const auto ftell_ret = ftell(rom_file);
    rewind(rom_file);
    if (ftell_ret < 0) {
        log::error("error determining size of input ROM file: %s", rom_path.c_str());
        return std::nullopt;
    }

    const auto file_size_bytes = static_cast<uint64_t>(ftell_ret);
    if (file_size_bytes > c8vm::allowed_rom_memory) {
        log::error("requested ROM file (%s, %llu bytes) doesn't fit in CHIP-8 memory!",
                   rom_path.c_str(), (unsigned long long)file_size_bytes);
        return std::nullopt;
    }

    std::vector<uint8_t> buffer(file_size_bytes);

    const uint64_t file_bytes_read = fread(buffer.data(), 1, file_size_bytes, rom_file);
    if (file_bytes_read != file_size_bytes) {
        log::error("error reading input ROM file: %s", rom_path.c_str());
        return std::nullopt;
    }

    log::info("successfully loaded %d bytes from %s", (int)file_size_bytes, rom_path.c_str());

    return buffer;
}

std::string resolve_path(const std::string& requested, const std::string& assets_dir)
{
    std::error_code ec;
    if (fs::exists(fs::path(requested), ec)) return requested;

    // clang-format off
    const fs::path in_assets = ( fs::path(assets_dir)
                               / fs::path("roms")
                               / fs::path(requested)
                               );
    // clang-format on

    if (fs::exists(in_assets, ec)) return in_assets.string();

    return requested;
}

} // namespace c8vm::rom
