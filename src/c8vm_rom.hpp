#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace c8vm::rom {

// Read a whole ROM image from disk. Prints the reason and returns nothing on failure,
// including when the image is too big for CHIP-8 memory.
std::optional<std::vector<uint8_t>> load_file(const std::string& rom_path);

// `requested` as given if it exists, otherwise <assets_dir>/roms/<requested>.
std::string resolve_path(const std::string& requested, const std::string& assets_dir);

} // namespace c8vm::rom
