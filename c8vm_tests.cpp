#define CATCH_CONFIG_MAIN // This tells Catch to provide a main() - only do this in one cpp
                          // file
#include <catch2/catch.hpp>

#include "c8vm_disassembler.hpp"
#include "c8vm_display.hpp"
#include "c8vm_instruction.hpp"
#include "c8vm_keypad.hpp"
#include "c8vm_memory.hpp"
#include "c8vm_prelude.hpp"

using namespace c8vm;

TEST_CASE("ith_hex_digit", "[opcode]")
{
    REQUIRE(ith_hex_digit<3>(0xF123) == 0x3);
    REQUIRE(ith_hex_digit<2>(0xF123) == 0x2);
    REQUIRE(ith_hex_digit<1>(0xF123) == 0x1);
    REQUIRE(ith_hex_digit<0>(0xF123) == 0xF);

    REQUIRE(ith_hex_digit<3>(0x0AB0) == 0x0);
    REQUIRE(ith_hex_digit<2>(0x0AB0) == 0xB);
    REQUIRE(ith_hex_digit<1>(0x0AB0) == 0xA);
    REQUIRE(ith_hex_digit<0>(0x0AB0) == 0x0);

    REQUIRE(ith_hex_digit<3>(0xFFFF) == 0xF);
    REQUIRE(ith_hex_digit<0>(0x0000) == 0x0);
}

TEST_CASE("decode recognizes every instruction", "[opcode]")
{
    const std::pair<uint16_t, instruction_kind> table[] = {
        {0x00E0, instruction_kind::cls},        {0x00EE, instruction_kind::ret},
        {0x1234, instruction_kind::jp},         {0x2345, instruction_kind::call},
        {0x3A12, instruction_kind::se_vx_kk},   {0x4B34, instruction_kind::sne_vx_kk},
        {0x5120, instruction_kind::se_vx_vy},   {0x6CFF, instruction_kind::ld_vx_kk},
        {0x7D01, instruction_kind::add_vx_kk},  {0x8120, instruction_kind::ld_vx_vy},
        {0x8121, instruction_kind::or_vx_vy},   {0x8122, instruction_kind::and_vx_vy},
        {0x8123, instruction_kind::xor_vx_vy},  {0x8124, instruction_kind::add_vx_vy},
        {0x8125, instruction_kind::sub_vx_vy},  {0x8126, instruction_kind::shr_vx},
        {0x8127, instruction_kind::subn_vx_vy}, {0x812E, instruction_kind::shl_vx},
        {0x9120, instruction_kind::sne_vx_vy},  {0xA123, instruction_kind::ld_i_nnn},
        {0xB123, instruction_kind::jp_v0_nnn},  {0xC1F0, instruction_kind::rnd_vx_kk},
        {0xD125, instruction_kind::drw},        {0xE19E, instruction_kind::skp_vx},
        {0xE1A1, instruction_kind::sknp_vx},    {0xF107, instruction_kind::ld_vx_dt},
        {0xF10A, instruction_kind::ld_vx_k},    {0xF115, instruction_kind::ld_dt_vx},
        {0xF118, instruction_kind::ld_st_vx},   {0xF11E, instruction_kind::add_i_vx},
        {0xF129, instruction_kind::ld_f_vx},    {0xF133, instruction_kind::ld_b_vx},
        {0xF155, instruction_kind::ld_mem_vx},  {0xF165, instruction_kind::ld_vx_mem},
    };

    for (const auto& [opcode, kind] : table) {
        INFO("opcode 0x" << std::hex << opcode);
        const auto instr = decode(opcode);
        REQUIRE(instr.has_value());
        REQUIRE(instr->kind == kind);
        REQUIRE(instr->opcode == opcode);
    }
}

TEST_CASE("decode extracts operand fields", "[opcode]")
{
    const auto drw = decode(0xDA7F);
    REQUIRE(drw);
    REQUIRE(drw->x == 0xA);
    REQUIRE(drw->y == 0x7);
    REQUIRE(drw->n == 0xF);

    const auto se = decode(0x3B7E);
    REQUIRE(se);
    REQUIRE(se->x == 0xB);
    REQUIRE(se->kk == 0x7E);

    const auto ld_i = decode(0xAFED);
    REQUIRE(ld_i);
    REQUIRE(ld_i->nnn == 0xFED);
}

TEST_CASE("decode rejects opcodes outside the instruction set", "[opcode]")
{
    REQUIRE_FALSE(decode(0x0000));
    REQUIRE_FALSE(decode(0x0123)); // SYS NNN
    REQUIRE_FALSE(decode(0x00E1));
    REQUIRE_FALSE(decode(0x5121));
    REQUIRE_FALSE(decode(0x8128));
    REQUIRE_FALSE(decode(0x812F));
    REQUIRE_FALSE(decode(0x912A));
    REQUIRE_FALSE(decode(0xE19F));
    REQUIRE_FALSE(decode(0xF100));
    REQUIRE_FALSE(decode(0xFFFF));
}

TEST_CASE("disassemble", "[disassembler]")
{
    REQUIRE(disassembler::disassemble(0x00E0) == "CLS");
    REQUIRE(disassembler::disassemble(0x00EE) == "RET");
    REQUIRE(disassembler::disassemble(0x1200) == "JP 0x200");
    REQUIRE(disassembler::disassemble(0x3A12) == "SE VA, 0x12");
    REQUIRE(disassembler::disassemble(0x8AB4) == "ADD VA, VB");
    REQUIRE(disassembler::disassemble(0xD125) == "DRW V1, V2, 0x5");
    REQUIRE(disassembler::disassemble(0xF30A) == "LD V3, K");
    REQUIRE(disassembler::disassemble(0xF455) == "LD [I], V4");
    REQUIRE(disassembler::disassemble(0x0123) == "DW 0x0123");
}

TEST_CASE("disassemble_rom lists every word", "[disassembler]")
{
    const uint8_t rom[] = {0x00, 0xE0, 0x12, 0x00, 0xAB};
    const auto listing = disassembler::disassemble_rom(rom, sizeof(rom), 0x200);

    REQUIRE(listing.size() == 3);
    REQUIRE(listing[0] == "0x0200  00E0  CLS");
    REQUIRE(listing[1] == "0x0202  1200  JP 0x200");
    REQUIRE(listing[2] == "0x0204  AB    DB 0xAB");
}

TEST_CASE("memory", "[memory]")
{
    memory mem;

    SECTION("font is loaded at address 0")
    {
        REQUIRE(*mem.read(0) == 0xF0);
        REQUIRE(*mem.read(5) == 0x20);
        REQUIRE(*mem.read(79) == 0x80);
        REQUIRE(*mem.read(80) == 0x00);
        REQUIRE(memory::font_address(0xA) == 50);
        REQUIRE(memory::font_address(0x1F) == 75);
    }

    SECTION("accesses outside 4KB are rejected")
    {
        REQUIRE(mem.read(0xFFF).has_value());
        REQUIRE_FALSE(mem.read(0x1000).has_value());
        REQUIRE(mem.write(0xFFF, 0x42));
        REQUIRE(*mem.read(0xFFF) == 0x42);
        REQUIRE_FALSE(mem.write(0x1000, 0x42));
    }

    SECTION("ROMs are loaded at 0x200 and must fit")
    {
        const uint8_t rom[] = {0x12, 0x34};
        REQUIRE(mem.load_rom(rom, sizeof(rom)));
        REQUIRE(*mem.read(0x200) == 0x12);
        REQUIRE(*mem.read(0x201) == 0x34);

        std::vector<uint8_t> too_big(allowed_rom_memory + 1, 0xAA);
        REQUIRE_FALSE(mem.load_rom(too_big.data(), too_big.size()));

        std::vector<uint8_t> just_fits(allowed_rom_memory, 0xBB);
        REQUIRE(mem.load_rom(just_fits.data(), just_fits.size()));
        REQUIRE(*mem.read(0xFFF) == 0xBB);
    }
}

TEST_CASE("display", "[display]")
{
    display gfx;

    REQUIRE_FALSE(gfx.is_dirty());

    SECTION("clearing a blank screen changes nothing")
    {
        gfx.clear();
        REQUIRE_FALSE(gfx.is_dirty());
        REQUIRE(gfx.current_revision() == 0);
    }

    SECTION("xor reports set to unset transitions")
    {
        REQUIRE_FALSE(gfx.xor_pixel(3, 4, true, false));
        REQUIRE(gfx.pixel(3, 4));
        REQUIRE(gfx.is_dirty());

        gfx.mark_presented();
        REQUIRE_FALSE(gfx.is_dirty());

        REQUIRE(gfx.xor_pixel(3, 4, true, false));
        REQUIRE_FALSE(gfx.pixel(3, 4));
        REQUIRE(gfx.is_dirty());
    }

    SECTION("zero bits leave the pixel alone")
    {
        REQUIRE_FALSE(gfx.xor_pixel(3, 4, false, false));
        REQUIRE_FALSE(gfx.pixel(3, 4));
        REQUIRE_FALSE(gfx.is_dirty());
    }

    SECTION("out of range pixels wrap or clip")
    {
        REQUIRE_FALSE(gfx.xor_pixel(64, 32, true, false));
        REQUIRE_FALSE(gfx.is_dirty());

        gfx.xor_pixel(65, 33, true, true);
        REQUIRE(gfx.pixel(1, 1));
    }

    SECTION("clear turns everything off")
    {
        gfx.xor_pixel(0, 0, true, false);
        gfx.xor_pixel(63, 31, true, false);
        gfx.mark_presented();

        gfx.clear();
        REQUIRE(gfx.is_dirty());
        for (auto i = 0; i < pixel_count; i++) {
            REQUIRE_FALSE(gfx.pixels()[i]);
        }
    }
}

TEST_CASE("keypad", "[keypad]")
{
    keypad input;

    REQUIRE_FALSE(input.first_pressed());

    input.set_key_pressed(0xB, true);
    input.set_key_pressed(0x4, true);
    REQUIRE(input.is_pressed(0xB));
    REQUIRE(input.is_pressed(0x4));
    REQUIRE(*input.first_pressed() == 0x4);

    input.set_key_pressed(0x4, false);
    REQUIRE(*input.first_pressed() == 0xB);

    // out of range keys are ignored
    input.set_key_pressed(0x10, true);
    REQUIRE_FALSE(input.is_pressed(0x10));
    REQUIRE_FALSE(input.is_pressed(0xFF));
}
