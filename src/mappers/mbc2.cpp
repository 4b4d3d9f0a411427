#include "mappers/mbc2.hpp"
#include "save_state.hpp"

MapperMBC2::MapperMBC2(uint16_t rom_banks) : Mapper(rom_banks, 0) {
    reset();
}

void MapperMBC2::reset() {
    ram_enabled = false;
    rom_bank = 0x01;
}

uint32_t MapperMBC2::map_rom(uint16_t addr) const {
    uint32_t bank = addr < 0x4000 ? 0 : rom_bank % rom_banks;
    return bank * 0x4000 + (addr & 0x3FFF);
}

void MapperMBC2::write_control(uint16_t addr, uint8_t data) {
    if (addr >= 0x4000) {
        return;
    }

    if (addr & 0x0100) {
        rom_bank = data & 0x0F;
        if (rom_bank == 0) {
            rom_bank = 1;
        }
    } else {
        ram_enabled = (data & 0x0F) == 0x0A;
    }
}

bool MapperMBC2::ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram) {
    if (!ram_enabled || ram.size() < RAM_SIZE) {
        return false;
    }
    // Upper nibble is not connected
    data = 0xF0 | (ram[addr & 0x01FF] & 0x0F);
    return true;
}

bool MapperMBC2::ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram) {
    if (!ram_enabled || ram.size() < RAM_SIZE) {
        return false;
    }
    ram[addr & 0x01FF] = data & 0x0F;
    return true;
}

void MapperMBC2::transfer_state(StateTransfer& state) {
    state.transfer(ram_enabled);
    state.transfer(rom_bank);
}
