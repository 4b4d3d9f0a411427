#include "mappers/rom_only.hpp"

MapperRomOnly::MapperRomOnly(uint16_t rom_banks, uint8_t ram_banks)
    : Mapper(rom_banks, ram_banks) {
    reset();
}

void MapperRomOnly::reset() {
    ram_enabled = true;
}

uint32_t MapperRomOnly::map_rom(uint16_t addr) const {
    return addr & 0x7FFF;
}

void MapperRomOnly::write_control(uint16_t /*addr*/, uint8_t /*data*/) {
    // No registers
}

void MapperRomOnly::transfer_state(StateTransfer& /*state*/) {
}
