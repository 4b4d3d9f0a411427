#include "mapper.hpp"

Mapper::Mapper(uint16_t rom_banks, uint8_t ram_banks)
    : rom_banks(rom_banks), ram_banks(ram_banks), ram_enabled(false) {
}

uint32_t Mapper::ram_offset(uint8_t bank, uint16_t addr, size_t ram_size) const {
    uint32_t offset = bank * 0x2000 + (addr & 0x1FFF);
    return offset % ram_size;
}

bool Mapper::ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram) {
    if (!ram_enabled || ram.empty()) {
        return false;
    }
    data = ram[ram_offset(0, addr, ram.size())];
    return true;
}

bool Mapper::ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram) {
    if (!ram_enabled || ram.empty()) {
        return false;
    }
    ram[ram_offset(0, addr, ram.size())] = data;
    return true;
}
