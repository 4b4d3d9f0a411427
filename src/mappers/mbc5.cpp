#include "mappers/mbc5.hpp"
#include "save_state.hpp"

MapperMBC5::MapperMBC5(uint16_t rom_banks, uint8_t ram_banks, bool has_rumble)
    : Mapper(rom_banks, ram_banks), has_rumble(has_rumble) {
    reset();
}

void MapperMBC5::reset() {
    ram_enabled = false;
    rom_bank = 0x001;
    ram_bank = 0x00;
    rumble = false;
}

uint32_t MapperMBC5::map_rom(uint16_t addr) const {
    uint32_t bank = addr < 0x4000 ? 0 : rom_bank % rom_banks;
    return bank * 0x4000 + (addr & 0x3FFF);
}

void MapperMBC5::write_control(uint16_t addr, uint8_t data) {
    if (addr < 0x2000) {
        // MBC5 compares the full byte
        ram_enabled = data == 0x0A;
    } else if (addr < 0x3000) {
        rom_bank = (rom_bank & 0x100) | data;
    } else if (addr < 0x4000) {
        rom_bank = (rom_bank & 0x0FF) | ((data & 0x01) << 8);
    } else if (addr < 0x6000) {
        if (has_rumble) {
            rumble = data & 0x08;
            ram_bank = data & 0x07;
        } else {
            ram_bank = data & 0x0F;
        }
    }
}

bool MapperMBC5::ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram) {
    if (!ram_enabled || ram.empty()) {
        return false;
    }
    data = ram[ram_offset(ram_bank, addr, ram.size())];
    return true;
}

bool MapperMBC5::ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram) {
    if (!ram_enabled || ram.empty()) {
        return false;
    }
    ram[ram_offset(ram_bank, addr, ram.size())] = data;
    return true;
}

void MapperMBC5::transfer_state(StateTransfer& state) {
    state.transfer(ram_enabled);
    state.transfer(rom_bank);
    state.transfer(ram_bank);
    state.transfer(rumble);
}
