#include "mappers/mbc1.hpp"
#include "save_state.hpp"

MapperMBC1::MapperMBC1(uint16_t rom_banks, uint8_t ram_banks)
    : Mapper(rom_banks, ram_banks) {
    reset();
}

void MapperMBC1::reset() {
    ram_enabled = false;
    bank1 = 0x01;
    bank2 = 0x00;
    mode = 0;
}

uint32_t MapperMBC1::map_rom(uint16_t addr) const {
    uint32_t bank;
    if (addr < 0x4000) {
        bank = mode ? (bank2 << 5) : 0;
    } else {
        bank = (bank2 << 5) | bank1;
    }
    // Unused upper bank bits are not connected
    bank %= rom_banks;
    return bank * 0x4000 + (addr & 0x3FFF);
}

void MapperMBC1::write_control(uint16_t addr, uint8_t data) {
    switch (addr & 0x6000) {
        case 0x0000:
            ram_enabled = (data & 0x0F) == 0x0A;
            break;
        case 0x2000:
            bank1 = data & 0x1F;
            if (bank1 == 0) {
                bank1 = 1;
            }
            break;
        case 0x4000:
            bank2 = data & 0x03;
            break;
        case 0x6000:
            mode = data & 0x01;
            break;
    }
}

bool MapperMBC1::ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram) {
    if (!ram_enabled || ram.empty()) {
        return false;
    }
    data = ram[ram_offset(ram_bank(), addr, ram.size())];
    return true;
}

bool MapperMBC1::ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram) {
    if (!ram_enabled || ram.empty()) {
        return false;
    }
    ram[ram_offset(ram_bank(), addr, ram.size())] = data;
    return true;
}

void MapperMBC1::transfer_state(StateTransfer& state) {
    state.transfer(ram_enabled);
    state.transfer(bank1);
    state.transfer(bank2);
    state.transfer(mode);
}
