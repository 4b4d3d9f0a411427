#include "memory.hpp"
#include "save_state.hpp"

Memory::Memory(bool cgb_mode) {
    reset(cgb_mode);
}

void Memory::reset(bool cgb_mode) {
    cgb = cgb_mode;
    wram.fill(0x00);
    hram.fill(0x00);
    wram_bank = 1;
    undocumented[0] = 0x00;
    undocumented[1] = 0x00;
    undocumented[2] = 0x00;
    undocumented[3] = 0x00;
}

size_t Memory::wram_offset(uint16_t addr) const {
    // Echo area maps back onto $C000
    if (addr >= 0xE000) {
        addr -= 0x2000;
    }
    if (addr < 0xD000) {
        return addr - 0xC000;
    }
    return wram_bank * WRAM_BANK_SIZE + (addr - 0xD000);
}

uint8_t Memory::read_wram(uint16_t addr) const {
    return wram[wram_offset(addr)];
}

void Memory::write_wram(uint16_t addr, uint8_t data) {
    wram[wram_offset(addr)] = data;
}

uint8_t Memory::read_svbk() const {
    if (!cgb) {
        return 0xFF;
    }
    return 0xF8 | wram_bank;
}

void Memory::write_svbk(uint8_t data) {
    if (!cgb) {
        return;
    }
    // Bank 0 selects bank 1
    wram_bank = data & 0x07;
    if (wram_bank == 0) {
        wram_bank = 1;
    }
}

uint8_t Memory::read_undocumented(uint16_t addr) const {
    switch (addr) {
        case 0xFF72: return undocumented[0];
        case 0xFF73: return undocumented[1];
        case 0xFF74: return cgb ? undocumented[2] : 0xFF;
        case 0xFF75: return 0x8F | undocumented[3];
        default:     return 0xFF;
    }
}

void Memory::write_undocumented(uint16_t addr, uint8_t data) {
    switch (addr) {
        case 0xFF72: undocumented[0] = data; break;
        case 0xFF73: undocumented[1] = data; break;
        case 0xFF74: if (cgb) undocumented[2] = data; break;
        case 0xFF75: undocumented[3] = data & 0x70; break;
        default: break;
    }
}

void Memory::transfer_state(StateTransfer& state) {
    state.transfer(wram);
    state.transfer(hram);
    state.transfer(wram_bank);
    state.transfer(undocumented);
}
