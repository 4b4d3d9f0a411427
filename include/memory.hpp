#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

class StateTransfer;

/**
 * Work RAM and High RAM
 *
 * $C000-$CFFF  WRAM bank 0
 * $D000-$DFFF  WRAM bank 1 (DMG) or 1-7 selected by SVBK $FF70 (CGB)
 * $E000-$FDFF  echo of $C000-$DDFF
 * $FF80-$FFFE  HRAM
 *
 * Also holds the undocumented CGB registers $FF72-$FF75.
 */
class Memory {
public:
    static constexpr size_t WRAM_BANK_SIZE = 0x1000;
    static constexpr size_t WRAM_BANKS = 8;

    explicit Memory(bool cgb_mode);

    void reset(bool cgb_mode);

    // $C000-$FDFF
    uint8_t read_wram(uint16_t addr) const;
    void write_wram(uint16_t addr, uint8_t data);

    // $FF80-$FFFE
    uint8_t read_hram(uint16_t addr) const { return hram[addr - 0xFF80]; }
    void write_hram(uint16_t addr, uint8_t data) { hram[addr - 0xFF80] = data; }

    // $FF70
    uint8_t read_svbk() const;
    void write_svbk(uint8_t data);

    // $FF72-$FF75
    uint8_t read_undocumented(uint16_t addr) const;
    void write_undocumented(uint16_t addr, uint8_t data);

    void transfer_state(StateTransfer& state);

private:
    bool cgb;
    std::array<uint8_t, WRAM_BANK_SIZE * WRAM_BANKS> wram;
    std::array<uint8_t, 0x7F> hram;
    uint8_t wram_bank;
    uint8_t undocumented[4];

    size_t wram_offset(uint16_t addr) const;
};
