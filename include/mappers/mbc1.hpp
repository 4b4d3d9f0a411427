#pragma once

#include "../mapper.hpp"

/**
 * MBC1 (types $01-$03)
 *
 * ROM: up to 2MB (128 banks), RAM: up to 32KB (4 banks)
 *
 * BANK1 (5 bits) selects the $4000 bank; writing 0 selects 1. The check only
 * looks at these 5 bits, so banks $20/$40/$60 alias to $21/$41/$61.
 * BANK2 (2 bits) supplies ROM bank bits 5-6, or the RAM bank. In mode 1 it
 * also applies to $0000-$3FFF and to RAM.
 */
class MapperMBC1 : public Mapper {
public:
    MapperMBC1(uint16_t rom_banks, uint8_t ram_banks);

    uint32_t map_rom(uint16_t addr) const override;
    void write_control(uint16_t addr, uint8_t data) override;
    bool ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram) override;
    bool ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram) override;
    void reset() override;
    void transfer_state(StateTransfer& state) override;

private:
    uint8_t bank1;
    uint8_t bank2;
    uint8_t mode;

    uint8_t ram_bank() const { return mode ? bank2 : 0; }
};
