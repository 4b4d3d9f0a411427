#pragma once

#include "../mapper.hpp"

/**
 * MBC5 (types $19-$1E)
 *
 * ROM: up to 8MB (512 banks, 9-bit bank number, bank 0 selectable at $4000)
 * RAM: up to 128KB (16 banks). On rumble boards RAM bank bit 3 drives the motor.
 */
class MapperMBC5 : public Mapper {
public:
    MapperMBC5(uint16_t rom_banks, uint8_t ram_banks, bool has_rumble);

    uint32_t map_rom(uint16_t addr) const override;
    void write_control(uint16_t addr, uint8_t data) override;
    bool ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram) override;
    bool ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram) override;
    void reset() override;
    void transfer_state(StateTransfer& state) override;

    bool rumble_active() const { return rumble; }

private:
    bool has_rumble;
    uint16_t rom_bank;
    uint8_t ram_bank;
    bool rumble;
};
