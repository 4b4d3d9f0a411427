#pragma once

#include "../mapper.hpp"

/**
 * ROM only (types $00, $08, $09)
 *
 * 32KB mapped directly, optional 8KB RAM always enabled.
 */
class MapperRomOnly : public Mapper {
public:
    MapperRomOnly(uint16_t rom_banks, uint8_t ram_banks);

    uint32_t map_rom(uint16_t addr) const override;
    void write_control(uint16_t addr, uint8_t data) override;
    void reset() override;
    void transfer_state(StateTransfer& state) override;
};
