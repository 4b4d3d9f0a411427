#pragma once

#include "../mapper.hpp"

/**
 * MBC2 (types $05, $06)
 *
 * ROM: up to 256KB (16 banks). 512 x 4-bit RAM built into the controller,
 * echoed through $A000-$BFFF. Address bit 8 chooses between the RAM-enable
 * and ROM-bank registers in $0000-$3FFF.
 */
class MapperMBC2 : public Mapper {
public:
    static constexpr size_t RAM_SIZE = 512;

    MapperMBC2(uint16_t rom_banks);

    uint32_t map_rom(uint16_t addr) const override;
    void write_control(uint16_t addr, uint8_t data) override;
    bool ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram) override;
    bool ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram) override;
    void reset() override;
    void transfer_state(StateTransfer& state) override;

private:
    uint8_t rom_bank;
};
