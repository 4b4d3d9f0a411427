#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

class StateTransfer;

/**
 * Mapper Base Class (Memory Bank Controller)
 *
 * Translates CPU addresses in the cartridge ranges into ROM/RAM offsets.
 * The set of mappers is closed: Cartridge::create_mapper() picks one from the
 * header's cartridge-type byte when the image is loaded.
 *
 * $0000-$3FFF  ROM bank 0 (bank-switched on some MBC1 boards)
 * $4000-$7FFF  switchable ROM bank
 * $A000-$BFFF  external RAM / RTC registers
 * Writes to $0000-$7FFF go to the mapper's control registers.
 */
class Mapper {
public:
    Mapper(uint16_t rom_banks, uint8_t ram_banks);
    virtual ~Mapper() = default;

    // Offset into the ROM image for a read in $0000-$7FFF
    virtual uint32_t map_rom(uint16_t addr) const = 0;

    // Control register write in $0000-$7FFF
    virtual void write_control(uint16_t addr, uint8_t data) = 0;

    // External RAM ($A000-$BFFF). Returns false when nothing drives the bus.
    virtual bool ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram);
    virtual bool ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram);

    virtual void reset() = 0;

    // Real-time ticks elapsed, 4194304 per second regardless of CPU speed
    virtual void clock(uint32_t /*ticks*/) {}

    virtual void transfer_state(StateTransfer& state) = 0;

protected:
    uint16_t rom_banks;   // 16KB units
    uint8_t ram_banks;    // 8KB units
    bool ram_enabled;

    // Offset of addr inside the selected 8KB RAM bank, wrapped to the RAM size
    uint32_t ram_offset(uint8_t bank, uint16_t addr, size_t ram_size) const;
};
