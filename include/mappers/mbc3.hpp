#pragma once

#include "../mapper.hpp"

/**
 * MBC3 (types $0F-$13)
 *
 * ROM: up to 2MB (128 banks), RAM: up to 32KB (4 banks), optional real-time
 * clock. Writing $08-$0C to $4000-$5FFF maps an RTC register into
 * $A000-$BFFF instead of RAM. Writing $00 then $01 to $6000-$7FFF latches
 * the running clock into the readable copy.
 *
 * The clock runs on emulated time, so execution stays deterministic.
 */
class MapperMBC3 : public Mapper {
public:
    MapperMBC3(uint16_t rom_banks, uint8_t ram_banks, bool has_rtc);

    uint32_t map_rom(uint16_t addr) const override;
    void write_control(uint16_t addr, uint8_t data) override;
    bool ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram) override;
    bool ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram) override;
    void reset() override;
    void clock(uint32_t ticks) override;
    void transfer_state(StateTransfer& state) override;

private:
    enum RtcRegister {
        RTC_SECONDS = 0,
        RTC_MINUTES,
        RTC_HOURS,
        RTC_DAY_LOW,
        RTC_DAY_HIGH,  // bit 0: day bit 8, bit 6: halt, bit 7: day carry
        RTC_COUNT
    };

    bool has_rtc;
    uint8_t rom_bank;
    uint8_t ram_select;   // $00-$03 RAM bank, $08-$0C RTC register
    uint8_t latch_state;

    uint8_t rtc[RTC_COUNT];
    uint8_t rtc_latched[RTC_COUNT];
    uint32_t rtc_ticks;   // sub-second accumulator

    void tick_second();
};
