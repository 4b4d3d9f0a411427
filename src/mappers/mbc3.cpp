#include "mappers/mbc3.hpp"
#include "model.hpp"
#include "save_state.hpp"
#include <cstring>

MapperMBC3::MapperMBC3(uint16_t rom_banks, uint8_t ram_banks, bool has_rtc)
    : Mapper(rom_banks, ram_banks), has_rtc(has_rtc) {
    std::memset(rtc, 0, sizeof(rtc));
    std::memset(rtc_latched, 0, sizeof(rtc_latched));
    rtc_ticks = 0;
    reset();
}

void MapperMBC3::reset() {
    // The clock keeps running across resets (it has its own battery)
    ram_enabled = false;
    rom_bank = 0x01;
    ram_select = 0x00;
    latch_state = 0xFF;
}

uint32_t MapperMBC3::map_rom(uint16_t addr) const {
    uint32_t bank = addr < 0x4000 ? 0 : rom_bank % rom_banks;
    return bank * 0x4000 + (addr & 0x3FFF);
}

void MapperMBC3::write_control(uint16_t addr, uint8_t data) {
    switch (addr & 0x6000) {
        case 0x0000:
            ram_enabled = (data & 0x0F) == 0x0A;
            break;
        case 0x2000:
            rom_bank = data & 0x7F;
            if (rom_bank == 0) {
                rom_bank = 1;
            }
            break;
        case 0x4000:
            ram_select = data & 0x0F;
            break;
        case 0x6000:
            if (latch_state == 0x00 && data == 0x01) {
                std::memcpy(rtc_latched, rtc, sizeof(rtc));
            }
            latch_state = data;
            break;
    }
}

bool MapperMBC3::ram_read(uint16_t addr, uint8_t& data, const std::vector<uint8_t>& ram) {
    if (!ram_enabled) {
        return false;
    }

    if (ram_select >= 0x08 && ram_select <= 0x0C) {
        if (!has_rtc) {
            return false;
        }
        data = rtc_latched[ram_select - 0x08];
        return true;
    }

    if (ram_select > 0x03 || ram.empty()) {
        return false;
    }
    data = ram[ram_offset(ram_select, addr, ram.size())];
    return true;
}

bool MapperMBC3::ram_write(uint16_t addr, uint8_t data, std::vector<uint8_t>& ram) {
    if (!ram_enabled) {
        return false;
    }

    if (ram_select >= 0x08 && ram_select <= 0x0C) {
        if (!has_rtc) {
            return false;
        }
        static const uint8_t masks[RTC_COUNT] = {0x3F, 0x3F, 0x1F, 0xFF, 0xC1};
        int reg = ram_select - 0x08;
        rtc[reg] = data & masks[reg];
        rtc_latched[reg] = rtc[reg];
        if (reg == RTC_SECONDS) {
            rtc_ticks = 0;
        }
        return true;
    }

    if (ram_select > 0x03 || ram.empty()) {
        return false;
    }
    ram[ram_offset(ram_select, addr, ram.size())] = data;
    return true;
}

void MapperMBC3::clock(uint32_t ticks) {
    if (!has_rtc || (rtc[RTC_DAY_HIGH] & 0x40)) {
        return;
    }

    rtc_ticks += ticks;
    while (rtc_ticks >= CPU_CLOCK_HZ) {
        rtc_ticks -= CPU_CLOCK_HZ;
        tick_second();
    }
}

void MapperMBC3::tick_second() {
    // Out-of-range values written by software count up to the register width and wrap to 0
    rtc[RTC_SECONDS] = (rtc[RTC_SECONDS] + 1) & 0x3F;
    if (rtc[RTC_SECONDS] != 60) {
        return;
    }
    rtc[RTC_SECONDS] = 0;

    rtc[RTC_MINUTES] = (rtc[RTC_MINUTES] + 1) & 0x3F;
    if (rtc[RTC_MINUTES] != 60) {
        return;
    }
    rtc[RTC_MINUTES] = 0;

    rtc[RTC_HOURS] = (rtc[RTC_HOURS] + 1) & 0x1F;
    if (rtc[RTC_HOURS] != 24) {
        return;
    }
    rtc[RTC_HOURS] = 0;

    uint16_t day = ((rtc[RTC_DAY_HIGH] & 0x01) << 8) | rtc[RTC_DAY_LOW];
    day++;
    if (day > 0x1FF) {
        day = 0;
        rtc[RTC_DAY_HIGH] |= 0x80;
    }
    rtc[RTC_DAY_LOW] = day & 0xFF;
    rtc[RTC_DAY_HIGH] = (rtc[RTC_DAY_HIGH] & 0xFE) | ((day >> 8) & 0x01);
}

void MapperMBC3::transfer_state(StateTransfer& state) {
    state.transfer(ram_enabled);
    state.transfer(rom_bank);
    state.transfer(ram_select);
    state.transfer(latch_state);
    state.transfer(rtc);
    state.transfer(rtc_latched);
    state.transfer(rtc_ticks);
}
