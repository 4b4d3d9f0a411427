#include <gtest/gtest.h>
#include "audio_unit.hpp"
#include "bus.hpp"
#include "emulator.hpp"
#include "ppu.hpp"
#include "test_rom.hpp"

namespace {

class BusTest : public ::testing::Test {
protected:
    std::unique_ptr<Emulator> emu;
    Bus* bus = nullptr;
    PPU* ppu = nullptr;

    void load(const TestRom& rom, EmulatorConfig config = EmulatorConfig()) {
        emu = std::make_unique<Emulator>(config);
        ASSERT_TRUE(emu->load_rom_data(rom.build()));
        bus = emu->get_bus();
        ppu = emu->get_ppu();
    }

    void SetUp() override {
        load(TestRom());
    }

    void lcd_off() {
        bus->cpu_write(0xFF40, 0x11);
    }
};

// ===== MEMORY MAP =====

TEST_F(BusTest, EchoRamMirrorsWorkRam) {
    bus->cpu_write(0xC123, 0x5A);
    EXPECT_EQ(bus->cpu_read(0xE123), 0x5A);

    bus->cpu_write(0xFDFF, 0xA5);
    EXPECT_EQ(bus->cpu_read(0xDDFF), 0xA5);
}

TEST_F(BusTest, UnusableAreaReadsZero) {
    lcd_off();
    bus->cpu_write(0xFEA0, 0x12);
    EXPECT_EQ(bus->cpu_read(0xFEA0), 0x00);
    EXPECT_EQ(bus->cpu_read(0xFEFF), 0x00);
}

TEST_F(BusTest, HighRamAndInterruptEnable) {
    bus->cpu_write(0xFF80, 0x11);
    bus->cpu_write(0xFFFE, 0x22);
    bus->cpu_write(0xFFFF, 0x1F);
    EXPECT_EQ(bus->cpu_read(0xFF80), 0x11);
    EXPECT_EQ(bus->cpu_read(0xFFFE), 0x22);
    EXPECT_EQ(bus->cpu_read(0xFFFF), 0x1F);
}

TEST_F(BusTest, InterruptFlagUpperBitsReadHigh) {
    bus->cpu_write(0xFF0F, 0x00);
    EXPECT_EQ(bus->cpu_read(0xFF0F), 0xE0);
    bus->cpu_write(0xFF0F, 0x04);
    EXPECT_EQ(bus->cpu_read(0xFF0F), 0xE4);
}

TEST_F(BusTest, UnmappedIoReadsHigh) {
    EXPECT_EQ(bus->cpu_read(0xFF03), 0xFF);
    EXPECT_EQ(bus->cpu_read(0xFF4C), 0xFF);
    EXPECT_EQ(bus->cpu_read(0xFF7F), 0xFF);
}

TEST_F(BusTest, RomWritesReachTheMapper) {
    load(TestRom(0x01, 0x02));
    EXPECT_EQ(bus->cpu_read(0x4000 + TestRom::BANK_MARKER), 1);
    bus->cpu_write(0x2000, 0x05);
    EXPECT_EQ(bus->cpu_read(0x4000 + TestRom::BANK_MARKER), 5);
}

TEST_F(BusTest, CartridgeRamThroughBus) {
    load(TestRom(0x03, 0x00, 0x02));
    bus->cpu_write(0xA000, 0x42);
    EXPECT_EQ(bus->cpu_read(0xA000), 0xFF);

    bus->cpu_write(0x0000, 0x0A);
    bus->cpu_write(0xA000, 0x42);
    EXPECT_EQ(bus->cpu_read(0xA000), 0x42);
    EXPECT_EQ(emu->battery_ram()[0], 0x42);
    EXPECT_TRUE(emu->has_battery());
}

// ===== PPU LOCKOUTS =====

TEST_F(BusTest, OamLockedDuringScanAndTransfer) {
    lcd_off();
    bus->cpu_write(0xFE00, 0x77);
    bus->cpu_write(0x8000, 0x66);
    bus->cpu_write(0xFF40, 0x91);

    // Line 0 starts in mode 2
    EXPECT_EQ(ppu->get_mode(), PPU::Mode::OAM_SCAN);
    EXPECT_EQ(bus->cpu_read(0xFE00), 0xFF);
    EXPECT_EQ(bus->cpu_read(0xFEA0), 0xFF);
    EXPECT_EQ(bus->cpu_read(0x8000), 0x66);

    ppu->advance(PPU::OAM_SCAN_DOTS);
    EXPECT_EQ(ppu->get_mode(), PPU::Mode::PIXEL_TRANSFER);
    EXPECT_EQ(bus->cpu_read(0xFE00), 0xFF);
    EXPECT_EQ(bus->cpu_read(0x8000), 0xFF);
    bus->cpu_write(0x8000, 0x01);
    bus->cpu_write(0xFE00, 0x01);

    ppu->advance(300);
    EXPECT_EQ(ppu->get_mode(), PPU::Mode::HBLANK);
    EXPECT_EQ(bus->cpu_read(0xFE00), 0x77);
    EXPECT_EQ(bus->cpu_read(0x8000), 0x66);
}

// ===== OAM DMA =====

TEST_F(BusTest, OamDmaCopiesOneBytePerCycle) {
    lcd_off();
    for (int i = 0; i < 0xA0; i++) {
        bus->cpu_write(0xC100 + i, static_cast<uint8_t>(i ^ 0x5A));
    }

    bus->cpu_write(0xFF46, 0xC1);
    EXPECT_EQ(bus->cpu_read(0xFF46), 0xC1);
    EXPECT_FALSE(bus->oam_dma_active());

    // Starts after the writing instruction, then one setup cycle
    bus->clock(1);
    EXPECT_TRUE(bus->oam_dma_active());
    EXPECT_EQ(bus->cpu_read(0xFE00), 0xFF);
    bus->clock(1);
    bus->clock(159);
    EXPECT_TRUE(bus->oam_dma_active());
    bus->clock(1);
    EXPECT_FALSE(bus->oam_dma_active());

    for (int i = 0; i < 0xA0; i++) {
        ASSERT_EQ(bus->cpu_read(0xFE00 + i), static_cast<uint8_t>(i ^ 0x5A)) << i;
    }
}

TEST_F(BusTest, OamDmaReadsRomAndEcho) {
    lcd_off();
    bus->cpu_write(0xC000, 0x99);
    bus->cpu_write(0xFF46, 0xE0);
    bus->clock(1);
    bus->clock(200);
    EXPECT_EQ(bus->cpu_read(0xFE00), 0x99);

    bus->cpu_write(0xFF46, 0x00);
    bus->clock(1);
    bus->clock(200);
    // Restart vectors are empty in the test image
    EXPECT_EQ(bus->cpu_read(0xFE00), 0x00);
}

// ===== BOOT ROM =====

TEST_F(BusTest, BootRomOverlayUntilFF50) {
    EmulatorConfig config;
    config.boot_rom.assign(0x100, 0xAA);
    load(TestRom(), config);

    EXPECT_TRUE(bus->boot_rom_mapped());
    EXPECT_EQ(bus->cpu_read(0x0000), 0xAA);
    EXPECT_EQ(bus->cpu_read(0x00FF), 0xAA);
    EXPECT_EQ(bus->cpu_read(0x0101), 0xC3);

    bus->cpu_write(0xFF50, 0x00);
    EXPECT_TRUE(bus->boot_rom_mapped());

    bus->cpu_write(0xFF50, 0x01);
    EXPECT_FALSE(bus->boot_rom_mapped());
    EXPECT_EQ(bus->cpu_read(0x0000), 0x00);
}

TEST_F(BusTest, CgbBootRomLeavesHeaderVisible) {
    EmulatorConfig config;
    config.model = Model::CGB;
    config.boot_rom.assign(0x900, 0xBB);
    load(TestRom(0x00, 0x00, 0x00, 0x80), config);

    EXPECT_EQ(bus->cpu_read(0x0050), 0xBB);
    EXPECT_EQ(bus->cpu_read(0x0101), 0xC3);
    EXPECT_EQ(bus->cpu_read(0x0200), 0xBB);
    EXPECT_EQ(bus->cpu_read(0x08FF), 0xBB);
    EXPECT_EQ(bus->cpu_read(0x0900), 0x00);
}

// ===== CGB REGISTERS =====

TEST_F(BusTest, WorkRamBanksOnCgb) {
    load(TestRom(0x00, 0x00, 0x00, 0x80));
    ASSERT_TRUE(emu->is_cgb_mode());

    bus->cpu_write(0xFF70, 0x02);
    bus->cpu_write(0xD000, 0x22);
    bus->cpu_write(0xFF70, 0x03);
    bus->cpu_write(0xD000, 0x33);
    EXPECT_EQ(bus->cpu_read(0xFF70), 0xFB);

    bus->cpu_write(0xFF70, 0x00);
    EXPECT_EQ(bus->cpu_read(0xD000), 0x00);
    bus->cpu_write(0xFF70, 0x02);
    EXPECT_EQ(bus->cpu_read(0xD000), 0x22);

    // Bank 0 is fixed
    bus->cpu_write(0xC000, 0x44);
    bus->cpu_write(0xFF70, 0x07);
    EXPECT_EQ(bus->cpu_read(0xC000), 0x44);
}

TEST_F(BusTest, DmgHasNoCgbRegisters) {
    bus->cpu_write(0xFF70, 0x02);
    EXPECT_EQ(bus->cpu_read(0xFF70), 0xFF);
    EXPECT_EQ(bus->cpu_read(0xFF4D), 0xFF);
    EXPECT_EQ(bus->cpu_read(0xFF55), 0xFF);
    EXPECT_EQ(bus->cpu_read(0xFF74), 0xFF);
}

TEST_F(BusTest, SpeedSwitchRegister) {
    load(TestRom(0x00, 0x00, 0x00, 0x80));
    EXPECT_EQ(bus->cpu_read(0xFF4D), 0x7E);
    bus->cpu_write(0xFF4D, 0x01);
    EXPECT_EQ(bus->cpu_read(0xFF4D), 0x7F);
    EXPECT_TRUE(bus->speed_switch_armed());

    bus->perform_speed_switch();
    EXPECT_TRUE(bus->is_double_speed());
    EXPECT_EQ(bus->cpu_read(0xFF4D), 0xFE);
    EXPECT_EQ(bus->cpu_read(0xFF04), 0x00);
}

TEST_F(BusTest, UndocumentedRegisters) {
    load(TestRom(0x00, 0x00, 0x00, 0x80));
    bus->cpu_write(0xFF72, 0x12);
    bus->cpu_write(0xFF74, 0x34);
    bus->cpu_write(0xFF75, 0xFF);
    EXPECT_EQ(bus->cpu_read(0xFF72), 0x12);
    EXPECT_EQ(bus->cpu_read(0xFF74), 0x34);
    EXPECT_EQ(bus->cpu_read(0xFF75), 0xFF);
    bus->cpu_write(0xFF75, 0x00);
    EXPECT_EQ(bus->cpu_read(0xFF75), 0x8F);
}

// ===== VRAM DMA =====

TEST_F(BusTest, GeneralPurposeVramDma) {
    load(TestRom(0x00, 0x00, 0x00, 0x80));
    lcd_off();
    for (int i = 0; i < 0x20; i++) {
        bus->cpu_write(0xC000 + i, static_cast<uint8_t>(0x80 + i));
    }

    bus->cpu_write(0xFF51, 0xC0);
    bus->cpu_write(0xFF52, 0x00);
    bus->cpu_write(0xFF53, 0x81);
    bus->cpu_write(0xFF54, 0x00);
    bus->cpu_write(0xFF55, 0x01);  // 2 blocks

    for (int i = 0; i < 0x20; i++) {
        ASSERT_EQ(bus->cpu_read(0x8100 + i), static_cast<uint8_t>(0x80 + i));
    }
    EXPECT_EQ(bus->take_stall_cycles(), 16u);
    EXPECT_EQ(bus->take_stall_cycles(), 0u);
    EXPECT_EQ(bus->cpu_read(0xFF55), 0xFF);
}

TEST_F(BusTest, HBlankVramDmaOneBlockPerLine) {
    load(TestRom(0x00, 0x00, 0x00, 0x80));
    for (int i = 0; i < 0x20; i++) {
        bus->cpu_write(0xC000 + i, static_cast<uint8_t>(i + 1));
    }

    bus->cpu_write(0xFF51, 0xC0);
    bus->cpu_write(0xFF52, 0x00);
    bus->cpu_write(0xFF53, 0x00);
    bus->cpu_write(0xFF54, 0x00);
    bus->cpu_write(0xFF55, 0x81);  // 2 blocks, HBlank
    EXPECT_EQ(bus->cpu_read(0xFF55), 0x01);

    ppu->advance(PPU::DOTS_PER_LINE);
    bus->clock(1);
    EXPECT_EQ(bus->cpu_read(0xFF55), 0x00);
    EXPECT_EQ(bus->take_stall_cycles(), 8u);

    ppu->advance(PPU::DOTS_PER_LINE);
    bus->clock(1);
    EXPECT_EQ(bus->cpu_read(0xFF55), 0xFF);

    lcd_off();
    EXPECT_EQ(bus->cpu_read(0x8000), 0x01);
    EXPECT_EQ(bus->cpu_read(0x801F), 0x20);
}

TEST_F(BusTest, HBlankVramDmaCanBeCancelled) {
    load(TestRom(0x00, 0x00, 0x00, 0x80));
    bus->cpu_write(0xFF55, 0x85);
    bus->cpu_write(0xFF55, 0x00);
    EXPECT_EQ(bus->cpu_read(0xFF55), 0x85);
}

// ===== AUDIO REGISTERS =====

class RecordingAudio : public AudioUnit {
public:
    uint8_t last_register = 0;
    uint8_t last_value = 0;
    uint64_t cycles = 0;
    uint32_t sequencer_ticks = 0;

    uint8_t read_register(uint16_t addr) override { return static_cast<uint8_t>(addr); }
    void write_register(uint16_t addr, uint8_t data) override {
        last_register = static_cast<uint8_t>(addr);
        last_value = data;
    }
    void clock(uint32_t machine_cycles) override { cycles += machine_cycles; }
    void frame_sequencer_tick() override { sequencer_ticks++; }
};

TEST_F(BusTest, AudioRegistersLatchedWithoutUnit) {
    bus->cpu_write(0xFF24, 0x77);
    EXPECT_EQ(bus->cpu_read(0xFF24), 0x77);
    bus->cpu_write(0xFF30, 0x12);
    EXPECT_EQ(bus->cpu_read(0xFF30), 0x12);
}

TEST_F(BusTest, AudioUnitReceivesRegistersAndCycles) {
    RecordingAudio audio;
    emu->attach_audio_unit(&audio);

    bus->cpu_write(0xFF26, 0x80);
    EXPECT_EQ(audio.last_register, 0x26);
    EXPECT_EQ(audio.last_value, 0x80);
    EXPECT_EQ(bus->cpu_read(0xFF12), 0x12);

    uint64_t total = 0;
    for (int i = 0; i < 10000; i++) {
        total += emu->run_one_cpu_step().cycles;
    }
    EXPECT_EQ(audio.cycles, total);
    // DIV-APU ticks every 2048 machine cycles
    EXPECT_GE(audio.sequencer_ticks, total / 2048 - 1);
    EXPECT_LE(audio.sequencer_ticks, total / 2048 + 1);
}

}
