#include <gtest/gtest.h>
#include "bus.hpp"
#include "cpu.hpp"
#include "emulator.hpp"
#include "errors.hpp"
#include "interrupts.hpp"
#include "ppu.hpp"
#include "test_rom.hpp"
#include "timer.hpp"
#include <string>

namespace {

const size_t SCREEN_BYTES = PPU::SCREEN_WIDTH * PPU::SCREEN_HEIGHT * 3;

// INC A; LDH ($47),A; LDH ($43),A; JR -7
// Palette and scroll change all through the frame, so every frame looks different
const std::initializer_list<uint8_t> STRIPES = {0x3C, 0xE0, 0x47, 0xE0, 0x43, 0x18, 0xF9};

class EmulatorTest : public ::testing::Test {
protected:
    std::unique_ptr<Emulator> emu;

    void load(std::initializer_list<uint8_t> program, EmulatorConfig config = EmulatorConfig(),
              TestRom rom = TestRom()) {
        emu = std::make_unique<Emulator>(config);
        rom.program(program);
        ASSERT_TRUE(emu->load_rom_data(rom.build()));
    }

    void steps(int count) {
        for (int i = 0; i < count; i++) {
            ASSERT_NE(emu->run_one_cpu_step().status, StepStatus::FAULT);
        }
    }

    std::vector<uint8_t> screen() {
        return std::vector<uint8_t>(emu->get_screen(), emu->get_screen() + SCREEN_BYTES);
    }

    uint8_t peek(uint16_t addr) { return emu->get_bus()->cpu_read(addr); }
};

// ===== STEP DRIVER =====

TEST_F(EmulatorTest, WorkRamWriteThenHalt) {
    // LD A,$42; LD ($C000),A; HALT
    load({0x3E, 0x42, 0xEA, 0x00, 0xC0, 0x76});
    steps(10);
    EXPECT_EQ(peek(0xC000), 0x42);
    EXPECT_TRUE(emu->get_cpu()->is_halted());

    // The rest of the machine keeps running while halted
    EXPECT_TRUE(emu->run_frame());
    EXPECT_TRUE(emu->get_cpu()->is_halted());
}

TEST_F(EmulatorTest, StepReportsMachineCycles) {
    // NOP; JP $0150 then LD BC,d16; PUSH BC
    load({0x01, 0x34, 0x12, 0xC5});
    EXPECT_EQ(emu->run_one_cpu_step().cycles, 1u);
    EXPECT_EQ(emu->run_one_cpu_step().cycles, 4u);
    EXPECT_EQ(emu->run_one_cpu_step().cycles, 3u);
    EXPECT_EQ(emu->run_one_cpu_step().cycles, 4u);
    EXPECT_EQ(emu->get_cycle_count(), 12u);
}

TEST_F(EmulatorTest, DividerResetTimesTimerOverflow) {
    load({
        0xAF,              // XOR A
        0xE0, 0x0F,        // LDH ($0F),A    clear IF
        0x3E, 0xF0,        // LD A,$F0
        0xE0, 0x05,        // LDH ($05),A    TIMA
        0xE0, 0x04,        // LDH ($04),A    DIV reset
        0x3E, 0x04,        // LD A,$04
        0xE0, 0x07,        // LDH ($07),A    TAC: enabled, 1024 T-cycle period
        0x18, 0xFE,        // JR -2
    });
    steps(2 + 5);
    ASSERT_EQ(emu->get_cpu()->PC, 0x0159);
    uint64_t reset_done = emu->get_cycle_count();
    EXPECT_EQ(emu->get_timer()->get_counter(), 12);

    // 16 increments of 256 machine cycles from the reset
    const uint64_t overflow_at = 16 * 256 - 3;
    while (true) {
        uint64_t before = emu->get_cycle_count() - reset_done;
        ASSERT_LT(before, overflow_at + 100);
        steps(1);
        if (emu->get_interrupts()->read_flags() & 0x04) {
            uint64_t after = emu->get_cycle_count() - reset_done;
            EXPECT_LT(before, overflow_at);
            EXPECT_GE(after, overflow_at);
            break;
        }
    }
    EXPECT_EQ(peek(0xFF05), 0x00);   // reloaded from TMA
}

TEST_F(EmulatorTest, RunFrameStopsAtVBlank) {
    load({0x18, 0xFE});
    ASSERT_TRUE(emu->run_frame());
    uint64_t first = emu->get_cycle_count();
    EXPECT_EQ(emu->get_ppu()->get_ly(), 144);

    ASSERT_TRUE(emu->run_frame());
    uint64_t frame = emu->get_cycle_count() - first;
    EXPECT_GE(frame, MACHINE_CYCLES_PER_FRAME - 3);
    EXPECT_LE(frame, MACHINE_CYCLES_PER_FRAME + 3);
}

TEST_F(EmulatorTest, RunFrameReturnsWithLcdOff) {
    // XOR A; LDH ($40),A; JR -2
    load({0xAF, 0xE0, 0x40, 0x18, 0xFE});
    ASSERT_TRUE(emu->run_frame());
    EXPECT_FALSE(emu->get_ppu()->lcd_enabled());

    uint64_t start = emu->get_cycle_count();
    ASSERT_TRUE(emu->run_frame());
    uint64_t elapsed = emu->get_cycle_count() - start;
    EXPECT_GE(elapsed, MACHINE_CYCLES_PER_FRAME);
    EXPECT_LT(elapsed, MACHINE_CYCLES_PER_FRAME + 3);
}

TEST_F(EmulatorTest, DoubleSpeedFrameTakesTwiceTheCycles) {
    // LD A,1; LDH ($4D),A; STOP; JR -2
    load({0x3E, 0x01, 0xE0, 0x4D, 0x10, 0x00, 0x18, 0xFE}, EmulatorConfig(),
         TestRom(0x00, 0x00, 0x00, 0x80));
    steps(2 + 3);
    ASSERT_TRUE(emu->get_bus()->is_double_speed());
    EXPECT_EQ(peek(0xFF4D), 0xFE);

    ASSERT_TRUE(emu->run_frame());
    uint64_t first = emu->get_cycle_count();
    ASSERT_TRUE(emu->run_frame());
    uint64_t frame = emu->get_cycle_count() - first;
    EXPECT_GE(frame, 2 * MACHINE_CYCLES_PER_FRAME - 3);
    EXPECT_LE(frame, 2 * MACHINE_CYCLES_PER_FRAME + 3);
}

TEST_F(EmulatorTest, IllegalOpcodeStopsTheMachine) {
    load({0x00, 0xED});
    EXPECT_FALSE(emu->run_frame());
    ASSERT_TRUE(emu->has_fault());
    EXPECT_EQ(emu->get_fault().kind, FaultKind::ILLEGAL_OPCODE);
    EXPECT_EQ(emu->get_fault().pc, 0x0151);
    EXPECT_EQ(emu->get_fault().opcode, 0xED);
    EXPECT_FALSE(emu->get_fault().message.empty());

    uint64_t cycles = emu->get_cycle_count();
    StepResult result = emu->run_one_cpu_step();
    EXPECT_EQ(result.status, StepStatus::FAULT);
    EXPECT_EQ(result.cycles, 0u);
    EXPECT_EQ(emu->get_cycle_count(), cycles);
}

TEST_F(EmulatorTest, SerialOutputCollectsBytes) {
    load({
        0x3E, 'H',         // LD A,'H'
        0xE0, 0x01,        // LDH ($01),A
        0x3E, 0x81,        // LD A,$81
        0xE0, 0x02,        // LDH ($02),A    start, internal clock
        0xF0, 0x02,        // LDH A,($02)
        0xCB, 0x7F,        // BIT 7,A
        0x20, 0xFA,        // JR NZ,-6
        0x3E, 'i',
        0xE0, 0x01,
        0x3E, 0x81,
        0xE0, 0x02,
        0xF0, 0x02,
        0xCB, 0x7F,
        0x20, 0xFA,
        0x76,              // HALT
    });
    ASSERT_TRUE(emu->run_frame());
    const std::vector<uint8_t>& out = emu->get_serial_output();
    EXPECT_EQ(std::string(out.begin(), out.end()), "Hi");
    EXPECT_EQ(emu->get_interrupts()->read_flags() & 0x08, 0x08);
}

TEST_F(EmulatorTest, JoypadInputReachesRegister) {
    load({0x18, 0xFE});
    emu->get_bus()->cpu_write(0xFF00, 0x20);
    emu->set_button(Button::RIGHT, true);
    EXPECT_EQ(peek(0xFF00) & 0x0F, 0x0E);

    emu->set_joypad_state(0);
    EXPECT_EQ(peek(0xFF00) & 0x0F, 0x0F);
}

// ===== LOADING =====

TEST_F(EmulatorTest, ModelSelection) {
    load({0x00});
    EXPECT_EQ(emu->get_model(), Model::DMG);
    EXPECT_FALSE(emu->is_cgb_mode());

    load({0x00}, EmulatorConfig(), TestRom(0x00, 0x00, 0x00, 0xC0));
    EXPECT_EQ(emu->get_model(), Model::CGB);
    EXPECT_TRUE(emu->is_cgb_mode());

    EmulatorConfig config;
    config.model = Model::MGB;
    load({0x00}, config, TestRom(0x00, 0x00, 0x00, 0x80));
    EXPECT_EQ(emu->get_model(), Model::MGB);
    EXPECT_FALSE(emu->is_cgb_mode());
    EXPECT_EQ(emu->get_cpu()->A, 0xFF);
}

TEST_F(EmulatorTest, BadBootRomSizeIsIgnored) {
    EmulatorConfig config;
    config.boot_rom.assign(100, 0x00);
    load({0x00}, config);
    EXPECT_EQ(emu->get_cpu()->PC, 0x0100);
    EXPECT_FALSE(emu->get_bus()->boot_rom_mapped());
}

TEST_F(EmulatorTest, RejectedImageKeepsNoCartridge) {
    Emulator empty;
    EXPECT_FALSE(empty.load_rom_data(std::vector<uint8_t>(0x40, 0x00)));
    EXPECT_FALSE(empty.has_cartridge());
    EXPECT_FALSE(empty.load_rom("/nonexistent/path/game.gb"));
    EXPECT_THROW(empty.battery_ram(), EmulatorError);
    EXPECT_THROW(empty.save_state(), StateError);
    EXPECT_FALSE(empty.has_battery());
}

TEST_F(EmulatorTest, ResetKeepsBatteryRam) {
    load({0x00}, EmulatorConfig(), TestRom(0x03, 0x00, 0x02));
    ASSERT_TRUE(emu->has_battery());
    emu->get_bus()->cpu_write(0x0000, 0x0A);
    emu->get_bus()->cpu_write(0xA010, 0x77);

    emu->reset();
    EXPECT_EQ(emu->battery_ram()[0x10], 0x77);
    EXPECT_EQ(peek(0xA010), 0xFF);   // RAM disabled again
    EXPECT_EQ(emu->get_cycle_count(), 0u);
    EXPECT_EQ(emu->get_cpu()->PC, 0x0100);

    // Battery RAM written back by a front end
    emu->battery_ram()[0x20] = 0x55;
    emu->get_bus()->cpu_write(0x0000, 0x0A);
    EXPECT_EQ(peek(0xA020), 0x55);
}

// ===== SNAPSHOTS =====

TEST_F(EmulatorTest, SnapshotResumesIdentically) {
    load(STRIPES);
    ASSERT_TRUE(emu->run_frame());
    steps(3000);   // mid-frame

    std::vector<uint8_t> snapshot = emu->save_state();
    uint64_t saved_cycles = emu->get_cycle_count();

    std::vector<std::vector<uint8_t>> frames;
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(emu->run_frame());
        frames.push_back(screen());
    }
    uint64_t end_cycles = emu->get_cycle_count();
    EXPECT_NE(frames[0], frames[1]);

    emu->load_state(snapshot);
    EXPECT_EQ(emu->get_cycle_count(), saved_cycles);
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(emu->run_frame());
        EXPECT_EQ(screen(), frames[i]) << "frame " << i;
    }
    EXPECT_EQ(emu->get_cycle_count(), end_cycles);

    // A fresh machine with the same cartridge picks it up too
    Emulator other;
    TestRom rom;
    rom.program(STRIPES);
    ASSERT_TRUE(other.load_rom_data(rom.build()));
    other.load_state(snapshot);
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(other.run_frame());
    }
    EXPECT_EQ(std::vector<uint8_t>(other.get_screen(), other.get_screen() + SCREEN_BYTES), frames[2]);
    EXPECT_EQ(other.save_state(), emu->save_state());
}

TEST_F(EmulatorTest, SnapshotKeepsCartridgeRam) {
    load({0x18, 0xFE}, EmulatorConfig(), TestRom(0x13, 0x02, 0x03));
    emu->get_bus()->cpu_write(0x0000, 0x0A);
    emu->get_bus()->cpu_write(0x4000, 0x02);
    emu->get_bus()->cpu_write(0xA000, 0x99);
    std::vector<uint8_t> snapshot = emu->save_state();

    emu->get_bus()->cpu_write(0xA000, 0x11);
    emu->get_bus()->cpu_write(0x4000, 0x00);
    emu->load_state(snapshot);
    EXPECT_EQ(peek(0xA000), 0x99);
}

TEST_F(EmulatorTest, CorruptSnapshotLeavesStateIntact) {
    load(STRIPES);
    steps(5000);
    std::vector<uint8_t> before = emu->save_state();

    EXPECT_THROW(emu->load_state(std::vector<uint8_t>(64, 0xAB)), StateError);
    EXPECT_EQ(emu->save_state(), before);

    std::vector<uint8_t> truncated = before;
    truncated.resize(truncated.size() / 2);
    EXPECT_THROW(emu->load_state(truncated), StateError);
    EXPECT_EQ(emu->save_state(), before);

    std::vector<uint8_t> padded = before;
    padded.push_back(0x00);
    EXPECT_THROW(emu->load_state(padded), StateError);
    EXPECT_EQ(emu->save_state(), before);

    std::vector<uint8_t> version = before;
    version[4] ^= 0x80;
    EXPECT_THROW(emu->load_state(version), StateError);
    EXPECT_EQ(emu->save_state(), before);
}

TEST_F(EmulatorTest, SnapshotFromAnotherCartridgeIsRejected) {
    load(STRIPES, EmulatorConfig(), TestRom(0x01, 0x01));
    steps(100);
    std::vector<uint8_t> foreign = emu->save_state();

    load(STRIPES);
    steps(100);
    std::vector<uint8_t> before = emu->save_state();
    EXPECT_THROW(emu->load_state(foreign), StateError);
    EXPECT_EQ(emu->save_state(), before);
}

TEST_F(EmulatorTest, SnapshotFromAnotherModelIsRejected) {
    EmulatorConfig cgb;
    cgb.model = Model::CGB;
    load(STRIPES, cgb);
    std::vector<uint8_t> cgb_snapshot = emu->save_state();

    load(STRIPES);
    EXPECT_THROW(emu->load_state(cgb_snapshot), StateError);
}

TEST_F(EmulatorTest, LoadingSnapshotClearsFault) {
    load({0x00, 0xED});
    std::vector<uint8_t> snapshot = emu->save_state();
    EXPECT_FALSE(emu->run_frame());
    ASSERT_TRUE(emu->has_fault());

    emu->load_state(snapshot);
    EXPECT_FALSE(emu->has_fault());
    EXPECT_EQ(emu->get_cpu()->PC, 0x0100);
}

}
