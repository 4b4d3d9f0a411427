#include <gtest/gtest.h>
#include "interrupts.hpp"
#include "joypad.hpp"
#include "serial.hpp"
#include <string>

namespace {

class JoypadTest : public ::testing::Test {
protected:
    InterruptController interrupts;
    Joypad joypad{&interrupts};

    bool joypad_requested() {
        return interrupts.read_flags() & 0x10;
    }
};

TEST_F(JoypadTest, NothingSelectedReadsHigh) {
    joypad.set_button(Button::A, true);
    joypad.write(0x30);
    EXPECT_EQ(joypad.read(), 0xFF);
}

TEST_F(JoypadTest, DirectionGroup) {
    joypad.write(0x20);  // bit 4 low
    joypad.set_button(Button::LEFT, true);
    joypad.set_button(Button::START, true);
    EXPECT_EQ(joypad.read(), 0xC0 | 0x20 | 0x0D);
}

TEST_F(JoypadTest, ActionGroup) {
    joypad.write(0x10);  // bit 5 low
    joypad.set_button(Button::LEFT, true);
    joypad.set_button(Button::START, true);
    EXPECT_EQ(joypad.read(), 0xC0 | 0x10 | 0x07);
}

TEST_F(JoypadTest, BothGroupsCombine) {
    joypad.write(0x00);
    uint8_t mask = (1 << static_cast<int>(Button::RIGHT)) | (1 << static_cast<int>(Button::B));
    joypad.set_state(mask);
    EXPECT_EQ(joypad.get_state(), mask);
    EXPECT_EQ(joypad.read() & 0x0F, 0x0C);
}

TEST_F(JoypadTest, PressOnSelectedLineRequestsInterrupt) {
    joypad.write(0x10);
    joypad.set_button(Button::UP, true);
    EXPECT_FALSE(joypad_requested());

    joypad.set_button(Button::A, true);
    EXPECT_TRUE(joypad_requested());

    interrupts.clear(Interrupt::JOYPAD);
    joypad.set_button(Button::A, false);
    EXPECT_FALSE(joypad_requested());
}

TEST_F(JoypadTest, SelectingHeldGroupRequestsInterrupt) {
    joypad.write(0x30);
    joypad.set_button(Button::DOWN, true);
    EXPECT_FALSE(joypad_requested());

    joypad.write(0x20);
    EXPECT_TRUE(joypad_requested());
}

class SerialTest : public ::testing::Test {
protected:
    InterruptController interrupts;
    Serial serial{&interrupts, false};

    bool serial_requested() {
        return interrupts.read_flags() & 0x08;
    }
};

TEST_F(SerialTest, InternalClockTransferCompletes) {
    serial.write(0xFF01, 'A');
    serial.write(0xFF02, 0x81);
    EXPECT_EQ(serial.read(0xFF02), 0xFF);

    serial.advance(128 * 8 - 1);
    EXPECT_FALSE(serial_requested());
    EXPECT_EQ(serial.read(0xFF02) & 0x80, 0x80);

    serial.advance(1);
    EXPECT_TRUE(serial_requested());
    EXPECT_EQ(serial.read(0xFF02), 0x7F);
    // Nothing on the other end of the cable
    EXPECT_EQ(serial.read(0xFF01), 0xFF);

    ASSERT_EQ(serial.get_output().size(), 1u);
    EXPECT_EQ(serial.get_output()[0], 'A');
}

TEST_F(SerialTest, ExternalClockNeverCompletes) {
    serial.write(0xFF01, 0x12);
    serial.write(0xFF02, 0x80);
    serial.advance(100000);
    EXPECT_FALSE(serial_requested());
    EXPECT_EQ(serial.read(0xFF01), 0x12);
    EXPECT_TRUE(serial.get_output().empty());
}

TEST_F(SerialTest, OutputLogCollectsBytes) {
    const char* text = "ok";
    for (const char* c = text; *c; c++) {
        serial.write(0xFF01, static_cast<uint8_t>(*c));
        serial.write(0xFF02, 0x81);
        serial.advance(128 * 8);
    }
    std::string out(serial.get_output().begin(), serial.get_output().end());
    EXPECT_EQ(out, "ok");

    serial.clear_output();
    EXPECT_TRUE(serial.get_output().empty());
}

TEST_F(SerialTest, OutputLogIsBounded) {
    for (size_t i = 0; i < Serial::OUTPUT_LIMIT; i++) {
        serial.write(0xFF01, static_cast<uint8_t>(i));
        serial.write(0xFF02, 0x81);
    }
    EXPECT_EQ(serial.get_output().size(), Serial::OUTPUT_LIMIT);

    serial.write(0xFF01, 'Z');
    serial.write(0xFF02, 0x81);
    EXPECT_EQ(serial.get_output().size(), Serial::OUTPUT_LIMIT / 2 + 1);
    EXPECT_EQ(serial.get_output().front(), static_cast<uint8_t>(Serial::OUTPUT_LIMIT / 2));
    EXPECT_EQ(serial.get_output().back(), 'Z');
}

TEST(SerialCgbTest, FastClock) {
    InterruptController interrupts;
    Serial serial(&interrupts, true);
    serial.write(0xFF02, 0x83);
    EXPECT_EQ(serial.read(0xFF02), 0xFF);
    serial.advance(4 * 8);
    EXPECT_EQ(interrupts.read_flags() & 0x08, 0x08);
    EXPECT_EQ(serial.read(0xFF02), 0x7F);
}

}
