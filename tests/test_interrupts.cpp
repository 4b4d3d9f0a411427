#include <gtest/gtest.h>
#include "interrupts.hpp"

TEST(InterruptControllerTest, NothingPendingAfterReset) {
    InterruptController ic;
    ic.reset();
    Interrupt kind;
    EXPECT_FALSE(ic.next_pending(0x1F, kind));
    EXPECT_FALSE(ic.any_pending());
    EXPECT_EQ(ic.read_flags(), 0xE0);
}

TEST(InterruptControllerTest, HighestPriorityFirst) {
    InterruptController ic;
    ic.request(Interrupt::JOYPAD);
    ic.request(Interrupt::TIMER);
    ic.request(Interrupt::LCD_STAT);

    Interrupt kind;
    ASSERT_TRUE(ic.next_pending(0x1F, kind));
    EXPECT_EQ(kind, Interrupt::LCD_STAT);

    // Masked kinds are skipped
    ASSERT_TRUE(ic.next_pending(0x14, kind));
    EXPECT_EQ(kind, Interrupt::TIMER);

    EXPECT_FALSE(ic.next_pending(0x09, kind));
}

TEST(InterruptControllerTest, ClearOnlyTouchesOneBit) {
    InterruptController ic;
    ic.request(Interrupt::VBLANK);
    ic.request(Interrupt::SERIAL);
    ic.clear(Interrupt::VBLANK);
    EXPECT_EQ(ic.read_flags(), 0xE0 | 0x08);
}

TEST(InterruptControllerTest, EnableRegisterGatesPending) {
    InterruptController ic;
    ic.request(Interrupt::TIMER);
    EXPECT_FALSE(ic.any_pending());

    ic.write_enable(0x04);
    EXPECT_TRUE(ic.any_pending());
    Interrupt kind;
    ASSERT_TRUE(ic.next_pending(kind));
    EXPECT_EQ(kind, Interrupt::TIMER);
}

TEST(InterruptControllerTest, FlagRegisterKeepsFiveBits) {
    InterruptController ic;
    ic.write_flags(0xFF);
    EXPECT_EQ(ic.read_flags(), 0xFF);
    ic.write_flags(0x00);
    EXPECT_EQ(ic.read_flags(), 0xE0);

    // IE is a full 8-bit register
    ic.write_enable(0xE4);
    EXPECT_EQ(ic.read_enable(), 0xE4);
}

TEST(InterruptControllerTest, Vectors) {
    EXPECT_EQ(InterruptController::vector_for(Interrupt::VBLANK), 0x0040);
    EXPECT_EQ(InterruptController::vector_for(Interrupt::LCD_STAT), 0x0048);
    EXPECT_EQ(InterruptController::vector_for(Interrupt::TIMER), 0x0050);
    EXPECT_EQ(InterruptController::vector_for(Interrupt::SERIAL), 0x0058);
    EXPECT_EQ(InterruptController::vector_for(Interrupt::JOYPAD), 0x0060);
}
