#include <gtest/gtest.h>
#include "cartridge.hpp"
#include "errors.hpp"
#include "model.hpp"
#include "test_rom.hpp"
#include <cstdio>
#include <fstream>

namespace {

// Bank number visible in the switchable area
uint16_t high_bank(const Cartridge& cart) {
    return cart.read_rom(0x4000 + TestRom::BANK_MARKER) |
           (cart.read_rom(0x4000 + TestRom::BANK_MARKER + 1) << 8);
}

uint16_t low_bank(const Cartridge& cart) {
    return cart.read_rom(TestRom::BANK_MARKER) | (cart.read_rom(TestRom::BANK_MARKER + 1) << 8);
}

void load(std::vector<uint8_t> image) {
    Cartridge cart(std::move(image));
}

// ===== HEADER VALIDATION =====

TEST(CartridgeTest, RejectsImageWithoutHeader) {
    EXPECT_THROW(load(std::vector<uint8_t>(0x100, 0x00)), CartridgeError);
}

TEST(CartridgeTest, RejectsTruncatedImage) {
    std::vector<uint8_t> image = TestRom(0x01, 0x02).build();  // declares 128KB
    image.resize(0x10000);
    EXPECT_THROW(load(std::move(image)), CartridgeError);
}

TEST(CartridgeTest, RejectsUnsupportedType) {
    EXPECT_THROW(load(TestRom(0x20).build()), CartridgeError);   // MBC6
    EXPECT_THROW(load(TestRom(0xFC).build()), CartridgeError);   // camera
}

TEST(CartridgeTest, RejectsSizesTheControllerCannotAddress) {
    EXPECT_THROW(load(TestRom(0x00, 0x01).build()), CartridgeError);
    EXPECT_THROW(load(TestRom(0x05, 0x04).build()), CartridgeError);
    EXPECT_THROW(load(TestRom(0x03, 0x00, 0x04).build()), CartridgeError);
    EXPECT_THROW(load(TestRom(0x00, 0x00, 0x07).build()), CartridgeError);
}

TEST(CartridgeTest, ChecksumMismatchOnlyWarns) {
    std::vector<uint8_t> image = TestRom().build();
    image[0x014D] ^= 0xFF;
    Cartridge cart(std::move(image));
    EXPECT_FALSE(cart.get_info().checksum_valid);
}

TEST(CartridgeTest, ParsesHeader) {
    Cartridge cart(TestRom(0x03, 0x02, 0x03, 0x80).build());
    const CartridgeInfo& info = cart.get_info();
    EXPECT_EQ(info.title, "TESTROM");
    EXPECT_TRUE(info.checksum_valid);
    EXPECT_EQ(info.rom_banks, 8);
    EXPECT_EQ(info.ram_size, 0x8000u);
    EXPECT_TRUE(info.has_battery);
    EXPECT_TRUE(cart.supports_cgb());
    EXPECT_EQ(cart.get_ram().size(), 0x8000u);
    EXPECT_STREQ(Cartridge::type_name(0x03), "MBC1+RAM+BATTERY");
}

TEST(CartridgeTest, OversizedImageIsCut) {
    std::vector<uint8_t> image = TestRom().build();
    image.resize(0xC000, 0xEE);
    Cartridge cart(std::move(image));
    EXPECT_EQ(cart.get_info().rom_banks, 2);
}

TEST(CartridgeTest, LoadsImageFromFile) {
    std::vector<uint8_t> image = TestRom(0x01, 0x01).build();
    std::string path = ::testing::TempDir() + "cartridge_test.gb";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(image.data()), image.size());
    }

    std::shared_ptr<Cartridge> cart = Cartridge::load_from_file(path);
    std::remove(path.c_str());
    EXPECT_EQ(cart->get_info().rom_banks, 4);
    EXPECT_EQ(high_bank(*cart), 1);
}

TEST(CartridgeTest, MissingFileThrows) {
    EXPECT_THROW(Cartridge::load_from_file(::testing::TempDir() + "no_such_cartridge.gb"),
                 CartridgeError);
}

// ===== ROM ONLY =====

TEST(CartridgeTest, RomOnlyIgnoresWrites) {
    Cartridge cart(TestRom(0x00).build());
    cart.write_control(0x2000, 0x05);
    EXPECT_EQ(high_bank(cart), 1);

    uint8_t data = 0;
    EXPECT_FALSE(cart.read_ram(0xA000, data));
}

// ===== MBC1 =====

TEST(CartridgeTest, Mbc1BankZeroSelectsOne) {
    Cartridge cart(TestRom(0x01, 0x06).build());  // 2MB
    EXPECT_EQ(high_bank(cart), 1);

    cart.write_control(0x2000, 0x00);
    EXPECT_EQ(high_bank(cart), 1);

    cart.write_control(0x2000, 0x1F);
    EXPECT_EQ(high_bank(cart), 0x1F);
}

TEST(CartridgeTest, Mbc1UpperBitsAliasing) {
    Cartridge cart(TestRom(0x01, 0x06).build());

    // Low register value 0 always reads as 1, also with upper bits set
    for (uint8_t upper = 1; upper < 4; upper++) {
        cart.write_control(0x4000, upper);
        cart.write_control(0x2000, 0x00);
        EXPECT_EQ(high_bank(cart), (upper << 5) | 0x01);
    }

    // 5-bit register: $20 written to the low register is 0 -> 1
    cart.write_control(0x4000, 0x00);
    cart.write_control(0x2000, 0x20);
    EXPECT_EQ(high_bank(cart), 0x01);
}

TEST(CartridgeTest, Mbc1ModeOneRemapsLowArea) {
    Cartridge cart(TestRom(0x01, 0x06).build());
    cart.write_control(0x4000, 0x02);
    EXPECT_EQ(low_bank(cart), 0);

    cart.write_control(0x6000, 0x01);
    EXPECT_EQ(low_bank(cart), 0x40);
    EXPECT_EQ(high_bank(cart), 0x41);

    cart.write_control(0x6000, 0x00);
    EXPECT_EQ(low_bank(cart), 0);
}

TEST(CartridgeTest, Mbc1BankWrapsToRomSize) {
    Cartridge cart(TestRom(0x01, 0x02).build());  // 8 banks
    cart.write_control(0x2000, 0x0B);
    EXPECT_EQ(high_bank(cart), 0x03);
}

TEST(CartridgeTest, Mbc1RamEnableAndBanking) {
    Cartridge cart(TestRom(0x03, 0x00, 0x03).build());
    uint8_t data = 0;

    EXPECT_FALSE(cart.write_ram(0xA000, 0x11));
    EXPECT_FALSE(cart.read_ram(0xA000, data));

    cart.write_control(0x0000, 0x0A);
    EXPECT_TRUE(cart.write_ram(0xA000, 0x11));

    // Mode 1 switches RAM banks
    cart.write_control(0x6000, 0x01);
    cart.write_control(0x4000, 0x02);
    EXPECT_TRUE(cart.write_ram(0xA000, 0x22));
    EXPECT_EQ(cart.get_ram()[0x4000], 0x22);

    cart.write_control(0x4000, 0x00);
    ASSERT_TRUE(cart.read_ram(0xA000, data));
    EXPECT_EQ(data, 0x11);

    cart.write_control(0x0000, 0x00);
    EXPECT_FALSE(cart.read_ram(0xA000, data));
}

// ===== MBC2 =====

TEST(CartridgeTest, Mbc2RegisterSelectByAddressBit8) {
    Cartridge cart(TestRom(0x05, 0x02).build());
    cart.write_control(0x2100, 0x03);
    EXPECT_EQ(high_bank(cart), 3);

    cart.write_control(0x0100, 0x00);
    EXPECT_EQ(high_bank(cart), 1);

    // Bit 8 clear: RAM enable, bank unchanged
    cart.write_control(0x0000, 0x0A);
    EXPECT_EQ(high_bank(cart), 1);
}

TEST(CartridgeTest, Mbc2HalfByteRam) {
    Cartridge cart(TestRom(0x06, 0x01).build());
    EXPECT_EQ(cart.get_ram().size(), 512u);
    cart.write_control(0x0000, 0x0A);

    cart.write_ram(0xA010, 0xAB);
    uint8_t data = 0;
    ASSERT_TRUE(cart.read_ram(0xA010, data));
    EXPECT_EQ(data, 0xFB);

    // 512 bytes mirrored across the window
    ASSERT_TRUE(cart.read_ram(0xA210, data));
    EXPECT_EQ(data, 0xFB);
}

// ===== MBC3 =====

TEST(CartridgeTest, Mbc3SevenBitBank) {
    Cartridge cart(TestRom(0x11, 0x06).build());
    cart.write_control(0x2000, 0x45);
    EXPECT_EQ(high_bank(cart), 0x45);
    cart.write_control(0x2000, 0x00);
    EXPECT_EQ(high_bank(cart), 0x01);
}

TEST(CartridgeTest, Mbc3ClockLatch) {
    Cartridge cart(TestRom(0x10, 0x00, 0x03).build());
    cart.write_control(0x0000, 0x0A);
    cart.write_control(0x4000, 0x08);  // seconds

    cart.clock(CPU_CLOCK_HZ * 5);
    uint8_t data = 0xFF;
    ASSERT_TRUE(cart.read_ram(0xA000, data));
    EXPECT_EQ(data, 0);  // not latched yet

    cart.write_control(0x6000, 0x00);
    cart.write_control(0x6000, 0x01);
    ASSERT_TRUE(cart.read_ram(0xA000, data));
    EXPECT_EQ(data, 5);

    cart.clock(CPU_CLOCK_HZ * 65);
    cart.write_control(0x6000, 0x00);
    cart.write_control(0x6000, 0x01);
    cart.read_ram(0xA000, data);
    EXPECT_EQ(data, 10);
    cart.write_control(0x4000, 0x09);  // minutes
    cart.read_ram(0xA000, data);
    EXPECT_EQ(data, 1);
}

TEST(CartridgeTest, Mbc3HaltStopsClock) {
    Cartridge cart(TestRom(0x0F).build());
    cart.write_control(0x0000, 0x0A);
    cart.write_control(0x4000, 0x0C);
    cart.write_ram(0xA000, 0x40);

    cart.clock(CPU_CLOCK_HZ * 10);
    cart.write_control(0x4000, 0x08);
    cart.write_control(0x6000, 0x00);
    cart.write_control(0x6000, 0x01);
    uint8_t data = 0xFF;
    ASSERT_TRUE(cart.read_ram(0xA000, data));
    EXPECT_EQ(data, 0);
}

TEST(CartridgeTest, Mbc3RamBanks) {
    Cartridge cart(TestRom(0x13, 0x00, 0x03).build());
    cart.write_control(0x0000, 0x0A);
    cart.write_control(0x4000, 0x03);
    cart.write_ram(0xA123, 0x5A);
    EXPECT_EQ(cart.get_ram()[3 * 0x2000 + 0x123], 0x5A);
}

// ===== MBC5 =====

TEST(CartridgeTest, Mbc5BankZeroIsSelectable) {
    Cartridge cart(TestRom(0x19, 0x03).build());
    cart.write_control(0x2000, 0x00);
    EXPECT_EQ(high_bank(cart), 0);
    cart.write_control(0x2000, 0x0C);
    EXPECT_EQ(high_bank(cart), 0x0C);
}

TEST(CartridgeTest, Mbc5NinthBankBit) {
    Cartridge cart(TestRom(0x19, 0x08).build());  // 8MB
    cart.write_control(0x3000, 0x01);
    cart.write_control(0x2000, 0x05);
    EXPECT_EQ(high_bank(cart), 0x105);
}

TEST(CartridgeTest, Mbc5RamEnableNeedsExactValue) {
    Cartridge cart(TestRom(0x1B, 0x00, 0x04).build());
    uint8_t data = 0;

    cart.write_control(0x0000, 0x1A);
    EXPECT_FALSE(cart.read_ram(0xA000, data));

    cart.write_control(0x0000, 0x0A);
    cart.write_control(0x4000, 0x0F);
    EXPECT_TRUE(cart.write_ram(0xA000, 0x99));
    EXPECT_EQ(cart.get_ram()[15 * 0x2000], 0x99);
}

}
