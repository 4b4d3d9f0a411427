#include "cartridge.hpp"
#include "errors.hpp"
#include "mapper.hpp"
#include "mappers/rom_only.hpp"
#include "mappers/mbc1.hpp"
#include "mappers/mbc2.hpp"
#include "mappers/mbc3.hpp"
#include "mappers/mbc5.hpp"
#include "save_state.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

// ============================================================================
// CARTRIDGE - GAME BOY ROM LOADER AND BANK CONTROLLER INTERFACE
// ============================================================================
//
// HEADER LAYOUT ($0100-$014F):
// $0100-$0103: Entry point (usually NOP; JP $0150)
// $0104-$0133: Nintendo logo
// $0134-$0143: Title (CGB titles end at $013E/$0142, $0143 is the CGB flag)
// $0146: SGB flag
// $0147: Cartridge type (bank controller and extras)
// $0148: ROM size (32KB << n)
// $0149: RAM size
// $014D: Header checksum over $0134-$014C

namespace {

const size_t HEADER_END = 0x0150;

struct TypeEntry {
    uint8_t type;
    const char* name;
    bool ram;
    bool battery;
    bool rtc;
    bool rumble;
};

const TypeEntry TYPES[] = {
    {0x00, "ROM ONLY",                  false, false, false, false},
    {0x01, "MBC1",                      false, false, false, false},
    {0x02, "MBC1+RAM",                  true,  false, false, false},
    {0x03, "MBC1+RAM+BATTERY",          true,  true,  false, false},
    {0x05, "MBC2",                      true,  false, false, false},
    {0x06, "MBC2+BATTERY",              true,  true,  false, false},
    {0x08, "ROM+RAM",                   true,  false, false, false},
    {0x09, "ROM+RAM+BATTERY",           true,  true,  false, false},
    {0x0F, "MBC3+TIMER+BATTERY",        false, true,  true,  false},
    {0x10, "MBC3+TIMER+RAM+BATTERY",    true,  true,  true,  false},
    {0x11, "MBC3",                      false, false, false, false},
    {0x12, "MBC3+RAM",                  true,  false, false, false},
    {0x13, "MBC3+RAM+BATTERY",          true,  true,  false, false},
    {0x19, "MBC5",                      false, false, false, false},
    {0x1A, "MBC5+RAM",                  true,  false, false, false},
    {0x1B, "MBC5+RAM+BATTERY",          true,  true,  false, false},
    {0x1C, "MBC5+RUMBLE",               false, false, false, true},
    {0x1D, "MBC5+RUMBLE+RAM",           true,  false, false, true},
    {0x1E, "MBC5+RUMBLE+RAM+BATTERY",   true,  true,  false, true},
};

const TypeEntry* find_type(uint8_t type) {
    for (const TypeEntry& entry : TYPES) {
        if (entry.type == type) {
            return &entry;
        }
    }
    return nullptr;
}

std::string hex_byte(uint8_t value) {
    std::ostringstream out;
    out << "$" << std::hex << std::uppercase << std::setfill('0') << std::setw(2) << (int)value;
    return out.str();
}

}

Cartridge::Cartridge(std::vector<uint8_t> image) : rom(std::move(image)) {
    parse_header();
    create_mapper();
}

Cartridge::~Cartridge() = default;

std::shared_ptr<Cartridge> Cartridge::load_from_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw CartridgeError("Cannot open file: " + filename);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw CartridgeError("Failed to read file: " + filename);
    }

    std::cout << "Loading ROM: " << filename << " (" << data.size() << " bytes)" << std::endl;
    return std::make_shared<Cartridge>(std::move(data));
}

void Cartridge::parse_header() {
    if (rom.size() < HEADER_END) {
        throw CartridgeError("Image too small for a cartridge header (" +
                             std::to_string(rom.size()) + " bytes)");
    }

    // ===== TITLE =====
    // Up to 16 characters, NUL padded; CGB titles reuse the last bytes
    for (uint16_t addr = 0x0134; addr < 0x0144; addr++) {
        char c = static_cast<char>(rom[addr]);
        if (c == '\0') {
            break;
        }
        if (addr == 0x0143 && (rom[addr] & 0x80)) {
            break;
        }
        info.title += c;
    }

    info.cgb_flag = rom[0x0143];
    info.sgb_flag = rom[0x0146];
    info.type = rom[0x0147];
    info.rom_size_code = rom[0x0148];
    info.ram_size_code = rom[0x0149];
    info.header_checksum = rom[0x014D];

    // ===== HEADER CHECKSUM =====
    uint8_t checksum = 0;
    for (uint16_t addr = 0x0134; addr <= 0x014C; addr++) {
        checksum = checksum - rom[addr] - 1;
    }
    info.checksum_valid = checksum == info.header_checksum;
    if (!info.checksum_valid) {
        std::cerr << "Warning: Header checksum mismatch (header " << hex_byte(info.header_checksum)
                  << ", computed " << hex_byte(checksum) << ")" << std::endl;
    }

    // ===== CONTROLLER TYPE =====
    const TypeEntry* entry = find_type(info.type);
    if (!entry) {
        throw CartridgeError("Unsupported cartridge type " + hex_byte(info.type));
    }
    info.has_ram = entry->ram;
    info.has_battery = entry->battery;
    info.has_rtc = entry->rtc;
    info.has_rumble = entry->rumble;

    // ===== ROM SIZE =====
    if (info.rom_size_code > 0x08) {
        throw CartridgeError("Invalid ROM size code " + hex_byte(info.rom_size_code));
    }
    info.rom_banks = 2 << info.rom_size_code;
    size_t declared_size = static_cast<size_t>(info.rom_banks) * 0x4000;
    if (rom.size() < declared_size) {
        throw CartridgeError("Truncated image: header declares " + std::to_string(declared_size) +
                             " bytes, image has " + std::to_string(rom.size()));
    }
    if (rom.size() > declared_size) {
        std::cerr << "Warning: Image has " << (rom.size() - declared_size)
                  << " bytes past the declared ROM size, ignoring them" << std::endl;
        rom.resize(declared_size);
    }

    // ===== RAM SIZE =====
    switch (info.ram_size_code) {
        case 0x00: info.ram_size = 0; break;
        case 0x01: info.ram_size = 0x800; break;
        case 0x02: info.ram_size = 0x2000; break;
        case 0x03: info.ram_size = 0x8000; break;
        case 0x04: info.ram_size = 0x20000; break;
        case 0x05: info.ram_size = 0x10000; break;
        default:
            throw CartridgeError("Invalid RAM size code " + hex_byte(info.ram_size_code));
    }
    if (!info.has_ram) {
        info.ram_size = 0;
    }

    std::cout << "Title: " << info.title << std::endl;
    std::cout << "Type: " << entry->name << " (" << hex_byte(info.type) << ")" << std::endl;
    std::cout << "ROM: " << (declared_size / 1024) << "KB (" << info.rom_banks << " banks)" << std::endl;
    std::cout << "RAM: " << (info.ram_size / 1024) << "KB" << (info.has_battery ? " battery-backed" : "") << std::endl;
    if (info.cgb_flag & 0x80) {
        std::cout << "CGB: " << (info.cgb_flag == 0xC0 ? "required" : "supported") << std::endl;
    }
}

void Cartridge::create_mapper() {
    // ===== MAPPER CREATION =====
    // Each bank controller has its own limits on ROM and RAM size
    uint8_t ram_banks = static_cast<uint8_t>((info.ram_size + 0x1FFF) / 0x2000);

    switch (info.type) {
        case 0x00: case 0x08: case 0x09:
            if (info.rom_banks > 2) {
                throw CartridgeError("ROM-only cartridge cannot address " +
                                     std::to_string(info.rom_banks) + " banks");
            }
            mapper = std::make_unique<MapperRomOnly>(info.rom_banks, ram_banks);
            break;

        case 0x01: case 0x02: case 0x03:
            if (info.rom_banks > 128 || ram_banks > 4) {
                throw CartridgeError("MBC1 cannot address the declared ROM/RAM size");
            }
            mapper = std::make_unique<MapperMBC1>(info.rom_banks, ram_banks);
            break;

        case 0x05: case 0x06:
            if (info.rom_banks > 16) {
                throw CartridgeError("MBC2 cannot address more than 16 ROM banks");
            }
            // Built-in 512 x 4-bit RAM regardless of the header
            info.ram_size = MapperMBC2::RAM_SIZE;
            mapper = std::make_unique<MapperMBC2>(info.rom_banks);
            break;

        case 0x0F: case 0x10: case 0x11: case 0x12: case 0x13:
            if (info.rom_banks > 128 || ram_banks > 4) {
                throw CartridgeError("MBC3 cannot address the declared ROM/RAM size");
            }
            mapper = std::make_unique<MapperMBC3>(info.rom_banks, ram_banks, info.has_rtc);
            break;

        case 0x19: case 0x1A: case 0x1B: case 0x1C: case 0x1D: case 0x1E:
            if (ram_banks > 16) {
                throw CartridgeError("MBC5 cannot address the declared RAM size");
            }
            mapper = std::make_unique<MapperMBC5>(info.rom_banks, ram_banks, info.has_rumble);
            break;

        default:
            throw CartridgeError("Unsupported cartridge type " + hex_byte(info.type));
    }

    ram.assign(info.ram_size, 0x00);
}

const char* Cartridge::type_name(uint8_t type) {
    const TypeEntry* entry = find_type(type);
    return entry ? entry->name : "UNKNOWN";
}

uint8_t Cartridge::read_rom(uint16_t addr) const {
    return rom[mapper->map_rom(addr)];
}

void Cartridge::write_control(uint16_t addr, uint8_t data) {
    mapper->write_control(addr, data);
}

bool Cartridge::read_ram(uint16_t addr, uint8_t& data) {
    return mapper->ram_read(addr, data, ram);
}

bool Cartridge::write_ram(uint16_t addr, uint8_t data) {
    return mapper->ram_write(addr, data, ram);
}

void Cartridge::clock(uint32_t ticks) {
    mapper->clock(ticks);
}

void Cartridge::reset() {
    mapper->reset();
}

void Cartridge::transfer_state(StateTransfer& state) {
    state.transfer_bytes(ram);
    mapper->transfer_state(state);
}
