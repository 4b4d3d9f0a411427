#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class Mapper;
class StateTransfer;

/**
 * Parsed cartridge header ($0100-$014F)
 */
struct CartridgeInfo {
    std::string title;
    uint8_t cgb_flag;         // $0143: $80 = CGB enhanced, $C0 = CGB only
    uint8_t sgb_flag;         // $0146
    uint8_t type;             // $0147
    uint8_t rom_size_code;    // $0148
    uint8_t ram_size_code;    // $0149
    uint8_t header_checksum;  // $014D
    bool checksum_valid;
    uint16_t rom_banks;       // 16KB units
    size_t ram_size;          // bytes
    bool has_ram;
    bool has_battery;
    bool has_rtc;
    bool has_rumble;
};

/**
 * Cartridge - Game Boy ROM image and its bank controller
 *
 * The header declares the controller ($0147), ROM size ($0148, 32KB << n)
 * and RAM size ($0149). Loading rejects, with CartridgeError:
 * - images too small to hold a header
 * - images shorter than their declared ROM size
 * - controller types this core does not implement
 * - size declarations the controller cannot address
 * A header checksum mismatch is only reported as a warning.
 */
class Cartridge {
public:
    explicit Cartridge(std::vector<uint8_t> image);
    ~Cartridge();

    // Read a ROM file from disk (throws CartridgeError)
    static std::shared_ptr<Cartridge> load_from_file(const std::string& filename);

    // $0000-$7FFF
    uint8_t read_rom(uint16_t addr) const;
    void write_control(uint16_t addr, uint8_t data);

    // $A000-$BFFF (false = open bus)
    bool read_ram(uint16_t addr, uint8_t& data);
    bool write_ram(uint16_t addr, uint8_t data);

    // Real-time ticks for the cartridge clock
    void clock(uint32_t ticks);

    void reset();

    const CartridgeInfo& get_info() const { return info; }
    bool supports_cgb() const { return info.cgb_flag & 0x80; }
    bool has_battery() const { return info.has_battery; }

    // External RAM, for battery save files
    std::vector<uint8_t>& get_ram() { return ram; }
    const std::vector<uint8_t>& get_ram() const { return ram; }

    static const char* type_name(uint8_t type);

    void transfer_state(StateTransfer& state);

private:
    std::vector<uint8_t> rom;
    std::vector<uint8_t> ram;
    CartridgeInfo info;
    std::unique_ptr<Mapper> mapper;

    void parse_header();
    void create_mapper();
};
