#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

class AudioUnit;
class Cartridge;
class InterruptController;
class Joypad;
class Memory;
class PPU;
class Serial;
class StateTransfer;
class Timer;

/**
 * System Bus - Connects all components
 *
 * CPU Memory Map:
 * $0000-$3FFF: ROM bank 0 (boot ROM overlays $0000-$00FF until $FF50 is written)
 * $4000-$7FFF: Switchable ROM bank
 * $8000-$9FFF: VRAM (blocked during mode 3)
 * $A000-$BFFF: Cartridge RAM / RTC
 * $C000-$DFFF: Work RAM
 * $E000-$FDFF: Echo of $C000-$DDFF
 * $FE00-$FE9F: OAM (blocked during modes 2-3 and OAM DMA)
 * $FEA0-$FEFF: Unusable
 * $FF00-$FF7F: I/O registers
 * $FF80-$FFFE: High RAM
 * $FFFF:       Interrupt enable
 *
 * Also runs the two DMA engines: OAM DMA ($FF46, one byte per machine cycle)
 * and CGB VRAM DMA ($FF51-$FF55, general purpose or one block per HBlank).
 */
class Bus {
public:
    Bus();
    ~Bus();

    // Connect components
    void connect_memory(Memory* memory_ptr);
    void connect_ppu(PPU* ppu_ptr);
    void connect_timer(Timer* timer_ptr);
    void connect_interrupts(InterruptController* interrupts_ptr);
    void connect_joypad(Joypad* joypad_ptr);
    void connect_serial(Serial* serial_ptr);
    void connect_audio(AudioUnit* audio_ptr);
    void insert_cartridge(std::shared_ptr<Cartridge> cart);

    // 256 bytes (DMG) or 2304 bytes (CGB); empty = no boot ROM
    void set_boot_rom(std::vector<uint8_t> image);

    void reset(bool cgb_mode);

    // CPU memory access
    uint8_t cpu_read(uint16_t addr);
    void cpu_write(uint16_t addr, uint8_t data);

    // Advance the DMA engines (after the PPU has been advanced)
    void clock(uint32_t machine_cycles);

    // Cycles the CPU loses to VRAM DMA, charged to the current step
    uint32_t take_stall_cycles();

    // ===== CGB SPEED SWITCH =====
    bool speed_switch_armed() const { return key1 & 0x01; }
    void perform_speed_switch();
    bool is_double_speed() const { return double_speed; }

    bool boot_rom_mapped() const { return boot_rom_enabled; }
    bool oam_dma_active() const { return dma_active; }

    Cartridge* get_cartridge() { return cartridge.get(); }

    void transfer_state(StateTransfer& state);

private:
    // Components
    Memory* memory;
    PPU* ppu;
    Timer* timer;
    InterruptController* interrupts;
    Joypad* joypad;
    Serial* serial;
    AudioUnit* audio;
    std::shared_ptr<Cartridge> cartridge;

    bool cgb;

    std::vector<uint8_t> boot_rom;
    bool boot_rom_enabled;

    // Audio registers when no audio unit is attached
    std::array<uint8_t, 0x30> audio_registers;

    // OAM DMA
    bool dma_requested;
    bool dma_active;
    uint8_t dma_register;
    uint8_t dma_index;
    uint8_t dma_delay;

    // VRAM DMA (CGB)
    uint16_t hdma_source;
    uint16_t hdma_dest;
    uint8_t hdma_length;     // blocks left - 1, $7F when idle
    bool hdma_hblank_active;
    uint32_t stall_cycles;

    // Speed switch (CGB)
    uint8_t key1;
    bool double_speed;

    uint8_t read_io(uint16_t addr);
    void write_io(uint16_t addr, uint8_t data);
    bool boot_rom_covers(uint16_t addr) const;

    uint8_t dma_read(uint16_t addr);
    void start_hdma(uint8_t data);
    void copy_hdma_block();
};
