#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "joypad.hpp"
#include "model.hpp"

// Forward declarations
class CPU;
class PPU;
class Bus;
class Memory;
class Timer;
class InterruptController;
class Serial;
class Cartridge;
class AudioUnit;
class StateTransfer;

/**
 * Emulator settings, fixed for the lifetime of an Emulator
 */
struct EmulatorConfig {
    Model model = Model::AUTO;
    std::vector<uint8_t> boot_rom;   // empty = start in the post-boot state
    bool halt_bug = true;
};

enum class StepStatus {
    OK,
    FRAME_COMPLETE,
    FAULT
};

struct StepResult {
    StepStatus status;
    uint32_t cycles;   // machine cycles consumed (0 on fault)
};

enum class FaultKind {
    NONE,
    ILLEGAL_OPCODE
};

// Why the CPU stopped executing
struct Fault {
    FaultKind kind = FaultKind::NONE;
    uint16_t pc = 0;
    uint8_t opcode = 0;
    std::string message;
};

/**
 * Main Emulator Class
 *
 * Owns every component, wires them to the bus and drives them in lockstep:
 * each CPU step reports how many machine cycles it took and every other
 * component is advanced by exactly that amount before the next step.
 */
class Emulator {
public:
    explicit Emulator(EmulatorConfig config = EmulatorConfig());
    ~Emulator();

    // Load ROM file (reports problems on std::cerr)
    bool load_rom(const std::string& filename);
    bool load_rom_data(std::vector<uint8_t> image);

    // Power cycle, keeps the cartridge and its RAM
    void reset();

    // One CPU instruction (or interrupt dispatch, or halted cycle)
    StepResult run_one_cpu_step();

    // Run until the next VBlank (returns false on fault)
    bool run_frame();

    // 160x144 RGB24 / color indices, updated once per frame
    const uint8_t* get_screen() const;
    const uint8_t* get_shades() const;

    // Joypad input, applied before the next step
    void set_button(Button button, bool pressed);
    void set_joypad_state(uint8_t pressed_mask);

    // Optional sound chip; not owned
    void attach_audio_unit(AudioUnit* audio);

    // ===== PERSISTENCE =====
    std::vector<uint8_t>& battery_ram();
    bool has_battery() const;

    std::vector<uint8_t> save_state();
    void load_state(const std::vector<uint8_t>& snapshot);  // throws StateError

    // ===== STATE INSPECTION =====
    uint64_t get_cycle_count() const { return cycle_count; }
    bool has_fault() const { return fault.kind != FaultKind::NONE; }
    const Fault& get_fault() const { return fault; }
    Model get_model() const { return model; }
    bool is_cgb_mode() const { return cgb_mode; }
    bool has_cartridge() const { return cartridge != nullptr; }
    const std::vector<uint8_t>& get_serial_output() const;

    // Get components (for debugging)
    CPU* get_cpu() { return cpu.get(); }
    PPU* get_ppu() { return ppu.get(); }
    Bus* get_bus() { return bus.get(); }
    Timer* get_timer() { return timer.get(); }
    InterruptController* get_interrupts() { return interrupts.get(); }
    Cartridge* get_cartridge() { return cartridge.get(); }

private:
    EmulatorConfig config;

    std::unique_ptr<InterruptController> interrupts;
    std::unique_ptr<Bus> bus;
    std::unique_ptr<CPU> cpu;
    std::unique_ptr<PPU> ppu;
    std::unique_ptr<Memory> memory;
    std::unique_ptr<Timer> timer;
    std::unique_ptr<Joypad> joypad;
    std::unique_ptr<Serial> serial;
    std::shared_ptr<Cartridge> cartridge;
    AudioUnit* audio;

    Model model;
    bool cgb_mode;
    uint64_t cycle_count;
    Fault fault;

    void advance_components(uint32_t machine_cycles);
    void transfer_header(StateTransfer& state);
    void transfer_components(StateTransfer& state);
};
