#include "emulator.hpp"
#include "audio_unit.hpp"
#include "bus.hpp"
#include "cartridge.hpp"
#include "cpu.hpp"
#include "errors.hpp"
#include "interrupts.hpp"
#include "memory.hpp"
#include "ppu.hpp"
#include "save_state.hpp"
#include "serial.hpp"
#include "timer.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>

namespace {
const char SNAPSHOT_MAGIC[4] = {'G', 'B', 'S', 'T'};
const uint16_t SNAPSHOT_VERSION = 1;

// Divider value the boot ROM leaves behind when it hands over at $0100
const uint16_t DMG_POST_BOOT_DIV = 0xABCC;
const uint16_t CGB_POST_BOOT_DIV = 0x1EA0;
}

Emulator::Emulator(EmulatorConfig cfg)
    : config(std::move(cfg)), audio(nullptr), model(Model::DMG), cgb_mode(false), cycle_count(0) {
    interrupts = std::make_unique<InterruptController>();
    bus = std::make_unique<Bus>();
    cpu = std::make_unique<CPU>(bus.get(), interrupts.get());
    ppu = std::make_unique<PPU>(interrupts.get());
    memory = std::make_unique<Memory>(false);
    timer = std::make_unique<Timer>(interrupts.get());
    joypad = std::make_unique<Joypad>(interrupts.get());
    serial = std::make_unique<Serial>(interrupts.get(), false);

    bus->connect_memory(memory.get());
    bus->connect_ppu(ppu.get());
    bus->connect_timer(timer.get());
    bus->connect_interrupts(interrupts.get());
    bus->connect_joypad(joypad.get());
    bus->connect_serial(serial.get());

    cpu->set_halt_bug(config.halt_bug);
}

Emulator::~Emulator() = default;

bool Emulator::load_rom(const std::string& filename) {
    std::shared_ptr<Cartridge> cart;
    try {
        cart = Cartridge::load_from_file(filename);
    } catch (const CartridgeError& e) {
        std::cerr << "Failed to load ROM: " << e.what() << std::endl;
        return false;
    }

    std::cout << "Loaded " << filename << std::endl;
    cartridge = cart;
    bus->insert_cartridge(cartridge);
    reset();
    return true;
}

bool Emulator::load_rom_data(std::vector<uint8_t> image) {
    std::shared_ptr<Cartridge> cart;
    try {
        cart = std::make_shared<Cartridge>(std::move(image));
    } catch (const CartridgeError& e) {
        std::cerr << "Failed to load ROM: " << e.what() << std::endl;
        return false;
    }

    cartridge = cart;
    bus->insert_cartridge(cartridge);
    reset();
    return true;
}

void Emulator::reset() {
    // ===== MODEL SELECTION =====
    model = config.model;
    if (model == Model::AUTO) {
        model = (cartridge && cartridge->supports_cgb()) ? Model::CGB : Model::DMG;
    }
    cgb_mode = model == Model::CGB && cartridge && cartridge->supports_cgb();

    bool boot = !config.boot_rom.empty();
    if (boot && config.boot_rom.size() != 0x100 && config.boot_rom.size() != 0x900) {
        std::cerr << "Ignoring boot ROM of " << config.boot_rom.size()
                  << " bytes (expected 256 or 2304)" << std::endl;
        boot = false;
    }

    std::cout << "Model: " << model_name(model);
    if (model == Model::CGB && !cgb_mode) {
        std::cout << " (DMG compatibility)";
    }
    std::cout << (boot ? ", boot ROM" : ", post-boot state") << std::endl;

    // ===== COMPONENTS =====
    bus->set_boot_rom(boot ? config.boot_rom : std::vector<uint8_t>());
    bus->reset(cgb_mode);
    interrupts->reset(boot ? 0x00 : 0xE1);
    memory->reset(cgb_mode);
    ppu->reset(cgb_mode, model == Model::CGB, !boot);
    joypad->reset();
    serial->reset(cgb_mode);

    uint16_t div = 0x0000;
    if (!boot) {
        div = model == Model::CGB ? CGB_POST_BOOT_DIV : DMG_POST_BOOT_DIV;
    }
    timer->reset(div);

    if (cartridge) {
        cartridge->reset();
    }

    cpu->reset(model, cgb_mode, boot);

    cycle_count = 0;
    fault = Fault();
}

// ============================================================================
// STEP DRIVER
// ============================================================================

StepResult Emulator::run_one_cpu_step() {
    if (has_fault()) {
        return {StepStatus::FAULT, 0};
    }

    uint32_t cycles = 0;
    try {
        cycles = cpu->step();
    } catch (const IllegalOpcodeError& e) {
        fault.kind = FaultKind::ILLEGAL_OPCODE;
        fault.pc = e.pc();
        fault.opcode = e.opcode();
        fault.message = e.what();
        std::cerr << "CPU fault: " << fault.message << std::endl;
        return {StepStatus::FAULT, 0};
    }

    // VRAM DMA started by this instruction holds the CPU
    cycles += bus->take_stall_cycles();

    advance_components(cycles);
    cycle_count += cycles;

    if (ppu->frame_complete()) {
        return {StepStatus::FRAME_COMPLETE, cycles};
    }
    return {StepStatus::OK, cycles};
}

void Emulator::advance_components(uint32_t machine_cycles) {
    bool double_speed = bus->is_double_speed();

    timer->advance(machine_cycles);

    if (audio) {
        audio->clock(machine_cycles);
    }
    uint32_t ticks = timer->take_frame_sequencer_ticks();
    if (audio) {
        for (uint32_t i = 0; i < ticks; i++) {
            audio->frame_sequencer_tick();
        }
    }

    serial->advance(machine_cycles);

    // The cartridge clock runs on real time, which double speed does not change
    if (cartridge) {
        cartridge->clock(machine_cycles * (double_speed ? 2 : 4));
    }

    ppu->advance(machine_cycles * (double_speed ? 2 : 4));
    bus->clock(machine_cycles);
}

bool Emulator::run_frame() {
    uint32_t elapsed = 0;

    while (true) {
        StepResult result = run_one_cpu_step();
        if (result.status == StepStatus::FAULT) {
            return false;
        }
        if (result.status == StepStatus::FRAME_COMPLETE) {
            return true;
        }

        // With the LCD off no VBlank comes; give the caller a frame's worth of time
        elapsed += result.cycles;
        uint32_t frame_cycles = MACHINE_CYCLES_PER_FRAME * (bus->is_double_speed() ? 2 : 1);
        if (!ppu->lcd_enabled() && elapsed >= frame_cycles) {
            return true;
        }
    }
}

const uint8_t* Emulator::get_screen() const {
    return ppu->get_screen();
}

const uint8_t* Emulator::get_shades() const {
    return ppu->get_shades();
}

void Emulator::set_button(Button button, bool pressed) {
    joypad->set_button(button, pressed);
}

void Emulator::set_joypad_state(uint8_t pressed_mask) {
    joypad->set_state(pressed_mask);
}

void Emulator::attach_audio_unit(AudioUnit* audio_unit) {
    audio = audio_unit;
    bus->connect_audio(audio_unit);
}

const std::vector<uint8_t>& Emulator::get_serial_output() const {
    return serial->get_output();
}

// ============================================================================
// PERSISTENCE
// ============================================================================

std::vector<uint8_t>& Emulator::battery_ram() {
    if (!cartridge) {
        throw EmulatorError("No cartridge loaded");
    }
    return cartridge->get_ram();
}

bool Emulator::has_battery() const {
    return cartridge && cartridge->has_battery();
}

void Emulator::transfer_header(StateTransfer& state) {
    const CartridgeInfo& info = cartridge->get_info();

    char magic[4];
    std::memcpy(magic, SNAPSHOT_MAGIC, sizeof(magic));
    uint16_t version = SNAPSHOT_VERSION;
    Model snapshot_model = model;
    bool snapshot_cgb = cgb_mode;
    char title[16] = {};
    std::memcpy(title, info.title.data(), std::min(info.title.size(), sizeof(title)));
    uint8_t checksum = info.header_checksum;
    uint16_t rom_banks = info.rom_banks;

    state.transfer(magic);
    if (!state.is_saving() && std::memcmp(magic, SNAPSHOT_MAGIC, sizeof(magic)) != 0) {
        throw StateError("Not a snapshot");
    }

    state.transfer(version);
    if (!state.is_saving() && version != SNAPSHOT_VERSION) {
        throw StateError("Unsupported snapshot version " + std::to_string(version));
    }

    state.transfer(snapshot_model);
    state.transfer(snapshot_cgb);
    if (!state.is_saving() && (snapshot_model != model || snapshot_cgb != cgb_mode)) {
        throw StateError(std::string("Snapshot was taken on ") + model_name(snapshot_model) +
                         ", running " + model_name(model));
    }

    state.transfer(title);
    state.transfer(checksum);
    state.transfer(rom_banks);
    if (!state.is_saving() &&
        (std::strncmp(title, info.title.c_str(), sizeof(title)) != 0 ||
         checksum != info.header_checksum || rom_banks != info.rom_banks)) {
        throw StateError("Snapshot belongs to a different cartridge");
    }
}

void Emulator::transfer_components(StateTransfer& state) {
    state.transfer(cycle_count);
    cpu->transfer_state(state);
    interrupts->transfer_state(state);
    bus->transfer_state(state);
    memory->transfer_state(state);
    ppu->transfer_state(state);
    timer->transfer_state(state);
    joypad->transfer_state(state);
    serial->transfer_state(state);
    cartridge->transfer_state(state);
}

std::vector<uint8_t> Emulator::save_state() {
    if (!cartridge) {
        throw StateError("No cartridge loaded");
    }

    StateTransfer state;
    transfer_header(state);
    transfer_components(state);
    return state.finish();
}

void Emulator::load_state(const std::vector<uint8_t>& snapshot) {
    if (!cartridge) {
        throw StateError("No cartridge loaded");
    }

    // A snapshot that fails halfway must not leave a half-restored machine
    std::vector<uint8_t> backup = save_state();

    try {
        StateTransfer state(snapshot);
        transfer_header(state);
        transfer_components(state);
        state.finish();
    } catch (const StateError&) {
        StateTransfer restore(backup);
        transfer_header(restore);
        transfer_components(restore);
        restore.finish();
        throw;
    }

    fault = Fault();
}
