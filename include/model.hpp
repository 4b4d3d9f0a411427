#pragma once

#include <cstdint>

/**
 * Hardware model the core emulates
 *
 * AUTO resolves at load time: CGB when the cartridge header flags CGB
 * support, DMG otherwise. A CGB running a DMG-only cartridge stays in
 * compatibility mode (no VRAM/WRAM banking, DMG palettes).
 */
enum class Model : uint8_t {
    AUTO,
    DMG,    // Game Boy
    MGB,    // Game Boy Pocket
    SGB,    // Super Game Boy
    CGB     // Game Boy Color
};

const char* model_name(Model model);

// Clock constants
constexpr uint32_t CPU_CLOCK_HZ = 4194304;                  // T-cycles per second
constexpr uint32_t MACHINE_CYCLES_PER_SECOND = CPU_CLOCK_HZ / 4;
constexpr uint32_t DOTS_PER_FRAME = 456 * 154;
constexpr uint32_t MACHINE_CYCLES_PER_FRAME = DOTS_PER_FRAME / 4;
