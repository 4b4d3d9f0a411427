#pragma once

#include <cstdint>

class StateTransfer;

/**
 * Interrupt sources, in bit order of IF/IE. Lower bit = higher priority.
 */
enum class Interrupt : uint8_t {
    VBLANK = 0,
    LCD_STAT = 1,
    TIMER = 2,
    SERIAL = 3,
    JOYPAD = 4
};

/**
 * Interrupt Controller - IF ($FF0F) and IE ($FFFF)
 *
 * Components raise requests; the CPU asks for the highest-priority request
 * that is also enabled and acknowledges it, which clears only that bit.
 */
class InterruptController {
public:
    InterruptController();

    void reset(uint8_t initial_flags = 0x00);

    void request(Interrupt kind);
    void clear(Interrupt kind);

    // Highest-priority kind set in both IF and enable_mask
    bool next_pending(uint8_t enable_mask, Interrupt& out) const;
    bool next_pending(Interrupt& out) const { return next_pending(enable, out); }

    // IE & IF & 0x1F != 0 (wakes HALT regardless of IME)
    bool any_pending() const { return (enable & flags & 0x1F) != 0; }

    static uint16_t vector_for(Interrupt kind) { return 0x0040 + 8 * static_cast<uint16_t>(kind); }

    // Register interface
    uint8_t read_flags() const { return flags | 0xE0; }
    void write_flags(uint8_t data) { flags = data & 0x1F; }
    uint8_t read_enable() const { return enable; }
    void write_enable(uint8_t data) { enable = data; }

    void transfer_state(StateTransfer& state);

private:
    uint8_t flags;   // IF
    uint8_t enable;  // IE
};
