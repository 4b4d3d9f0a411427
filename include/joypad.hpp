#pragma once

#include <cstdint>

class InterruptController;
class StateTransfer;

enum class Button : uint8_t {
    RIGHT = 0,
    LEFT = 1,
    UP = 2,
    DOWN = 3,
    A = 4,
    B = 5,
    SELECT = 6,
    START = 7
};

/**
 * Joypad ($FF00)
 *
 * Bit 5 low selects the action buttons, bit 4 low the directions. The low
 * nibble reads 0 for each pressed button in a selected group. A selected
 * line going from high to low requests the joypad interrupt.
 */
class Joypad {
public:
    explicit Joypad(InterruptController* interrupts);

    void reset();

    void set_button(Button button, bool pressed);

    // Bit per Button (1 = pressed)
    void set_state(uint8_t pressed_mask);
    uint8_t get_state() const { return pressed; }

    uint8_t read() const;
    void write(uint8_t data);

    void transfer_state(StateTransfer& state);

private:
    InterruptController* interrupts;

    uint8_t pressed;  // bit per Button
    uint8_t select;   // bits 4-5 as written

    uint8_t input_lines() const;
    void update(uint8_t lines_before);
};
