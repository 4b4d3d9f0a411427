#pragma once

#include <cstdint>

class InterruptController;
class StateTransfer;

/**
 * Divider and programmable timer ($FF04-$FF07)
 *
 * DIV is the upper byte of a 16-bit counter that advances by 4 every
 * machine cycle. TIMA is clocked by the falling edge of one counter bit
 * (selected by TAC) ANDed with the TAC enable bit, so writes to DIV or TAC
 * that drop that signal also clock TIMA.
 *
 * TAC select -> counter bit -> period:
 *   00 -> bit 9 -> 1024 T-cycles
 *   01 -> bit 3 ->   16 T-cycles
 *   10 -> bit 5 ->   64 T-cycles
 *   11 -> bit 7 ->  256 T-cycles
 */
class Timer {
public:
    explicit Timer(InterruptController* interrupts);

    void reset(uint16_t initial_counter = 0x0000);

    // Advance by machine cycles
    void advance(uint32_t machine_cycles);

    uint8_t read(uint16_t addr) const;
    void write(uint16_t addr, uint8_t data);

    // CGB double speed moves the DIV-APU tap from bit 12 to bit 13
    void set_double_speed(bool enabled) { double_speed = enabled; }

    // DIV-APU ticks since the last call (for an attached audio unit)
    uint32_t take_frame_sequencer_ticks();

    uint16_t get_counter() const { return counter; }
    uint8_t get_tima() const { return tima; }

    void transfer_state(StateTransfer& state);

private:
    InterruptController* interrupts;

    uint16_t counter;
    uint8_t tima;
    uint8_t tma;
    uint8_t tac;
    bool double_speed;
    uint32_t frame_sequencer_ticks;

    bool timer_signal(uint16_t value) const;
    bool frame_sequencer_signal(uint16_t value) const;
    void set_counter(uint16_t value);
    void increment_tima();
};
