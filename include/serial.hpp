#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

class InterruptController;
class StateTransfer;

/**
 * Serial port ($FF01 SB, $FF02 SC)
 *
 * No link partner is attached: internal-clock transfers shift in 1s and
 * complete after 8 bits, externally clocked transfers never complete.
 * Every byte shifted out is kept in an output log (test ROMs print through it).
 * The log holds at most OUTPUT_LIMIT bytes; the oldest half is dropped when full.
 */
class Serial {
public:
    static constexpr size_t OUTPUT_LIMIT = 0x10000;

    Serial(InterruptController* interrupts, bool cgb_mode);

    void reset(bool cgb_mode);

    void advance(uint32_t machine_cycles);

    uint8_t read(uint16_t addr) const;
    void write(uint16_t addr, uint8_t data);

    const std::vector<uint8_t>& get_output() const { return output; }
    void clear_output() { output.clear(); }

    void transfer_state(StateTransfer& state);

private:
    InterruptController* interrupts;
    bool cgb;

    uint8_t data;     // SB
    uint8_t control;  // SC
    uint8_t bits_remaining;
    uint32_t bit_cycles;  // machine cycles until the next bit shifts

    std::vector<uint8_t> output;

    uint32_t cycles_per_bit() const;
};
