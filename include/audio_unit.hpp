#pragma once

#include <cstdint>

/**
 * Audio Unit interface
 *
 * The core does not synthesize sound. A front end that wants audio attaches
 * an implementation; the bus forwards $FF10-$FF3F to it and the step driver
 * clocks it with the same cycle count as every other component.
 */
class AudioUnit {
public:
    virtual ~AudioUnit() = default;

    virtual uint8_t read_register(uint16_t addr) = 0;
    virtual void write_register(uint16_t addr, uint8_t data) = 0;

    // Machine cycles elapsed in the last step
    virtual void clock(uint32_t machine_cycles) = 0;

    // DIV-APU tick (512 Hz)
    virtual void frame_sequencer_tick() = 0;
};
