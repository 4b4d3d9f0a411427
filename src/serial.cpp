#include "serial.hpp"
#include "interrupts.hpp"
#include "save_state.hpp"

Serial::Serial(InterruptController* interrupts, bool cgb_mode)
    : interrupts(interrupts), cgb(cgb_mode), data(0x00), control(0x00),
      bits_remaining(0), bit_cycles(0) {
}

void Serial::reset(bool cgb_mode) {
    cgb = cgb_mode;
    data = 0x00;
    control = 0x00;
    bits_remaining = 0;
    bit_cycles = 0;
    output.clear();
}

// 8192 Hz internal clock = 128 machine cycles per bit; CGB fast mode is 32x faster
uint32_t Serial::cycles_per_bit() const {
    return (cgb && (control & 0x02)) ? 4 : 128;
}

void Serial::advance(uint32_t machine_cycles) {
    if (bits_remaining == 0) {
        return;
    }

    while (machine_cycles > 0 && bits_remaining > 0) {
        if (machine_cycles < bit_cycles) {
            bit_cycles -= machine_cycles;
            return;
        }
        machine_cycles -= bit_cycles;

        // Disconnected line reads high
        data = (data << 1) | 0x01;
        bits_remaining--;
        bit_cycles = cycles_per_bit();

        if (bits_remaining == 0) {
            control &= 0x7F;
            interrupts->request(Interrupt::SERIAL);
        }
    }
}

uint8_t Serial::read(uint16_t addr) const {
    if (addr == 0xFF01) {
        return data;
    }
    if (addr == 0xFF02) {
        return control | (cgb ? 0x7C : 0x7E);
    }
    return 0xFF;
}

void Serial::write(uint16_t addr, uint8_t value) {
    if (addr == 0xFF01) {
        data = value;
        return;
    }
    if (addr != 0xFF02) {
        return;
    }

    control = value & (cgb ? 0x83 : 0x81);
    if ((control & 0x81) == 0x81) {
        if (output.size() >= OUTPUT_LIMIT) {
            output.erase(output.begin(), output.begin() + OUTPUT_LIMIT / 2);
        }
        output.push_back(data);
        bits_remaining = 8;
        bit_cycles = cycles_per_bit();
    } else {
        bits_remaining = 0;
    }
}

void Serial::transfer_state(StateTransfer& state) {
    state.transfer(data);
    state.transfer(control);
    state.transfer(bits_remaining);
    state.transfer(bit_cycles);
}
