#include "timer.hpp"
#include "interrupts.hpp"
#include "save_state.hpp"

namespace {
const uint8_t TIMER_BITS[4] = {9, 3, 5, 7};
}

Timer::Timer(InterruptController* interrupts)
    : interrupts(interrupts), counter(0), tima(0), tma(0), tac(0),
      double_speed(false), frame_sequencer_ticks(0) {
}

void Timer::reset(uint16_t initial_counter) {
    counter = initial_counter;
    tima = 0x00;
    tma = 0x00;
    tac = 0x00;
    double_speed = false;
    frame_sequencer_ticks = 0;
}

bool Timer::timer_signal(uint16_t value) const {
    return (tac & 0x04) && (value & (1 << TIMER_BITS[tac & 0x03]));
}

bool Timer::frame_sequencer_signal(uint16_t value) const {
    return value & (1 << (double_speed ? 13 : 12));
}

void Timer::increment_tima() {
    tima++;
    if (tima == 0x00) {
        // Overflow: reload from modulo and request the interrupt
        tima = tma;
        interrupts->request(Interrupt::TIMER);
    }
}

// Every change of the counter goes through here so falling edges are never missed
void Timer::set_counter(uint16_t value) {
    bool timer_before = timer_signal(counter);
    bool sequencer_before = frame_sequencer_signal(counter);

    counter = value;

    if (timer_before && !timer_signal(counter)) {
        increment_tima();
    }
    if (sequencer_before && !frame_sequencer_signal(counter)) {
        frame_sequencer_ticks++;
    }
}

void Timer::advance(uint32_t machine_cycles) {
    for (uint32_t i = 0; i < machine_cycles; i++) {
        set_counter(counter + 4);
    }
}

uint8_t Timer::read(uint16_t addr) const {
    switch (addr) {
        case 0xFF04: return counter >> 8;
        case 0xFF05: return tima;
        case 0xFF06: return tma;
        case 0xFF07: return tac | 0xF8;
        default:     return 0xFF;
    }
}

void Timer::write(uint16_t addr, uint8_t data) {
    switch (addr) {
        case 0xFF04:
            // Any write clears the whole counter
            set_counter(0x0000);
            break;
        case 0xFF05:
            tima = data;
            break;
        case 0xFF06:
            tma = data;
            break;
        case 0xFF07: {
            bool before = timer_signal(counter);
            tac = data & 0x07;
            if (before && !timer_signal(counter)) {
                increment_tima();
            }
            break;
        }
        default:
            break;
    }
}

uint32_t Timer::take_frame_sequencer_ticks() {
    uint32_t ticks = frame_sequencer_ticks;
    frame_sequencer_ticks = 0;
    return ticks;
}

void Timer::transfer_state(StateTransfer& state) {
    state.transfer(counter);
    state.transfer(tima);
    state.transfer(tma);
    state.transfer(tac);
    state.transfer(double_speed);
    state.transfer(frame_sequencer_ticks);
}
