#include "joypad.hpp"
#include "interrupts.hpp"
#include "save_state.hpp"

Joypad::Joypad(InterruptController* interrupts)
    : interrupts(interrupts), pressed(0x00), select(0x30) {
}

void Joypad::reset() {
    pressed = 0x00;
    select = 0x30;
}

uint8_t Joypad::input_lines() const {
    uint8_t lines = 0x0F;
    if (!(select & 0x10)) {
        lines &= ~(pressed & 0x0F);
    }
    if (!(select & 0x20)) {
        lines &= ~((pressed >> 4) & 0x0F);
    }
    return lines;
}

void Joypad::update(uint8_t lines_before) {
    uint8_t lines_after = input_lines();
    if (lines_before & ~lines_after & 0x0F) {
        interrupts->request(Interrupt::JOYPAD);
    }
}

void Joypad::set_button(Button button, bool is_pressed) {
    uint8_t before = input_lines();
    uint8_t bit = 1 << static_cast<uint8_t>(button);
    if (is_pressed) {
        pressed |= bit;
    } else {
        pressed &= ~bit;
    }
    update(before);
}

void Joypad::set_state(uint8_t pressed_mask) {
    uint8_t before = input_lines();
    pressed = pressed_mask;
    update(before);
}

uint8_t Joypad::read() const {
    return 0xC0 | select | input_lines();
}

void Joypad::write(uint8_t data) {
    uint8_t before = input_lines();
    select = data & 0x30;
    update(before);
}

void Joypad::transfer_state(StateTransfer& state) {
    state.transfer(pressed);
    state.transfer(select);
}
