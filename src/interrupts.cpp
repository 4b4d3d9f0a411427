#include "interrupts.hpp"
#include "save_state.hpp"

InterruptController::InterruptController() : flags(0x00), enable(0x00) {
}

void InterruptController::reset(uint8_t initial_flags) {
    flags = initial_flags & 0x1F;
    enable = 0x00;
}

void InterruptController::request(Interrupt kind) {
    flags |= 1 << static_cast<uint8_t>(kind);
}

void InterruptController::clear(Interrupt kind) {
    flags &= ~(1 << static_cast<uint8_t>(kind));
}

bool InterruptController::next_pending(uint8_t enable_mask, Interrupt& out) const {
    uint8_t eligible = flags & enable_mask & 0x1F;
    if (eligible == 0) {
        return false;
    }

    // VBlank > STAT > Timer > Serial > Joypad
    for (uint8_t bit = 0; bit < 5; bit++) {
        if (eligible & (1 << bit)) {
            out = static_cast<Interrupt>(bit);
            return true;
        }
    }
    return false;
}

void InterruptController::transfer_state(StateTransfer& state) {
    state.transfer(flags);
    state.transfer(enable);
}
