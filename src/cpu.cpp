#include "cpu.hpp"
#include "bus.hpp"
#include "errors.hpp"
#include "interrupts.hpp"
#include "save_state.hpp"

CPU::CPU(Bus* bus, InterruptController* interrupts)
    : bus(bus), interrupts(interrupts), total_cycles(0), extra_cycles(0), halt_bug_enabled(true) {
    reset(Model::DMG, false, false);
}

void CPU::reset(Model model, bool cgb_mode, bool boot_rom) {
    // ===== POWER-ON REGISTER STATE =====
    // With a boot ROM everything starts at zero and execution begins at $0000.
    // Without one, load what each model's boot ROM hands over at $0100.
    // Games use A (and B on CGB) to detect the hardware they run on.
    A = F = B = C = D = E = H = L = 0x00;
    SP = 0x0000;
    PC = 0x0000;

    if (!boot_rom) {
        SP = 0xFFFE;
        PC = 0x0100;

        switch (model) {
            case Model::MGB:
                A = 0xFF; F = 0xB0;
                set_bc(0x0013); set_de(0x00D8); set_hl(0x014D);
                break;
            case Model::SGB:
                A = 0x01; F = 0x00;
                set_bc(0x0014); set_de(0x0000); set_hl(0xC060);
                break;
            case Model::CGB:
                A = 0x11; F = 0x80;
                if (cgb_mode) {
                    set_bc(0x0000); set_de(0xFF56); set_hl(0x000D);
                } else {
                    set_bc(0x0000); set_de(0x0008); set_hl(0x007C);
                }
                break;
            case Model::DMG:
            case Model::AUTO:
            default:
                A = 0x01; F = 0xB0;
                set_bc(0x0013); set_de(0x00D8); set_hl(0x014D);
                break;
        }
    }

    total_cycles = 0;
    extra_cycles = 0;
    opcode = 0x00;
    opcode_pc = 0x0000;
    cb_opcode = 0x00;
    ime = false;
    ei_delay = 0;
    halted = false;
    stopped = false;
    halt_bug = false;
}

uint32_t CPU::step() {
    // ===== STOPPED =====
    // Only a selected joypad line going low wakes the CPU
    if (stopped) {
        if ((read(0xFF00) & 0x0F) != 0x0F) {
            stopped = false;
        }
        total_cycles += 1;
        return 1;
    }

    // ===== HALTED =====
    // Any enabled request ends HALT, with or without IME
    if (halted) {
        if (interrupts->any_pending()) {
            halted = false;
        }
        total_cycles += 1;
        return 1;
    }

    // ===== INTERRUPT DISPATCH =====
    Interrupt kind;
    if (ime && interrupts->next_pending(kind)) {
        uint32_t cycles = service_interrupt();
        total_cycles += cycles;
        return cycles;
    }

    // ===== FETCH =====
    opcode_pc = PC;
    opcode = read(PC);
    if (halt_bug) {
        // PC fails to advance, so this byte is read again next time
        halt_bug = false;
    } else {
        PC++;
    }

    // ===== EXECUTE =====
    const Instruction& instr = instruction_table[opcode];
    extra_cycles = 0;
    uint8_t taken = (this->*instr.operate)();

    uint32_t cycles = taken ? instr.cycles_taken : instr.cycles;
    if (opcode == 0xCB) {
        cycles = cb_cycle_table[cb_opcode];
    }
    cycles += extra_cycles;

    // EI: IME goes up once the instruction after EI has finished
    if (ei_delay > 0 && --ei_delay == 0) {
        ime = true;
    }

    total_cycles += cycles;
    return cycles;
}

uint32_t CPU::service_interrupt() {
    // ===== INTERRUPT SERVICE (5 machine cycles) =====
    // 2 idle cycles, push PC high, push PC low, jump to vector.
    // The high-byte push can land on IE ($FFFF) and cancel the request,
    // in which case the CPU ends up at $0000.
    ime = false;
    ei_delay = 0;

    if (halt_bug) {
        // Interrupted right after the buggy HALT: return to the HALT itself
        halt_bug = false;
        PC--;
    }

    SP--;
    write(SP, PC >> 8);

    Interrupt kind;
    bool still_pending = interrupts->next_pending(kind);

    SP--;
    write(SP, PC & 0xFF);

    if (!still_pending) {
        PC = 0x0000;
        return 5;
    }

    interrupts->clear(kind);
    PC = InterruptController::vector_for(kind);
    return 5;
}

const char* CPU::get_instruction_name(uint8_t opcode) {
    return instruction_table[opcode].name;
}

// ============================================================================
// HELPERS
// ============================================================================

uint8_t CPU::read(uint16_t addr) {
    return bus->cpu_read(addr);
}

void CPU::write(uint16_t addr, uint8_t data) {
    bus->cpu_write(addr, data);
}

uint8_t CPU::fetch8() {
    return read(PC++);
}

uint16_t CPU::fetch16() {
    uint16_t lo = fetch8();
    uint16_t hi = fetch8();
    return (hi << 8) | lo;
}

void CPU::push16(uint16_t data) {
    SP--;
    write(SP, data >> 8);
    SP--;
    write(SP, data & 0xFF);
}

uint16_t CPU::pop16() {
    uint16_t lo = read(SP++);
    uint16_t hi = read(SP++);
    return (hi << 8) | lo;
}

void CPU::set_flag(Flags flag, bool value) {
    if (value) {
        F |= flag;
    } else {
        F &= ~flag;
    }
}

bool CPU::get_flag(Flags flag) const {
    return (F & flag) != 0;
}

void CPU::set_flags(bool z, bool n, bool h, bool c) {
    F = (z ? FLAG_Z : 0) | (n ? FLAG_N : 0) | (h ? FLAG_H : 0) | (c ? FLAG_C : 0);
}

// Register index from opcode bits: B, C, D, E, H, L, (HL), A
uint8_t CPU::read_r8(uint8_t index) {
    switch (index & 0x07) {
        case 0: return B;
        case 1: return C;
        case 2: return D;
        case 3: return E;
        case 4: return H;
        case 5: return L;
        case 6: return read(get_hl());
        default: return A;
    }
}

void CPU::write_r8(uint8_t index, uint8_t value) {
    switch (index & 0x07) {
        case 0: B = value; break;
        case 1: C = value; break;
        case 2: D = value; break;
        case 3: E = value; break;
        case 4: H = value; break;
        case 5: L = value; break;
        case 6: write(get_hl(), value); break;
        default: A = value; break;
    }
}

// Pair index from opcode bits 4-5: BC, DE, HL, SP
uint16_t CPU::read_r16(uint8_t index) const {
    switch (index & 0x03) {
        case 0: return get_bc();
        case 1: return get_de();
        case 2: return get_hl();
        default: return SP;
    }
}

void CPU::write_r16(uint8_t index, uint16_t value) {
    switch (index & 0x03) {
        case 0: set_bc(value); break;
        case 1: set_de(value); break;
        case 2: set_hl(value); break;
        default: SP = value; break;
    }
}

// Condition from opcode bits 3-4: NZ, Z, NC, C
bool CPU::condition(uint8_t index) const {
    switch (index & 0x03) {
        case 0: return !get_flag(FLAG_Z);
        case 1: return get_flag(FLAG_Z);
        case 2: return !get_flag(FLAG_C);
        default: return get_flag(FLAG_C);
    }
}

void CPU::alu(uint8_t operation, uint8_t value) {
    uint8_t carry = get_flag(FLAG_C) ? 1 : 0;

    switch (operation & 0x07) {
        case 0: {  // ADD
            uint16_t result = A + value;
            set_flags((result & 0xFF) == 0, false, ((A & 0x0F) + (value & 0x0F)) > 0x0F, result > 0xFF);
            A = result & 0xFF;
            break;
        }
        case 1: {  // ADC
            uint16_t result = A + value + carry;
            set_flags((result & 0xFF) == 0, false, ((A & 0x0F) + (value & 0x0F) + carry) > 0x0F, result > 0xFF);
            A = result & 0xFF;
            break;
        }
        case 2: {  // SUB
            uint8_t result = A - value;
            set_flags(result == 0, true, (A & 0x0F) < (value & 0x0F), A < value);
            A = result;
            break;
        }
        case 3: {  // SBC
            int result = A - value - carry;
            set_flags((result & 0xFF) == 0, true, (A & 0x0F) < (value & 0x0F) + carry, result < 0);
            A = result & 0xFF;
            break;
        }
        case 4:    // AND
            A &= value;
            set_flags(A == 0, false, true, false);
            break;
        case 5:    // XOR
            A ^= value;
            set_flags(A == 0, false, false, false);
            break;
        case 6:    // OR
            A |= value;
            set_flags(A == 0, false, false, false);
            break;
        case 7: {  // CP
            uint8_t result = A - value;
            set_flags(result == 0, true, (A & 0x0F) < (value & 0x0F), A < value);
            break;
        }
    }
}

// SP + signed immediate; H and C come from the unsigned low byte addition
uint16_t CPU::add_sp_offset() {
    uint8_t offset = fetch8();
    uint16_t result = SP + static_cast<int8_t>(offset);
    set_flags(false, false, ((SP & 0x0F) + (offset & 0x0F)) > 0x0F, ((SP & 0xFF) + offset) > 0xFF);
    return result;
}

// ============================================================================
// LOADS
// ============================================================================

uint8_t CPU::NOP() {
    return 0;
}

uint8_t CPU::LD_RR_D16() {
    write_r16(opcode >> 4, fetch16());
    return 0;
}

// (BC), (DE), (HL+), (HL-)
uint8_t CPU::LD_IND_A() {
    switch ((opcode >> 4) & 0x03) {
        case 0: write(get_bc(), A); break;
        case 1: write(get_de(), A); break;
        case 2: write(get_hl(), A); set_hl(get_hl() + 1); break;
        case 3: write(get_hl(), A); set_hl(get_hl() - 1); break;
    }
    return 0;
}

uint8_t CPU::LD_A_IND() {
    switch ((opcode >> 4) & 0x03) {
        case 0: A = read(get_bc()); break;
        case 1: A = read(get_de()); break;
        case 2: A = read(get_hl()); set_hl(get_hl() + 1); break;
        case 3: A = read(get_hl()); set_hl(get_hl() - 1); break;
    }
    return 0;
}

uint8_t CPU::LD_R_D8() {
    uint8_t value = fetch8();
    write_r8(opcode >> 3, value);
    return 0;
}

uint8_t CPU::LD_R_R() {
    write_r8(opcode >> 3, read_r8(opcode));
    return 0;
}

uint8_t CPU::LD_A16_SP() {
    uint16_t addr = fetch16();
    write(addr, SP & 0xFF);
    write(addr + 1, SP >> 8);
    return 0;
}

uint8_t CPU::LDH_A8_A() {
    write(0xFF00 | fetch8(), A);
    return 0;
}

uint8_t CPU::LDH_A_A8() {
    A = read(0xFF00 | fetch8());
    return 0;
}

uint8_t CPU::LD_C_A() {
    write(0xFF00 | C, A);
    return 0;
}

uint8_t CPU::LD_A_C() {
    A = read(0xFF00 | C);
    return 0;
}

uint8_t CPU::LD_A16_A() {
    write(fetch16(), A);
    return 0;
}

uint8_t CPU::LD_A_A16() {
    A = read(fetch16());
    return 0;
}

uint8_t CPU::LD_HL_SP_E8() {
    set_hl(add_sp_offset());
    return 0;
}

uint8_t CPU::LD_SP_HL() {
    SP = get_hl();
    return 0;
}

uint8_t CPU::PUSH() {
    uint8_t index = (opcode >> 4) & 0x03;
    push16(index == 3 ? get_af() : read_r16(index));
    return 0;
}

uint8_t CPU::POP() {
    uint8_t index = (opcode >> 4) & 0x03;
    uint16_t value = pop16();
    if (index == 3) {
        // Low nibble of F does not exist
        set_af(value);
    } else {
        write_r16(index, value);
    }
    return 0;
}

// ============================================================================
// ARITHMETIC
// ============================================================================

uint8_t CPU::INC_RR() {
    write_r16(opcode >> 4, read_r16(opcode >> 4) + 1);
    return 0;
}

uint8_t CPU::DEC_RR() {
    write_r16(opcode >> 4, read_r16(opcode >> 4) - 1);
    return 0;
}

uint8_t CPU::INC_R() {
    uint8_t value = read_r8(opcode >> 3);
    uint8_t result = value + 1;
    write_r8(opcode >> 3, result);
    set_flag(FLAG_Z, result == 0);
    set_flag(FLAG_N, false);
    set_flag(FLAG_H, (value & 0x0F) == 0x0F);
    return 0;
}

uint8_t CPU::DEC_R() {
    uint8_t value = read_r8(opcode >> 3);
    uint8_t result = value - 1;
    write_r8(opcode >> 3, result);
    set_flag(FLAG_Z, result == 0);
    set_flag(FLAG_N, true);
    set_flag(FLAG_H, (value & 0x0F) == 0x00);
    return 0;
}

uint8_t CPU::ADD_HL_RR() {
    uint16_t hl = get_hl();
    uint16_t value = read_r16(opcode >> 4);
    uint32_t result = hl + value;
    set_flag(FLAG_N, false);
    set_flag(FLAG_H, ((hl & 0x0FFF) + (value & 0x0FFF)) > 0x0FFF);
    set_flag(FLAG_C, result > 0xFFFF);
    set_hl(result & 0xFFFF);
    return 0;
}

uint8_t CPU::ADD_SP_E8() {
    SP = add_sp_offset();
    return 0;
}

uint8_t CPU::ALU_R() {
    alu(opcode >> 3, read_r8(opcode));
    return 0;
}

uint8_t CPU::ALU_D8() {
    alu(opcode >> 3, fetch8());
    return 0;
}

uint8_t CPU::DAA() {
    // Adjust A back to BCD after an addition or subtraction
    uint8_t a = A;
    bool carry = get_flag(FLAG_C);

    if (!get_flag(FLAG_N)) {
        if (carry || a > 0x99) {
            a += 0x60;
            carry = true;
        }
        if (get_flag(FLAG_H) || (a & 0x0F) > 0x09) {
            a += 0x06;
        }
    } else {
        if (carry) {
            a -= 0x60;
        }
        if (get_flag(FLAG_H)) {
            a -= 0x06;
        }
    }

    A = a;
    set_flag(FLAG_Z, A == 0);
    set_flag(FLAG_H, false);
    set_flag(FLAG_C, carry);
    return 0;
}

uint8_t CPU::CPL() {
    A = ~A;
    set_flag(FLAG_N, true);
    set_flag(FLAG_H, true);
    return 0;
}

uint8_t CPU::SCF() {
    set_flag(FLAG_N, false);
    set_flag(FLAG_H, false);
    set_flag(FLAG_C, true);
    return 0;
}

uint8_t CPU::CCF() {
    set_flag(FLAG_N, false);
    set_flag(FLAG_H, false);
    set_flag(FLAG_C, !get_flag(FLAG_C));
    return 0;
}

// Accumulator rotates always clear Z
uint8_t CPU::RLCA() {
    uint8_t carry = A >> 7;
    A = (A << 1) | carry;
    set_flags(false, false, false, carry);
    return 0;
}

uint8_t CPU::RRCA() {
    uint8_t carry = A & 0x01;
    A = (A >> 1) | (carry << 7);
    set_flags(false, false, false, carry);
    return 0;
}

uint8_t CPU::RLA() {
    uint8_t carry = A >> 7;
    A = (A << 1) | (get_flag(FLAG_C) ? 1 : 0);
    set_flags(false, false, false, carry);
    return 0;
}

uint8_t CPU::RRA() {
    uint8_t carry = A & 0x01;
    A = (A >> 1) | (get_flag(FLAG_C) ? 0x80 : 0x00);
    set_flags(false, false, false, carry);
    return 0;
}

// ============================================================================
// CONTROL FLOW
// ============================================================================

uint8_t CPU::JR() {
    int8_t offset = static_cast<int8_t>(fetch8());
    PC += offset;
    return 0;
}

uint8_t CPU::JR_CC() {
    int8_t offset = static_cast<int8_t>(fetch8());
    if (!condition(opcode >> 3)) {
        return 0;
    }
    PC += offset;
    return 1;
}

uint8_t CPU::JP() {
    PC = fetch16();
    return 0;
}

uint8_t CPU::JP_CC() {
    uint16_t addr = fetch16();
    if (!condition(opcode >> 3)) {
        return 0;
    }
    PC = addr;
    return 1;
}

uint8_t CPU::JP_HL() {
    PC = get_hl();
    return 0;
}

uint8_t CPU::CALL() {
    uint16_t addr = fetch16();
    push16(PC);
    PC = addr;
    return 0;
}

uint8_t CPU::CALL_CC() {
    uint16_t addr = fetch16();
    if (!condition(opcode >> 3)) {
        return 0;
    }
    push16(PC);
    PC = addr;
    return 1;
}

uint8_t CPU::RET() {
    PC = pop16();
    return 0;
}

uint8_t CPU::RET_CC() {
    if (!condition(opcode >> 3)) {
        return 0;
    }
    PC = pop16();
    return 1;
}

uint8_t CPU::RETI() {
    PC = pop16();
    ime = true;
    ei_delay = 0;
    return 0;
}

uint8_t CPU::RST() {
    push16(PC);
    PC = opcode & 0x38;
    return 0;
}

// ============================================================================
// CPU CONTROL
// ============================================================================

uint8_t CPU::DI() {
    ime = false;
    ei_delay = 0;
    return 0;
}

uint8_t CPU::EI() {
    // Counts down at the end of this instruction and the next one
    if (ei_delay == 0 && !ime) {
        ei_delay = 2;
    }
    return 0;
}

uint8_t CPU::HALT() {
    if (!ime && interrupts->any_pending()) {
        // Nothing to wait for; the halt bug makes the next byte run twice
        if (halt_bug_enabled) {
            halt_bug = true;
        }
        return 0;
    }
    halted = true;
    return 0;
}

uint8_t CPU::STOP() {
    // STOP is 2 bytes long
    fetch8();

    if (bus->speed_switch_armed()) {
        // CGB speed switch; the CPU idles while the clock settles
        bus->perform_speed_switch();
        extra_cycles = 2050;
        return 0;
    }

    write(0xFF04, 0x00);
    stopped = true;
    return 0;
}

uint8_t CPU::XXX() {
    throw IllegalOpcodeError(opcode_pc, opcode);
}

// ============================================================================
// CB PREFIX
// ============================================================================

uint8_t CPU::PREFIX_CB() {
    cb_opcode = fetch8();
    uint8_t reg = cb_opcode & 0x07;
    uint8_t bit = (cb_opcode >> 3) & 0x07;
    uint8_t value = read_r8(reg);

    switch (cb_opcode >> 6) {
        case 0: {
            // Rotates and shifts
            uint8_t result = 0;
            bool carry = false;
            switch (bit) {
                case 0: carry = value & 0x80; result = (value << 1) | (value >> 7); break;                   // RLC
                case 1: carry = value & 0x01; result = (value >> 1) | (value << 7); break;                   // RRC
                case 2: carry = value & 0x80; result = (value << 1) | (get_flag(FLAG_C) ? 1 : 0); break;    // RL
                case 3: carry = value & 0x01; result = (value >> 1) | (get_flag(FLAG_C) ? 0x80 : 0); break; // RR
                case 4: carry = value & 0x80; result = value << 1; break;                                     // SLA
                case 5: carry = value & 0x01; result = (value >> 1) | (value & 0x80); break;                 // SRA
                case 6: carry = false; result = (value << 4) | (value >> 4); break;                           // SWAP
                case 7: carry = value & 0x01; result = value >> 1; break;                                     // SRL
            }
            write_r8(reg, result);
            set_flags(result == 0, false, false, carry);
            break;
        }
        case 1:  // BIT
            set_flag(FLAG_Z, !(value & (1 << bit)));
            set_flag(FLAG_N, false);
            set_flag(FLAG_H, true);
            break;
        case 2:  // RES
            write_r8(reg, value & ~(1 << bit));
            break;
        case 3:  // SET
            write_r8(reg, value | (1 << bit));
            break;
    }
    return 0;
}

void CPU::transfer_state(StateTransfer& state) {
    state.transfer(A);
    state.transfer(F);
    state.transfer(B);
    state.transfer(C);
    state.transfer(D);
    state.transfer(E);
    state.transfer(H);
    state.transfer(L);
    state.transfer(SP);
    state.transfer(PC);
    state.transfer(total_cycles);
    state.transfer(opcode);
    state.transfer(cb_opcode);
    state.transfer(ime);
    state.transfer(ei_delay);
    state.transfer(halted);
    state.transfer(stopped);
    state.transfer(halt_bug);
    state.transfer(halt_bug_enabled);
}

// ============================================================================
// INSTRUCTION TABLES
// ============================================================================

const CPU::Instruction CPU::instruction_table[256] = {
    {"NOP", &CPU::NOP, 1, 1},{"LD BC,d16", &CPU::LD_RR_D16, 3, 3},{"LD (BC),A", &CPU::LD_IND_A, 2, 2},{"INC BC", &CPU::INC_RR, 2, 2},{"INC B", &CPU::INC_R, 1, 1},{"DEC B", &CPU::DEC_R, 1, 1},{"LD B,d8", &CPU::LD_R_D8, 2, 2},{"RLCA", &CPU::RLCA, 1, 1},{"LD (a16),SP", &CPU::LD_A16_SP, 5, 5},{"ADD HL,BC", &CPU::ADD_HL_RR, 2, 2},{"LD A,(BC)", &CPU::LD_A_IND, 2, 2},{"DEC BC", &CPU::DEC_RR, 2, 2},{"INC C", &CPU::INC_R, 1, 1},{"DEC C", &CPU::DEC_R, 1, 1},{"LD C,d8", &CPU::LD_R_D8, 2, 2},{"RRCA", &CPU::RRCA, 1, 1},
    {"STOP", &CPU::STOP, 1, 1},{"LD DE,d16", &CPU::LD_RR_D16, 3, 3},{"LD (DE),A", &CPU::LD_IND_A, 2, 2},{"INC DE", &CPU::INC_RR, 2, 2},{"INC D", &CPU::INC_R, 1, 1},{"DEC D", &CPU::DEC_R, 1, 1},{"LD D,d8", &CPU::LD_R_D8, 2, 2},{"RLA", &CPU::RLA, 1, 1},{"JR r8", &CPU::JR, 3, 3},{"ADD HL,DE", &CPU::ADD_HL_RR, 2, 2},{"LD A,(DE)", &CPU::LD_A_IND, 2, 2},{"DEC DE", &CPU::DEC_RR, 2, 2},{"INC E", &CPU::INC_R, 1, 1},{"DEC E", &CPU::DEC_R, 1, 1},{"LD E,d8", &CPU::LD_R_D8, 2, 2},{"RRA", &CPU::RRA, 1, 1},
    {"JR NZ,r8", &CPU::JR_CC, 2, 3},{"LD HL,d16", &CPU::LD_RR_D16, 3, 3},{"LD (HL+),A", &CPU::LD_IND_A, 2, 2},{"INC HL", &CPU::INC_RR, 2, 2},{"INC H", &CPU::INC_R, 1, 1},{"DEC H", &CPU::DEC_R, 1, 1},{"LD H,d8", &CPU::LD_R_D8, 2, 2},{"DAA", &CPU::DAA, 1, 1},{"JR Z,r8", &CPU::JR_CC, 2, 3},{"ADD HL,HL", &CPU::ADD_HL_RR, 2, 2},{"LD A,(HL+)", &CPU::LD_A_IND, 2, 2},{"DEC HL", &CPU::DEC_RR, 2, 2},{"INC L", &CPU::INC_R, 1, 1},{"DEC L", &CPU::DEC_R, 1, 1},{"LD L,d8", &CPU::LD_R_D8, 2, 2},{"CPL", &CPU::CPL, 1, 1},
    {"JR NC,r8", &CPU::JR_CC, 2, 3},{"LD SP,d16", &CPU::LD_RR_D16, 3, 3},{"LD (HL-),A", &CPU::LD_IND_A, 2, 2},{"INC SP", &CPU::INC_RR, 2, 2},{"INC (HL)", &CPU::INC_R, 3, 3},{"DEC (HL)", &CPU::DEC_R, 3, 3},{"LD (HL),d8", &CPU::LD_R_D8, 3, 3},{"SCF", &CPU::SCF, 1, 1},{"JR C,r8", &CPU::JR_CC, 2, 3},{"ADD HL,SP", &CPU::ADD_HL_RR, 2, 2},{"LD A,(HL-)", &CPU::LD_A_IND, 2, 2},{"DEC SP", &CPU::DEC_RR, 2, 2},{"INC A", &CPU::INC_R, 1, 1},{"DEC A", &CPU::DEC_R, 1, 1},{"LD A,d8", &CPU::LD_R_D8, 2, 2},{"CCF", &CPU::CCF, 1, 1},
    {"LD B,B", &CPU::LD_R_R, 1, 1},{"LD B,C", &CPU::LD_R_R, 1, 1},{"LD B,D", &CPU::LD_R_R, 1, 1},{"LD B,E", &CPU::LD_R_R, 1, 1},{"LD B,H", &CPU::LD_R_R, 1, 1},{"LD B,L", &CPU::LD_R_R, 1, 1},{"LD B,(HL)", &CPU::LD_R_R, 2, 2},{"LD B,A", &CPU::LD_R_R, 1, 1},{"LD C,B", &CPU::LD_R_R, 1, 1},{"LD C,C", &CPU::LD_R_R, 1, 1},{"LD C,D", &CPU::LD_R_R, 1, 1},{"LD C,E", &CPU::LD_R_R, 1, 1},{"LD C,H", &CPU::LD_R_R, 1, 1},{"LD C,L", &CPU::LD_R_R, 1, 1},{"LD C,(HL)", &CPU::LD_R_R, 2, 2},{"LD C,A", &CPU::LD_R_R, 1, 1},
    {"LD D,B", &CPU::LD_R_R, 1, 1},{"LD D,C", &CPU::LD_R_R, 1, 1},{"LD D,D", &CPU::LD_R_R, 1, 1},{"LD D,E", &CPU::LD_R_R, 1, 1},{"LD D,H", &CPU::LD_R_R, 1, 1},{"LD D,L", &CPU::LD_R_R, 1, 1},{"LD D,(HL)", &CPU::LD_R_R, 2, 2},{"LD D,A", &CPU::LD_R_R, 1, 1},{"LD E,B", &CPU::LD_R_R, 1, 1},{"LD E,C", &CPU::LD_R_R, 1, 1},{"LD E,D", &CPU::LD_R_R, 1, 1},{"LD E,E", &CPU::LD_R_R, 1, 1},{"LD E,H", &CPU::LD_R_R, 1, 1},{"LD E,L", &CPU::LD_R_R, 1, 1},{"LD E,(HL)", &CPU::LD_R_R, 2, 2},{"LD E,A", &CPU::LD_R_R, 1, 1},
    {"LD H,B", &CPU::LD_R_R, 1, 1},{"LD H,C", &CPU::LD_R_R, 1, 1},{"LD H,D", &CPU::LD_R_R, 1, 1},{"LD H,E", &CPU::LD_R_R, 1, 1},{"LD H,H", &CPU::LD_R_R, 1, 1},{"LD H,L", &CPU::LD_R_R, 1, 1},{"LD H,(HL)", &CPU::LD_R_R, 2, 2},{"LD H,A", &CPU::LD_R_R, 1, 1},{"LD L,B", &CPU::LD_R_R, 1, 1},{"LD L,C", &CPU::LD_R_R, 1, 1},{"LD L,D", &CPU::LD_R_R, 1, 1},{"LD L,E", &CPU::LD_R_R, 1, 1},{"LD L,H", &CPU::LD_R_R, 1, 1},{"LD L,L", &CPU::LD_R_R, 1, 1},{"LD L,(HL)", &CPU::LD_R_R, 2, 2},{"LD L,A", &CPU::LD_R_R, 1, 1},
    {"LD (HL),B", &CPU::LD_R_R, 2, 2},{"LD (HL),C", &CPU::LD_R_R, 2, 2},{"LD (HL),D", &CPU::LD_R_R, 2, 2},{"LD (HL),E", &CPU::LD_R_R, 2, 2},{"LD (HL),H", &CPU::LD_R_R, 2, 2},{"LD (HL),L", &CPU::LD_R_R, 2, 2},{"HALT", &CPU::HALT, 1, 1},{"LD (HL),A", &CPU::LD_R_R, 2, 2},{"LD A,B", &CPU::LD_R_R, 1, 1},{"LD A,C", &CPU::LD_R_R, 1, 1},{"LD A,D", &CPU::LD_R_R, 1, 1},{"LD A,E", &CPU::LD_R_R, 1, 1},{"LD A,H", &CPU::LD_R_R, 1, 1},{"LD A,L", &CPU::LD_R_R, 1, 1},{"LD A,(HL)", &CPU::LD_R_R, 2, 2},{"LD A,A", &CPU::LD_R_R, 1, 1},
    {"ADD A,B", &CPU::ALU_R, 1, 1},{"ADD A,C", &CPU::ALU_R, 1, 1},{"ADD A,D", &CPU::ALU_R, 1, 1},{"ADD A,E", &CPU::ALU_R, 1, 1},{"ADD A,H", &CPU::ALU_R, 1, 1},{"ADD A,L", &CPU::ALU_R, 1, 1},{"ADD A,(HL)", &CPU::ALU_R, 2, 2},{"ADD A,A", &CPU::ALU_R, 1, 1},{"ADC A,B", &CPU::ALU_R, 1, 1},{"ADC A,C", &CPU::ALU_R, 1, 1},{"ADC A,D", &CPU::ALU_R, 1, 1},{"ADC A,E", &CPU::ALU_R, 1, 1},{"ADC A,H", &CPU::ALU_R, 1, 1},{"ADC A,L", &CPU::ALU_R, 1, 1},{"ADC A,(HL)", &CPU::ALU_R, 2, 2},{"ADC A,A", &CPU::ALU_R, 1, 1},
    {"SUB B", &CPU::ALU_R, 1, 1},{"SUB C", &CPU::ALU_R, 1, 1},{"SUB D", &CPU::ALU_R, 1, 1},{"SUB E", &CPU::ALU_R, 1, 1},{"SUB H", &CPU::ALU_R, 1, 1},{"SUB L", &CPU::ALU_R, 1, 1},{"SUB (HL)", &CPU::ALU_R, 2, 2},{"SUB A", &CPU::ALU_R, 1, 1},{"SBC A,B", &CPU::ALU_R, 1, 1},{"SBC A,C", &CPU::ALU_R, 1, 1},{"SBC A,D", &CPU::ALU_R, 1, 1},{"SBC A,E", &CPU::ALU_R, 1, 1},{"SBC A,H", &CPU::ALU_R, 1, 1},{"SBC A,L", &CPU::ALU_R, 1, 1},{"SBC A,(HL)", &CPU::ALU_R, 2, 2},{"SBC A,A", &CPU::ALU_R, 1, 1},
    {"AND B", &CPU::ALU_R, 1, 1},{"AND C", &CPU::ALU_R, 1, 1},{"AND D", &CPU::ALU_R, 1, 1},{"AND E", &CPU::ALU_R, 1, 1},{"AND H", &CPU::ALU_R, 1, 1},{"AND L", &CPU::ALU_R, 1, 1},{"AND (HL)", &CPU::ALU_R, 2, 2},{"AND A", &CPU::ALU_R, 1, 1},{"XOR B", &CPU::ALU_R, 1, 1},{"XOR C", &CPU::ALU_R, 1, 1},{"XOR D", &CPU::ALU_R, 1, 1},{"XOR E", &CPU::ALU_R, 1, 1},{"XOR H", &CPU::ALU_R, 1, 1},{"XOR L", &CPU::ALU_R, 1, 1},{"XOR (HL)", &CPU::ALU_R, 2, 2},{"XOR A", &CPU::ALU_R, 1, 1},
    {"OR B", &CPU::ALU_R, 1, 1},{"OR C", &CPU::ALU_R, 1, 1},{"OR D", &CPU::ALU_R, 1, 1},{"OR E", &CPU::ALU_R, 1, 1},{"OR H", &CPU::ALU_R, 1, 1},{"OR L", &CPU::ALU_R, 1, 1},{"OR (HL)", &CPU::ALU_R, 2, 2},{"OR A", &CPU::ALU_R, 1, 1},{"CP B", &CPU::ALU_R, 1, 1},{"CP C", &CPU::ALU_R, 1, 1},{"CP D", &CPU::ALU_R, 1, 1},{"CP E", &CPU::ALU_R, 1, 1},{"CP H", &CPU::ALU_R, 1, 1},{"CP L", &CPU::ALU_R, 1, 1},{"CP (HL)", &CPU::ALU_R, 2, 2},{"CP A", &CPU::ALU_R, 1, 1},
    {"RET NZ", &CPU::RET_CC, 2, 5},{"POP BC", &CPU::POP, 3, 3},{"JP NZ,a16", &CPU::JP_CC, 3, 4},{"JP a16", &CPU::JP, 4, 4},{"CALL NZ,a16", &CPU::CALL_CC, 3, 6},{"PUSH BC", &CPU::PUSH, 4, 4},{"ADD A,d8", &CPU::ALU_D8, 2, 2},{"RST 00H", &CPU::RST, 4, 4},{"RET Z", &CPU::RET_CC, 2, 5},{"RET", &CPU::RET, 4, 4},{"JP Z,a16", &CPU::JP_CC, 3, 4},{"PREFIX CB", &CPU::PREFIX_CB, 2, 2},{"CALL Z,a16", &CPU::CALL_CC, 3, 6},{"CALL a16", &CPU::CALL, 6, 6},{"ADC A,d8", &CPU::ALU_D8, 2, 2},{"RST 08H", &CPU::RST, 4, 4},
    {"RET NC", &CPU::RET_CC, 2, 5},{"POP DE", &CPU::POP, 3, 3},{"JP NC,a16", &CPU::JP_CC, 3, 4},{"???", &CPU::XXX, 1, 1},{"CALL NC,a16", &CPU::CALL_CC, 3, 6},{"PUSH DE", &CPU::PUSH, 4, 4},{"SUB d8", &CPU::ALU_D8, 2, 2},{"RST 10H", &CPU::RST, 4, 4},{"RET C", &CPU::RET_CC, 2, 5},{"RETI", &CPU::RETI, 4, 4},{"JP C,a16", &CPU::JP_CC, 3, 4},{"???", &CPU::XXX, 1, 1},{"CALL C,a16", &CPU::CALL_CC, 3, 6},{"???", &CPU::XXX, 1, 1},{"SBC A,d8", &CPU::ALU_D8, 2, 2},{"RST 18H", &CPU::RST, 4, 4},
    {"LDH (a8),A", &CPU::LDH_A8_A, 3, 3},{"POP HL", &CPU::POP, 3, 3},{"LD (C),A", &CPU::LD_C_A, 2, 2},{"???", &CPU::XXX, 1, 1},{"???", &CPU::XXX, 1, 1},{"PUSH HL", &CPU::PUSH, 4, 4},{"AND d8", &CPU::ALU_D8, 2, 2},{"RST 20H", &CPU::RST, 4, 4},{"ADD SP,r8", &CPU::ADD_SP_E8, 4, 4},{"JP HL", &CPU::JP_HL, 1, 1},{"LD (a16),A", &CPU::LD_A16_A, 4, 4},{"???", &CPU::XXX, 1, 1},{"???", &CPU::XXX, 1, 1},{"???", &CPU::XXX, 1, 1},{"XOR d8", &CPU::ALU_D8, 2, 2},{"RST 28H", &CPU::RST, 4, 4},
    {"LDH A,(a8)", &CPU::LDH_A_A8, 3, 3},{"POP AF", &CPU::POP, 3, 3},{"LD A,(C)", &CPU::LD_A_C, 2, 2},{"DI", &CPU::DI, 1, 1},{"???", &CPU::XXX, 1, 1},{"PUSH AF", &CPU::PUSH, 4, 4},{"OR d8", &CPU::ALU_D8, 2, 2},{"RST 30H", &CPU::RST, 4, 4},{"LD HL,SP+r8", &CPU::LD_HL_SP_E8, 3, 3},{"LD SP,HL", &CPU::LD_SP_HL, 2, 2},{"LD A,(a16)", &CPU::LD_A_A16, 4, 4},{"EI", &CPU::EI, 1, 1},{"???", &CPU::XXX, 1, 1},{"???", &CPU::XXX, 1, 1},{"CP d8", &CPU::ALU_D8, 2, 2},{"RST 38H", &CPU::RST, 4, 4},
};

// CB-prefixed costs include the prefix fetch
const uint8_t CPU::cb_cycle_table[256] = {
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 3, 2, 2, 2, 2, 2, 2, 2, 3, 2,
    2, 2, 2, 2, 2, 2, 3, 2, 2, 2, 2, 2, 2, 2, 3, 2,
    2, 2, 2, 2, 2, 2, 3, 2, 2, 2, 2, 2, 2, 2, 3, 2,
    2, 2, 2, 2, 2, 2, 3, 2, 2, 2, 2, 2, 2, 2, 3, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
    2, 2, 2, 2, 2, 2, 4, 2, 2, 2, 2, 2, 2, 2, 4, 2,
};
