#pragma once

#include <cstdint>
#include "model.hpp"

// Forward declarations
class Bus;
class InterruptController;
class StateTransfer;

/**
 * SM83 CPU Emulation - Instruction Stepped
 *
 * TECHNICAL SPECIFICATIONS:
 * - Clock Speed: 4.194304 MHz (1.048576 MHz machine cycles), x2 in CGB double speed
 * - Data Bus: 8-bit
 * - Address Bus: 16-bit (64KB address space)
 * - Registers: A, F, B, C, D, E, H, L (paired as AF, BC, DE, HL), SP, PC
 * - Flags (F): Z (bit 7), N (bit 6), H (bit 5), C (bit 4), low nibble always 0
 *
 * INSTRUCTION TIMING:
 * - Each instruction takes 1-6 machine cycles
 * - Conditional JR/JP/CALL/RET cost more when taken
 * - CB-prefixed instructions take 2 cycles, 3-4 when they touch (HL)
 *
 * INTERRUPT HANDLING:
 * - Checked before every fetch; with IME set the highest-priority pending
 *   interrupt is serviced instead (5 machine cycles)
 * - EI takes effect after the following instruction, RETI immediately
 * - HALT waits for IE & IF != 0 even with IME clear
 * - HALT with IME clear and an interrupt already pending does not halt:
 *   the next opcode byte is read twice (halt bug)
 *
 * OPCODES:
 * - 245 defined opcodes + 256 CB-prefixed opcodes
 * - 11 undefined opcodes lock up the CPU (IllegalOpcodeError)
 */
class CPU {
public:
    CPU(Bus* bus, InterruptController* interrupts);

    // Register state after power-on. Without a boot ROM this is the state
    // the boot ROM leaves behind for the given model.
    void reset(Model model, bool cgb_mode, bool boot_rom);

    // Execute one instruction (or interrupt dispatch, or one halted cycle).
    // Returns machine cycles consumed.
    uint32_t step();

    // Halt bug on/off (hardware variant knob)
    void set_halt_bug(bool enabled) { halt_bug_enabled = enabled; }

    // ===== TIMING AND STATE INSPECTION =====

    // Get total machine cycles executed since reset
    uint64_t get_cycles() const { return total_cycles; }

    // Get last opcode executed (for debugging/disassembly)
    uint8_t get_current_opcode() const { return opcode; }

    static const char* get_instruction_name(uint8_t opcode);

    bool get_ime() const { return ime; }
    bool is_halted() const { return halted; }
    bool is_stopped() const { return stopped; }

    // ===== REGISTER PAIRS =====
    uint16_t get_af() const { return (A << 8) | F; }
    uint16_t get_bc() const { return (B << 8) | C; }
    uint16_t get_de() const { return (D << 8) | E; }
    uint16_t get_hl() const { return (H << 8) | L; }
    void set_af(uint16_t value) { A = value >> 8; F = value & 0xF0; }
    void set_bc(uint16_t value) { B = value >> 8; C = value & 0xFF; }
    void set_de(uint16_t value) { D = value >> 8; E = value & 0xFF; }
    void set_hl(uint16_t value) { H = value >> 8; L = value & 0xFF; }

    // ===== FLAG INSPECTION (for debugging) =====
    bool get_zero() const { return get_flag(FLAG_Z); }
    bool get_subtract() const { return get_flag(FLAG_N); }
    bool get_half_carry() const { return get_flag(FLAG_H); }
    bool get_carry() const { return get_flag(FLAG_C); }

    // Registers (public for debugging/testing)
    uint8_t A;
    uint8_t F;
    uint8_t B;
    uint8_t C;
    uint8_t D;
    uint8_t E;
    uint8_t H;
    uint8_t L;
    uint16_t SP;
    uint16_t PC;

    // Status flags
    enum Flags {
        FLAG_C = (1 << 4),  // Carry
        FLAG_H = (1 << 5),  // Half carry
        FLAG_N = (1 << 6),  // Subtract
        FLAG_Z = (1 << 7),  // Zero
    };

    void transfer_state(StateTransfer& state);

private:
    Bus* bus;
    InterruptController* interrupts;

    // Cycle tracking
    uint64_t total_cycles;
    uint32_t extra_cycles;   // stall added by the current instruction (speed switch)

    // Execution state
    uint8_t opcode;
    uint16_t opcode_pc;   // address the current opcode was fetched from
    uint8_t cb_opcode;
    bool ime;
    uint8_t ei_delay;        // instructions until EI takes effect
    bool halted;
    bool stopped;
    bool halt_bug;           // next fetch does not increment PC
    bool halt_bug_enabled;

    // Memory access
    uint8_t read(uint16_t addr);
    void write(uint16_t addr, uint8_t data);
    uint8_t fetch8();
    uint16_t fetch16();

    // Stack operations
    void push16(uint16_t data);
    uint16_t pop16();

    // Flag operations
    void set_flag(Flags flag, bool value);
    bool get_flag(Flags flag) const;
    void set_flags(bool z, bool n, bool h, bool c);

    // Operand decoding from opcode bits
    uint8_t read_r8(uint8_t index);
    void write_r8(uint8_t index, uint8_t value);
    uint16_t read_r16(uint8_t index) const;
    void write_r16(uint8_t index, uint16_t value);
    bool condition(uint8_t index) const;

    // Shared arithmetic
    void alu(uint8_t operation, uint8_t value);
    uint16_t add_sp_offset();

    uint32_t service_interrupt();

    // Opcodes (return 1 if a conditional instruction took its long path)
    uint8_t NOP();       uint8_t LD_RR_D16(); uint8_t LD_IND_A();  uint8_t LD_A_IND();
    uint8_t INC_RR();    uint8_t DEC_RR();    uint8_t INC_R();     uint8_t DEC_R();
    uint8_t LD_R_D8();   uint8_t LD_R_R();    uint8_t ADD_HL_RR(); uint8_t LD_A16_SP();
    uint8_t RLCA();      uint8_t RRCA();      uint8_t RLA();       uint8_t RRA();
    uint8_t DAA();       uint8_t CPL();       uint8_t SCF();       uint8_t CCF();
    uint8_t JR();        uint8_t JR_CC();     uint8_t JP();        uint8_t JP_CC();
    uint8_t JP_HL();     uint8_t CALL();      uint8_t CALL_CC();   uint8_t RET();
    uint8_t RET_CC();    uint8_t RETI();      uint8_t RST();       uint8_t PUSH();
    uint8_t POP();       uint8_t ALU_R();     uint8_t ALU_D8();    uint8_t LDH_A8_A();
    uint8_t LDH_A_A8();  uint8_t LD_C_A();    uint8_t LD_A_C();    uint8_t LD_A16_A();
    uint8_t LD_A_A16();  uint8_t ADD_SP_E8(); uint8_t LD_HL_SP_E8(); uint8_t LD_SP_HL();
    uint8_t DI();        uint8_t EI();        uint8_t HALT();      uint8_t STOP();
    uint8_t PREFIX_CB();

    uint8_t XXX();  // Undefined opcode - locks up the CPU

    // Instruction table entry
    struct Instruction {
        const char* name;
        uint8_t (CPU::*operate)();
        uint8_t cycles;
        uint8_t cycles_taken;
    };

    static const Instruction instruction_table[256];
    static const uint8_t cb_cycle_table[256];
};
