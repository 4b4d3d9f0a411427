#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Error types raised by the core
 *
 * - CartridgeError: image rejected at load time (truncated, unsupported
 *   mapper, inconsistent size declaration)
 * - IllegalOpcodeError: the CPU fetched one of the 11 undefined opcodes and
 *   locked up. Only the step driver catches it.
 * - StateError: a snapshot could not be restored
 */
class EmulatorError : public std::runtime_error {
public:
    explicit EmulatorError(const std::string& message) : std::runtime_error(message) {}
};

class CartridgeError : public EmulatorError {
public:
    explicit CartridgeError(const std::string& message) : EmulatorError(message) {}
};

class IllegalOpcodeError : public EmulatorError {
public:
    IllegalOpcodeError(uint16_t pc, uint8_t opcode);

    uint16_t pc() const { return address; }
    uint8_t opcode() const { return op; }

private:
    uint16_t address;
    uint8_t op;
};

class StateError : public EmulatorError {
public:
    explicit StateError(const std::string& message) : EmulatorError(message) {}
};
