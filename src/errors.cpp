#include "errors.hpp"
#include <iomanip>
#include <sstream>

static std::string illegal_opcode_message(uint16_t pc, uint8_t opcode) {
    std::ostringstream message;
    message << "Illegal opcode $" << std::hex << std::uppercase << std::setfill('0')
            << std::setw(2) << (int)opcode << " at $" << std::setw(4) << pc
            << ", CPU locked up";
    return message.str();
}

IllegalOpcodeError::IllegalOpcodeError(uint16_t pc, uint8_t opcode)
    : EmulatorError(illegal_opcode_message(pc, opcode)), address(pc), op(opcode) {
}
