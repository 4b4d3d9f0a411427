#include "save_state.hpp"
#include "errors.hpp"
#include <string>

StateTransfer::StateTransfer() : saving(true), position(0) {
}

StateTransfer::StateTransfer(const std::vector<uint8_t>& snapshot)
    : saving(false), buffer(snapshot), position(0) {
}

void StateTransfer::transfer_raw(void* data, size_t size) {
    if (saving) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        buffer.insert(buffer.end(), bytes, bytes + size);
        return;
    }

    if (position + size > buffer.size()) {
        throw StateError("Snapshot truncated at offset " + std::to_string(position));
    }
    std::memcpy(data, buffer.data() + position, size);
    position += size;
}

void StateTransfer::transfer_bytes(std::vector<uint8_t>& bytes) {
    uint32_t size = static_cast<uint32_t>(bytes.size());
    transfer(size);
    if (!saving && size != bytes.size()) {
        throw StateError("Snapshot buffer size mismatch (" + std::to_string(size) +
                         " bytes, expected " + std::to_string(bytes.size()) + ")");
    }
    if (size > 0) {
        transfer_raw(bytes.data(), size);
    }
}

std::vector<uint8_t> StateTransfer::finish() {
    if (saving) {
        return std::move(buffer);
    }
    if (position != buffer.size()) {
        throw StateError("Snapshot has " + std::to_string(buffer.size() - position) +
                         " trailing bytes");
    }
    return {};
}
