#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <vector>

/**
 * Snapshot serializer
 *
 * Every component implements transfer_state(StateTransfer&) and lists its
 * fields in a fixed order. The same function saves or restores, depending on
 * the direction the transfer was created with, so the two can never drift
 * apart. The resulting byte buffer is opaque to callers.
 */
class StateTransfer {
public:
    // Start an empty snapshot
    StateTransfer();

    // Restore from an existing snapshot (throws StateError on underrun)
    explicit StateTransfer(const std::vector<uint8_t>& snapshot);

    bool is_saving() const { return saving; }

    template<typename T>
    void transfer(T& value) {
        static_assert(std::is_trivially_copyable<T>::value,
                      "only trivially copyable values can be transferred");
        transfer_raw(&value, sizeof(T));
    }

    // Variable-size buffer. On load the size must match the live buffer.
    void transfer_bytes(std::vector<uint8_t>& bytes);

    void transfer_raw(void* data, size_t size);

    // Save: hand out the finished buffer. Load: check nothing was left over.
    std::vector<uint8_t> finish();

private:
    bool saving;
    std::vector<uint8_t> buffer;
    size_t position;
};
