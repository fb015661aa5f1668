#include "rrpc/memory/output_buffer.hpp"

#include <sodium.h>
#include <cstring>
#include <new>

namespace rrpc::memory {

uint8_t* OutputBuffer::AllocateOutput(const std::span<const uint8_t> payload) noexcept {
    auto* data = new(std::nothrow) uint8_t[payload.size()];
    if (!data) {
        return nullptr;
    }
    if (!payload.empty()) {
        std::memcpy(data, payload.data(), payload.size());
    }
    return data;
}

void OutputBuffer::ReleaseOutput(
    uint8_t* data,
    const size_t length,
    const configuration::BoundaryConfig config) noexcept {
    if (!data) {
        return;
    }
    if (config.WipeOnRelease() && length > 0) {
        sodium_memzero(data, length);
    }
    delete[] data;
}

} // namespace rrpc::memory
