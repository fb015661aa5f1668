#pragma once

#include "rrpc/configuration/boundary_config.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace rrpc::memory {

/**
 * @brief Producer/consumer pair for buffers handed across the C boundary
 *
 * AllocateOutput is the only producer and ReleaseOutput the only consumer;
 * both sit on the same new[]/delete[] pair. Ownership of an allocated buffer
 * passes to the foreign caller, which must hand it back to ReleaseOutput
 * exactly once. Nothing here tracks outstanding buffers.
 */
class OutputBuffer {
public:
    /**
     * @brief Allocate a buffer and copy the payload into it
     *
     * A zero-length payload still yields a distinct non-null allocation that
     * must be released.
     *
     * @return Buffer start, or nullptr if allocation failed
     */
    [[nodiscard]] static uint8_t* AllocateOutput(std::span<const uint8_t> payload) noexcept;

    /**
     * @brief Return a buffer produced by AllocateOutput
     *
     * nullptr is ignored. With a SecureWipe policy the first @p length bytes
     * are zeroed before deallocation.
     */
    static void ReleaseOutput(
        uint8_t* data,
        size_t length,
        configuration::BoundaryConfig config = configuration::BoundaryConfig::Active()) noexcept;

    OutputBuffer() = delete;
    ~OutputBuffer() = delete;
    OutputBuffer(const OutputBuffer&) = delete;
    OutputBuffer& operator=(const OutputBuffer&) = delete;
};

} // namespace rrpc::memory
