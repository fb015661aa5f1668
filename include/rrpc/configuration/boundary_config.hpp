#pragma once

#include "rrpc/core/constants.hpp"

#include <cstddef>
#include <cstdint>

namespace rrpc::configuration {

/// How released output buffers are treated before their memory is returned
enum class ReleasePolicy : uint8_t {
    /// Deallocate immediately
    Plain = 0,

    /// Zero the buffer with sodium_memzero, then deallocate
    SecureWipe = 1
};

/// Boundary behaviour knobs
///
/// The input cap is part of the status-code contract and is the same for
/// every factory; only the release policy varies.
///
/// @example
/// ```cpp
/// constexpr auto config = BoundaryConfig::Active();
/// if (input_length > config.MaxInputSize()) {
///     // reject with RRPC_ERROR_TOO_LARGE
/// }
/// ```
class BoundaryConfig {
public:
    /// Secure release enabled
    [[nodiscard]] static constexpr BoundaryConfig Hardened() noexcept {
        return BoundaryConfig(ReleasePolicy::SecureWipe);
    }

    /// Plain release, for payloads that carry nothing sensitive
    [[nodiscard]] static constexpr BoundaryConfig Fast() noexcept {
        return BoundaryConfig(ReleasePolicy::Plain);
    }

    [[nodiscard]] static constexpr BoundaryConfig Default() noexcept {
        return Hardened();
    }

    /// Configuration the boundary is compiled with (RRPC_SECURE_RELEASE)
    [[nodiscard]] static constexpr BoundaryConfig Active() noexcept {
#if defined(RRPC_SECURE_RELEASE) && RRPC_SECURE_RELEASE == 0
        return Fast();
#else
        return Default();
#endif
    }

    [[nodiscard]] constexpr size_t MaxInputSize() const noexcept {
        return max_input_size_;
    }

    [[nodiscard]] constexpr ReleasePolicy GetReleasePolicy() const noexcept {
        return release_policy_;
    }

    [[nodiscard]] constexpr bool WipeOnRelease() const noexcept {
        return release_policy_ == ReleasePolicy::SecureWipe;
    }

    constexpr bool operator==(const BoundaryConfig& other) const noexcept {
        return max_input_size_ == other.max_input_size_ &&
               release_policy_ == other.release_policy_;
    }

    constexpr bool operator!=(const BoundaryConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    constexpr explicit BoundaryConfig(const ReleasePolicy policy) noexcept
        : max_input_size_(Constants::MAX_INPUT_SIZE)
        , release_policy_(policy) {}

    size_t max_input_size_;
    ReleasePolicy release_policy_;
};

} // namespace rrpc::configuration
