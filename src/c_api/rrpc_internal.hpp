/**
 * @file rrpc_internal.hpp
 * @brief Internal helpers for the rRPC C API implementation
 *
 * This header is NOT part of the public API.
 */

#ifndef RRPC_INTERNAL_HPP
#define RRPC_INTERNAL_HPP

#include "rrpc/c_api/rrpc_api.h"
#include "rrpc/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace rrpc::internal {

/**
 * @brief Map an internal failure to its boundary status code
 */
RrpcStatus status_from_failure(const RpcFailure& failure) noexcept;

/**
 * @brief Validate call arguments that do not need the runtime
 *
 * Covers the method pointer, the input pointer/length pair, the input cap
 * and the output slots, in that order.
 *
 * @return RRPC_SUCCESS if all checks pass, otherwise the first failing status
 */
RrpcStatus validate_call_args(
    const char* method,
    const uint8_t* in_ptr,
    size_t in_len,
    uint8_t* const* out_ptr,
    const size_t* out_len) noexcept;

/**
 * @brief Copy a result into a new boundary buffer and fill the output slots
 *
 * @return true on success, false if allocation failed (slots untouched)
 */
bool hand_over_output(std::span<const uint8_t> result, uint8_t** out_ptr, size_t* out_len) noexcept;

/**
 * @brief Log a rejected call and return its status
 */
RrpcStatus reject(RrpcStatus status, std::string_view reason) noexcept;

} // namespace rrpc::internal

#endif // RRPC_INTERNAL_HPP
