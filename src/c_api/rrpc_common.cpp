/**
 * @file rrpc_common.cpp
 * @brief Argument validation, status mapping and buffer handoff for the C API
 */

#include "rrpc/c_api/rrpc_api.h"
#include "rrpc_internal.hpp"
#include "rrpc/configuration/boundary_config.hpp"
#include "rrpc/core/constants.hpp"
#include "rrpc/debug/call_logger.hpp"
#include "rrpc/memory/output_buffer.hpp"

using rrpc::configuration::BoundaryConfig;
using rrpc::memory::OutputBuffer;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace rrpc::internal {

RrpcStatus status_from_failure(const RpcFailure& failure) noexcept {
    switch (failure.type) {
        case RpcFailureType::UnknownMethod:
            return RRPC_ERROR_UNKNOWN_METHOD;
        case RpcFailureType::NotFound:
            return RRPC_ERROR_NOT_FOUND;
        case RpcFailureType::ParseError:
            return RRPC_ERROR_PARSE;
        case RpcFailureType::SerializationError:
            return RRPC_ERROR_SERIALIZATION;
        case RpcFailureType::TooLarge:
            return RRPC_ERROR_TOO_LARGE;
        case RpcFailureType::Internal:
            return RRPC_ERROR_INTERNAL;
    }
    return RRPC_ERROR_INTERNAL;
}

RrpcStatus reject(const RrpcStatus status, const std::string_view reason) noexcept {
    debug::LogCallRejected(static_cast<int>(status), reason);
    return status;
}

RrpcStatus validate_call_args(
    const char* method,
    const uint8_t* in_ptr,
    const size_t in_len,
    uint8_t* const* out_ptr,
    const size_t* out_len) noexcept {
    if (!method) {
        return reject(RRPC_ERROR_PARSE, ErrorMessages::METHOD_NAME_NULL);
    }
    if (!in_ptr && in_len > 0) {
        return reject(RRPC_ERROR_PARSE, ErrorMessages::INPUT_NULL);
    }
    if (constexpr auto config = BoundaryConfig::Active(); in_len > config.MaxInputSize()) {
        return reject(RRPC_ERROR_TOO_LARGE, ErrorMessages::INPUT_TOO_LARGE);
    }
    if (!out_ptr || !out_len) {
        return reject(RRPC_ERROR_INTERNAL, ErrorMessages::OUTPUT_SLOT_NULL);
    }
    return RRPC_SUCCESS;
}

bool hand_over_output(const std::span<const uint8_t> result, uint8_t** out_ptr, size_t* out_len) noexcept {
    auto* data = OutputBuffer::AllocateOutput(result);
    if (!data) {
        return false;
    }
    *out_ptr = data;
    *out_len = result.size();
    return true;
}

} // namespace rrpc::internal

// ============================================================================
// Shared C API Implementations
// ============================================================================

extern "C" {

const char* rrpc_version(void) {
    return rrpc::Constants::VERSION.data();
}

void rrpc_free(uint8_t* ptr, const size_t len) {
    OutputBuffer::ReleaseOutput(ptr, len);
}

const char* rrpc_status_string(const RrpcStatus code) {
    switch (code) {
        case RRPC_SUCCESS: return "Success";
        case RRPC_ERROR_NOT_INITIALIZED: return "Runtime not initialized";
        case RRPC_ERROR_UNKNOWN_METHOD: return "Unknown method";
        case RRPC_ERROR_PARSE: return "Parse error";
        case RRPC_ERROR_NOT_FOUND: return "Not found";
        case RRPC_ERROR_SERIALIZATION: return "Serialization error";
        case RRPC_ERROR_TOO_LARGE: return "Input too large";
        case RRPC_ERROR_INTERNAL: return "Internal error";
        default: return "Unknown status";
    }
}

} // extern "C"
