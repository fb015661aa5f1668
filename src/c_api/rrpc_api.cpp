/**
 * @file rrpc_api.cpp
 * @brief C boundary: runtime initialization and method dispatch
 */

#include "rrpc/c_api/rrpc_api.h"
#include "rrpc_internal.hpp"
#include "rrpc/core/constants.hpp"
#include "rrpc/core/result.hpp"
#include "rrpc/debug/call_logger.hpp"
#include "rrpc/runtime/runtime_state.hpp"
#include "rrpc/utilities/utf8.hpp"

#include <exception>
#include <span>
#include <string>

using namespace rrpc;
using namespace rrpc::internal;
using rrpc::runtime::Bytes;
using rrpc::runtime::Registry;
using rrpc::runtime::RuntimeState;
using rrpc::utilities::Utf8;

extern "C" {

RrpcStatus rrpc_init(void) {
    try {
        (void)RuntimeState::Initialize();
    } catch (const std::exception& ex) {
        // Only allocation of the runtime itself can fail here; call_once
        // lets the next rrpc_init retry.
        return reject(RRPC_ERROR_INTERNAL, ex.what());
    }
    return RRPC_SUCCESS;
}

RrpcStatus rrpc_call(
    const char* method,
    const uint8_t* in_ptr,
    const size_t in_len,
    uint8_t** out_ptr,
    size_t* out_len) {
    if (const auto status = validate_call_args(method, in_ptr, in_len, out_ptr, out_len);
        status != RRPC_SUCCESS) {
        return status;
    }

    RuntimeState* state = RuntimeState::TryGet();
    if (!state) {
        return reject(RRPC_ERROR_NOT_INITIALIZED, ErrorMessages::NOT_INITIALIZED);
    }

    const auto method_name = Utf8::FromCString(method);
    if (!method_name) {
        return reject(RRPC_ERROR_PARSE, ErrorMessages::METHOD_NAME_NOT_UTF8);
    }

    const std::span<const uint8_t> input =
            in_len > 0 ? std::span(in_ptr, in_len) : std::span<const uint8_t>();

    // Lookup, handler execution and output allocation all run under the lock.
    return state->WithRegistry([&](const Registry& registry) -> RrpcStatus {
        using CallResult = Result<Bytes, RpcFailure>;
        // Exceptions must not cross the C boundary; a throwing handler is Internal.
        auto guarded = Result<CallResult, RpcFailure>::Try(
            [&]() { return registry.Call(*method_name, input); },
            [](const std::exception& ex) {
                return RpcFailure::Internal(
                    std::string(ErrorMessages::HANDLER_THREW) + ": " + ex.what());
            });
        auto outcome = std::move(guarded).Bind([](CallResult inner) { return inner; });
        if (outcome.IsErr()) {
            const auto& failure = outcome.UnwrapErr();
            debug::LogHandlerFailure(*method_name, failure);
            return status_from_failure(failure);
        }

        const auto& bytes = outcome.Unwrap();
        if (!hand_over_output(bytes, out_ptr, out_len)) {
            return reject(RRPC_ERROR_INTERNAL, ErrorMessages::OUTPUT_ALLOCATION_FAILED);
        }
        debug::LogCallCompleted(*method_name, in_len, bytes.size());
        return RRPC_SUCCESS;
    });
}

} // extern "C"
