#pragma once

/**
 * @file call_logger.hpp
 * @brief Debug logging for boundary calls and registry changes.
 *
 * Status codes returned across the C boundary drop the failure context;
 * with RRPC_DEBUG_CALLS enabled the context is written to stderr instead.
 * Input and output payloads are never logged, only their sizes.
 *
 * Enable via CMake: -DRRPC_DEBUG_CALLS=ON
 */

#include "rrpc/core/failures.hpp"

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#ifdef RRPC_DEBUG_CALLS
#include <fmt/format.h>
#endif

namespace rrpc::debug {

#ifdef RRPC_DEBUG_CALLS

#define RRPC_LOG_MSG(operation, message) \
    do { \
        std::fprintf(stderr, "[RRPC-DEBUG] %s %s\n", operation, message); \
        std::fflush(stderr); \
    } while(0)

inline void LogLine(const std::string_view operation, const std::string& line) {
    std::fprintf(stderr, "[RRPC-DEBUG] %.*s %s\n",
                 static_cast<int>(operation.size()), operation.data(), line.c_str());
    std::fflush(stderr);
}

inline void LogRuntimeInitialized() {
    RRPC_LOG_MSG("init", "runtime state created");
}

inline void LogSodiumInitFailed() {
    RRPC_LOG_MSG("init", "sodium_init failed, secure release falls back to sodium_memzero only");
}

inline void LogMethodRegistered(const std::string_view method, const bool replaced) {
    LogLine("register", fmt::format("'{}'{}", method, replaced ? " (replaced)" : ""));
}

inline void LogCallRejected(const int status, const std::string_view reason) {
    LogLine("call", fmt::format("rejected with status {}: {}", status, reason));
}

inline void LogHandlerFailure(const std::string_view method, const RpcFailure& failure) {
    LogLine("call", fmt::format("'{}' failed: {}", method, failure.ToString()));
}

inline void LogCallCompleted(const std::string_view method, const size_t input_length,
                             const size_t output_length) {
    LogLine("call", fmt::format("'{}' {} bytes in, {} bytes out", method, input_length, output_length));
}

#else // !RRPC_DEBUG_CALLS

#define RRPC_LOG_MSG(operation, message) ((void)0)

inline void LogRuntimeInitialized() {}
inline void LogSodiumInitFailed() {}
inline void LogMethodRegistered(std::string_view, bool) {}
inline void LogCallRejected(int, std::string_view) {}
inline void LogHandlerFailure(std::string_view, const RpcFailure&) {}
inline void LogCallCompleted(std::string_view, size_t, size_t) {}

#endif // RRPC_DEBUG_CALLS

} // namespace rrpc::debug
