#pragma once

#include "rrpc/c_api/rrpc_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

#define RRPC_API_VERSION_MAJOR 1
#define RRPC_API_VERSION_MINOR 0
#define RRPC_API_VERSION_PATCH 0

#define RRPC_MAX_INPUT_SIZE ((size_t)10 * 1024 * 1024)

typedef enum {
    RRPC_SUCCESS = 0,
    RRPC_ERROR_NOT_INITIALIZED = 1,
    RRPC_ERROR_UNKNOWN_METHOD = 2,
    RRPC_ERROR_PARSE = 3,
    RRPC_ERROR_NOT_FOUND = 4,
    RRPC_ERROR_SERIALIZATION = 5,
    RRPC_ERROR_TOO_LARGE = 6,
    RRPC_ERROR_INTERNAL = 99
} RrpcStatus;

RRPC_API const char* rrpc_version(void);

// Create the process-wide runtime. Idempotent; registrations made after an
// earlier call survive later calls.
RRPC_API RrpcStatus rrpc_init(void);

// Invoke the handler registered under `method` (NUL-terminated UTF-8).
// On RRPC_SUCCESS, *out_ptr/*out_len describe a new buffer owned by the
// caller, which must pass it to rrpc_free exactly once. On any other status
// the output slots are left untouched.
//
// Arguments are checked in this order, first failure wins:
//   method null -> PARSE, in_ptr null with in_len > 0 -> PARSE,
//   in_len > RRPC_MAX_INPUT_SIZE -> TOO_LARGE, output slot null -> INTERNAL,
//   runtime not initialized -> NOT_INITIALIZED, method not UTF-8 -> PARSE.
//
// Calls are serialized on one runtime lock held while the handler runs.
// A handler must not call rrpc_call itself; it would deadlock.
RRPC_API RrpcStatus rrpc_call(
    const char* method,
    const uint8_t* in_ptr,
    size_t in_len,
    uint8_t** out_ptr,
    size_t* out_len);

// Release a buffer returned by rrpc_call. NULL is ignored. Releasing twice or
// releasing a pointer from anywhere else is undefined behavior.
RRPC_API void rrpc_free(uint8_t* ptr, size_t len);

RRPC_API const char* rrpc_status_string(RrpcStatus code);

#ifdef __cplusplus
}
#endif
