#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace rrpc {
struct Constants {
    static constexpr size_t MAX_INPUT_SIZE = 10 * 1024 * 1024;
    static constexpr std::string_view VERSION = "1.0.0";
    static constexpr uint8_t SECURE_WIPE_PATTERN = 0;
};
struct ErrorMessages {
    static constexpr std::string_view METHOD_NAME_NULL = "Method name pointer is null";
    static constexpr std::string_view INPUT_NULL = "Input data is null but length is non-zero";
    static constexpr std::string_view INPUT_TOO_LARGE = "Input exceeds maximum size";
    static constexpr std::string_view OUTPUT_SLOT_NULL = "Output pointer or length slot is null";
    static constexpr std::string_view NOT_INITIALIZED = "Runtime not initialized";
    static constexpr std::string_view METHOD_NAME_NOT_UTF8 = "Method name is not valid UTF-8";
    static constexpr std::string_view OUTPUT_ALLOCATION_FAILED = "Failed to allocate output buffer";
    static constexpr std::string_view HANDLER_THREW = "Handler raised an exception";
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
};
}
