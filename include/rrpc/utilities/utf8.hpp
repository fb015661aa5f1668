#pragma once
#include <optional>
#include <string_view>
namespace rrpc::utilities {
class Utf8 {
public:
    /**
     * @brief Strict UTF-8 check: rejects overlong forms, surrogates and
     * code points above U+10FFFF
     */
    [[nodiscard]] static bool IsValid(std::string_view text) noexcept;

    /**
     * @brief View a NUL-terminated C string if it is valid UTF-8
     */
    [[nodiscard]] static std::optional<std::string_view> FromCString(const char* text) noexcept;

    Utf8() = delete;
};
}
