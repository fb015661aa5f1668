#include "rrpc/utilities/utf8.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace rrpc::utilities {
    namespace {
        constexpr bool IsContinuation(const uint8_t byte) {
            return (byte & 0xC0) == 0x80;
        }
    }

    bool Utf8::IsValid(const std::string_view text) noexcept {
        const auto *bytes = reinterpret_cast<const uint8_t *>(text.data());
        const size_t size = text.size();
        size_t i = 0;
        while (i < size) {
            const uint8_t lead = bytes[i];
            if (lead < 0x80) {
                ++i;
                continue;
            }
            size_t extra;
            uint8_t lower = 0x80;
            uint8_t upper = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                extra = 1;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                extra = 2;
                if (lead == 0xE0) {
                    lower = 0xA0;
                } else if (lead == 0xED) {
                    upper = 0x9F;
                }
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                extra = 3;
                if (lead == 0xF0) {
                    lower = 0x90;
                } else if (lead == 0xF4) {
                    upper = 0x8F;
                }
            } else {
                return false;
            }
            if (size - i <= extra) {
                return false;
            }
            // The second byte carries the overlong/surrogate/range limits.
            if (bytes[i + 1] < lower || bytes[i + 1] > upper) {
                return false;
            }
            for (size_t k = 2; k <= extra; ++k) {
                if (!IsContinuation(bytes[i + k])) {
                    return false;
                }
            }
            i += extra + 1;
        }
        return true;
    }

    std::optional<std::string_view> Utf8::FromCString(const char *text) noexcept {
        if (!text) {
            return std::nullopt;
        }
        const std::string_view view(text, std::strlen(text));
        if (!IsValid(view)) {
            return std::nullopt;
        }
        return view;
    }
}
