//
// UTF-8 well-formedness check (RFC 3629: no overlong forms, no surrogates,
// nothing above U+10FFFF).
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace pngmsg {

    // Offset of the first byte that starts an ill-formed sequence, or nullopt
    inline std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = static_cast<std::uint8_t>(data[i]);
            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t need;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                need = 1;
            } else if (c >= 0xE0 && c <= 0xEF) {
                need = 2;
                if (c == 0xE0) {
                    lo = 0xA0;      // overlong
                } else if (c == 0xED) {
                    hi = 0x9F;      // surrogates
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                need = 3;
                if (c == 0xF0) {
                    lo = 0x90;      // overlong
                } else if (c == 0xF4) {
                    hi = 0x8F;      // above U+10FFFF
                }
            } else {
                return i;
            }

            if (size - i <= need) {
                return i;
            }

            // Only the first continuation byte has a narrowed range
            auto c1 = static_cast<std::uint8_t>(data[i + 1]);
            if (c1 < lo || c1 > hi) {
                return i;
            }
            for (std::size_t k = 2; k <= need; k++) {
                auto ck = static_cast<std::uint8_t>(data[i + k]);
                if (ck < 0x80 || ck > 0xBF) {
                    return i;
                }
            }
            i += need + 1;
        }
        return std::nullopt;
    }

} // namespace pngmsg
