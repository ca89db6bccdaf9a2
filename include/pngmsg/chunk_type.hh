/**
 * @file chunk_type.hh
 * @brief PNG chunk type code (four ASCII letters with property bits)
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>

#include <pngmsg/export_pngmsg.h>

namespace pngmsg {

    /**
     * @class chunk_type
     * @brief Validated 4-byte chunk identifier
     *
     * Every byte is an ASCII letter. Bit 5 (0x20, the lowercase bit) of each
     * byte carries one property of the chunk:
     *  - byte 1: ancillary (set) or critical (unset)
     *  - byte 2: private (set) or public (unset)
     *  - byte 3: reserved, must be unset in conforming codes
     *  - byte 4: safe to copy (set) or unsafe to copy (unset)
     */
    class PNGMSG_EXPORT chunk_type {
    public:
        static constexpr std::size_t size = 4;

        /**
         * @brief Construct from raw bytes
         * @throws chunk_type_error (invalid_byte) if a byte is not in A-Z or a-z
         */
        explicit chunk_type(const std::array<std::uint8_t, size>& code);

        /**
         * @brief Construct from text such as "IHDR"
         * @throws chunk_type_error (invalid_length) if the text is not 4 bytes long,
         *         (invalid_byte) if a byte is not an ASCII letter
         */
        static chunk_type from_string(std::string_view code);

        [[nodiscard]] const std::array<std::uint8_t, size>& bytes() const { return m_code; }

        // Construction guarantees ASCII letters, so the bytes are printable as-is
        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_code.data()), size};
        }

        [[nodiscard]] bool is_critical() const { return !property_bit(0); }
        [[nodiscard]] bool is_public() const { return !property_bit(1); }
        [[nodiscard]] bool is_reserved_bit_valid() const { return !property_bit(2); }
        [[nodiscard]] bool is_safe_to_copy() const { return property_bit(3); }

        /**
         * @brief Conformance of the code
         *
         * Only the reserved bit decides validity. The public/private and
         * safe-to-copy bits do not take part.
         */
        [[nodiscard]] bool is_valid() const { return is_reserved_bit_valid(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_code == o.m_code; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_code < o.m_code; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << t.to_string();
        }

    private:
        [[nodiscard]] bool property_bit(std::size_t index) const {
            return (m_code[index] & 0x20) != 0;
        }

        std::array<std::uint8_t, size> m_code;
    };

    /// True for bytes in A-Z and a-z
    constexpr bool is_ascii_letter(std::uint8_t c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

} // namespace pngmsg
