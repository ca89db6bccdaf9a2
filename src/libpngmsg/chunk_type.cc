//
// Chunk type code validation.
//

#include <pngmsg/chunk_type.hh>
#include <pngmsg/exceptions.hh>

namespace pngmsg {

    chunk_type::chunk_type(const std::array<std::uint8_t, size>& code)
        : m_code(code) {
        for (std::uint8_t c : m_code) {
            if (!is_ascii_letter(c)) {
                THROW_CHUNK_TYPE(chunk_type_errc::invalid_byte, c,
                                 "Invalid chunk type: value ", static_cast<unsigned>(c),
                                 " is not a valid ASCII letter");
            }
        }
    }

    chunk_type chunk_type::from_string(std::string_view code) {
        if (code.size() != size) {
            THROW_CHUNK_TYPE(chunk_type_errc::invalid_length, code.size(),
                             "Invalid chunk type '", code, "': code is of length ",
                             code.size(), " but it must be of length ", size);
        }

        std::array<std::uint8_t, size> bytes{};
        for (std::size_t i = 0; i < size; i++) {
            bytes[i] = static_cast<std::uint8_t>(code[i]);
        }
        return chunk_type(bytes);
    }

} // namespace pngmsg
