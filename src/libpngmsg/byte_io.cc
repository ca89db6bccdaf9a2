//
// Cursor-based reader and appending writer over in-memory byte buffers.
//

#include <algorithm>

#include "byte_io.hh"

namespace pngmsg {
    // reader implementation
    reader::reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }

        // Check how much we can read within the buffer
        size = std::min(size, remaining());
        if (size == 0) {
            return 0;  // EOF-like behavior
        }

        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    std::vector<std::byte> reader::read_exact(std::size_t size, parse_errc on_short) {
        THROW_PARSE_IF(size > remaining(), on_short,
                       "Unexpected end of data at offset ", m_position,
                       ": requested ", size, " bytes, ", remaining(), " available");
        std::vector<std::byte> buffer(m_data + m_position, m_data + m_position + size);
        m_position += size;
        return buffer;
    }

    // writer implementation
    void writer::write(const void* src, std::size_t size) {
        auto* first = static_cast<const std::byte*>(src);
        m_buffer.insert(m_buffer.end(), first, first + size);
    }
}
