//
// Forward iterator over the chunk records of a PNG byte buffer.
//

#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/exceptions.hh>

#include <algorithm>
#include <string>

namespace pngmsg {

    chunk_iterator::chunk_iterator(const std::byte* data, std::size_t size, std::size_t start,
                                   const parse_options& options)
        : m_data(data),
          m_size(size),
          m_position(std::min(start, size)),
          m_options(options),
          m_current{},
          m_ended(false) {
        // Read the first chunk
        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    void chunk_iterator::next() {
        if (m_ended) {
            return;
        }

        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    bool chunk_iterator::read_next_chunk() {
        m_current.record.reset();

        if (m_position >= m_size) {
            return false;
        }

        std::size_t start_pos = m_position;
        // A trailing record that does not decode fails the parse in every mode
        m_current.record.emplace(chunk::parse(m_data + start_pos, m_size - start_pos));

        const chunk& c = *m_current.record;
        if (c.length() > m_options.max_chunk_size) {
            if (m_options.strict) {
                THROW_PARSE(parse_errc::chunk_too_large,
                            "Chunk '", c.type(), "' at offset ", start_pos, " has size ", c.length(),
                            " bytes, which exceeds maximum allowed size of ",
                            m_options.max_chunk_size, " bytes");
            }
            warn(start_pos, "size_limit",
                 build_error_msg("Chunk '", c.type(), "' size ", c.length(),
                                 " exceeds maximum ", m_options.max_chunk_size));
        }

        m_current.file_offset = start_pos;
        m_position = start_pos + c.size_on_disk();
        return true;
    }

    void chunk_iterator::warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

} // namespace pngmsg
