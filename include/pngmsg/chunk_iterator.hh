/**
 * @file chunk_iterator.hh
 * @brief Forward iterator over the chunk records of a PNG byte buffer
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <pngmsg/chunk.hh>
#include <pngmsg/parse_options.hh>
#include <pngmsg/export_pngmsg.h>

namespace pngmsg {

    /**
     * @class chunk_iterator
     * @brief Walks back-to-back chunk records in a buffer
     *
     * Each record starts where the previous one ended, i.e. at
     * start + sum(12 + length_i) over the preceding records. The buffer is
     * borrowed and must outlive the iterator; decoded chunks own copies of
     * their payload.
     */
    class PNGMSG_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief Information about the current chunk being iterated
         */
        struct chunk_info {
            std::uint64_t file_offset = 0;  ///< Absolute offset of the length field
            std::optional<chunk> record;    ///< Decoded chunk (empty once iteration ended)
        };

        /**
         * @brief Start iterating at a given offset
         * @param data Buffer to read from
         * @param size Buffer size in bytes
         * @param start Offset of the first record (8 for a full PNG file)
         * @param options Strictness, size limit and warning callback
         * @throws parse_error, crc_error, chunk_type_error if the first record is malformed
         */
        chunk_iterator(const std::byte* data, std::size_t size, std::size_t start,
                       const parse_options& options = {});

        /**
         * @brief Get current chunk information (const version)
         */
        const chunk_info& current() const { return m_current; }

        /**
         * @brief Get current chunk information (mutable version)
         */
        chunk_info& current() { return m_current; }

        /**
         * @brief Advance to the next chunk
         * @throws parse_error, crc_error, chunk_type_error if the next record is malformed
         */
        void next();

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        // Decode the record at m_position, returns false at end of data
        bool read_next_chunk();

        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const;

        const std::byte* m_data;
        std::size_t m_size;
        std::size_t m_position;
        parse_options m_options;
        chunk_info m_current;
        bool m_ended;
    };

} // namespace pngmsg
