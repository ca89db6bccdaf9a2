/**
 * @file chunk.hh
 * @brief PNG chunk record: length, type, data and CRC
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <pngmsg/chunk_type.hh>
#include <pngmsg/export_pngmsg.h>

namespace pngmsg {

    /**
     * @class chunk
     * @brief A single chunk as stored in a PNG file
     *
     * On disk a chunk is framed as
     * @code
     *   length:u32 BE | type:4 letters | data:length bytes | crc:u32 BE
     * @endcode
     * where the CRC covers the type and data bytes. A chunk owns a copy of
     * its payload and never changes after construction.
     */
    class PNGMSG_EXPORT chunk {
    public:
        static constexpr std::size_t length_field_size = 4;
        static constexpr std::size_t type_field_size = chunk_type::size;
        static constexpr std::size_t crc_field_size = 4;
        static constexpr std::size_t metadata_size =
            length_field_size + type_field_size + crc_field_size;

        /// Largest payload a PNG chunk may carry (2^31 - 1 bytes)
        static constexpr std::uint32_t max_length = 0x7FFFFFFFu;

        /**
         * @brief Build a fresh chunk, computing length and CRC
         * @param type Chunk type code
         * @param data Payload
         * @throws std::length_error if the payload is longer than max_length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Decode a chunk from the start of a buffer
         *
         * Fields are read in file order and each missing field is reported
         * with its own error. Bytes following the CRC are not examined.
         *
         * @param data Buffer holding at least one chunk record
         * @param size Buffer size in bytes
         * @return The decoded chunk
         * @throws parse_error (no_data_length, no_chunk_type, no_crc)
         * @throws data_length_error if the payload is shorter than declared
         * @throws crc_error if the stored CRC does not match
         * @throws chunk_type_error if the type bytes are not ASCII letters
         */
        static chunk parse(const std::byte* data, std::size_t size);

        static chunk parse(const std::vector<std::byte>& data) {
            return parse(data.data(), data.size());
        }

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Number of bytes the record occupies in a file
        [[nodiscard]] std::size_t size_on_disk() const { return metadata_size + m_length; }

        /// Serialized record in file order
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Payload as text
         * @throws encoding_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        bool operator==(const chunk& o) const {
            return m_length == o.m_length && m_type == o.m_type &&
                   m_data == o.m_data && m_crc == o.m_crc;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

        friend std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

} // namespace pngmsg
