/**
 * @file png.hh
 * @brief PNG document: signature followed by an ordered list of chunks
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>

#include <pngmsg/chunk.hh>
#include <pngmsg/parse_options.hh>
#include <pngmsg/export_pngmsg.h>

namespace pngmsg {

    /**
     * @class png
     * @brief Chunk-level view of a PNG file
     *
     * Holds the chunks in file order. Pixel data is never decoded and no PNG
     * structural rule (IHDR first, IEND last, ...) is enforced; the document
     * only guarantees that every chunk is well framed and checksummed.
     */
    class PNGMSG_EXPORT png {
    public:
        /// 89 50 4E 47 0D 0A 1A 0A
        static constexpr std::array<std::uint8_t, 8> standard_header{
            137, 80, 78, 71, 13, 10, 26, 10
        };

        png() = default;

        /// Document with the standard signature and the given chunks
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG file
         * @param data File contents
         * @param size File size in bytes
         * @param options Parse options
         * @throws parse_error (invalid_signature) if the signature is absent or wrong
         * @throws parse_error, crc_error, chunk_type_error for the first malformed chunk
         */
        static png parse(const std::byte* data, std::size_t size, const parse_options& options = {});

        static png parse(const std::vector<std::byte>& data, const parse_options& options = {}) {
            return parse(data.data(), data.size(), options);
        }

        /// Add a chunk after the last one
        void append_chunk(chunk c);

        /**
         * @brief Detach the first chunk with the given type
         * @return The removed chunk; the remaining chunks keep their order
         * @throws chunk_not_found_error if no chunk has that type
         */
        chunk remove_chunk(std::string_view code);

        /// First chunk with the given type, nullptr if there is none
        [[nodiscard]] const chunk* chunk_by_type(std::string_view code) const;

        [[nodiscard]] const std::array<std::uint8_t, 8>& header() const { return standard_header; }
        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        /// Signature followed by every chunk in order
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        friend std::ostream& operator<<(std::ostream& os, const png& p);

    private:
        std::vector<chunk>::const_iterator find(std::string_view code) const;

        std::vector<chunk> m_chunks;
    };

} // namespace pngmsg
