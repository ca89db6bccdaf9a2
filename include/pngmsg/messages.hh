/**
 * @file messages.hh
 * @brief Hide, read back and remove text messages in PNG files
 *
 * These functions work on whole files already loaded into memory. Reading
 * and writing the files is left to the caller.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pngmsg/parse_options.hh>
#include <pngmsg/export_pngmsg.h>

namespace pngmsg {

    /**
     * @struct removed_message
     * @brief Result of remove_message
     */
    struct removed_message {
        std::vector<std::byte> file;  ///< File contents without the message chunk
        /// Text the removed chunk carried, nullopt if its data is not UTF-8
        std::optional<std::string> message;
    };

    /**
     * @brief Append a message chunk
     *
     * @param file PNG file contents
     * @param code 4-letter chunk type, e.g. "ruSt"
     * @param message Text to store
     * @param options Parse options
     * @return File contents with the new chunk after the existing ones
     * @throws chunk_type_error if code is not a valid chunk type
     * @throws parse_error if file is not a well-formed PNG chunk stream
     */
    PNGMSG_EXPORT std::vector<std::byte> encode_message(const std::vector<std::byte>& file,
                                                        std::string_view code,
                                                        std::string_view message,
                                                        const parse_options& options = {});

    /**
     * @brief Read the message stored under a chunk type
     * @return The text of the first chunk with that type, nullopt if there is none
     * @throws encoding_error if the chunk data is not UTF-8
     */
    PNGMSG_EXPORT std::optional<std::string> decode_message(const std::vector<std::byte>& file,
                                                            std::string_view code,
                                                            const parse_options& options = {});

    /**
     * @brief Remove the first chunk with the given type
     *
     * The chunk is removed whatever its payload, so binary chunks such as
     * IDAT can be dropped too; only their text is left out of the result.
     *
     * @throws chunk_not_found_error if no chunk has that type
     */
    PNGMSG_EXPORT removed_message remove_message(const std::vector<std::byte>& file,
                                                 std::string_view code,
                                                 const parse_options& options = {});

    /// Listing of the chunks that may carry a message
    PNGMSG_EXPORT std::string list_chunks(const std::vector<std::byte>& file,
                                          const parse_options& options = {});

} // namespace pngmsg
