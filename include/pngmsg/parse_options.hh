/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngmsg {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG files
     *
     * Controls strictness, size limits, and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * Governs chunks larger than max_chunk_size only. When true they fail
         * the parse, when false they are accepted and reported through
         * on_warning. Truncated records, checksum and type code failures are
         * fatal in both modes.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * Default is 2^31 - 1, the largest length the PNG format allows and
         * the largest payload chunk accepts, so anything built in memory
         * parses back with default options.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset where warning occurred
         * @param category Warning category ("size_limit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngmsg
