/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngmsg library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every failure caused by malformed
 * input data is reported with one of these types; nothing in the library
 * tries to repair damaged input.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <string>
#include <sstream>

namespace pngmsg {

    /**
     * @class pngmsg_error
     * @brief Base exception class for all pngmsg errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all pngmsg-specific errors with a single catch block.
     */
    class pngmsg_error : public std::runtime_error {
    public:
        explicit pngmsg_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @enum parse_errc
     * @brief Structural and integrity failures found while decoding bytes
     */
    enum class parse_errc {
        invalid_signature,        ///< PNG signature missing or mismatched
        no_data_length,           ///< Fewer than 4 bytes left for the length field
        no_chunk_type,            ///< Fewer than 4 bytes left for the type field
        non_matching_data_length, ///< Declared length exceeds the available bytes
        no_crc,                   ///< Fewer than 4 bytes left for the CRC field
        invalid_crc,              ///< Stored CRC differs from the computed one
        chunk_too_large           ///< Declared length exceeds parse_options::max_chunk_size
    };

    /**
     * @class parse_error
     * @brief Exception for parsing errors
     *
     * Thrown when the byte stream is not a well-formed sequence of PNG
     * chunk records. code() tells which framing step failed.
     */
    class parse_error : public pngmsg_error {
    public:
        parse_error(parse_errc code, const std::string& msg)
            : pngmsg_error(msg), m_code(code) {}

        [[nodiscard]] parse_errc code() const noexcept { return m_code; }

    private:
        parse_errc m_code;
    };

    /**
     * @class data_length_error
     * @brief The declared payload length is larger than what the buffer holds
     */
    class data_length_error : public parse_error {
    public:
        data_length_error(std::uint32_t declared, std::size_t available, const std::string& msg)
            : parse_error(parse_errc::non_matching_data_length, msg),
              m_declared(declared), m_available(available) {}

        [[nodiscard]] std::uint32_t declared() const noexcept { return m_declared; }
        [[nodiscard]] std::size_t available() const noexcept { return m_available; }

    private:
        std::uint32_t m_declared;
        std::size_t m_available;
    };

    /**
     * @class crc_error
     * @brief Stored checksum does not match the one computed over type and data
     */
    class crc_error : public parse_error {
    public:
        crc_error(std::uint32_t provided, std::uint32_t computed, const std::string& msg)
            : parse_error(parse_errc::invalid_crc, msg),
              m_provided(provided), m_computed(computed) {}

        [[nodiscard]] std::uint32_t provided() const noexcept { return m_provided; }
        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }

    private:
        std::uint32_t m_provided;
        std::uint32_t m_computed;
    };

    /**
     * @enum chunk_type_errc
     * @brief Reasons a chunk type code can be rejected
     */
    enum class chunk_type_errc {
        invalid_byte,  ///< A byte is not an ASCII letter
        invalid_length ///< The text form is not exactly 4 bytes long
    };

    /**
     * @class chunk_type_error
     * @brief Exception for invalid chunk type codes
     *
     * value() carries the offending byte for invalid_byte and the actual
     * length for invalid_length.
     */
    class chunk_type_error : public pngmsg_error {
    public:
        chunk_type_error(chunk_type_errc code, std::size_t value, const std::string& msg)
            : pngmsg_error(msg), m_code(code), m_value(value) {}

        [[nodiscard]] chunk_type_errc code() const noexcept { return m_code; }
        [[nodiscard]] std::size_t value() const noexcept { return m_value; }

    private:
        chunk_type_errc m_code;
        std::size_t m_value;
    };

    /**
     * @class encoding_error
     * @brief Chunk payload is not valid UTF-8 text
     */
    class encoding_error : public pngmsg_error {
    public:
        encoding_error(std::size_t offset, const std::string& msg)
            : pngmsg_error(msg), m_offset(offset) {}

        /// Offset of the first byte that breaks the UTF-8 encoding
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @class chunk_not_found_error
     * @brief No chunk with the requested type code exists in the document
     */
    class chunk_not_found_error : public pngmsg_error {
    public:
        chunk_not_found_error(std::string code, const std::string& msg)
            : pngmsg_error(msg), m_code(std::move(code)) {}

        [[nodiscard]] const std::string& code() const noexcept { return m_code; }

    private:
        std::string m_code;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with the given code and formatted message
     * @param code parse_errc value
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(code, ...) \
        throw ::pngmsg::parse_error((code), ::pngmsg::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     * @param condition Condition to check
     * @param code parse_errc value
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) THROW_PARSE(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_UNLESS
     * @brief Throw a parse_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param code parse_errc value
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_PARSE_UNLESS(condition, code, ...) \
        do { if (!(condition)) THROW_PARSE(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_CHUNK_TYPE
     * @brief Throw a chunk_type_error with formatted message
     * @param code chunk_type_errc value
     * @param value Offending byte or length
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CHUNK_TYPE(code, value, ...) \
        throw ::pngmsg::chunk_type_error((code), (value), ::pngmsg::build_error_msg(__VA_ARGS__))

    /** @} */ // end of ExceptionMacros group

} // namespace pngmsg
