/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the pngme library.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>

namespace pngme {

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pngme-specific error with a single catch block.
     */
    class pngme_error : public std::runtime_error {
    public:
        explicit pngme_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading from or writing to a stream fails.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class format_error
     * @brief Base class for errors caused by malformed data
     */
    class format_error : public pngme_error {
    public:
        explicit format_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for chunk decoding errors
     *
     * Thrown when a byte buffer or stream does not hold a well formed
     * chunk. The reason() tells which check rejected the input.
     */
    class parse_error : public format_error {
    public:
        enum class reason_t {
            too_short,     ///< Buffer smaller than the 12 byte minimum frame
            truncated,     ///< Declared length exceeds the available bytes
            size_limit,    ///< Declared length exceeds parse_options::max_chunk_size
            crc_mismatch,  ///< Stored CRC differs from the computed one
            invalid_type   ///< Chunk type rejected by parse_options::require_valid_type
        };

        parse_error(reason_t r, const std::string& msg)
            : format_error(msg), m_reason(r) {}

        [[nodiscard]] reason_t reason() const noexcept { return m_reason; }

    private:
        reason_t m_reason;
    };

    /**
     * @class crc_mismatch_error
     * @brief Stored checksum does not match the checksum of type and payload
     */
    class crc_mismatch_error : public parse_error {
    public:
        crc_mismatch_error(std::uint32_t expected, std::uint32_t actual, const std::string& msg)
            : parse_error(reason_t::crc_mismatch, msg),
              m_expected(expected),
              m_actual(actual) {}

        /// CRC stored in the chunk
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC computed over type and payload
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_actual;
    };

    /**
     * @class chunk_type_error
     * @brief Text cannot be turned into a chunk type
     */
    class chunk_type_error : public format_error {
    public:
        explicit chunk_type_error(const std::string& msg)
            : format_error(msg) {}
    };

    /**
     * @class utf8_error
     * @brief Chunk payload requested as text is not valid UTF-8
     */
    class utf8_error : public format_error {
    public:
        utf8_error(std::size_t offset, const std::string& msg)
            : format_error(msg), m_offset(offset) {}

        /// Offset of the first byte of the offending sequence
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
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
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with the given reason and formatted message
     * @param reason Enumerator of parse_error::reason_t (unqualified)
     */
    #define THROW_PARSE(reason, ...) \
        throw ::pngme::parse_error(::pngme::parse_error::reason_t::reason, \
                                   ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_FORMAT
     * @brief Throw an error of a format_error subclass with formatted message
     */
    #define THROW_FORMAT(type, ...) \
        throw ::pngme::type(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, reason, ...) \
        do { if (condition) THROW_PARSE(reason, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
