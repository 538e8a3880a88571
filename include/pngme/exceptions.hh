/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout libpngme.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <cstdint>

namespace pngme {

    /**
     * @class pngme_error
     * @brief Base exception class for all libpngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every PNG-specific error with a single catch block.
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
     * The library core never touches files. This is thrown by the
     * collaborators that load and store byte buffers.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class format_error
     * @brief A chunk type string is not exactly 4 ASCII letters
     */
    class format_error : public pngme_error {
    public:
        explicit format_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class decode_error
     * @brief Base class for structural and integrity violations in a byte stream
     *
     * Thrown when decoding a chunk or a whole file fails. The more specific
     * classes below derive from it so callers may catch the whole family.
     */
    class decode_error : public pngme_error {
    public:
        explicit decode_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class invalid_signature
     * @brief Input does not begin with the 8-byte PNG signature
     */
    class invalid_signature : public decode_error {
    public:
        explicit invalid_signature(const std::string& msg)
            : decode_error(msg) {}
    };

    /**
     * @class truncated_input
     * @brief Fewer bytes are available than a chunk record demands
     */
    class truncated_input : public decode_error {
    public:
        explicit truncated_input(const std::string& msg)
            : decode_error(msg) {}
    };

    /**
     * @class crc_mismatch
     * @brief Recomputed CRC-32 disagrees with the stored checksum
     */
    class crc_mismatch : public decode_error {
    public:
        crc_mismatch(const std::string& msg, std::uint32_t stored, std::uint32_t computed)
            : decode_error(msg), m_stored(stored), m_computed(computed) {}

        /// Checksum found in the byte stream
        [[nodiscard]] std::uint32_t stored() const noexcept { return m_stored; }
        /// Checksum recomputed over type and data
        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }

    private:
        std::uint32_t m_stored;
        std::uint32_t m_computed;
    };

    /**
     * @class not_text_error
     * @brief Chunk data was requested as text but is not valid UTF-8
     */
    class not_text_error : public pngme_error {
    public:
        explicit not_text_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class chunk_not_found
     * @brief A removal or required lookup by type found no match
     */
    class chunk_not_found : public pngme_error {
    public:
        explicit chunk_not_found(const std::string& msg)
            : pngme_error(msg) {}
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
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_FORMAT
     * @brief Throw a format_error with formatted message
     */
    #define THROW_FORMAT(...) \
        throw ::pngme::format_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_DECODE
     * @brief Throw a decode_error with formatted message
     */
    #define THROW_DECODE(...) \
        throw ::pngme::decode_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_TRUNCATED
     * @brief Throw a truncated_input error with formatted message
     */
    #define THROW_TRUNCATED(...) \
        throw ::pngme::truncated_input(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_NOT_FOUND
     * @brief Throw a chunk_not_found error with formatted message
     */
    #define THROW_NOT_FOUND(...) \
        throw ::pngme::chunk_not_found(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     * @param condition Condition to check
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_DECODE_IF
     * @brief Conditionally throw a decode_error
     */
    #define THROW_DECODE_IF(condition, ...) \
        do { if (condition) THROW_DECODE(__VA_ARGS__); } while(0)

    /**
     * @def THROW_TRUNCATED_IF
     * @brief Conditionally throw a truncated_input error
     */
    #define THROW_TRUNCATED_IF(condition, ...) \
        do { if (condition) THROW_TRUNCATED(__VA_ARGS__); } while(0)

    /**
     * @def THROW_FORMAT_UNLESS
     * @brief Throw a format_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_FORMAT_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_FORMAT(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
