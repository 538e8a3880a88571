/**
 * @file decode_options.hh
 * @brief Decoding options and configuration for PNG files
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct decode_options
     * @brief Configuration options for decoding PNG byte streams
     *
     * Controls strictness, size limits and warning handling. Structural
     * and CRC failures are always fatal regardless of these settings.
     */
    struct decode_options {
        /**
         * @brief Strict decoding mode
         *
         * When true, a chunk whose type fails chunk_type::is_valid()
         * aborts decoding. When false, it is kept and reported as a warning.
         */
        bool strict = false;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * A chunk declaring a longer length aborts decoding before any
         * allocation. Default is the PNG limit of 2^31 - 1.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset of the chunk the warning refers to
         * @param category Warning category (e.g., "invalid_type", "missing_iend")
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
         * If set, will be called for non-fatal issues during decoding.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
