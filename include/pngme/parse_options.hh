/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for chunk decoding
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding chunks
     *
     * Controls strictness, size limits and warning handling. The
     * defaults accept every well formed chunk PNG allows.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk larger than max_chunk_size is an error.
         * When false, it is reported through on_warning and decoded.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed payload size in bytes
         *
         * Default is 2^31 - 1, the largest length PNG permits.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @brief Reject chunk types that fail chunk_type::is_valid()
         *
         * When false, such types are reported as "invalid_type" warnings.
         */
        bool require_valid_type = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset of the chunk the warning refers to
         * @param category Warning category ("size_limit", "invalid_type", "trailing_data")
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

} // namespace pngme
