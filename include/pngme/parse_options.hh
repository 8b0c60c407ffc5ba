/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
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
     * @brief Configuration options for parsing PNG files
     *
     * Controls strictness, size limits, and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, the whole buffer must consist of the signature followed
         * by complete chunks, and oversized chunks are an error.
         * When false, bytes after the IEND chunk are ignored and oversized
         * chunks are only reported as warnings.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk length in bytes
         *
         * The PNG format limits a chunk length to 2^31-1.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where warning occurred
         * @param category Warning category ("reserved_bit", "size_limit", "trailing_data")
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
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
