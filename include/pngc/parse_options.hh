/**
 * @file parse_options.hh
 * @brief Decoding options and configuration for chunks
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngc {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding chunks
     *
     * Controls size limits, type code strictness and warning handling.
     * CRC verification is not configurable and always takes place.
     */
    struct parse_options {
        /**
         * @brief Maximum accepted payload length in bytes
         *
         * Chunks declaring more than this fail with length_exceeded before
         * any payload byte is read. Values above 2^31 - 1 are treated as
         * 2^31 - 1, the format maximum.
         */
        std::uint32_t max_chunk_length = 0x7FFFFFFFu;

        /**
         * @brief Reject type codes that are not well-formed
         *
         * When true, a decoded type code failing chunk_type::is_valid()
         * raises invalid_byte. When false (default) it is accepted and
         * reported through on_warning.
         */
        bool require_valid_type = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset of the chunk the warning refers to
         * @param category Warning category ("type_code", "trailing_data")
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

} // namespace pngc
