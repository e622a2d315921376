/**
 * @file parse_options.hh
 * @brief Parsing options for chunk frames
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing chunk frames
     *
     * Controls strictness, the length limit and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a CRC mismatch or an over-limit length fails the parse.
         * When false, both are reported through on_warning and the chunk
         * is still built. A lenient parse keeps the recomputed CRC, never
         * the one found in the frame.
         */
        bool strict = true;

        /**
         * @brief Maximum accepted declared length in bytes
         *
         * Defaults to 2^31 - 1, the largest length a PNG chunk may declare.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset of the chunk frame the warning is about
         * @param category Warning category ("crc_mismatch", "size_limit")
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

} // namespace pngchunk
