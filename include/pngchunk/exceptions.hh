/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk codec
 *
 * Every failure of the codec is reported by throwing one of the classes
 * below. All of them derive from pngchunk_error, so a single catch block
 * is enough for callers that do not care about the exact kind.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all codec errors
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class invalid_chunk_type_error
     * @brief A type tag is not exactly four ASCII letters
     *
     * Thrown by every chunk_type constructor, both the raw byte form
     * and the text form.
     */
    class invalid_chunk_type_error : public pngchunk_error {
    public:
        explicit invalid_chunk_type_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base class for errors in a chunk frame
     */
    class parse_error : public pngchunk_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class invalid_chunk_error
     * @brief A chunk frame is structurally malformed
     *
     * Thrown when the buffer is too short for the declared length,
     * when the type tag is invalid, or when a declared length exceeds
     * the configured limit.
     */
    class invalid_chunk_error : public parse_error {
    public:
        explicit invalid_chunk_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class crc_mismatch_error
     * @brief The CRC stored in a frame disagrees with the recomputed one
     */
    class crc_mismatch_error : public parse_error {
    public:
        crc_mismatch_error(const std::string& msg, std::uint32_t expected, std::uint32_t actual)
            : parse_error(msg), m_expected(expected), m_actual(actual) {}

        /// CRC computed over the type tag and payload
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }

        /// CRC stored in the frame
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_actual;
    };

    /**
     * @class invalid_text_error
     * @brief A payload is not valid UTF-8
     */
    class invalid_text_error : public pngchunk_error {
    public:
        invalid_text_error(const std::string& msg, std::size_t offset)
            : pngchunk_error(msg), m_offset(offset) {}

        /// Offset of the first byte that breaks the encoding
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @class io_error
     * @brief Exception for stream I/O errors
     *
     * Thrown when reading a chunk from a stream that ends early or fails,
     * or when writing a chunk to a stream fails.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
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

    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_INVALID_CHUNK(...) \
        throw ::pngchunk::invalid_chunk_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_INVALID_CHUNK_TYPE(...) \
        throw ::pngchunk::invalid_chunk_type_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_INVALID_CHUNK_IF(condition, ...) \
        do { if (condition) THROW_INVALID_CHUNK(__VA_ARGS__); } while(0)

    #define THROW_INVALID_CHUNK_TYPE_IF(condition, ...) \
        do { if (condition) THROW_INVALID_CHUNK_TYPE(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
