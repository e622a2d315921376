/**
 * @file chunk.hh
 * @brief A single PNG chunk: type tag, payload and CRC
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    class frame_decoder;

    /**
     * @class chunk
     * @brief One length-prefixed, type-tagged, CRC-checked chunk
     *
     * Frame layout, big-endian throughout:
     *
     * | offset     | size   | field                      |
     * |------------|--------|----------------------------|
     * | 0          | 4      | length of data             |
     * | 4          | 4      | type tag                   |
     * | 8          | length | data                       |
     * | 8 + length | 4      | CRC-32 over type tag, data |
     *
     * A chunk is immutable. length() always equals data().size() and crc()
     * always equals the CRC-32 of the tag followed by the data.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Size of the length, type and CRC fields together
        static constexpr std::size_t frame_overhead = 12;

        /**
         * @brief Build a chunk, computing its length and CRC
         * @param type Chunk type tag
         * @param data Payload
         * @throws invalid_chunk_error if the payload is longer than 2^32 - 1 bytes
         */
        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Parse a chunk frame from memory
         *
         * Bytes following the frame are ignored, frame_size() of the
         * result tells how many were consumed.
         *
         * @param data Start of the frame
         * @param size Number of bytes available
         * @param options Strictness, length limit and warning handler
         * @throws invalid_chunk_error if the frame is malformed
         * @throws crc_mismatch_error if the stored CRC is wrong (strict mode)
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options);
        static chunk parse(const void* data, std::size_t size);
        static chunk parse(const std::vector<std::byte>& bytes, const parse_options& options);
        static chunk parse(const std::vector<std::byte>& bytes);

        [[nodiscard]] std::uint32_t length() const noexcept { return m_length; }
        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return m_data; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }

        /// Size of the serialized frame: 12 + length()
        [[nodiscard]] std::size_t frame_size() const noexcept {
            return frame_overhead + m_data.size();
        }

        /**
         * @brief Decode the payload as UTF-8 text
         * @throws invalid_text_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_text() const;

        /// Encode the chunk as a frame of frame_size() bytes
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /// Encode into a caller buffer holding at least frame_size() bytes
        void serialize_to(void* dst) const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        friend class frame_decoder;

        chunk(std::uint32_t length, const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    /**
     * @brief Display the payload of a chunk as text
     *
     * A UTF-8 payload is written verbatim. Any other payload is written
     * with bytes outside printable ASCII escaped as \\xNN, so this never
     * fails. Use chunk::data_as_text() for an exact decode.
     */
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
