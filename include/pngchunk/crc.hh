/**
 * @file crc.hh
 * @brief CRC-32 as used by PNG chunk frames
 *
 * Reflected polynomial 0xEDB88320, initial value 0xFFFFFFFF, final XOR
 * 0xFFFFFFFF. This is the zlib CRC, so values agree with any PNG reader.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Compute the CRC-32 of a memory block
     * @param data Start of the block (may be null when size is 0)
     * @param size Number of bytes
     * @return Finalized CRC value
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const void* data, std::size_t size);

    /**
     * @class crc32_accumulator
     * @brief Incremental CRC-32 over data fed in pieces
     *
     * Feeding the type tag and then the payload yields the same value as
     * crc32() over their concatenation.
     */
    class PNGCHUNK_EXPORT crc32_accumulator {
    public:
        crc32_accumulator();

        crc32_accumulator& update(const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t value() const noexcept { return m_crc; }

        void reset();

    private:
        std::uint32_t m_crc;
    };

} // namespace pngchunk
