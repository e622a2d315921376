//
// Shared validation of chunk frames, used by chunk::parse and read_chunk
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    class frame_decoder {
    public:
        // Length and type fields
        static constexpr std::size_t header_size = 8;
        static constexpr std::size_t crc_size = 4;

        struct header {
            std::uint32_t length;
            chunk_type type;
        };

        // Decode and validate the 8 header bytes of a frame starting at offset
        static header decode_header(const std::byte* src, std::uint64_t offset, const parse_options& options);

        // Check the stored CRC against the contents and build the chunk
        static chunk finish(const header& h,
                            std::vector<std::byte> data,
                            std::uint32_t stored_crc,
                            std::uint64_t offset,
                            const parse_options& options);
    };

} // namespace pngchunk
