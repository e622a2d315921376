//
// Blocking reader over std::istream used by read_chunk
//

#pragma once

#include <iosfwd>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pngchunk {

    class reader {
        public:
            explicit reader(std::istream& is);

            // Reads up to size bytes, returns how many were read. Throws on stream failure.
            std::size_t read(void* dst, std::size_t size);

            // Reads exactly size bytes or throws io_error
            std::vector<std::byte> read_exact(std::size_t size);

            std::uint32_t read_be32();

            // Current stream position, 0 when the stream cannot tell
            [[nodiscard]] std::uint64_t position() const;

        private:
            std::istream& m_stream;
    };
}
