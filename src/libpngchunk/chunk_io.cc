//
// Single-frame stream I/O
//

#include <pngchunk/chunk_io.hh>

#include <istream>
#include <ostream>
#include <utility>

#include <pngchunk/exceptions.hh>

#include "frame_decoder.hh"
#include "input.hh"

namespace pngchunk {

    chunk read_chunk(std::istream& stream, const parse_options& options) {
        reader in(stream);
        const std::uint64_t offset = in.position();

        std::vector<std::byte> header_bytes;
        try {
            header_bytes = in.read_exact(frame_decoder::header_size);
        } catch (const io_error& e) {
            THROW_IO("Cannot read chunk header at offset ", offset, ": ", e.what());
        }

        auto header = frame_decoder::decode_header(header_bytes.data(), offset, options);

        std::vector<std::byte> data;
        std::uint32_t stored_crc = 0;
        try {
            data = in.read_exact(header.length);
            stored_crc = in.read_be32();
        } catch (const io_error& e) {
            THROW_IO("Chunk ", header.type, " at offset ", offset, " is truncated, declared length ",
                     header.length, ": ", e.what());
        }

        return frame_decoder::finish(header, std::move(data), stored_crc, offset, options);
    }

    chunk read_chunk(std::istream& stream) {
        return read_chunk(stream, parse_options{});
    }

    void write_chunk(std::ostream& stream, const chunk& c) {
        THROW_IO_UNLESS(stream.good(), "Stream in bad state");

        auto bytes = c.serialize();
        stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(stream.good(), "Failed to write chunk ", c.type(), " (", bytes.size(), " bytes)");
    }

} // namespace pngchunk
