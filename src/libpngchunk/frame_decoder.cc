//
// Shared validation of chunk frames
//

#include "frame_decoder.hh"

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include <pngchunk/crc.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    namespace {
        std::string hex32(std::uint32_t v) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::setfill('0') << std::setw(8) << v;
            return oss.str();
        }

        chunk_type decode_type(const std::byte* src, std::uint64_t offset) {
            try {
                return chunk_type::from_bytes(src);
            } catch (const invalid_chunk_type_error& e) {
                THROW_INVALID_CHUNK("Chunk at offset ", offset, " has an invalid type tag: ", e.what());
            }
        }
    }

    frame_decoder::header frame_decoder::decode_header(const std::byte* src,
                                                       std::uint64_t offset,
                                                       const parse_options& options) {
        const std::uint32_t length = load_be32(src);
        const chunk_type type = decode_type(src + 4, offset);

        if (length > options.max_chunk_size) {
            if (options.strict) {
                THROW_INVALID_CHUNK("Chunk ", type, " at offset ", offset, " declares length ", length,
                                    " bytes, which exceeds maximum allowed size of ",
                                    options.max_chunk_size, " bytes");
            } else if (options.on_warning) {
                options.on_warning(offset, "size_limit",
                    build_error_msg("Chunk ", type, " declares length ", length,
                                    " exceeding maximum ", options.max_chunk_size, ", reading it in full"));
            }
        }

        return {length, type};
    }

    chunk frame_decoder::finish(const header& h,
                                std::vector<std::byte> data,
                                std::uint32_t stored_crc,
                                std::uint64_t offset,
                                const parse_options& options) {
        const std::uint32_t computed = crc32_accumulator()
            .update(h.type.bytes().data(), h.type.bytes().size())
            .update(data.data(), data.size())
            .value();

        if (computed != stored_crc) {
            auto msg = build_error_msg("Chunk ", h.type, " at offset ", offset, " stores CRC ",
                                       hex32(stored_crc), " but its contents hash to ", hex32(computed));
            if (options.strict) {
                throw crc_mismatch_error(msg, computed, stored_crc);
            }
            if (options.on_warning) {
                options.on_warning(offset, "crc_mismatch", msg);
            }
        }

        // The recomputed value is kept even in lenient mode
        return chunk(h.length, h.type, std::move(data), computed);
    }

} // namespace pngchunk
