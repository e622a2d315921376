//
// Chunk construction, parsing and encoding
//

#include <pngchunk/chunk.hh>

#include <cstring>
#include <iomanip>
#include <limits>
#include <ostream>
#include <utility>

#include <pngchunk/crc.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include "frame_decoder.hh"
#include "utf8.hh"

namespace pngchunk {

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_length(0), m_type(type), m_data(std::move(data)), m_crc(0) {
        constexpr auto max_length = std::numeric_limits<std::uint32_t>::max();
        THROW_INVALID_CHUNK_IF(m_data.size() > max_length,
            "Chunk ", m_type, " payload of ", m_data.size(),
            " bytes cannot be encoded, the length field holds at most ", max_length);

        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = crc32_accumulator()
            .update(m_type.bytes().data(), m_type.bytes().size())
            .update(m_data.data(), m_data.size())
            .value();
    }

    chunk::chunk(std::uint32_t length, const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length), m_type(type), m_data(std::move(data)), m_crc(crc) {}

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        THROW_INVALID_CHUNK_IF(size < frame_overhead,
            "Chunk frame needs at least ", frame_overhead, " bytes, got ", size);

        const auto* src = static_cast<const std::byte*>(data);
        auto header = frame_decoder::decode_header(src, 0, options);

        const std::uint64_t data_end = frame_decoder::header_size + std::uint64_t(header.length);
        const std::uint64_t frame_end = data_end + frame_decoder::crc_size;
        THROW_INVALID_CHUNK_IF(size < frame_end,
            "Chunk ", header.type, " declares ", header.length, " bytes of data, frame needs ",
            frame_end, " bytes but only ", size, " are available");

        std::vector<std::byte> payload(src + frame_decoder::header_size, src + data_end);
        const std::uint32_t stored_crc = load_be32(src + data_end);

        return frame_decoder::finish(header, std::move(payload), stored_crc, 0, options);
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes) {
        return parse(bytes.data(), bytes.size(), parse_options{});
    }

    std::string chunk::data_as_text() const {
        if (auto bad = detail::find_invalid_utf8(m_data.data(), m_data.size())) {
            throw invalid_text_error(
                build_error_msg("Chunk ", m_type, " payload is not valid UTF-8: bad sequence at offset ", *bad),
                *bad);
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out(frame_size());
        serialize_to(out.data());
        return out;
    }

    void chunk::serialize_to(void* dst) const {
        auto* out = static_cast<std::byte*>(dst);
        store_be32(out, m_length);
        m_type.to_bytes(out + 4);
        if (!m_data.empty()) {
            std::memcpy(out + frame_decoder::header_size, m_data.data(), m_data.size());
        }
        store_be32(out + frame_decoder::header_size + m_data.size(), m_crc);
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        if (!detail::find_invalid_utf8(c.data().data(), c.data().size())) {
            return os.write(reinterpret_cast<const char*>(c.data().data()),
                            static_cast<std::streamsize>(c.data().size()));
        }

        // Not UTF-8, escape everything outside printable ASCII
        auto flags = os.flags();
        auto fill = os.fill();
        for (auto b : c.data()) {
            auto v = std::to_integer<unsigned>(b);
            if (v >= 32 && v <= 126) {
                os << static_cast<char>(v);
            } else {
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2) << v;
            }
        }
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngchunk
