//
// Blocking reader over std::istream
//

#include <istream>
#include <algorithm>
#include <array>

#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include "input.hh"

namespace pngchunk {

    // Payloads are read in blocks so a bogus length cannot force a huge
    // allocation before the stream runs dry
    static constexpr std::size_t read_block_size = 64 * 1024;

    reader::reader(std::istream& is) : m_stream(is) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        return bytes_read;
    }

    std::vector<std::byte> reader::read_exact(std::size_t size) {
        std::vector<std::byte> buffer;
        while (buffer.size() < size) {
            const std::size_t have = buffer.size();
            const std::size_t want = std::min(read_block_size, size - have);
            buffer.resize(have + want);

            std::size_t actual = read(buffer.data() + have, want);
            THROW_IO_IF(actual != want, "Unexpected end of stream: requested ", size,
                        " bytes, got ", have + actual);
        }
        return buffer;
    }

    std::uint32_t reader::read_be32() {
        std::array<std::byte, 4> buff;
        std::size_t actual = read(buff.data(), buff.size());
        THROW_IO_IF(actual != buff.size(), "Unexpected end of stream: failed to read 4 bytes, got ", actual);
        return load_be32(buff.data());
    }

    std::uint64_t reader::position() const {
        std::streampos pos = const_cast<std::istream&>(m_stream).tellg();
        if (pos == std::streampos(-1)) {
            return 0;
        }
        return static_cast<std::uint64_t>(pos);
    }
}
