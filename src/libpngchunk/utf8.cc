#include "utf8.hh"

#include <cstdint>

namespace pngchunk::detail {

    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            const auto lead = std::to_integer<std::uint8_t>(data[i]);
            if (lead < 0x80) {
                i++;
                continue;
            }

            std::size_t trailing;
            std::uint32_t cp;
            std::uint32_t min_cp;
            if ((lead & 0xE0) == 0xC0) {
                trailing = 1;
                cp = lead & 0x1F;
                min_cp = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                trailing = 2;
                cp = lead & 0x0F;
                min_cp = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                trailing = 3;
                cp = lead & 0x07;
                min_cp = 0x10000;
            } else {
                return i;
            }

            if (size - i - 1 < trailing) {
                return i;  // truncated sequence
            }

            for (std::size_t k = 1; k <= trailing; k++) {
                const auto c = std::to_integer<std::uint8_t>(data[i + k]);
                if ((c & 0xC0) != 0x80) {
                    return i;
                }
                cp = (cp << 6) | (c & 0x3F);
            }

            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return i;
            }
            i += trailing + 1;
        }
        return std::nullopt;
    }

} // namespace pngchunk::detail
