//
// UTF-8 validation for chunk payloads
//

#pragma once

#include <cstddef>
#include <optional>

namespace pngchunk::detail {

    // Offset of the first byte of the first invalid sequence, nullopt if the
    // whole block is well-formed UTF-8. Overlong forms, surrogates and code
    // points above U+10FFFF are invalid.
    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size);

} // namespace pngchunk::detail
