/**
 * @file chunk_type.hh
 * @brief Four-letter chunk type tag and its case-encoded properties
 */

#pragma once

#include <array>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    namespace detail {
        constexpr bool is_ascii_letter(std::uint8_t c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        inline std::string hex_byte(std::uint8_t c) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::setfill('0') << std::setw(2) << static_cast<unsigned>(c);
            return oss.str();
        }
    }

    /**
     * @class chunk_type
     * @brief A chunk type tag: exactly four ASCII letters
     *
     * The case of each letter (bit 5) carries one property of the chunk:
     *
     * | byte | uppercase        | lowercase        |
     * |------|------------------|------------------|
     * | 0    | critical         | ancillary        |
     * | 1    | public           | private          |
     * | 2    | reserved, valid  | reserved, invalid|
     * | 3    | unsafe to copy   | safe to copy     |
     *
     * Every constructor rejects a byte that is not an ASCII letter with
     * invalid_chunk_type_error. A tag with a lowercase third letter can be
     * constructed; it only fails is_valid().
     */
    class chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        // Constructor from 4 individual chars
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_bytes{ checked(c0, 0), checked(c1, 1), checked(c2, 2), checked(c3, 3) } {}

        // Constructor from raw bytes
        explicit chunk_type(const bytes_type& bytes)
            : m_bytes(bytes) {
            for (std::size_t i = 0; i < m_bytes.size(); i++) {
                THROW_INVALID_CHUNK_TYPE_IF(!detail::is_ascii_letter(m_bytes[i]),
                    "Invalid chunk type bytes: byte ", i, " is ", detail::hex_byte(m_bytes[i]),
                    ", expected an ASCII letter");
            }
        }

        // Constructor from text, must be exactly 4 letters
        explicit chunk_type(std::string_view sv)
            : m_bytes{} {
            for (std::size_t i = 0; i < sv.size(); i++) {
                auto c = static_cast<std::uint8_t>(sv[i]);
                THROW_INVALID_CHUNK_TYPE_IF(!detail::is_ascii_letter(c),
                    "Invalid chunk type string \"", sv, "\": character ", i, " (",
                    detail::hex_byte(c), ") is not an ASCII letter");
            }
            THROW_INVALID_CHUNK_TYPE_IF(sv.size() != m_bytes.size(),
                "Invalid chunk type string \"", sv, "\": expected 4 bytes, got ", sv.size());
            std::memcpy(m_bytes.data(), sv.data(), m_bytes.size());
        }

        // Constructor from C-string
        chunk_type(const char* str) : chunk_type(std::string_view(str)) {}

        // Constructor from 4 raw bytes in memory
        static chunk_type from_bytes(const void* data) {
            bytes_type bytes;
            std::memcpy(bytes.data(), data, bytes.size());
            return chunk_type(bytes);
        }

        // Constructor from text
        static chunk_type from_string(std::string_view sv) {
            return chunk_type(sv);
        }

        [[nodiscard]] const bytes_type& bytes() const noexcept { return m_bytes; }

        // Ancillary chunks may be ignored by a decoder that does not know them
        [[nodiscard]] constexpr bool is_critical() const noexcept {
            return (m_bytes[0] & case_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_public() const noexcept {
            return (m_bytes[1] & case_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept {
            return (m_bytes[2] & case_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept {
            return (m_bytes[3] & case_bit) != 0;
        }

        [[nodiscard]] bool is_valid() const noexcept {
            return std::all_of(m_bytes.begin(), m_bytes.end(), detail::is_ascii_letter) &&
                   is_reserved_bit_valid();
        }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), m_bytes.size()};
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), m_bytes.size());
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

        // Stream output, quoted
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << '\'' << t.to_string() << '\'';
        }

    private:
        static constexpr std::uint8_t case_bit = 0x20;

        static constexpr std::uint8_t checked(char c, std::size_t index) {
            return detail::is_ascii_letter(static_cast<std::uint8_t>(c))
                ? static_cast<std::uint8_t>(c)
                : throw invalid_chunk_type_error(build_error_msg(
                      "Invalid chunk type bytes: byte ", index, " is ",
                      detail::hex_byte(static_cast<std::uint8_t>(c)), ", expected an ASCII letter"));
        }

        bytes_type m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for tags known at compile time
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw invalid_chunk_type_error("Chunk type literal must be exactly 4 characters");
        }
        return { str[0], str[1], str[2], str[3] };
    }

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
