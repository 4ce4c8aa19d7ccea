/**
 * @file chunk_type.hh
 * @brief Four byte chunk type identifier
 * @author Igor
 * @date 10/08/2025
 *
 * A chunk type is four bytes, conventionally ASCII letters. Bit 5 (0x20)
 * of each byte, the ASCII case bit, carries a property of the chunk:
 *
 * | byte | uppercase (bit clear) | lowercase (bit set) |
 * |------|-----------------------|---------------------|
 * | 0    | critical              | ancillary           |
 * | 1    | public                | private             |
 * | 2    | reserved bit valid    | reserved bit set    |
 * | 3    | unsafe to copy        | safe to copy        |
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <iosfwd>

#include <pngme/export_pngme.h>

namespace pngme {
    class PNGME_EXPORT chunk_type {
    public:
        using bytes_t = std::array<std::uint8_t, 4>;

        static constexpr std::uint8_t case_bit = 0x20;

        // Constructor from 4 individual chars, no validation
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_bytes{static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                      static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3)} {}

        // Constructor from raw bytes, no validation
        constexpr explicit chunk_type(const bytes_t& b)
            : m_bytes(b) {}

        static constexpr chunk_type from_bytes(const bytes_t& b) {
            return chunk_type(b);
        }

        // Copies 4 bytes from data
        static chunk_type from_bytes(const void* data) {
            bytes_t b;
            std::memcpy(b.data(), data, 4);
            return chunk_type(b);
        }

        /**
         * @brief Parse a chunk type from its text form
         * @param s Exactly four ASCII letters
         * @throws chunk_type_error if s is not four characters long or holds a
         *         character that is not an ASCII letter
         */
        static chunk_type from_string(std::string_view s);

        [[nodiscard]] constexpr const bytes_t& bytes() const { return m_bytes; }

        [[nodiscard]] std::string to_string() const {
            return std::string(m_bytes.begin(), m_bytes.end());
        }

        // Byte i of the identifier, i must be 0 to 3
        [[nodiscard]] constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        [[nodiscard]] constexpr bool is_critical() const { return is_upper_at(0); }
        [[nodiscard]] constexpr bool is_public() const { return is_upper_at(1); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return is_upper_at(2); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return !is_upper_at(3); }

        // All four bytes are ASCII letters and the reserved bit is clear
        [[nodiscard]] bool is_valid() const;

        // Same letters, ignoring ASCII case
        [[nodiscard]] bool equals_ignore_case(const chunk_type& o) const;

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

    private:
        // Case bit of byte i is clear, i is one of the fixed flag positions 0 to 3
        constexpr bool is_upper_at(std::size_t i) const {
            return (m_bytes[i] & case_bit) == 0;
        }

        bytes_t m_bytes;
    };

    // Quoted, non-printable bytes escaped as \xNN
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    constexpr bool is_ascii_letter(std::uint8_t c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
