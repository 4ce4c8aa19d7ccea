//
// Created by igor on 10/08/2025.
//

#include <algorithm>
#include <iomanip>
#include <ostream>

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

namespace pngme {
    chunk_type chunk_type::from_string(std::string_view s) {
        if (s.size() != 4) {
            THROW_FORMAT(chunk_type_error, "Invalid chunk type '", s, "': expected 4 characters, got ", s.size());
        }
        bytes_t b;
        for (std::size_t i = 0; i < 4; i++) {
            auto c = static_cast<std::uint8_t>(s[i]);
            if (!is_ascii_letter(c)) {
                THROW_FORMAT(chunk_type_error, "Invalid chunk type '", s, "': character at position ", i,
                             " is not an ASCII letter");
            }
            b[i] = c;
        }
        return chunk_type(b);
    }

    bool chunk_type::is_valid() const {
        return std::all_of(m_bytes.begin(), m_bytes.end(), is_ascii_letter) && is_reserved_bit_valid();
    }

    bool chunk_type::equals_ignore_case(const chunk_type& o) const {
        for (std::size_t i = 0; i < 4; i++) {
            auto a = m_bytes[i];
            auto b = o.m_bytes[i];
            if (a == b) {
                continue;
            }
            // Only letters fold, the case bit alone must differ
            if (!is_ascii_letter(a) || !is_ascii_letter(b) || (a | case_bit) != (b | case_bit)) {
                return false;
            }
        }
        return true;
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << '\'';
        for (auto c : t.bytes()) {
            if (c >= 32 && c <= 126) {
                os << static_cast<char>(c);
            } else {
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(c);
                os.flags(flags);
            }
        }
        os << '\'';
        os.flags(flags);
        os.fill(fill);
        return os;
    }
}
