//
// Created by igor on 14/08/2025.
//

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <utility>

#include <pngme/chunk.hh>
#include <pngme/crc.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>

#include "input.hh"

namespace pngme {
    namespace {
        constexpr std::size_t max_rendered_bytes = 64;

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        std::uint32_t checksum(const chunk_type& type, const std::vector<std::byte>& data) {
            std::uint32_t crc = crc32(type.bytes().data(), 4);
            return crc32_update(crc, data.data(), data.size());
        }

        // Printable text: valid UTF-8 where tab, CR and LF are the only control
        // characters. C0 controls and DEL are single bytes, C1 controls
        // (U+0080 to U+009F) are encoded as 0xC2 followed by 0x80 to 0x9F.
        bool is_printable_text(const std::vector<std::byte>& data) {
            if (find_invalid_utf8(data.data(), data.size())) {
                return false;
            }
            for (std::size_t i = 0; i < data.size(); i++) {
                auto c = std::to_integer<unsigned char>(data[i]);
                if ((c < 0x20 && c != '\t' && c != '\n' && c != '\r') || c == 0x7F) {
                    return false;
                }
                if (c == 0xC2 && std::to_integer<unsigned char>(data[i + 1]) <= 0x9F) {
                    return false;
                }
            }
            return true;
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(0),
          m_type(type),
          m_data(std::move(data)),
          m_crc(0) {
        if (m_data.size() > std::numeric_limits<std::uint32_t>::max()) {
            THROW_FORMAT(format_error, "Payload of chunk ", m_type, " is too large: ", m_data.size(), " bytes");
        }
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = checksum(m_type, m_data);
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length),
          m_type(type),
          m_data(std::move(data)),
          m_crc(crc) {}

    chunk chunk::decode(reader_base& in, std::uint64_t base_offset, const parse_options& options) {
        auto length = in.read_be32();
        if (length > options.max_chunk_size) {
            auto msg = build_error_msg("Chunk at offset ", base_offset, " declares ", length,
                                       " bytes of data, limit is ", options.max_chunk_size);
            if (options.strict) {
                throw parse_error(parse_error::reason_t::size_limit, msg);
            }
            warn(options, base_offset, "size_limit", msg);
        }

        auto type = in.read_chunk_type();
        auto data = in.read_exact(length);
        auto stored = in.read_be32();

        auto computed = checksum(type, data);
        if (stored != computed) {
            std::ostringstream os;
            os << std::hex << std::setfill('0')
               << "CRC mismatch in chunk " << type << " at offset " << std::dec << base_offset
               << std::hex << ": stored 0x" << std::setw(8) << stored
               << ", computed 0x" << std::setw(8) << computed;
            throw crc_mismatch_error(stored, computed, os.str());
        }

        if (!type.is_valid()) {
            auto msg = build_error_msg("Chunk at offset ", base_offset, " has invalid type ", type);
            THROW_PARSE_IF(options.require_valid_type, invalid_type, msg);
            warn(options, base_offset, "invalid_type", msg);
        }

        return chunk(length, type, std::move(data), computed);
    }

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        memory_reader in(data, size);

        THROW_PARSE_IF(size < overhead, too_short,
                       "Chunk needs at least ", overhead, " bytes, got ", size);

        // Check the declared length against the buffer before touching the payload
        std::uint32_t declared = load_be32(in.current());
        std::uint64_t needed = std::uint64_t(declared) + 8;
        std::uint64_t available = size - 4;
        THROW_PARSE_IF(available < needed, truncated,
                       "Chunk declares ", declared, " bytes of data but only ", available - 8,
                       " are available");

        chunk result = decode(in, 0, options);
        if (in.remaining() > 0) {
            warn(options, result.encoded_size(), "trailing_data",
                 build_error_msg(in.remaining(), " bytes follow chunk ", result.type()));
        }
        return result;
    }

    std::optional<chunk> chunk::read(std::istream& is, const parse_options& options) {
        using traits = std::istream::traits_type;
        if (traits::eq_int_type(is.peek(), traits::eof())) {
            THROW_IO_UNLESS(is.eof() && !is.bad(), "Stream in bad state");
            return std::nullopt;
        }

        std::uint64_t base_offset = 0;
        auto pos = is.tellg();
        if (pos != std::streampos(-1)) {
            base_offset = static_cast<std::uint64_t>(std::streamoff(pos));
        } else {
            is.clear(is.rdstate() & ~std::ios::failbit);
        }

        stream_reader in(is);
        return decode(in, base_offset, options);
    }

    std::string chunk::data_as_string() const {
        if (auto offset = find_invalid_utf8(m_data.data(), m_data.size())) {
            throw utf8_error(*offset, build_error_msg("Data of chunk ", m_type,
                                                      " is not valid UTF-8 at offset ", *offset));
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::as_bytes() const {
        std::vector<std::byte> out(encoded_size());
        store_be32(out.data(), m_length);
        m_type.to_bytes(out.data() + 4);
        if (!m_data.empty()) {
            std::memcpy(out.data() + 8, m_data.data(), m_data.size());
        }
        store_be32(out.data() + 8 + m_data.size(), m_crc);
        return out;
    }

    void chunk::write(std::ostream& os) const {
        auto bytes = as_bytes();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(os.good(), "Failed to write chunk ", m_type, " (", bytes.size(), " bytes)");
    }

    std::string chunk::to_string() const {
        std::ostringstream os;
        os << "chunk " << m_type << " length=" << m_length
           << " crc=0x" << std::hex << std::setfill('0') << std::setw(8) << m_crc << std::dec
           << " data=";

        std::size_t shown = std::min(m_data.size(), max_rendered_bytes);
        if (is_printable_text(m_data)) {
            // Do not cut a multi-byte sequence in half
            while (shown < m_data.size() && (std::to_integer<unsigned>(m_data[shown]) & 0xC0) == 0x80) {
                shown--;
            }
            os << '"';
            for (std::size_t i = 0; i < shown; i++) {
                auto c = std::to_integer<char>(m_data[i]);
                switch (c) {
                    case '"': os << "\\\""; break;
                    case '\\': os << "\\\\"; break;
                    case '\n': os << "\\n"; break;
                    case '\r': os << "\\r"; break;
                    case '\t': os << "\\t"; break;
                    default: os << c;
                }
            }
            os << '"';
        } else {
            os << '<' << std::hex << std::setfill('0');
            for (std::size_t i = 0; i < shown; i++) {
                if (i > 0) {
                    os << ' ';
                }
                os << std::setw(2) << std::to_integer<unsigned>(m_data[i]);
            }
            os << std::dec << '>';
        }
        if (shown < m_data.size()) {
            os << "...";
        }
        return os.str();
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        return os << c.to_string();
    }

    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto lead = std::to_integer<unsigned>(data[i]);
            std::size_t extra;
            std::uint32_t cp;
            std::uint32_t min_cp;
            if (lead < 0x80) {
                i++;
                continue;
            } else if ((lead & 0xE0) == 0xC0) {
                extra = 1;
                cp = lead & 0x1F;
                min_cp = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                extra = 2;
                cp = lead & 0x0F;
                min_cp = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                extra = 3;
                cp = lead & 0x07;
                min_cp = 0x10000;
            } else {
                return i;
            }

            if (size - i <= extra) {
                return i;
            }
            for (std::size_t k = 1; k <= extra; k++) {
                auto cont = std::to_integer<unsigned>(data[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    return i;
                }
                cp = (cp << 6) | (cont & 0x3F);
            }

            // Overlong forms, UTF-16 surrogates and values past U+10FFFF
            if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                return i;
            }
            i += extra + 1;
        }
        return std::nullopt;
    }
}
