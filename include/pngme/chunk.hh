/**
 * @file chunk.hh
 * @brief Length-prefixed, typed, CRC protected chunk record
 * @author Igor
 * @date 14/08/2025
 *
 * Wire layout, all integers big-endian:
 *
 * | offset | size | field                               |
 * |--------|------|-------------------------------------|
 * | 0      | 4    | payload length N                    |
 * | 4      | 4    | chunk type                          |
 * | 8      | N    | payload                             |
 * | 8 + N  | 4    | CRC-32 over bytes [4, 8 + N)        |
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    class reader_base;

    /**
     * @class chunk
     * @brief Immutable chunk value
     *
     * A chunk is either composed from a type and payload, in which case the
     * CRC is computed once, or decoded from bytes, in which case the CRC is
     * verified before the value exists.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Size of the length, type and CRC fields together
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Compose a chunk and compute its CRC
         * @param type Chunk type, not validated
         * @param data Payload
         * @throws format_error if the payload does not fit a 32 bit length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Decode the chunk at the start of a buffer
         * @param data Encoded chunk, possibly followed by more bytes
         * @param size Size of the buffer
         * @param options Size limits, type checking and warning callback
         * @return Decoded chunk; it covers the first encoded_size() bytes
         * @throws parse_error if the buffer is too short or truncated, or is
         *         rejected by options
         * @throws crc_mismatch_error if the stored CRC is wrong
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options = {});

        static chunk parse(const std::vector<std::byte>& data, const parse_options& options = {}) {
            return parse(data.data(), data.size(), options);
        }

        /**
         * @brief Decode one chunk from a stream
         * @param is Stream positioned at a length field
         * @param options Size limits, type checking and warning callback
         * @return Decoded chunk, or std::nullopt if the stream ends before
         *         the first byte
         * @throws parse_error if the stream ends inside the chunk
         * @throws crc_mismatch_error if the stored CRC is wrong
         * @throws io_error if the stream fails
         */
        static std::optional<chunk> read(std::istream& is, const parse_options& options = {});

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Number of bytes as_bytes() produces
        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_data.size(); }

        /**
         * @brief Payload as UTF-8 text
         * @throws utf8_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Encoded chunk, the exact inverse of parse()
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        /**
         * @brief Write the encoded chunk
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        /**
         * @brief Human readable summary
         *
         * `chunk 'RuSt' length=5 crc=0x1a2b3c4d data="hello"`. The payload is
         * shown quoted when it is printable UTF-8 text, as hex bytes otherwise,
         * and cut after 64 bytes with a trailing "...".
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        static chunk decode(reader_base& in, std::uint64_t base_offset, const parse_options& options);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    /**
     * @brief Check a byte sequence for well formed UTF-8
     * @return Offset of the first invalid sequence, or std::nullopt if valid
     */
    PNGME_EXPORT std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size);

} // namespace pngme
