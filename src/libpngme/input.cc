//
// Created by igor on 12/08/2025.
//

#include <algorithm>
#include <istream>

#include "input.hh"

namespace pngme {
    // reader_base implementation
    std::vector<std::byte> reader_base::read_exact(std::size_t size) {
        std::vector<std::byte> buffer;
        std::size_t total = 0;
        while (total < size) {
            std::size_t n = std::min(size - total, block_size);
            buffer.resize(total + n);
            std::size_t actual = read(buffer.data() + total, n);
            total += actual;
            THROW_PARSE_IF(actual != n, truncated,
                           "Unexpected end of data at offset ", tell(), ": requested ", size,
                           " bytes, got ", total);
        }
        return buffer;
    }

    std::uint32_t reader_base::read_be32() {
        std::byte buff[4];
        std::size_t actual = read(buff, 4);
        THROW_PARSE_IF(actual != 4, truncated,
                       "Unexpected end of data at offset ", tell(), ": needed 4 bytes, got ", actual);
        return load_be32(buff);
    }

    chunk_type reader_base::read_chunk_type() {
        chunk_type::bytes_t data;
        std::size_t actual = read(data.data(), 4);
        THROW_PARSE_IF(actual != 4, truncated, "Failed to read chunk type at offset ", tell());
        return chunk_type::from_bytes(data);
    }

    // memory_reader implementation
    memory_reader::memory_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)),
          m_size(size),
          m_position(0) {
        THROW_IO_IF(!m_data && size > 0, "Null buffer of size ", size);
    }

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        std::size_t n = std::min(size, remaining());
        if (n > 0) {
            std::memcpy(dst, current(), n);
            m_position += n;
        }
        return n;
    }

    // stream_reader implementation
    stream_reader::stream_reader(std::istream& is)
        : m_stream(is),
          m_position(0) {}

    std::size_t stream_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        if (m_stream.eof()) {
            return 0;
        }
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        auto bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        m_position += bytes_read;
        return bytes_read;
    }
}
