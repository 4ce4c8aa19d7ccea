//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <vector>
#include <cstring>

#include <pngme/exceptions.hh>
#include <pngme/endian.hh>
#include <pngme/chunk_type.hh>

namespace pngme {
    // Base reader interface
    class reader_base {
        public:
            virtual ~reader_base() = default;

            // Reads up to size bytes, returns the number actually read
            virtual std::size_t read(void* dst, std::size_t size) = 0;
            virtual std::uint64_t tell() const = 0;

            // Reads exactly size bytes, throws parse_error(truncated) on short input.
            // Large requests are filled block by block so a bogus size fails
            // before it is fully allocated.
            std::vector<std::byte> read_exact(std::size_t size);

            // Big-endian 32 bit field, throws parse_error(truncated) on short input
            std::uint32_t read_be32();

            chunk_type read_chunk_type();

            static constexpr std::size_t block_size = 64 * 1024;
    };

    // Reads from an in-memory buffer
    class memory_reader : public reader_base {
        public:
            memory_reader(const void* data, std::size_t size);

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_position; }

            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Reads from a stream; tell() is relative to where reading started
    class stream_reader : public reader_base {
        public:
            explicit stream_reader(std::istream& is);

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_position; }

        private:
            std::istream& m_stream;
            std::uint64_t m_position;
    };
}
