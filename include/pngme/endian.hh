//
// Created by igor on 10/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>

namespace pngme {
    // Every integer field of a chunk is big-endian (network order)

    inline std::uint32_t load_be32(const std::byte* p) {
        return (std::to_integer<std::uint32_t>(p[0]) << 24) |
               (std::to_integer<std::uint32_t>(p[1]) << 16) |
               (std::to_integer<std::uint32_t>(p[2]) << 8) |
               std::to_integer<std::uint32_t>(p[3]);
    }

    inline void store_be32(std::byte* p, std::uint32_t v) {
        p[0] = std::byte((v >> 24) & 0xFF);
        p[1] = std::byte((v >> 16) & 0xFF);
        p[2] = std::byte((v >> 8) & 0xFF);
        p[3] = std::byte(v & 0xFF);
    }
}
