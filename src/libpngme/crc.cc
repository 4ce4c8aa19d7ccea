//
// Created by igor on 15/08/2025.
//

#include <limits>
#include <zlib.h>

#include <pngme/crc.hh>

namespace pngme {
    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size) {
        uLong value = crc;
        const auto* p = static_cast<const Bytef*>(data);
        // zlib takes uInt lengths, feed oversized blocks piecewise
        constexpr std::size_t max_block = std::numeric_limits<uInt>::max();
        while (size > 0) {
            auto n = static_cast<uInt>(size < max_block ? size : max_block);
            value = ::crc32(value, p, n);
            p += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(value);
    }
}
