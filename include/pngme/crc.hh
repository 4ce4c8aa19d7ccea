/**
 * @file crc.hh
 * @brief CRC-32/ISO-HDLC checksum used to protect chunk type and payload
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @brief Continue a running CRC-32 over another block of bytes
     * @param crc Value returned by a previous call (0 to start a new checksum)
     * @param data Bytes to feed, may be null when size is 0
     * @param size Number of bytes
     * @return Updated checksum
     *
     * Reflected polynomial 0xEDB88320, initial value and final xor 0xFFFFFFFF,
     * the variant shared by zlib, Ethernet and PNG.
     */
    PNGME_EXPORT std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size);

    /// CRC-32 of a single block
    inline std::uint32_t crc32(const void* data, std::size_t size) {
        return crc32_update(0, data, size);
    }

    inline std::uint32_t crc32(const std::vector<std::byte>& data) {
        return crc32_update(0, data.data(), data.size());
    }
}
