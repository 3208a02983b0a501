/**
 * @file endian.hh
 * @brief Big-endian 32-bit field access for the chunk length and CRC
 * @author Igor
 * @date 10/08/2025
 */

#pragma once

#include <cstdint>
#include <cstring>

#include <pngc/pngc_config.h>

namespace pngc {
    // Host byte order from the CMake-generated config
#if PNGC_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Converts between host and network order (its own inverse)
    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    inline void store_be32(void* dst, std::uint32_t value) {
        value = swap32be(value);
        std::memcpy(dst, &value, sizeof(value));
    }

    inline std::uint32_t load_be32(const void* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }
}
