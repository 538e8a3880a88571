//
// Created by igor on 10/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

#include <pngme/pngme_config.h>

namespace pngme {
    // Platform endianness detection using CMake-generated config
#if PNGME_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    // Byte swapping functions
    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // PNG stores every multi-byte integer in network (big-endian) order
    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // Read a big-endian u32 from unaligned memory
    inline std::uint32_t load_be32(const void* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }

    // Write a big-endian u32 to unaligned memory
    inline void store_be32(void* dst, std::uint32_t value) {
        value = swap32be(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
