//
// Created by igor on 10/08/2025.
//

#pragma once

#include <cstdint>
#include <type_traits>

#include <pngme/pngme_config.h>

namespace pngme {
    // Platform endianness detection using CMake-generated config
#if LIBPNGME_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    // Byte swapping functions
    inline uint16_t swap16(uint16_t x) {
        return static_cast<uint16_t>((x << 8) | (x >> 8));
    }

    inline uint32_t swap32(uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // PNG stores every multi-byte integer in network (big-endian) order
    inline uint16_t swap16be(uint16_t x) {
        return is_big_endian ? x : swap16(x);
    }

    inline uint32_t swap32be(uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    template<typename T>
    struct is_byte_swappable {
        static constexpr bool value =
            std::is_integral_v <T> && (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4);
    };

    template<typename T>
    inline constexpr bool is_byte_swappable_v = is_byte_swappable <T>::value;

    // Convert between native and big-endian representation
    template<typename T>
    T to_big_endian(T x) {
        static_assert(is_byte_swappable_v <T>,
                      "to_big_endian only supports integral types of 1, 2 or 4 bytes");

        if constexpr (sizeof(T) == 1) {
            return x;
        } else if constexpr (sizeof(T) == 2) {
            return static_cast <T>(swap16be(static_cast <uint16_t>(x)));
        } else {
            return static_cast <T>(swap32be(static_cast <uint32_t>(x)));
        }
    }

    template<typename T>
    T from_big_endian(T x) {
        // the swap is its own inverse
        return to_big_endian(x);
    }
}
