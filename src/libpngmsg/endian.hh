//
// Host byte order detection and 32-bit byte swapping.
//

#pragma once

#include <cstdint>
#include <type_traits>

#include "pngmsg_config.h"

namespace pngmsg {
    // Platform endianness detection using CMake-generated config
#if PNGMSG_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    // Byte swapping functions
    inline uint32_t swap32(uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    template<typename T>
    struct is_byte_swappable {
        static constexpr bool value =
            std::is_integral_v<T> && (sizeof(T) == 1 || sizeof(T) == 4);
    };

    template<typename T>
    inline constexpr bool is_byte_swappable_v = is_byte_swappable<T>::value;

    // Generic swap_byte_order implementation
    template<typename T>
    T swap_byte_order(T x) noexcept {
        static_assert(is_byte_swappable_v<T>,
                      "swap_byte_order only supports integral types of 1 or 4 bytes");

        if constexpr (sizeof(T) == 1) {
            return x;
        } else {
            return static_cast<T>(swap32(static_cast<uint32_t>(x)));
        }
    }
}
