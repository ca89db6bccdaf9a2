/**
 * @file byte_order.hh
 * @brief Byte order (endianness) selection for reading/writing multi-byte values
 */

#pragma once

#include "endian.hh"

namespace pngmsg {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        big ///< Big-endian (network order, used by PNG for all integers)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }
}
