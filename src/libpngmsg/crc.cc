//
// CRC-32 via zlib. zlib's crc32 is the ISO-HDLC variant PNG uses.
//

#include <pngmsg/crc.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngmsg {

    namespace {
        uLong update(uLong crc, const std::byte* data, std::size_t size) {
            // zlib takes a uInt length, feed large buffers in slices
            constexpr std::size_t max_slice = std::numeric_limits<uInt>::max();
            while (size > 0) {
                auto slice = std::min(size, max_slice);
                crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(slice));
                data += slice;
                size -= slice;
            }
            return crc;
        }
    }

    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = ::crc32(0L, Z_NULL, 0);
        crc = update(crc, reinterpret_cast<const std::byte*>(type.bytes().data()), chunk_type::size);
        crc = update(crc, data, size);
        return static_cast<std::uint32_t>(crc);
    }

} // namespace pngmsg
