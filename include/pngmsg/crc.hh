//
// CRC-32 (ISO-HDLC, the PNG polynomial) over chunk type and data.
//

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngmsg/chunk_type.hh>
#include <pngmsg/export_pngmsg.h>

namespace pngmsg {

    // Checksum covering the type bytes followed by the payload, as stored in a chunk
    PNGMSG_EXPORT std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size);

} // namespace pngmsg
