//
// Chunk record encoding and decoding.
//

#include <pngmsg/chunk.hh>
#include <pngmsg/crc.hh>
#include <pngmsg/exceptions.hh>

#include <ostream>
#include <stdexcept>
#include <utility>

#include "byte_io.hh"
#include "utf8.hh"

namespace pngmsg {

    namespace {
        std::uint32_t checked_length(const std::vector<std::byte>& data) {
            if (data.size() > chunk::max_length) {
                throw std::length_error("Chunk payload of " + std::to_string(data.size()) +
                                        " bytes exceeds the PNG limit of " +
                                        std::to_string(chunk::max_length) + " bytes");
            }
            return static_cast<std::uint32_t>(data.size());
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(checked_length(data)),
          m_type(type),
          m_data(std::move(data)),
          m_crc(chunk_crc(m_type, m_data.data(), m_data.size())) {
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length), m_type(type), m_data(std::move(data)), m_crc(crc) {
    }

    chunk chunk::parse(const std::byte* data, std::size_t size) {
        reader in(data, size);

        auto length = in.read<std::uint32_t>(byte_order::big, parse_errc::no_data_length);

        std::array<std::uint8_t, chunk_type::size> code{};
        THROW_PARSE_IF(in.read(code.data(), code.size()) != code.size(), parse_errc::no_chunk_type,
                       "Invalid chunk: could not find chunk type at offset ", length_field_size);
        chunk_type type(code);

        if (in.remaining() < length) {
            throw data_length_error(length, in.remaining(), build_error_msg(
                "Invalid chunk '", type, "': the data length provided ", length,
                " is larger than the ", in.remaining(), " bytes available"));
        }
        auto payload = in.read_exact(length, parse_errc::non_matching_data_length);

        auto crc = in.read<std::uint32_t>(byte_order::big, parse_errc::no_crc);
        auto actual_crc = chunk_crc(type, payload.data(), payload.size());
        if (crc != actual_crc) {
            throw crc_error(crc, actual_crc, build_error_msg(
                "Invalid chunk '", type, "': the CRC provided ", crc,
                " is not equal to the calculated value ", actual_crc));
        }

        return chunk(length, type, std::move(payload), crc);
    }

    std::vector<std::byte> chunk::to_bytes() const {
        writer out(size_on_disk());
        out.write(m_length, byte_order::big);
        out.write(m_type.bytes().data(), chunk_type::size);
        out.write(m_data.data(), m_data.size());
        out.write(m_crc, byte_order::big);
        return out.finish();
    }

    std::string chunk::data_as_string() const {
        if (auto bad = find_invalid_utf8(m_data.data(), m_data.size())) {
            throw encoding_error(*bad, build_error_msg(
                "Chunk '", m_type, "' data is not valid UTF-8: invalid sequence at offset ", *bad));
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n";
        os << "  Length: " << c.length() << "\n";
        os << "  Type: " << c.type() << "\n";
        os << "  Data: " << c.data().size() << " bytes\n";
        os << "  Crc: " << c.crc() << "\n";
        os << "}\n";
        return os;
    }

} // namespace pngmsg
