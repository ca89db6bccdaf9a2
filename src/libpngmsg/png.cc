//
// PNG document parsing, serialization and chunk lookup.
//

#include <pngmsg/png.hh>
#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/exceptions.hh>

#include <algorithm>
#include <cstring>
#include <ostream>
#include <string>
#include <utility>

namespace pngmsg {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        THROW_PARSE_IF(size < standard_header.size(), parse_errc::invalid_signature,
                       "Invalid PNG: file is ", size, " bytes long, too short for the ",
                       standard_header.size(), "-byte signature");
        THROW_PARSE_UNLESS(std::memcmp(data, standard_header.data(), standard_header.size()) == 0,
                           parse_errc::invalid_signature,
                           "Invalid PNG: signature does not match");

        png result;
        chunk_iterator it(data, size, standard_header.size(), options);
        while (it.has_next()) {
            result.m_chunks.push_back(std::move(*it.current().record));
            it.next();
        }
        return result;
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png::remove_chunk(std::string_view code) {
        auto pos = find(code);
        if (pos == m_chunks.end()) {
            throw chunk_not_found_error(std::string(code), build_error_msg(
                "Could not find a chunk with code '", code, "'"));
        }

        auto mutable_pos = m_chunks.begin() + (pos - m_chunks.cbegin());
        chunk removed = std::move(*mutable_pos);
        m_chunks.erase(mutable_pos);
        return removed;
    }

    const chunk* png::chunk_by_type(std::string_view code) const {
        auto pos = find(code);
        return pos == m_chunks.end() ? nullptr : &*pos;
    }

    std::vector<chunk>::const_iterator png::find(std::string_view code) const {
        return std::find_if(m_chunks.begin(), m_chunks.end(), [code](const chunk& c) {
            return c.type().to_string() == code;
        });
    }

    std::vector<std::byte> png::to_bytes() const {
        std::size_t total = standard_header.size();
        for (const auto& c : m_chunks) {
            total += c.size_on_disk();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        for (auto b : standard_header) {
            out.push_back(static_cast<std::byte>(b));
        }
        for (const auto& c : m_chunks) {
            auto bytes = c.to_bytes();
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        for (const auto& c : p.chunks()) {
            os << c.type() << "\n";
            os << c;
        }
        return os;
    }

} // namespace pngmsg
