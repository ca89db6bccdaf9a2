//
// Message-level operations on whole PNG files.
//

#include <pngmsg/messages.hh>
#include <pngmsg/png.hh>

#include <sstream>
#include <utility>

#include "utf8.hh"

namespace pngmsg {

    std::vector<std::byte> encode_message(const std::vector<std::byte>& file,
                                          std::string_view code,
                                          std::string_view message,
                                          const parse_options& options) {
        auto type = chunk_type::from_string(code);
        auto doc = png::parse(file, options);

        auto* first = reinterpret_cast<const std::byte*>(message.data());
        doc.append_chunk(chunk(type, std::vector<std::byte>(first, first + message.size())));
        return doc.to_bytes();
    }

    std::optional<std::string> decode_message(const std::vector<std::byte>& file,
                                              std::string_view code,
                                              const parse_options& options) {
        auto doc = png::parse(file, options);
        const chunk* c = doc.chunk_by_type(code);
        if (!c) {
            return std::nullopt;
        }
        return c->data_as_string();
    }

    removed_message remove_message(const std::vector<std::byte>& file,
                                   std::string_view code,
                                   const parse_options& options) {
        auto doc = png::parse(file, options);
        chunk removed = doc.remove_chunk(code);

        removed_message result{doc.to_bytes(), std::nullopt};
        const auto& payload = removed.data();
        if (!find_invalid_utf8(payload.data(), payload.size())) {
            result.message = removed.data_as_string();
        }
        return result;
    }

    std::string list_chunks(const std::vector<std::byte>& file, const parse_options& options) {
        std::ostringstream os;
        os << png::parse(file, options);
        return os.str();
    }

} // namespace pngmsg
