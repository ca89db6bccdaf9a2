//
// Cursor-based reader and appending writer over in-memory byte buffers.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include <pngmsg/exceptions.hh>
#include "byte_order.hh"

namespace pngmsg {

    // Reads from a borrowed buffer; the buffer must outlive the reader
    class reader {
        public:
            reader(const std::byte* data, std::size_t size);

            // Copies up to size bytes, returns how many were copied
            std::size_t read(void* dst, std::size_t size);

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

            // Throws parse_error(on_short) when fewer than size bytes are left
            std::vector<std::byte> read_exact(std::size_t size, parse_errc on_short);

            template<typename T>
            T read(byte_order bo, parse_errc on_short) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_PARSE_IF(actual != sizeof(T), on_short,
                               "Unexpected end of data at offset ", m_position,
                               ": needed ", sizeof(T), " bytes, got ", actual);

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Appends to an owned buffer
    class writer {
        public:
            writer() = default;
            explicit writer(std::size_t reserve) { m_buffer.reserve(reserve); }

            void write(const void* src, std::size_t size);

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                write(&value, sizeof(T));
            }

            [[nodiscard]] std::vector<std::byte> finish() { return std::move(m_buffer); }

        private:
            std::vector<std::byte> m_buffer;
    };
}
