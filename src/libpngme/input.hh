//
// Created by igor on 12/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <array>
#include <vector>

#include <pngme/exceptions.hh>
#include <pngme/endian.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    // Cursor over a caller-owned byte range. Short reads throw truncated_error.
    class reader {
        public:
            reader(const void* data, std::size_t size);

            // Copies up to size bytes, returns the number copied
            std::size_t read(void* dst, std::size_t size);

            void read_exact(void* dst, std::size_t size, const char* what);
            std::vector<std::byte> read_exact(std::size_t size, const char* what);

            // Big-endian integer
            template<typename T>
            T read(const char* what) {
                T value;
                read_exact(&value, sizeof(T), what);
                return from_big_endian(value);
            }

            chunk_type read_chunk_type();

            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Appends big-endian fields to a growing buffer
    class writer {
        public:
            explicit writer(std::vector<std::byte>& out) : m_out(out) {}

            void write(const void* src, std::size_t size) {
                auto p = static_cast<const std::byte*>(src);
                m_out.insert(m_out.end(), p, p + size);
            }

            template<typename T>
            void write(T value) {
                T be = to_big_endian(value);
                write(&be, sizeof(T));
            }

            void write(const chunk_type& type) {
                write(type.bytes().data(), chunk_type::size);
            }

        private:
            std::vector<std::byte>& m_out;
    };
}
