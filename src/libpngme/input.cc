//
// Created by igor on 12/08/2025.
//

#include <algorithm>

#include "input.hh"

namespace pngme {
    reader::reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        THROW_ERROR_IF(!data && size != 0, truncated_error, "Null buffer of size ", size);
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }
        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void reader::read_exact(void* dst, std::size_t size, const char* what) {
        THROW_ERROR_IF(size > remaining(), truncated_error,
                       "Unexpected end of data reading ", what, " at offset ", m_position,
                       ": need ", size, " bytes, ", remaining(), " available");
        read(dst, size);
    }

    std::vector<std::byte> reader::read_exact(std::size_t size, const char* what) {
        THROW_ERROR_IF(size > remaining(), truncated_error,
                       "Unexpected end of data reading ", what, " at offset ", m_position,
                       ": need ", size, " bytes, ", remaining(), " available");
        std::vector<std::byte> buffer(m_data + m_position, m_data + m_position + size);
        m_position += size;
        return buffer;
    }

    chunk_type reader::read_chunk_type() {
        std::array<std::byte, chunk_type::size> data;
        read_exact(data.data(), data.size(), "chunk type");
        return chunk_type::from_bytes(data);
    }
}
