//
// Created by igor on 15/08/2025.
//

#include <algorithm>
#include <limits>

#include <zlib.h>

#include "crc.hh"

namespace pngme {
    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(type.bytes().data()),
                    static_cast<uInt>(chunk_type::size));

        // zlib takes a uInt length; feed large payloads in pieces
        auto p = reinterpret_cast<const Bytef*>(data);
        while (size > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = crc32(crc, p, n);
            p += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(crc);
    }
}
