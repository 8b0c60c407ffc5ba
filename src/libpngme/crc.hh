//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngme/chunk_type.hh>

namespace pngme {
    // CRC-32/ISO-HDLC over the type bytes followed by the chunk data
    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size);
}
