//
// Created by igor on 15/08/2025.
//

#include <cstdint>

#include "utf8.hh"

namespace pngme {
    namespace {
        bool is_continuation(std::uint8_t c) {
            return (c & 0xC0) == 0x80;
        }

        // Length of the sequence that starts at data, or 0 if it is malformed
        std::size_t sequence_length(const std::uint8_t* data, std::size_t size) {
            std::uint8_t c = data[0];

            if (c < 0x80) {
                return 1;
            }
            if ((c & 0xE0) == 0xC0) {
                if (size < 2 || !is_continuation(data[1])) {
                    return 0;
                }
                // overlong
                if ((c & 0x1E) == 0) {
                    return 0;
                }
                return 2;
            }
            if ((c & 0xF0) == 0xE0) {
                if (size < 3 || !is_continuation(data[1]) || !is_continuation(data[2])) {
                    return 0;
                }
                if (c == 0xE0 && (data[1] & 0x20) == 0) {
                    return 0;
                }
                std::uint32_t cp = ((c & 0x0Fu) << 12) | ((data[1] & 0x3Fu) << 6) | (data[2] & 0x3Fu);
                if (cp >= 0xD800 && cp <= 0xDFFF) {
                    return 0;
                }
                return 3;
            }
            if ((c & 0xF8) == 0xF0) {
                if (size < 4 || !is_continuation(data[1]) ||
                    !is_continuation(data[2]) || !is_continuation(data[3])) {
                    return 0;
                }
                if (c == 0xF0 && (data[1] & 0x30) == 0) {
                    return 0;
                }
                std::uint32_t cp = ((c & 0x07u) << 18) | ((data[1] & 0x3Fu) << 12) |
                                   ((data[2] & 0x3Fu) << 6) | (data[3] & 0x3Fu);
                if (cp > 0x10FFFF) {
                    return 0;
                }
                return 4;
            }
            // Invalid start byte
            return 0;
        }
    }

    bool is_valid_utf8(const std::byte* data, std::size_t size) {
        auto p = reinterpret_cast<const std::uint8_t*>(data);
        std::size_t i = 0;
        while (i < size) {
            std::size_t n = sequence_length(p + i, size - i);
            if (n == 0) {
                return false;
            }
            i += n;
        }
        return true;
    }
}
