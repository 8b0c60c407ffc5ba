//
// Created by igor on 10/08/2025.
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace pngme {

    namespace {
        std::string describe_bytes(const std::array<std::byte, chunk_type::size>& bytes) {
            std::ostringstream os;
            os << '\'';
            for (auto b : bytes) {
                auto c = std::to_integer<unsigned char>(b);
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    // Escape non-printable characters
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c) << std::dec;
                }
            }
            os << '\'';
            return os.str();
        }
    }

    std::optional<chunk_type> chunk_type::validated(const std::array<std::byte, size>& bytes) noexcept {
        if (!std::all_of(bytes.begin(), bytes.end(), is_chunk_type_letter)) {
            return std::nullopt;
        }
        return chunk_type(bytes);
    }

    chunk_type chunk_type::from_bytes(const std::array<std::byte, size>& bytes) {
        auto result = validated(bytes);
        THROW_ERROR_UNLESS(result, invalid_chunk_type,
                           "Invalid chunk type ", describe_bytes(bytes),
                           ": every byte must be an ASCII letter");
        return *result;
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        std::array<std::byte, size> bytes;
        std::memcpy(bytes.data(), data, size);
        return from_bytes(bytes);
    }

    chunk_type chunk_type::from_string(std::string_view text) {
        THROW_ERROR_IF(text.size() != size, invalid_chunk_type,
                       "Invalid chunk type '", text, "': expected ", size,
                       " characters, got ", text.size());
        return from_bytes(text.data());
    }

    std::optional<chunk_type> chunk_type::try_parse(std::string_view text) noexcept {
        if (text.size() != size) {
            return std::nullopt;
        }
        std::array<std::byte, size> bytes;
        std::memcpy(bytes.data(), text.data(), size);
        return validated(bytes);
    }
}
