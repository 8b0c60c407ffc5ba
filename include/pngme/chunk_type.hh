//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <pngme/export_pngme.h>

namespace pngme {
    /**
     * @class chunk_type
     * @brief Validated four-letter PNG chunk type code
     *
     * Every byte is an ASCII letter. Bit 5 of each byte carries one
     * property of the chunk (ancillary, private, reserved, safe-to-copy).
     * Instances are immutable; they can only be obtained through the
     * validating factories below.
     */
    class PNGME_EXPORT chunk_type {
    public:
        static constexpr std::size_t size = 4;

        /**
         * @brief Create from four raw bytes
         * @throws invalid_chunk_type if any byte is not an ASCII letter
         */
        static chunk_type from_bytes(const std::array<std::byte, size>& bytes);

        /**
         * @brief Create from four bytes at @p data
         * @throws invalid_chunk_type if any byte is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data);

        /**
         * @brief Create from text such as "IHDR"
         * @throws invalid_chunk_type if the text is not exactly four ASCII letters
         */
        static chunk_type from_string(std::string_view text);

        /**
         * @brief Non-throwing variant of from_string()
         * @return The type, or nullopt if @p text is not a valid type code
         */
        static std::optional<chunk_type> try_parse(std::string_view text) noexcept;

        // Raw bytes, exactly as stored
        [[nodiscard]] const std::array<std::byte, size>& bytes() const { return m_bytes; }

        // Write the four bytes to dest
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), size);
        }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), size};
        }

        // Byte 0: upper case means the chunk is critical
        [[nodiscard]] bool is_critical() const { return !lower_case_bit(0); }

        // Byte 1: upper case means the chunk is public
        [[nodiscard]] bool is_public() const { return !lower_case_bit(1); }

        // Byte 2: must be upper case in the current PNG revision
        [[nodiscard]] bool is_reserved_bit_valid() const { return !lower_case_bit(2); }

        // Byte 3: lower case means the chunk is safe to copy
        [[nodiscard]] bool is_safe_to_copy() const { return lower_case_bit(3); }

        // Only the reserved bit is checked; the letter rule holds by construction
        [[nodiscard]] bool is_valid() const { return is_reserved_bit_valid(); }

        // Byte-wise comparison, case sensitive
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os.write(reinterpret_cast<const char*>(t.m_bytes.data()), size);
        }

    private:
        explicit chunk_type(const std::array<std::byte, size>& bytes) : m_bytes(bytes) {}

        // Empty unless every byte is an ASCII letter
        static std::optional<chunk_type> validated(const std::array<std::byte, size>& bytes) noexcept;

        [[nodiscard]] bool lower_case_bit(std::size_t i) const {
            return (m_bytes[i] & std::byte{0x20}) != std::byte{0};
        }

        std::array<std::byte, size> m_bytes;
    };

    /**
     * @brief Check the ASCII letter rule for a single byte
     */
    inline bool is_chunk_type_letter(std::byte b) {
        auto c = std::to_integer<unsigned char>(b);
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), chunk_type::size);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
