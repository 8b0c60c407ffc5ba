/**
 * @file chunk.hh
 * @brief A single length-prefixed, CRC-protected PNG chunk
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief Validated PNG chunk: type code, opaque data and its CRC
     *
     * On disk a chunk is laid out as
     * @code
     *   length (u32 BE) | type (4 bytes) | data (length bytes) | crc (u32 BE)
     * @endcode
     * where crc is the CRC-32 of the type bytes followed by the data.
     * The CRC is always computed from the contents, so a chunk is valid by
     * construction. Chunks are immutable; edits replace the whole chunk.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Bytes taken by the length, type and crc fields
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk and compute its CRC
         * @param type Chunk type code
         * @param data Chunk data
         * @throws chunk_too_large if data does not fit the 32-bit length field
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Parse one chunk from the start of a byte range
         *
         * Bytes following the chunk are ignored.
         *
         * @throws truncated_error if a field runs past the end of the range
         * @throws invalid_chunk_type if the type code is not four ASCII letters
         * @throws checksum_mismatch if the stored CRC disagrees with the contents
         */
        static chunk parse(const void* data, std::size_t size);
        static chunk parse(const std::vector<std::byte>& data);

        /// Number of data bytes
        [[nodiscard]] std::uint32_t length() const { return m_length; }

        [[nodiscard]] const chunk_type& type() const { return m_type; }

        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Size of as_bytes(), i.e. length() + 12
        [[nodiscard]] std::size_t serialized_size() const { return m_length + overhead; }

        /**
         * @brief Interpret the data as text
         * @throws encoding_error if the data is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// The chunk in its on-disk form
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        // Appends the on-disk form to out
        void write_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const {
            return m_length == o.m_length && m_type == o.m_type &&
                   m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    /// One-line summary: "Chunk (Type: RuSt; CRC: 2882656334; Length: 42)"
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
