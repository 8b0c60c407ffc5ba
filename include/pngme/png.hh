/**
 * @file png.hh
 * @brief Whole-file PNG container: signature plus ordered chunks
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief Ordered sequence of chunks behind the eight-byte PNG signature
     *
     * The container only checks structure: the signature and that every
     * chunk is well formed. Chunk order and which types appear are left
     * to the caller. Chunks keep the order they were read or appended in.
     */
    class PNGME_EXPORT png {
    public:
        /// 89 50 4E 47 0D 0A 1A 0A
        static constexpr std::array<std::byte, 8> STANDARD_HEADER = {
            std::byte{0x89}, std::byte{'P'}, std::byte{'N'}, std::byte{'G'},
            std::byte{0x0D}, std::byte{0x0A}, std::byte{0x1A}, std::byte{0x0A}
        };

        png() = default;
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete file image
         * @param data Start of the buffer
         * @param size Buffer size in bytes
         * @param options Strictness, size limit and warning callback
         * @throws bad_signature if the buffer does not start with STANDARD_HEADER
         * @throws truncated_error if the buffer ends inside a chunk
         * @throws invalid_chunk_type, checksum_mismatch, chunk_too_large
         */
        static png parse(const void* data, std::size_t size, const parse_options& options);
        static png parse(const void* data, std::size_t size);
        static png parse(const std::vector<std::byte>& data, const parse_options& options);
        static png parse(const std::vector<std::byte>& data);

        /// Add a chunk after the last one
        void append_chunk(chunk c);

        /**
         * @brief Find the first chunk whose type text equals @p type
         * @return Pointer into the container, or nullptr if there is no match
         *         or @p type is not a valid chunk type
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Remove the first chunk whose type text equals @p type
         * @return The removed chunk
         * @throws chunk_not_found if no chunk matches; the container is unchanged
         */
        chunk remove_first_chunk(std::string_view type);

        [[nodiscard]] const std::array<std::byte, 8>& header() const { return STANDARD_HEADER; }

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /// The file image: signature followed by every chunk in order
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        bool operator==(const png& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        std::vector<chunk>::const_iterator find_first(std::string_view type) const;

        std::vector<chunk> m_chunks;
    };

    /// One line per chunk, in stored order
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngme
