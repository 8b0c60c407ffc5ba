//
// Created by igor on 14/08/2025.
//

#include <limits>
#include <ostream>

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>

#include "chunk_io.hh"
#include "crc.hh"
#include "utf8.hh"

namespace pngme {

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(0), m_type(type), m_data(std::move(data)), m_crc(0) {
        THROW_ERROR_IF(m_data.size() > std::numeric_limits<std::uint32_t>::max(), chunk_too_large,
                       "Chunk '", m_type, "' data of ", m_data.size(),
                       " bytes does not fit a 32-bit length");
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = chunk_crc(m_type, m_data.data(), m_data.size());
    }

    chunk read_chunk(reader& in, const parse_options& options) {
        const auto start = in.tell();

        auto length = in.read<std::uint32_t>("chunk length");
        auto type = in.read_chunk_type();

        // A short buffer is reported as truncation whatever the length limit
        THROW_ERROR_IF(in.remaining() < std::uint64_t{length} + 4, truncated_error,
                       "Unexpected end of data reading chunk data at offset ", in.tell(),
                       ": need ", length, " bytes and a 4-byte crc, ", in.remaining(), " available");

        if (length > options.max_chunk_size) {
            if (options.strict) {
                THROW_ERROR(chunk_too_large,
                            "Chunk '", type, "' at offset ", start, " has length ", length,
                            " bytes, which exceeds maximum allowed size of ",
                            options.max_chunk_size, " bytes");
            } else if (options.on_warning) {
                options.on_warning(start, "size_limit",
                    build_error_msg("Chunk '", type, "' length ", length,
                                    " exceeds maximum ", options.max_chunk_size));
            }
        }
        auto data = in.read_exact(length, "chunk data");
        auto stored_crc = in.read<std::uint32_t>("chunk crc");

        chunk result(type, std::move(data));
        THROW_ERROR_IF(result.crc() != stored_crc, checksum_mismatch,
                       "Chunk '", type, "' at offset ", start, " has CRC ", stored_crc,
                       " but its contents give ", result.crc());

        if (!type.is_valid() && options.on_warning) {
            options.on_warning(start, "reserved_bit",
                build_error_msg("Chunk '", type, "' has the reserved bit set"));
        }
        return result;
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        // Only the 32-bit length field bounds a standalone chunk
        parse_options options;
        options.max_chunk_size = std::numeric_limits<std::uint32_t>::max();

        reader in(data, size);
        return read_chunk(in, options);
    }

    chunk chunk::parse(const std::vector<std::byte>& data) {
        return parse(data.data(), data.size());
    }

    std::string chunk::data_as_string() const {
        THROW_ERROR_UNLESS(is_valid_utf8(m_data.data(), m_data.size()), encoding_error,
                           "Chunk '", m_type, "' data is not valid UTF-8");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    void chunk::write_to(std::vector<std::byte>& out) const {
        writer w(out);
        w.write(m_length);
        w.write(m_type);
        w.write(m_data.data(), m_data.size());
        w.write(m_crc);
    }

    std::vector<std::byte> chunk::as_bytes() const {
        std::vector<std::byte> out;
        out.reserve(serialized_size());
        write_to(out);
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        return os << "Chunk (Type: " << c.type() << "; CRC: " << c.crc()
                  << "; Length: " << c.length() << ")";
    }
}
