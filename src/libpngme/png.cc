//
// Created by igor on 15/08/2025.
//

#include <algorithm>
#include <ostream>

#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include "chunk_io.hh"
#include "input.hh"

namespace pngme {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const void* data, std::size_t size, const parse_options& options) {
        reader in(data, size);

        std::array<std::byte, 8> signature{};
        const auto got = in.read(signature.data(), signature.size());
        THROW_ERROR_IF(got != signature.size() || signature != STANDARD_HEADER, bad_signature,
                       "Not a PNG file: the first ", STANDARD_HEADER.size(),
                       " bytes are not the PNG signature (buffer size ", size, ")");

        std::vector<chunk> chunks;
        while (!in.at_end()) {
            chunks.push_back(read_chunk(in, options));

            if (!options.strict && chunks.back().type().to_string() == "IEND") {
                if (!in.at_end() && options.on_warning) {
                    options.on_warning(in.tell(), "trailing_data",
                        build_error_msg("Ignoring ", in.remaining(), " bytes after IEND"));
                }
                break;
            }
        }
        return png(std::move(chunks));
    }

    png png::parse(const void* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    png png::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    png png::parse(const std::vector<std::byte>& data) {
        return parse(data.data(), data.size(), parse_options{});
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    std::vector<chunk>::const_iterator png::find_first(std::string_view type) const {
        // Anything that is not a type code cannot match
        auto wanted = chunk_type::try_parse(type);
        if (!wanted) {
            return m_chunks.end();
        }
        return std::find_if(m_chunks.begin(), m_chunks.end(),
                            [&wanted](const chunk& c) { return c.type() == *wanted; });
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = find_first(type);
        return it == m_chunks.end() ? nullptr : &*it;
    }

    chunk png::remove_first_chunk(std::string_view type) {
        auto it = find_first(type);
        THROW_ERROR_IF(it == m_chunks.end(), chunk_not_found,
                       "No chunk of type '", type, "' in file");
        chunk removed = *it;
        m_chunks.erase(it);
        return removed;
    }

    std::vector<std::byte> png::as_bytes() const {
        std::size_t total = STANDARD_HEADER.size();
        for (const auto& c : m_chunks) {
            total += c.serialized_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        out.insert(out.end(), STANDARD_HEADER.begin(), STANDARD_HEADER.end());
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        for (const auto& c : p.chunks()) {
            os << c << '\n';
        }
        return os;
    }
}
