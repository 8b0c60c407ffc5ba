//
// Created by igor on 16/08/2025.
//

#include <ostream>

#include <pngme/commands.hh>
#include <pngme/png.hh>

namespace pngme {

    std::vector<std::byte> encode(const std::vector<std::byte>& file,
                                  std::string_view type,
                                  std::string_view message,
                                  const parse_options& options) {
        // Validate the type before touching the file
        auto chunk_kind = chunk_type::from_string(type);
        auto image = png::parse(file, options);

        auto text = reinterpret_cast<const std::byte*>(message.data());
        image.append_chunk(chunk(chunk_kind, std::vector<std::byte>(text, text + message.size())));
        return image.as_bytes();
    }

    std::optional<std::string> decode(const std::vector<std::byte>& file,
                                      std::string_view type,
                                      const parse_options& options) {
        auto image = png::parse(file, options);
        const chunk* found = image.chunk_by_type(type);
        if (!found) {
            return std::nullopt;
        }
        return found->data_as_string();
    }

    std::vector<std::byte> remove(const std::vector<std::byte>& file,
                                  std::string_view type,
                                  const parse_options& options) {
        auto image = png::parse(file, options);
        image.remove_first_chunk(type);
        return image.as_bytes();
    }

    void print_chunks(const std::vector<std::byte>& file,
                      std::ostream& os,
                      const parse_options& options) {
        os << png::parse(file, options);
    }
}
