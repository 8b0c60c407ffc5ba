/**
 * @file commands.hh
 * @brief Message hiding operations on whole PNG file images
 * @author Igor
 * @date 16/08/2025
 *
 * Each operation takes the bytes of a file and returns new bytes or a
 * result; reading and writing the file itself is up to the caller.
 */

#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @brief Append a chunk carrying @p message
     * @param file PNG file image
     * @param type Four-letter chunk type for the new chunk
     * @param message Text stored as the chunk data
     * @param options Options for parsing @p file
     * @return The updated file image
     * @throws invalid_chunk_type if @p type is not a valid chunk type
     * @throws parse_error if @p file does not parse
     */
    PNGME_EXPORT std::vector<std::byte> encode(const std::vector<std::byte>& file,
                                               std::string_view type,
                                               std::string_view message,
                                               const parse_options& options = {});

    /**
     * @brief Read the message in the first chunk of type @p type
     * @return The message, or nullopt if there is no such chunk
     * @throws encoding_error if the chunk data is not UTF-8
     * @throws parse_error if @p file does not parse
     */
    PNGME_EXPORT std::optional<std::string> decode(const std::vector<std::byte>& file,
                                                   std::string_view type,
                                                   const parse_options& options = {});

    /**
     * @brief Drop the first chunk of type @p type
     * @return The updated file image
     * @throws chunk_not_found if there is no such chunk
     * @throws parse_error if @p file does not parse
     */
    PNGME_EXPORT std::vector<std::byte> remove(const std::vector<std::byte>& file,
                                               std::string_view type,
                                               const parse_options& options = {});

    /**
     * @brief Write one line per chunk to @p os
     * @throws parse_error if @p file does not parse
     */
    PNGME_EXPORT void print_chunks(const std::vector<std::byte>& file,
                                   std::ostream& os,
                                   const parse_options& options = {});

} // namespace pngme
