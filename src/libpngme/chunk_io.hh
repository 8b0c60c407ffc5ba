//
// Created by igor on 15/08/2025.
//

#pragma once

#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>
#include "input.hh"

namespace pngme {
    // Reads one chunk at the reader position and verifies its CRC.
    // The reader is left just past the chunk.
    chunk read_chunk(reader& in, const parse_options& options);
}
