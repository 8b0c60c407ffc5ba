//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>

namespace pngme {
    // Strict UTF-8 check: no overlong forms, surrogates or code points past U+10FFFF
    bool is_valid_utf8(const std::byte* data, std::size_t size);
}
