/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_CONFIG_HPP
#define CANONICA_BCS_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace canonica::bcs {
    // the largest length of a sequence, map, string or byte string
    static constexpr size_t max_sequence_length = (1ULL << 31) - 1;
    // the default and the maximum allowed nesting of named containers
    static constexpr size_t max_container_depth = 500;
    // a 32-bit value needs at most 5 base-128 digits
    static constexpr size_t max_uleb128_digits = 5;

    using uint128_t = unsigned __int128;
    using int128_t = __int128;
}

#endif // !CANONICA_BCS_CONFIG_HPP
