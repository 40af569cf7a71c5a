/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_ULEB128_HPP
#define CANONICA_BCS_ULEB128_HPP

#include <limits>
#include <canonica/bcs/config.hpp>
#include <canonica/bcs/error.hpp>
#include <canonica/bcs/source.hpp>

namespace canonica::bcs {
    /*
     * Decodes a ULEB128 value into 32 bits accepting only its shortest encoding.
     * The most significant (last) digit of a multi-digit encoding must be non-zero,
     * otherwise a shorter encoding of the same value would exist.
     */
    template<byte_source S>
    uint32_t decode_uleb128(S &src)
    {
        uint64_t value = 0;
        for (size_t shift = 0; shift < max_uleb128_digits * 7; shift += 7) {
            const uint8_t byte = src.next_byte();
            const uint8_t digit = byte & 0x7F;
            value |= static_cast<uint64_t>(digit) << shift;
            if (digit == byte) {
                if (shift > 0 && digit == 0) [[unlikely]]
                    throw decode_error { error_kind::non_canonical_uleb128, fmt::format("a zero final digit at offset {}", src.position() - 1) };
                if (value > std::numeric_limits<uint32_t>::max()) [[unlikely]]
                    throw decode_error { error_kind::uleb128_overflow, fmt::format("value {} does not fit into 32 bits", value) };
                return static_cast<uint32_t>(value);
            }
        }
        throw decode_error { error_kind::uleb128_overflow, fmt::format("more than {} digits", max_uleb128_digits) };
    }

    template<byte_source S>
    size_t decode_length(S &src)
    {
        const size_t len = decode_uleb128(src);
        if (len > max_sequence_length) [[unlikely]]
            throw max_length_error { len };
        return len;
    }
}

#endif // !CANONICA_BCS_ULEB128_HPP
