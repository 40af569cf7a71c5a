/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */

#include <utf8cpp/utf8.h>
#include <canonica/bcs/error.hpp>
#include <canonica/bcs/text.hpp>

namespace canonica::bcs {
    std::string_view utf8_view(const buffer bytes)
    {
        const auto s = bytes.string_view();
        if (const auto it = utf8::find_invalid(s.begin(), s.end()); it != s.end()) [[unlikely]]
            throw decode_error { error_kind::utf8, fmt::format("invalid UTF-8 byte at offset {} of a {}-byte string", it - s.begin(), s.size()) };
        return s;
    }
}
