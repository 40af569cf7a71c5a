/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_TEXT_HPP
#define CANONICA_BCS_TEXT_HPP

#include <string_view>
#include <canonica/common/bytes.hpp>

namespace canonica::bcs {
    // throws a utf8 decode_error unless bytes are well-formed UTF-8
    extern std::string_view utf8_view(buffer bytes);
}

#endif // !CANONICA_BCS_TEXT_HPP
