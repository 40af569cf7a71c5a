/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */

#include <canonica/bcs/config.hpp>
#include <canonica/bcs/error.hpp>

namespace canonica::bcs {
    decode_error::decode_error(const error_kind kind, const std::string_view msg):
        error { fmt::format("{}: {}", kind, msg) }, _kind { kind }
    {
    }

    max_length_error::max_length_error(const size_t len):
        decode_error { error_kind::exceeded_max_length,
            fmt::format("length {} exceeds the maximum of {}", len, max_sequence_length) },
        _len { len }
    {
    }

    container_depth_error::container_depth_error(const std::string_view container):
        decode_error { error_kind::exceeded_container_depth,
            fmt::format("exceeded the container depth limit at {}", container) },
        _container { container }
    {
    }

    not_supported_error::not_supported_error(const std::string_view msg):
        decode_error { error_kind::not_supported, msg }
    {
    }
}
