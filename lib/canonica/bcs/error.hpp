/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_ERROR_HPP
#define CANONICA_BCS_ERROR_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <canonica/common/error.hpp>
#include <canonica/common/format.hpp>

namespace canonica::bcs {
    enum class error_kind: uint8_t {
        eof,
        io,
        expected_boolean,
        expected_option,
        non_canonical_uleb128,
        uleb128_overflow,
        exceeded_max_length,
        exceeded_container_depth,
        utf8,
        non_canonical_map,
        remaining_input,
        not_supported,
        unknown_variant
    };

    struct decode_error: error {
        explicit decode_error(error_kind kind, std::string_view msg);

        error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        error_kind _kind;
    };

    struct eof_error: decode_error {
        eof_error(): decode_error { error_kind::eof, "unexpected end of input" }
        {
        }
    };

    struct io_error: decode_error {
        explicit io_error(std::string_view msg): decode_error { error_kind::io, msg }
        {
        }
    };

    struct max_length_error: decode_error {
        explicit max_length_error(size_t len);

        size_t length() const noexcept
        {
            return _len;
        }
    private:
        size_t _len;
    };

    struct container_depth_error: decode_error {
        explicit container_depth_error(std::string_view container);

        const std::string &container() const noexcept
        {
            return _container;
        }
    private:
        std::string _container;
    };

    struct not_supported_error: decode_error {
        explicit not_supported_error(std::string_view msg);
    };
}

namespace fmt {
    template<>
    struct formatter<canonica::bcs::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using canonica::bcs::error_kind;
            switch (v) {
                case error_kind::eof: return fmt::format_to(ctx.out(), "eof");
                case error_kind::io: return fmt::format_to(ctx.out(), "io");
                case error_kind::expected_boolean: return fmt::format_to(ctx.out(), "expected_boolean");
                case error_kind::expected_option: return fmt::format_to(ctx.out(), "expected_option");
                case error_kind::non_canonical_uleb128: return fmt::format_to(ctx.out(), "non_canonical_uleb128");
                case error_kind::uleb128_overflow: return fmt::format_to(ctx.out(), "uleb128_overflow");
                case error_kind::exceeded_max_length: return fmt::format_to(ctx.out(), "exceeded_max_length");
                case error_kind::exceeded_container_depth: return fmt::format_to(ctx.out(), "exceeded_container_depth");
                case error_kind::utf8: return fmt::format_to(ctx.out(), "utf8");
                case error_kind::non_canonical_map: return fmt::format_to(ctx.out(), "non_canonical_map");
                case error_kind::remaining_input: return fmt::format_to(ctx.out(), "remaining_input");
                case error_kind::not_supported: return fmt::format_to(ctx.out(), "not_supported");
                case error_kind::unknown_variant: return fmt::format_to(ctx.out(), "unknown_variant");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !CANONICA_BCS_ERROR_HPP
