/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_DEPTH_HPP
#define CANONICA_BCS_DEPTH_HPP

#include <string_view>
#include <canonica/bcs/error.hpp>

namespace canonica::bcs {
    struct depth_guard {
        // leaves the container on scope exit including the stack unwinding after a failed nested decode
        struct scope {
            scope(const scope &) =delete;

            scope(depth_guard &guard, const std::string_view name): _guard { guard }
            {
                _guard.enter(name);
            }

            ~scope()
            {
                _guard.leave();
            }
        private:
            depth_guard &_guard;
        };

        explicit depth_guard(const size_t limit) noexcept: _remaining { limit }
        {
        }

        void enter(const std::string_view name)
        {
            if (!_remaining) [[unlikely]]
                throw container_depth_error { name };
            --_remaining;
        }

        void leave() noexcept
        {
            ++_remaining;
        }

        size_t remaining() const noexcept
        {
            return _remaining;
        }
    private:
        size_t _remaining;
    };
}

#endif // !CANONICA_BCS_DEPTH_HPP
