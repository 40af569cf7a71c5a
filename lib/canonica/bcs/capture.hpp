/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_CAPTURE_HPP
#define CANONICA_BCS_CAPTURE_HPP

#include <vector>
#include <canonica/common/bytes.hpp>

namespace canonica::bcs {
    /*
     * Reconstructs the raw bytes of values decoded from a non-seekable stream.
     * While at least one capture is active, all consumed bytes go to the top buffer.
     * A popped buffer is also appended to the one beneath it so that an outer capture
     * sees the complete encoding of its nested captures.
     */
    struct capture_stack {
        void push()
        {
            _bufs.emplace_back();
        }

        uint8_vector pop()
        {
            if (_bufs.empty()) [[unlikely]]
                throw error("pop called on an empty capture stack!");
            uint8_vector top { std::move(_bufs.back()) };
            _bufs.pop_back();
            if (!_bufs.empty())
                _bufs.back() << static_cast<buffer>(top);
            return top;
        }

        // drops the top capture without propagating its bytes
        void discard()
        {
            if (_bufs.empty()) [[unlikely]]
                throw error("discard called on an empty capture stack!");
            _bufs.pop_back();
        }

        void append(const buffer bytes)
        {
            if (!_bufs.empty())
                _bufs.back() << bytes;
        }

        bool active() const noexcept
        {
            return !_bufs.empty();
        }

        size_t depth() const noexcept
        {
            return _bufs.size();
        }
    private:
        std::vector<uint8_vector> _bufs {};
    };
}

#endif // !CANONICA_BCS_CAPTURE_HPP
