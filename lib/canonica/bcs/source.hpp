/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_SOURCE_HPP
#define CANONICA_BCS_SOURCE_HPP

#include <array>
#include <concepts>
#include <cstring>
#include <canonica/common/bytes.hpp>
#include <canonica/bcs/capture.hpp>
#include <canonica/bcs/error.hpp>
#include <canonica/bcs/stream.hpp>

namespace canonica::bcs {
    template<typename T>
    concept byte_source = requires(T &s, const T &cs, write_buffer out) {
        typename T::key_bytes;
        { s.fill(out) };
        { s.next_byte() } -> std::same_as<uint8_t>;
        { s.end() };
        { cs.position() } -> std::convertible_to<size_t>;
    };

    // a source that can return zero-copy views into its input
    template<typename T>
    concept borrowing_source = byte_source<T> && requires(T &s, size_t len) {
        { s.borrow(len) } -> std::same_as<buffer>;
    };

    struct slice_source {
        using key_bytes = buffer;

        explicit slice_source(const buffer data) noexcept: _data { data }
        {
        }

        uint8_t next_byte()
        {
            if (_pos < _data.size()) [[likely]]
                return _data[_pos++];
            throw eof_error {};
        }

        uint8_t peek() const
        {
            if (_pos < _data.size()) [[likely]]
                return _data[_pos];
            throw eof_error {};
        }

        void fill(const write_buffer out)
        {
            const auto bytes = borrow(out.size());
            if (!bytes.empty())
                memcpy(out.data(), bytes.data(), bytes.size());
        }

        buffer borrow(const size_t len)
        {
            if (len > remaining()) [[unlikely]]
                throw eof_error {};
            const buffer res { _data.data() + _pos, len };
            _pos += len;
            return res;
        }

        // returns the bytes consumed by f as a view into the input
        template<typename F>
        key_bytes capture(F &&f)
        {
            const auto start = _pos;
            f();
            return _data.subbuf(start, _pos - start);
        }

        void end() const
        {
            if (_pos != _data.size()) [[unlikely]]
                throw decode_error { error_kind::remaining_input, fmt::format("{} bytes remain after the decoded value", remaining()) };
        }

        size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        size_t position() const noexcept
        {
            return _pos;
        }
    private:
        buffer _data;
        size_t _pos = 0;
    };

    struct reader_source {
        using key_bytes = uint8_vector;

        explicit reader_source(read_stream &stream) noexcept: _stream { stream }
        {
        }

        uint8_t next_byte()
        {
            std::array<uint8_t, 1> byte;
            fill(byte);
            return byte[0];
        }

        void fill(const write_buffer out)
        {
            size_t num_read = 0;
            while (num_read < out.size()) {
                const auto chunk = out.subspan(num_read);
                const auto n = _stream.read(chunk);
                if (!n) [[unlikely]]
                    throw eof_error {};
                _captures.append(buffer { chunk.data(), n });
                num_read += n;
            }
            _pos += num_read;
        }

        // returns the bytes consumed by f as an owned copy
        template<typename F>
        key_bytes capture(F &&f)
        {
            _captures.push();
            try {
                f();
            } catch (...) {
                _captures.discard();
                throw;
            }
            return _captures.pop();
        }

        void end()
        {
            std::array<uint8_t, 1> byte;
            if (_stream.read(byte)) [[unlikely]]
                throw decode_error { error_kind::remaining_input, fmt::format("bytes remain after the decoded value at offset {}", _pos) };
        }

        size_t position() const noexcept
        {
            return _pos;
        }

        const capture_stack &captures() const noexcept
        {
            return _captures;
        }
    private:
        read_stream &_stream;
        capture_stack _captures {};
        size_t _pos = 0;
    };

    static_assert(borrowing_source<slice_source>);
    static_assert(byte_source<reader_source>);
    static_assert(!borrowing_source<reader_source>);
}

#endif // !CANONICA_BCS_SOURCE_HPP
