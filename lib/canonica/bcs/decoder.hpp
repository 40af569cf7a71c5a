/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */

/*
 * The decoding engine for the Binary Canonical Serialization (BCS) format.
 * BCS is not self-describing: the caller drives the engine with one call per expected shape
 * and the engine translates each call into reads from the byte source.
 * The engine is a template over the byte source so that the same code serves
 * the zero-copy slice_source and the streaming reader_source.
 */
#ifndef CANONICA_BCS_DECODER_HPP
#define CANONICA_BCS_DECODER_HPP

#include <array>
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <canonica/bcs/config.hpp>
#include <canonica/bcs/depth.hpp>
#include <canonica/bcs/error.hpp>
#include <canonica/bcs/source.hpp>
#include <canonica/bcs/text.hpp>
#include <canonica/bcs/uleb128.hpp>

namespace canonica::bcs {
    // specialized by the reflection layer and by user types
    template<typename T>
    struct deserializer;

    template<byte_source S>
    struct decoder;

    template<byte_source S>
    struct seq_access {
        seq_access(const seq_access &) =delete;

        seq_access(decoder<S> &dec, const size_t num_items) noexcept:
            _dec { dec }, _remaining { num_items }
        {
        }

        template<typename F>
        auto next_element(F &&f) -> std::optional<std::invoke_result_t<F, decoder<S> &>>
        {
            if (!_remaining)
                return {};
            --_remaining;
            return f(_dec);
        }

        template<typename T>
        std::optional<T> next()
        {
            return next_element([](auto &dec) { return dec.template decode<T>(); });
        }

        // for fixed-arity shapes whose caller knows that an element must be there
        template<typename T>
        T read()
        {
            if (auto v = next<T>(); v) [[likely]]
                return std::move(*v);
            throw error("iteration past the end of a sequence!");
        }

        bool done() const noexcept
        {
            return _remaining == 0;
        }

        size_t remaining() const noexcept
        {
            return _remaining;
        }
    private:
        decoder<S> &_dec;
        size_t _remaining;
    };

    template<byte_source S>
    struct map_access {
        using key_bytes = typename S::key_bytes;

        map_access(const map_access &) =delete;

        map_access(decoder<S> &dec, const size_t num_items) noexcept:
            _dec { dec }, _remaining { num_items }
        {
        }

        // the raw bytes of each key must be strictly greater than those of the previous one
        template<typename F>
        auto next_key(F &&f) -> std::optional<std::invoke_result_t<F, decoder<S> &>>
        {
            if (!_remaining)
                return {};
            std::optional<std::invoke_result_t<F, decoder<S> &>> key {};
            auto bytes = _dec.source().capture([&] { key.emplace(f(_dec)); });
            if (_prev_key && static_cast<buffer>(*_prev_key) >= static_cast<buffer>(bytes)) [[unlikely]]
                throw decode_error { error_kind::non_canonical_map,
                    fmt::format("key {} does not follow the previous key {}", static_cast<buffer>(bytes), static_cast<buffer>(*_prev_key)) };
            --_remaining;
            _prev_key.emplace(std::move(bytes));
            return key;
        }

        template<typename F>
        auto next_value(F &&f) -> std::invoke_result_t<F, decoder<S> &>
        {
            return f(_dec);
        }

        template<typename K>
        std::optional<K> next_key()
        {
            return next_key([](auto &dec) { return dec.template decode<K>(); });
        }

        template<typename V>
        V next_value()
        {
            return _dec.template decode<V>();
        }

        bool done() const noexcept
        {
            return _remaining == 0;
        }

        size_t remaining() const noexcept
        {
            return _remaining;
        }
    private:
        decoder<S> &_dec;
        size_t _remaining;
        std::optional<key_bytes> _prev_key {};
    };

    template<byte_source S>
    struct variant_access {
        variant_access(const variant_access &) =delete;

        explicit variant_access(decoder<S> &dec) noexcept: _dec { dec }
        {
        }

        void unit() const noexcept
        {
        }

        template<typename F>
        auto newtype(F &&f) -> std::invoke_result_t<F, decoder<S> &>
        {
            return f(_dec);
        }

        template<typename T>
        T newtype()
        {
            return _dec.template decode<T>();
        }

        template<typename F>
        auto tuple(const size_t len, F &&f)
        {
            return _dec.decode_tuple(len, std::forward<F>(f));
        }

        // field names are not encoded, only their number matters
        template<typename F>
        auto fields(const size_t num_fields, F &&f)
        {
            return _dec.decode_tuple(num_fields, std::forward<F>(f));
        }
    private:
        decoder<S> &_dec;
    };

    template<byte_source S>
    struct decoder {
        static constexpr bool zero_copy = borrowing_source<S>;
        using source_type = S;
        using str_type = std::conditional_t<zero_copy, std::string_view, std::string>;
        using bytes_type = std::conditional_t<zero_copy, buffer, uint8_vector>;
        using seq_type = seq_access<S>;
        using map_type = map_access<S>;
        using variant_type = variant_access<S>;

        decoder(const decoder &) =delete;

        decoder(S &src, const size_t max_depth) noexcept:
            _src { src }, _depth { max_depth }
        {
        }

        template<typename T>
        T decode()
        {
            return deserializer<T>::decode(*this);
        }

        [[noreturn]] void decode_any()
        {
            throw not_supported_error { "decode_any is not supported: the format is not self-describing" };
        }

        [[noreturn]] void decode_ignored_any()
        {
            throw not_supported_error { "decode_ignored_any is not supported: the format is not self-describing" };
        }

        bool decode_bool()
        {
            switch (const auto b = _src.next_byte(); b) {
                case 0: return false;
                case 1: return true;
                [[unlikely]] default:
                    throw decode_error { error_kind::expected_boolean, fmt::format("invalid boolean byte 0x{:02X} at offset {}", b, _src.position() - 1) };
            }
        }

        uint8_t decode_u8()
        {
            return _src.next_byte();
        }

        uint16_t decode_u16()
        {
            return _decode_le<uint16_t>();
        }

        uint32_t decode_u32()
        {
            return _decode_le<uint32_t>();
        }

        uint64_t decode_u64()
        {
            return _decode_le<uint64_t>();
        }

        uint128_t decode_u128()
        {
            return _decode_le<uint128_t>();
        }

        int8_t decode_i8()
        {
            return static_cast<int8_t>(decode_u8());
        }

        int16_t decode_i16()
        {
            return static_cast<int16_t>(decode_u16());
        }

        int32_t decode_i32()
        {
            return static_cast<int32_t>(decode_u32());
        }

        int64_t decode_i64()
        {
            return static_cast<int64_t>(decode_u64());
        }

        int128_t decode_i128()
        {
            return static_cast<int128_t>(decode_u128());
        }

        [[noreturn]] void decode_f32()
        {
            throw not_supported_error { "decode_f32 is not supported" };
        }

        [[noreturn]] void decode_f64()
        {
            throw not_supported_error { "decode_f64 is not supported" };
        }

        [[noreturn]] void decode_char()
        {
            throw not_supported_error { "decode_char is not supported" };
        }

        uint32_t decode_uleb128()
        {
            return bcs::decode_uleb128(_src);
        }

        size_t decode_length()
        {
            return bcs::decode_length(_src);
        }

        bytes_type decode_bytes()
        {
            const auto len = decode_length();
            if constexpr (zero_copy) {
                return _src.borrow(len);
            } else {
                uint8_vector res {};
                _fill_owned(res, len);
                return res;
            }
        }

        str_type decode_str()
        {
            if constexpr (zero_copy) {
                return utf8_view(decode_bytes());
            } else {
                const auto bytes = decode_bytes();
                return std::string { utf8_view(bytes) };
            }
        }

        // the format does not encode field or variant identifiers
        bytes_type decode_identifier()
        {
            return decode_bytes();
        }

        template<typename F>
        auto decode_option(F &&f) -> std::optional<std::invoke_result_t<F, decoder &>>
        {
            switch (const auto b = _src.next_byte(); b) {
                case 0: return {};
                case 1: return f(*this);
                [[unlikely]] default:
                    throw decode_error { error_kind::expected_option, fmt::format("invalid option byte 0x{:02X} at offset {}", b, _src.position() - 1) };
            }
        }

        void decode_unit() const noexcept
        {
        }

        void decode_unit_struct(const std::string_view name)
        {
            depth_guard::scope ds { _depth, name };
            decode_unit();
        }

        template<typename F>
        auto decode_newtype_struct(const std::string_view name, F &&f)
        {
            depth_guard::scope ds { _depth, name };
            return f(*this);
        }

        template<typename F>
        auto decode_seq(F &&f)
        {
            const auto len = decode_length();
            seq_type seq { *this, len };
            return f(seq);
        }

        template<typename F>
        auto decode_tuple(const size_t len, F &&f)
        {
            seq_type seq { *this, len };
            return f(seq);
        }

        template<typename F>
        auto decode_tuple_struct(const std::string_view name, const size_t len, F &&f)
        {
            depth_guard::scope ds { _depth, name };
            return decode_tuple(len, std::forward<F>(f));
        }

        template<typename F>
        auto decode_map(F &&f)
        {
            const auto len = decode_length();
            map_type map { *this, len };
            return f(map);
        }

        template<typename F>
        auto decode_struct(const std::string_view name, const size_t num_fields, F &&f)
        {
            depth_guard::scope ds { _depth, name };
            return decode_tuple(num_fields, std::forward<F>(f));
        }

        // f receives the variant index and the accessor for the variant's payload
        template<typename F>
        auto decode_enum(const std::string_view name, F &&f)
        {
            depth_guard::scope ds { _depth, name };
            const auto idx = decode_uleb128();
            variant_type va { *this };
            return f(idx, va);
        }

        constexpr bool is_human_readable() const noexcept
        {
            return false;
        }

        void end()
        {
            _src.end();
        }

        S &source() noexcept
        {
            return _src;
        }

        const depth_guard &depth() const noexcept
        {
            return _depth;
        }
    private:
        // a bogus length must fail at the end of input before a large allocation
        static constexpr size_t owned_chunk_size = 0x10000;

        S &_src;
        depth_guard _depth;

        template<typename T>
        T _decode_le()
        {
            std::array<uint8_t, sizeof(T)> bytes;
            _src.fill(bytes);
            T val = 0;
            for (size_t i = 0; i < sizeof(T); ++i)
                val |= static_cast<T>(bytes[i]) << (i * 8);
            return val;
        }

        void _fill_owned(uint8_vector &res, const size_t len)
        {
            while (res.size() < len) {
                const auto off = res.size();
                res.resize(off + std::min(len - off, owned_chunk_size));
                _src.fill(write_buffer { res.data() + off, res.size() - off });
            }
        }
    };
}

#endif // !CANONICA_BCS_DECODER_HPP
