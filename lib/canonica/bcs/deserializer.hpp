/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_DESERIALIZER_HPP
#define CANONICA_BCS_DESERIALIZER_HPP

#include <algorithm>
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>
#include <canonica/bcs/decoder.hpp>

/*
 * Decoding of standard types. A user type plugs in by specializing deserializer<T>
 * with a static decode method that drives the decoder through its named-container
 * entry points, e.g. decode_struct("Name", num_fields, ...).
 */
namespace canonica::bcs {
    template<>
    struct deserializer<bool> {
        static bool decode(auto &dec)
        {
            return dec.decode_bool();
        }
    };

    template<>
    struct deserializer<uint8_t> {
        static uint8_t decode(auto &dec)
        {
            return dec.decode_u8();
        }
    };

    template<>
    struct deserializer<uint16_t> {
        static uint16_t decode(auto &dec)
        {
            return dec.decode_u16();
        }
    };

    template<>
    struct deserializer<uint32_t> {
        static uint32_t decode(auto &dec)
        {
            return dec.decode_u32();
        }
    };

    template<>
    struct deserializer<uint64_t> {
        static uint64_t decode(auto &dec)
        {
            return dec.decode_u64();
        }
    };

    template<>
    struct deserializer<uint128_t> {
        static uint128_t decode(auto &dec)
        {
            return dec.decode_u128();
        }
    };

    template<>
    struct deserializer<int8_t> {
        static int8_t decode(auto &dec)
        {
            return dec.decode_i8();
        }
    };

    template<>
    struct deserializer<int16_t> {
        static int16_t decode(auto &dec)
        {
            return dec.decode_i16();
        }
    };

    template<>
    struct deserializer<int32_t> {
        static int32_t decode(auto &dec)
        {
            return dec.decode_i32();
        }
    };

    template<>
    struct deserializer<int64_t> {
        static int64_t decode(auto &dec)
        {
            return dec.decode_i64();
        }
    };

    template<>
    struct deserializer<int128_t> {
        static int128_t decode(auto &dec)
        {
            return dec.decode_i128();
        }
    };

    template<>
    struct deserializer<float> {
        static float decode(auto &dec)
        {
            dec.decode_f32();
        }
    };

    template<>
    struct deserializer<double> {
        static double decode(auto &dec)
        {
            dec.decode_f64();
        }
    };

    template<>
    struct deserializer<char> {
        static char decode(auto &dec)
        {
            dec.decode_char();
        }
    };

    template<>
    struct deserializer<std::monostate> {
        static std::monostate decode(auto &dec)
        {
            dec.decode_unit();
            return {};
        }
    };

    template<>
    struct deserializer<std::string> {
        static std::string decode(auto &dec)
        {
            return std::string { dec.decode_str() };
        }
    };

    // borrows from the input so is available only for zero-copy sources
    template<>
    struct deserializer<std::string_view> {
        template<borrowing_source S>
        static std::string_view decode(decoder<S> &dec)
        {
            return dec.decode_str();
        }
    };

    template<>
    struct deserializer<uint8_vector> {
        static uint8_vector decode(auto &dec)
        {
            return uint8_vector { dec.decode_bytes() };
        }
    };

    template<>
    struct deserializer<buffer> {
        template<borrowing_source S>
        static buffer decode(decoder<S> &dec)
        {
            return dec.decode_bytes();
        }
    };

    template<typename T>
    struct deserializer<std::optional<T>> {
        static std::optional<T> decode(auto &dec)
        {
            return dec.decode_option([](auto &d) { return d.template decode<T>(); });
        }
    };

    template<typename T>
    struct deserializer<std::unique_ptr<T>> {
        static std::unique_ptr<T> decode(auto &dec)
        {
            return std::make_unique<T>(dec.template decode<T>());
        }
    };

    template<typename T, typename A>
    struct deserializer<std::vector<T, A>> {
        // caps the reservation since the length comes from the input
        static constexpr size_t max_reserve = 0x1000;

        static std::vector<T, A> decode(auto &dec)
        {
            return dec.decode_seq([](auto &seq) {
                std::vector<T, A> res {};
                res.reserve(std::min(seq.remaining(), max_reserve));
                while (auto item = seq.template next<T>())
                    res.emplace_back(std::move(*item));
                return res;
            });
        }
    };

    template<typename T, size_t SZ>
    struct deserializer<std::array<T, SZ>> {
        static std::array<T, SZ> decode(auto &dec)
        {
            return dec.decode_tuple(SZ, [](auto &seq) {
                std::array<T, SZ> res {};
                for (auto &v: res)
                    v = seq.template read<T>();
                return res;
            });
        }
    };

    template<typename X, typename Y>
    struct deserializer<std::pair<X, Y>> {
        static std::pair<X, Y> decode(auto &dec)
        {
            return dec.decode_tuple(2, [](auto &seq) {
                auto x = seq.template read<X>();
                auto y = seq.template read<Y>();
                return std::pair<X, Y> { std::move(x), std::move(y) };
            });
        }
    };

    template<typename ...Ts>
    struct deserializer<std::tuple<Ts...>> {
        static std::tuple<Ts...> decode(auto &dec)
        {
            return dec.decode_tuple(sizeof...(Ts), [](auto &seq) {
                // braced initialization guarantees the left-to-right evaluation order
                return std::tuple<Ts...> { seq.template read<Ts>()... };
            });
        }
    };

    template<typename K, typename V, typename C, typename A>
    struct deserializer<std::map<K, V, C, A>> {
        static std::map<K, V, C, A> decode(auto &dec)
        {
            return dec.decode_map([](auto &map) {
                std::map<K, V, C, A> res {};
                while (auto key = map.template next_key<K>()) {
                    auto val = map.template next_value<V>();
                    res.insert_or_assign(std::move(*key), std::move(val));
                }
                return res;
            });
        }
    };

    // std::monostate alternatives are unit variants, all others carry a single value
    template<typename ...Ts>
    struct deserializer<std::variant<Ts...>> {
        using value_type = std::variant<Ts...>;

        static value_type decode(auto &dec)
        {
            return dec.decode_enum("std::variant", [](const uint32_t idx, auto &va) {
                return _decode_alt<0>(idx, va);
            });
        }
    private:
        template<size_t I>
        static value_type _decode_alt(const uint32_t idx, auto &va)
        {
            if constexpr (I < sizeof...(Ts)) {
                if (idx == I) {
                    using alt_type = std::variant_alternative_t<I, value_type>;
                    if constexpr (std::is_same_v<alt_type, std::monostate>) {
                        va.unit();
                        return value_type { std::in_place_index<I> };
                    } else {
                        return value_type { std::in_place_index<I>, va.template newtype<alt_type>() };
                    }
                }
                return _decode_alt<I + 1>(idx, va);
            } else {
                throw decode_error { error_kind::unknown_variant,
                    fmt::format("variant index {} is out of range for {} alternatives", idx, sizeof...(Ts)) };
            }
        }
    };
}

#endif // !CANONICA_BCS_DESERIALIZER_HPP
