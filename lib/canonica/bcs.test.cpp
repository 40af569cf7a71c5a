/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */

#include <algorithm>
#include <sstream>
#include <canonica/bcs.hpp>
#include <canonica/test.hpp>

namespace {
    struct socket_address {
        std::array<uint8_t, 4> ip {};
        uint16_t port = 0;

        bool operator==(const socket_address &o) const noexcept
        {
            return ip == o.ip && port == o.port;
        }
    };

    struct account {
        std::string name;
        std::optional<socket_address> addr;
        std::vector<uint64_t> balances;
        std::map<std::string, bool> flags;

        bool operator==(const account &o) const noexcept
        {
            return name == o.name && addr == o.addr && balances == o.balances && flags == o.flags;
        }
    };
}

namespace canonica::bcs {
    template<>
    struct deserializer<socket_address> {
        static socket_address decode(auto &dec)
        {
            return dec.decode_struct("SocketAddr", 2, [](auto &seq) {
                socket_address res {};
                res.ip = seq.template read<std::array<uint8_t, 4>>();
                res.port = seq.template read<uint16_t>();
                return res;
            });
        }
    };

    template<>
    struct deserializer<account> {
        static account decode(auto &dec)
        {
            return dec.decode_struct("Account", 4, [](auto &seq) {
                account res {};
                res.name = seq.template read<std::string>();
                res.addr = seq.template read<std::optional<socket_address>>();
                res.balances = seq.template read<std::vector<uint64_t>>();
                res.flags = seq.template read<std::map<std::string, bool>>();
                return res;
            });
        }
    };
}

using namespace canonica;
using namespace canonica::bcs;

namespace {
    // one named container per level, each level but the last one is followed by another
    template<typename D>
    size_t decode_nested(D &dec)
    {
        return dec.decode_newtype_struct("Nested", [](auto &d) -> size_t {
            const auto inner = d.decode_option([](auto &dd) { return decode_nested(dd); });
            return inner.value_or(0) + 1;
        });
    }

    uint8_vector nested_bytes(const size_t levels)
    {
        uint8_vector res {};
        for (size_t i = 1; i < levels; ++i)
            res << 0x01;
        res << 0x00;
        return res;
    }

    template<typename T>
    T decode_via_reader(const buffer bytes, const size_t max_chunk=1)
    {
        buffer_reader r { bytes, max_chunk };
        return from_reader<T>(r);
    }

    const socket_address localhost_8001 { { 127, 0, 0, 1 }, 8001 };

    // serves the given number of zero bytes and then fails
    struct failing_stream: read_stream {
        explicit failing_stream(const size_t num_ok): _num_ok { num_ok }
        {
        }
    private:
        size_t _num_ok;

        size_t _read_impl(const write_buffer out) override
        {
            if (!_num_ok)
                throw io_error("the device has been disconnected");
            const auto n = std::min(out.size(), _num_ok);
            std::fill_n(out.begin(), n, uint8_t { 0 });
            _num_ok -= n;
            return n;
        }
    };
}

suite bcs_suite = [] {
    "bcs"_test = [] {
        "socket address"_test = [] {
            const auto bytes = uint8_vector::from_hex("7F000001411F");
            const auto addr = from_bytes<socket_address>(bytes);
            expect(addr.ip == std::array<uint8_t, 4> { 127, 0, 0, 1 });
            test_same(addr.port, 8001);
            expect(decode_via_reader<socket_address>(bytes) == localhost_8001);
            std::istringstream is { std::string { bytes.str() } };
            istream_reader r { is };
            expect(from_reader<socket_address>(r) == localhost_8001);
        };
        "composite value"_test = [] {
            const auto bytes = uint8_vector::from_hex(
                "05616C696365"
                "01" "7F000001411F"
                "02" "0100000000000000" "FFFFFFFFFFFFFFFF"
                "02" "016101" "016200");
            const account exp { "alice", localhost_8001, { 1, 0xFFFFFFFFFFFFFFFFULL }, { { "a", true }, { "b", false } } };
            expect(from_bytes<account>(bytes) == exp);
            expect(decode_via_reader<account>(bytes) == exp);
            expect(decode_via_reader<account>(bytes, 5) == exp);
        };
        "borrowed strings"_test = [] {
            const auto bytes = uint8_vector::from_hex("020361626302787A");
            const auto v = from_bytes<std::vector<std::string_view>>(bytes);
            test_same(v.size(), 2ULL);
            test_same(v[0], std::string_view { "abc" });
            test_same(v[1], std::string_view { "xz" });
            expect(reinterpret_cast<const uint8_t *>(v[1].data()) == bytes.data() + 6);
        };
        "uleb128 canonicality"_test = [] {
            test_same(from_bytes<std::vector<uint8_t>>(uint8_vector::from_hex("00")).size(), 0ULL);
            expect_throws_kind([] { from_bytes<std::vector<uint8_t>>(uint8_vector::from_hex("8000")); }, error_kind::non_canonical_uleb128);
            const auto seed = [](auto &dec) { return dec.decode_uleb128(); };
            test_same(from_bytes_seed(seed, uint8_vector::from_hex("FFFFFFFF0F")), 0xFFFFFFFFU);
            expect_throws_kind([&] { from_bytes_seed(seed, uint8_vector::from_hex("FFFFFFFF1F")); }, error_kind::uleb128_overflow);
            const auto non_canonical = uint8_vector::from_hex("8000");
            buffer_reader r { non_canonical };
            expect_throws_kind([&] { from_reader_seed(seed, r); }, error_kind::non_canonical_uleb128);
        };
        "map canonicality"_test = [] {
            using map_type = std::map<uint8_t, uint8_t>;
            const map_type exp { { 1, 10 }, { 2, 11 } };
            const auto ascending = uint8_vector::from_hex("02010A020B");
            expect(from_bytes<map_type>(ascending) == exp);
            expect(decode_via_reader<map_type>(ascending) == exp);
            for (const auto hex: { "02020B010A", "02010A010B" }) {
                const auto bytes = uint8_vector::from_hex(hex);
                expect_throws_kind([&] { from_bytes<map_type>(bytes); }, error_kind::non_canonical_map);
                expect_throws_kind([&] { decode_via_reader<map_type>(bytes); }, error_kind::non_canonical_map);
            }
        };
        "maps as map keys"_test = [] {
            using key_type = std::map<uint8_t, uint8_t>;
            using map_type = std::map<key_type, uint8_t>;
            const map_type exp { { key_type { { 1, 1 } }, 10 }, { key_type { { 2, 0 } }, 11 } };
            const auto ascending = uint8_vector::from_hex("02" "0101010A" "0102000B");
            expect(from_bytes<map_type>(ascending) == exp);
            expect(decode_via_reader<map_type>(ascending) == exp);
            expect(decode_via_reader<map_type>(ascending, 3) == exp);
            const auto descending = uint8_vector::from_hex("02" "0102000B" "0101010A");
            expect_throws_kind([&] { from_bytes<map_type>(descending); }, error_kind::non_canonical_map);
            expect_throws_kind([&] { decode_via_reader<map_type>(descending); }, error_kind::non_canonical_map);
            const auto bad_inner_key = uint8_vector::from_hex("01" "02020001000A");
            expect_throws_kind([&] { from_bytes<map_type>(bad_inner_key); }, error_kind::non_canonical_map);
            expect_throws_kind([&] { decode_via_reader<map_type>(bad_inner_key); }, error_kind::non_canonical_map);
        };
        "depth limit"_test = [] {
            const auto seed = [](auto &dec) { return decode_nested(dec); };
            {
                const auto bytes = nested_bytes(max_container_depth);
                test_same(from_bytes_seed(seed, bytes), max_container_depth);
                buffer_reader r { bytes, 7 };
                test_same(from_reader_seed(seed, r), max_container_depth);
            }
            {
                const auto bytes = nested_bytes(max_container_depth + 1);
                expect_throws_kind([&] { from_bytes_seed(seed, bytes); }, error_kind::exceeded_container_depth);
                buffer_reader r { bytes };
                expect_throws_kind([&] { from_reader_seed(seed, r); }, error_kind::exceeded_container_depth);
            }
            {
                const auto bytes = nested_bytes(3);
                test_same(from_bytes_seed_with_limit(seed, bytes, 3), 3ULL);
                expect_throws_kind([&] { from_bytes_seed_with_limit(seed, bytes, 2); }, error_kind::exceeded_container_depth);
                buffer_reader r { bytes };
                test_same(from_reader_seed_with_limit(seed, r, 3), 3ULL);
            }
        };
        "depth error names the innermost container"_test = [] {
            const auto bytes = uint8_vector::from_hex("7F000001411F");
            const auto seed = [](auto &dec) {
                return dec.decode_newtype_struct("Endpoint", [](auto &d) { return d.template decode<socket_address>(); });
            };
            test_same(from_bytes_seed_with_limit(seed, bytes, 2).port, 8001);
            try {
                from_bytes_seed_with_limit(seed, bytes, 1);
                expect(false);
            } catch (const container_depth_error &ex) {
                test_same(ex.container(), std::string { "SocketAddr" });
            }
        };
        "limit above the maximum"_test = [] {
            const auto bytes = uint8_vector::from_hex("00");
            expect_throws_kind([&] { from_bytes_with_limit<uint8_t>(bytes, max_container_depth + 1); }, error_kind::not_supported);
            buffer_reader r { bytes };
            expect_throws_kind([&] { from_reader_with_limit<uint8_t>(r, max_container_depth + 1); }, error_kind::not_supported);
            test_same(r.position(), 0ULL);
            test_same(from_bytes_with_limit<uint8_t>(bytes, 0), 0);
        };
        "truncation"_test = [] {
            const auto bytes = uint8_vector::from_hex(
                "05616C696365" "01" "7F000001411F" "01" "0100000000000000" "01" "016101");
            expect(from_bytes<account>(bytes).name == "alice");
            for (size_t sz = 0; sz < bytes.size(); ++sz) {
                const auto prefix = buffer { bytes }.subbuf(0, sz);
                expect_throws_kind([&] { from_bytes<account>(prefix); }, error_kind::eof);
                expect_throws_kind([&] { decode_via_reader<account>(prefix); }, error_kind::eof);
            }
        };
        "trailing bytes"_test = [] {
            auto bytes = uint8_vector::from_hex("7F000001411F");
            bytes << 0x00;
            expect_throws_kind([&] { from_bytes<socket_address>(bytes); }, error_kind::remaining_input);
            expect_throws_kind([&] { decode_via_reader<socket_address>(bytes); }, error_kind::remaining_input);
            expect_throws_kind([&] { decode_via_reader<socket_address>(bytes, 64); }, error_kind::remaining_input);
        };
        "unsupported shapes ignore the input"_test = [] {
            const auto seed = [](auto &dec) {
                dec.decode_any();
                return 0;
            };
            expect_throws_kind([&] { from_bytes_seed(seed, buffer {}); }, error_kind::not_supported);
            expect_throws_kind([] { from_bytes<double>(uint8_vector::from_hex("000000000000F03F")); }, error_kind::not_supported);
        };
        "stream failures"_test = [] {
            {
                failing_stream s { 1 };
                expect_throws_kind([&] { from_reader<uint16_t>(s); }, error_kind::io);
            }
            {
                // the value is complete and the failure happens in the end-of-input check
                failing_stream s { 2 };
                expect_throws_kind([&] { from_reader<uint16_t>(s); }, error_kind::io);
            }
            {
                failing_stream s { 3 };
                expect_throws_kind([&] { from_reader<uint16_t>(s); }, error_kind::remaining_input);
            }
            {
                std::istringstream is { std::string { "\x01\x00", 2 } };
                is.setstate(std::ios::badbit);
                istream_reader r { is };
                expect_throws_kind([&] { from_reader<uint16_t>(r); }, error_kind::io);
            }
            {
                std::istringstream is { std::string { "\x01\x00", 2 } };
                is.exceptions(std::ios::failbit | std::ios::badbit);
                istream_reader r { is };
                test_same(from_reader<uint16_t>(r), 1);
            }
        };
        "errors report their kind"_test = [] {
            try {
                from_bytes<bool>(uint8_vector::from_hex("02"));
                expect(false);
            } catch (const decode_error &ex) {
                test_same(ex.kind(), error_kind::expected_boolean);
                expect(std::string_view { ex.what() }.starts_with("expected_boolean: ")) << ex.what();
            }
        };
    };
};
