/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */

#include <canonica/common/bytes.hpp>
#include <canonica/test.hpp>

using namespace canonica;

suite bytes_suite = [] {
    "bytes"_test = [] {
        "from_hex"_test = [] {
            const auto v = uint8_vector::from_hex("7F0000011F");
            test_same(v.size(), 5ULL);
            test_same(v[0], 0x7F);
            test_same(v[4], 0x1F);
            expect(throws([] { uint8_vector::from_hex("7F0"); }));
            expect(throws([] { uint8_vector::from_hex("ZZ"); }));
        };
        "format"_test = [] {
            test_same(fmt::format("{}", uint8_vector::from_hex("deadbeef")), std::string { "DEADBEEF" });
        };
        "compare"_test = [] {
            const auto a = uint8_vector::from_hex("0102");
            const auto b = uint8_vector::from_hex("0103");
            const auto a_prefix = uint8_vector::from_hex("01");
            expect(static_cast<buffer>(a) < static_cast<buffer>(b));
            expect(static_cast<buffer>(a_prefix) < static_cast<buffer>(a));
            expect(static_cast<buffer>(a) == static_cast<buffer>(uint8_vector::from_hex("0102")));
            expect(buffer {} < static_cast<buffer>(a_prefix));
            expect(buffer {} == buffer {});
        };
        "subbuf"_test = [] {
            const auto v = uint8_vector::from_hex("00010203");
            const buffer b { v };
            expect(b.subbuf(1, 2) == static_cast<buffer>(uint8_vector::from_hex("0102")));
            test_same(b.subbuf(4).size(), 0ULL);
            expect(throws([&] { b.subbuf(3, 2); }));
            expect(throws([&] { b.subbuf(5); }));
        };
        "append"_test = [] {
            uint8_vector v {};
            v << 0x01;
            v << static_cast<buffer>(uint8_vector::from_hex("0203"));
            expect(v == uint8_vector::from_hex("010203"));
        };
    };
};
