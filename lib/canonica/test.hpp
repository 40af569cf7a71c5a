/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_TEST_HPP
#define CANONICA_TEST_HPP

#include <iostream>
#include <optional>
#include <source_location>
#include <span>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <canonica/common/bytes.hpp>
#include <canonica/bcs/error.hpp>
#include <canonica/logger.hpp>

namespace canonica {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", buffer { std::span<const uint8_t> { t } });
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T, typename Y>
    bool test_same(const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<T>(y);
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename F>
    void expect_throws_kind(const F &f, const bcs::error_kind kind, const std::source_location &loc=std::source_location::current())
    {
        std::optional<bcs::error_kind> act {};
        try {
            f();
        } catch (const bcs::decode_error &ex) {
            act = ex.kind();
        }
        expect(act == kind, loc) << fmt::format("expected a {} error but got {}", kind, act);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<canonica::test_printer>> {};

#endif // !CANONICA_TEST_HPP
