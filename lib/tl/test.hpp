/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_TEST_HPP
#define THROWLINE_TEST_HPP

#include <iostream>
#include <source_location>
#include <string>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <tl/format.hpp>

namespace throwline {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T>
    bool test_same(const T &x, const T &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename T, typename Y>
    bool test_same(const std::string &name, const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<T>(y);
        expect(res, loc) << fmt::format("{}: {} != {}", name, x, y);
        return res;
    }

    // Runs f and returns what it has thrown as an error value, an absent value when it has not thrown.
    template<typename F>
    throwable_ptr catch_error(F &&f)
    {
        try {
            std::forward<F>(f)();
        } catch (...) {
            return capture(std::current_exception());
        }
        return {};
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<throwline::test_printer>> {};

#endif // !THROWLINE_TEST_HPP
