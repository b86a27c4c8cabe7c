/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_FORMAT_HPP
#define THROWLINE_FORMAT_HPP

#include <concepts>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#   endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif
#include <tl/throwable.hpp>

namespace throwline {
    using fmt::format;
}

namespace fmt {
    template<typename T>
    requires std::derived_from<T, throwline::throwable>
    struct formatter<T>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<typename T>
    requires std::derived_from<T, throwline::throwable>
    struct formatter<std::shared_ptr<T>>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const std::shared_ptr<T> &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", v->to_string());
            return fmt::format_to(ctx.out(), "no error");
        }
    };

    template<>
    struct formatter<std::thread::id>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::stringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !THROWLINE_FORMAT_HPP
