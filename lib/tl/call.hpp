/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_CALL_HPP
#define THROWLINE_CALL_HPP

#include <string_view>
#include <type_traits>
#include <tl/wrap.hpp>
#include <tl/wrapped.hpp>

/*
 * Runs a callback and converts whatever it throws into a wrapped_exception,
 * with fatal and logic errors passing through untouched. The message and the extra info,
 * when given, are stored on the wrapper only when wrapping actually happens.
 */
namespace throwline {
    template<typename F>
    std::invoke_result_t<F> call(F &&f)
    {
        try {
            return std::forward<F>(f)();
        } catch (...) {
            wrap_current<wrapped_exception>([](const throwable_ptr &cause) {
                return std::make_shared<wrapped_exception>(cause);
            })->rethrow();
        }
    }

    template<typename F>
    std::invoke_result_t<F> call(F &&f, const std::string_view message)
    {
        try {
            return std::forward<F>(f)();
        } catch (...) {
            wrap_current<wrapped_exception>([&](const throwable_ptr &cause) {
                return std::make_shared<wrapped_exception>(message, cause);
            })->rethrow();
        }
    }

    template<typename F, typename A, typename... Args>
    std::invoke_result_t<F> call(F &&f, const std::string_view message, A &&extra0, Args&&... extra)
    {
        try {
            return std::forward<F>(f)();
        } catch (...) {
            wrap_current<wrapped_exception>([&](const throwable_ptr &cause) {
                return std::make_shared<wrapped_exception>(message, cause,
                    make_extra_info(std::forward<A>(extra0), std::forward<Args>(extra)...));
            })->rethrow();
        }
    }

    template<typename F, typename... Args>
    std::invoke_result_t<F> call_with_info(F &&f, Args&&... extra)
    {
        try {
            return std::forward<F>(f)();
        } catch (...) {
            wrap_current<wrapped_exception>([&](const throwable_ptr &cause) {
                return std::make_shared<wrapped_exception>(cause, make_extra_info(std::forward<Args>(extra)...));
            })->rethrow();
        }
    }

    template<typename F>
    void run(F &&f)
    {
        call(std::forward<F>(f));
    }

    template<typename F>
    void run(F &&f, const std::string_view message)
    {
        call(std::forward<F>(f), message);
    }

    template<typename F, typename A, typename... Args>
    void run(F &&f, const std::string_view message, A &&extra0, Args&&... extra)
    {
        call(std::forward<F>(f), message, std::forward<A>(extra0), std::forward<Args>(extra)...);
    }

    template<typename F, typename... Args>
    void run_with_info(F &&f, Args&&... extra)
    {
        call_with_info(std::forward<F>(f), std::forward<Args>(extra)...);
    }
}

#endif // !THROWLINE_CALL_HPP
