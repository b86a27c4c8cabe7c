/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_WRAPPED_HPP
#define THROWLINE_WRAPPED_HPP

#include <optional>
#include <string>
#include <vector>
#include <tl/errors.hpp>
#include <tl/format.hpp>

namespace throwline {
    using extra_info_list = std::vector<std::string>;

    template<typename... Args>
    extra_info_list make_extra_info(Args&&... a)
    {
        return { fmt::format("{}", std::forward<Args>(a))... };
    }

    // Errors carrying diagnostic values attached at the time of wrapping.
    struct extra_info_source {
        virtual ~extra_info_source() =default;
        [[nodiscard]] virtual const std::optional<extra_info_list> &extra_info() const noexcept =0;
    };

    namespace detail {
        extern std::optional<extra_info_list> inherited_extra_info(const throwable_ptr &cause);
    }

    /*
     * Wraps an error so that it can cross code that only expects logic or fatal errors.
     * Without an explicit message, message() and localized_message() return the cause's.
     * Without explicit extra info, the cause's extra info is inherited.
     */
    template<typename Self, typename Base>
    struct basic_wrapper: throwable_of<Self, Base>, extra_info_source {
        explicit basic_wrapper(const throwable_ptr &cause)
            : basic_wrapper { cause, std::optional<std::string> {}, detail::inherited_extra_info(cause) }
        {
        }

        basic_wrapper(const throwable_ptr &cause, extra_info_list extra)
            : basic_wrapper { cause, std::optional<std::string> {}, std::optional<extra_info_list> { std::move(extra) } }
        {
        }

        basic_wrapper(const std::string_view msg, const throwable_ptr &cause)
            : basic_wrapper { cause, std::optional<std::string> { msg }, detail::inherited_extra_info(cause) }
        {
        }

        basic_wrapper(const std::string_view msg, const throwable_ptr &cause, extra_info_list extra)
            : basic_wrapper { cause, std::optional<std::string> { msg }, std::optional<extra_info_list> { std::move(extra) } }
        {
        }

        // the complete state, used when the message or the extra info may be absent
        basic_wrapper(const throwable_ptr &cause, std::optional<std::string> msg, std::optional<extra_info_list> extra)
            : throwable_of<Self, Base> { cause, std::move(msg) }, _extra_info { std::move(extra) }
        {
        }

        std::optional<std::string> message() const override
        {
            if (auto msg = this->throwable::message(); msg)
                return msg;
            if (const auto &c = this->cause(); c)
                return c->message();
            return {};
        }

        std::optional<std::string> localized_message() const override
        {
            if (auto msg = this->throwable::message(); msg)
                return msg;
            if (const auto &c = this->cause(); c)
                return c->localized_message();
            return {};
        }

        [[nodiscard]] std::optional<std::string> own_message() const
        {
            return this->throwable::message();
        }

        const std::optional<extra_info_list> &extra_info() const noexcept override
        {
            return _extra_info;
        }
    private:
        std::optional<extra_info_list> _extra_info;
    };

    struct wrapped_exception: basic_wrapper<wrapped_exception, program_error> {
        using basic_wrapper::basic_wrapper;
    };

    struct wrapped_error: basic_wrapper<wrapped_error, fatal_error> {
        using basic_wrapper::basic_wrapper;
    };
}

#endif // !THROWLINE_WRAPPED_HPP
