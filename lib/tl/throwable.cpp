/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#ifdef __APPLE__
#   define _GNU_SOURCE 1
#endif
#include <iostream>
#include <stdexcept>
#include <boost/core/demangle.hpp>
#include <boost/stacktrace.hpp>
#include <tl/config.hpp>
#include <tl/errors.hpp>
#include <tl/format.hpp>
#include <tl/logger.hpp>

namespace throwline {
    std::string demangle(const char *name)
    {
        return boost::core::demangle(name);
    }

    stack_context::stack_context(const size_t skip):
        _thread_id { std::this_thread::get_id() }
    {
        _depth = boost::stacktrace::safe_dump_to(skip, _trace.data(), _trace.size());
    }

    std::string stack_context::to_string() const
    {
        if (!_depth)
            return {};
        return boost::stacktrace::to_string(boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size()));
    }

    struct throwable::state {
        std::optional<std::string> message;
        throwable_ptr cause;
        bool cause_set;
        std::vector<throwable_ptr> suppressed {};
        // skips the frames of safe_dump_to, stack_context, and the state construction
        stack_context stack { 3 };
        std::once_flag what_once {};
        std::string what_text {};

        state(std::optional<std::string> &&msg, const throwable_ptr &cause_, const bool cause_set_):
            message { std::move(msg) }, cause { cause_ }, cause_set { cause_set_ }
        {
        }
    };

    throwable::throwable():
        _state { std::make_shared<state>(std::optional<std::string> {}, throwable_ptr {}, false) }
    {
    }

    throwable::throwable(const std::string_view msg):
        _state { std::make_shared<state>(std::optional<std::string> { msg }, throwable_ptr {}, false) }
    {
    }

    throwable::throwable(const throwable_ptr &cause):
        _state { std::make_shared<state>(cause ? std::optional<std::string> { cause->to_string() } : std::optional<std::string> {}, cause, true) }
    {
    }

    throwable::throwable(const std::string_view msg, const throwable_ptr &cause):
        _state { std::make_shared<state>(std::optional<std::string> { msg }, cause, true) }
    {
    }

    throwable::throwable(const throwable_ptr &cause, std::optional<std::string> msg):
        _state { std::make_shared<state>(std::move(msg), cause, true) }
    {
    }

    const char *throwable::what() const noexcept
    {
        try {
            std::call_once(_state->what_once, [this] {
                _state->what_text = message().value_or(type_name());
                try {
                    if (config::get().stacktrace_logging)
                        logger::trace("stack trace for a user visible error: {}\n{}", _state->what_text, _state->stack.to_string());
                } catch (const std::exception &ex) {
                    std::cerr << "TL_WHAT: failed to log the stack trace of " << _state->what_text << ": " << ex.what() << '\n';
                }
            });
        } catch (const std::exception &) {
            // the text could not be computed, the once flag stays unset and the next call retries
            return typeid(*this).name();
        }
        return _state->what_text.c_str();
    }

    std::optional<std::string> throwable::message() const
    {
        return _state->message;
    }

    std::optional<std::string> throwable::localized_message() const
    {
        return message();
    }

    error_category throwable::category() const noexcept
    {
        return error_category::checked;
    }

    error_signal throwable::signal() const noexcept
    {
        return error_signal::none;
    }

    std::string throwable::type_name() const
    {
        return demangle(typeid(*this).name());
    }

    namespace detail {
        void throw_sliced(const throwable &err, const std::type_info &self)
        {
            throw illegal_state_error(fmt::format("{} derives from {} directly and can't be copied with its exact type, derive it through throwable_of",
                demangle(typeid(err).name()), demangle(self.name())));
        }
    }

    throwable_ptr throwable::clone() const
    {
        if (typeid(*this) != typeid(throwable))
            detail::throw_sliced(*this, typeid(throwable));
        return std::make_shared<throwable>(*this);
    }

    void throwable::rethrow() const
    {
        if (typeid(*this) != typeid(throwable))
            detail::throw_sliced(*this, typeid(throwable));
        throw *this;
    }

    const throwable_ptr &throwable::cause() const noexcept
    {
        return _state->cause;
    }

    void throwable::init_cause(const throwable_ptr &cause)
    {
        if (_state->cause_set)
            throw illegal_state_error(fmt::format("can't overwrite the cause of {} with {}",
                to_string(), cause ? cause->to_string() : std::string { "an absent value" }));
        if (cause && cause->same(*this))
            throw illegal_argument_error("self-causation is not permitted");
        _state->cause = cause;
        _state->cause_set = true;
    }

    const std::vector<throwable_ptr> &throwable::suppressed() const noexcept
    {
        return _state->suppressed;
    }

    void throwable::add_suppressed(const throwable_ptr &err)
    {
        if (!err)
            throw illegal_argument_error("cannot suppress an absent value");
        if (err->same(*this))
            throw illegal_argument_error(fmt::format("self-suppression is not permitted: {}", to_string()));
        _state->suppressed.emplace_back(err);
    }

    const stack_context &throwable::stack() const noexcept
    {
        return _state->stack;
    }

    std::string throwable::to_string() const
    {
        if (const auto msg = localized_message(); msg)
            return fmt::format("{}: {}", type_name(), *msg);
        return type_name();
    }

    throwable_ptr capture(const std::exception_ptr &ptr)
    {
        if (!ptr)
            return {};
        try {
            std::rethrow_exception(ptr);
        } catch (const throwable &t) {
            return t.clone();
        } catch (const std::bad_alloc &ex) {
            return std::make_shared<foreign_fatal_error>(ptr, demangle(typeid(ex).name()), ex.what());
        } catch (const std::logic_error &ex) {
            return std::make_shared<foreign_logic_error>(ptr, demangle(typeid(ex).name()), ex.what());
        } catch (const std::exception &ex) {
            return std::make_shared<foreign_error>(ptr, demangle(typeid(ex).name()), ex.what());
        } catch (...) {
            return std::make_shared<foreign_error>(ptr, "unknown exception", "an exception of a type not derived from std::exception");
        }
    }
}
