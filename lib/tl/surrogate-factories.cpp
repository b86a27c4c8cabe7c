/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tl/errors.hpp>
#include <tl/execution.hpp>
#include <tl/surrogate.hpp>

namespace throwline {
    // for types with the (), (msg), (cause), and (msg, cause) constructors
    template<typename T>
    static std::shared_ptr<T> surrogate_with_message(const T &tmpl, const throwable_ptr &cause)
    {
        if (const auto msg = tmpl.message(); msg)
            return std::make_shared<T>(*msg, cause);
        auto x = std::make_shared<T>();
        x->init_cause(cause);
        return x;
    }

    // for types with the () and (msg) constructors only
    template<typename T>
    static std::shared_ptr<T> surrogate_init_cause(const T &tmpl, const throwable_ptr &cause)
    {
        const auto msg = tmpl.message();
        auto x = msg ? std::make_shared<T>(*msg) : std::make_shared<T>();
        x->init_cause(cause);
        return x;
    }

    void register_builtin_factories(surrogate_registry &reg)
    {
        reg.add<throwable>(surrogate_with_message<throwable>);
        reg.add<fatal_error>(surrogate_with_message<fatal_error>);
        reg.add<thread_death>([](const thread_death &, const throwable_ptr &cause) {
            // does not accept a message
            auto x = std::make_shared<thread_death>();
            x->init_cause(cause);
            return x;
        });
        reg.add<program_error>(surrogate_with_message<program_error>);
        reg.add<illegal_state_error>(surrogate_with_message<illegal_state_error>);
        reg.add<illegal_argument_error>(surrogate_with_message<illegal_argument_error>);
        reg.add<unsupported_operation_error>(surrogate_with_message<unsupported_operation_error>);
        reg.add<checked_error>(surrogate_with_message<checked_error>);
        reg.add<interrupted_error>(surrogate_init_cause<interrupted_error>);
        reg.add<io_error>(surrogate_with_message<io_error>);
        reg.add<file_error>([](const file_error &tmpl, const throwable_ptr &cause) {
            // the message is derived from the fields
            auto x = std::make_shared<file_error>(tmpl.path(), tmpl.other(), tmpl.reason());
            x->init_cause(cause);
            return x;
        });
        reg.add<parse_error>([](const parse_error &tmpl, const throwable_ptr &cause) {
            auto x = std::make_shared<parse_error>(tmpl.message().value_or(""), tmpl.offset());
            x->init_cause(cause);
            return x;
        });
        reg.add<timeout_error>(surrogate_init_cause<timeout_error>);
        reg.add<execution_error>(surrogate_with_message<execution_error>);
    }
}
