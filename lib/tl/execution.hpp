/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_EXECUTION_HPP
#define THROWLINE_EXECUTION_HPP

#include <future>
#include <tl/errors.hpp>
#include <tl/surrogate.hpp>
#include <tl/task.hpp>

namespace throwline {
    // The failure of a task that ran on another thread, the cause is the task's own error.
    struct execution_error: throwable_of<execution_error, checked_error> {
        using throwable_of::throwable_of;
    };

    // Waits for the result, a failure of the task is raised as an execution_error caused by it.
    template<typename T>
    T get_result(std::future<T> &f)
    {
        try {
            return f.get();
        } catch (...) {
            throw execution_error(capture(std::current_exception()));
        }
    }

    /*
     * Raises the cause of ee when it is an X, re-created on the calling thread so that both the caller's and
     * the task's stack contexts are kept: first as a surrogate of the cause with ee as its cause, otherwise
     * through supplier(cause message, ee). Does nothing when the cause is not an X.
     *
     * try {
     *     return get_result(f);
     * } catch (const execution_error &ex) {
     *     const auto ee = std::static_pointer_cast<execution_error>(ex.clone());
     *     wrap_and_throw<io_error>(ee, [](const auto &msg, const auto &cause) {
     *         return std::make_shared<io_error>(msg.value_or(""), cause);
     *     });
     *     throw;
     * }
     */
    template<std::derived_from<throwable> X, typename F>
    void wrap_and_throw(const std::shared_ptr<execution_error> &ee, F &&supplier, const surrogate_registry &reg=surrogate_registry::get())
    {
        if (!ee)
            return;
        const auto tmpl = std::dynamic_pointer_cast<X>(ee->cause());
        if (!tmpl)
            return;
        if (const auto surrogate = reg.reconstruct(tmpl, ee); surrogate != tmpl)
            surrogate->rethrow();
        std::shared_ptr<X> res = std::forward<F>(supplier)(tmpl->message(), ee);
        if (!res)
            throw illegal_state_error("the wrapper supplier returned no value", ee);
        if (tmpl->signal() == error_signal::interruption && res->signal() != error_signal::interruption)
            this_task::interrupt();
        res->rethrow();
    }

    // Same as wrap_and_throw but gives the supplier the whole cause: supplier(const X &cause, ee).
    template<std::derived_from<throwable> X, typename F>
    void wrap_and_throw_with_template(const std::shared_ptr<execution_error> &ee, F &&supplier, const surrogate_registry &reg=surrogate_registry::get())
    {
        if (!ee)
            return;
        const auto tmpl = std::dynamic_pointer_cast<X>(ee->cause());
        if (!tmpl)
            return;
        if (const auto surrogate = reg.reconstruct(tmpl, ee); surrogate != tmpl)
            surrogate->rethrow();
        std::shared_ptr<X> res = std::forward<F>(supplier)(*tmpl, ee);
        if (!res)
            throw illegal_state_error("the wrapper supplier returned no value", ee);
        if (tmpl->signal() == error_signal::interruption && res->signal() != error_signal::interruption)
            this_task::interrupt();
        res->rethrow();
    }
}

#endif // !THROWLINE_EXECUTION_HPP
