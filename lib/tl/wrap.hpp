/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_WRAP_HPP
#define THROWLINE_WRAP_HPP

#include <concepts>
#include <exception>
#include <memory>
#include <tl/errors.hpp>
#include <tl/task.hpp>

namespace throwline {
    /*
     * Narrows an error to the type X expected by the caller:
     * 1) an absent error gives an absent result;
     * 2) an X is returned as is;
     * 3) fatal and logic errors are re-raised directly without calling the supplier;
     * 4) anything else is wrapped by supplier(err) and returned for the caller to raise.
     * When an interruption is wrapped into a value that is not an interruption itself,
     * the current task is interrupted.
     *
     * try {
     *     ...
     * } catch (...) {
     *     wrap_current<io_error>([](const auto &cause) { return std::make_shared<io_error>(cause); })->rethrow();
     * }
     */
    template<std::derived_from<throwable> X, typename F>
    std::shared_ptr<X> wrap(const throwable_ptr &err, F &&supplier)
    {
        if (!err)
            return {};
        if (auto x = std::dynamic_pointer_cast<X>(err))
            return x;
        if (err->unrecoverable())
            err->rethrow();
        std::shared_ptr<X> wrapped = std::forward<F>(supplier)(err);
        if (!wrapped)
            throw illegal_state_error("the wrapper supplier returned no value", err);
        if (err->signal() == error_signal::interruption && wrapped->signal() != error_signal::interruption)
            this_task::interrupt();
        return wrapped;
    }

    template<std::derived_from<throwable> X, typename F>
    std::shared_ptr<X> wrap_current(F &&supplier)
    {
        return wrap<X>(capture(std::current_exception()), std::forward<F>(supplier));
    }
}

#endif // !THROWLINE_WRAP_HPP
