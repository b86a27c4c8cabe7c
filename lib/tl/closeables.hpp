/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_CLOSEABLES_HPP
#define THROWLINE_CLOSEABLES_HPP

#include <functional>
#include <initializer_list>
#include <span>
#include <tl/suppression.hpp>

namespace throwline {
    struct closeable {
        virtual ~closeable() =default;
        virtual void close() =0;
    };

    struct closeable_fn: closeable {
        explicit closeable_fn(std::function<void()> fn): _fn { std::move(fn) }
        {
        }

        void close() override
        {
            _fn();
        }
    private:
        std::function<void()> _fn;
    };

    // Closes the given closeables in order, merging each failure into err. Absent closeables are skipped.
    extern throwable_ptr close_and_catch(throwable_ptr err, closeable *c);
    extern throwable_ptr close_and_catch(throwable_ptr err, std::span<closeable * const> cs);

    inline throwable_ptr close_and_catch(throwable_ptr err, const std::initializer_list<closeable *> cs)
    {
        return close_and_catch(std::move(err), std::span<closeable * const> { cs.begin(), cs.size() });
    }

    inline throwable_ptr close_and_catch(const std::initializer_list<closeable *> cs)
    {
        return close_and_catch(throwable_ptr {}, cs);
    }

    // Closes all, then raises the merged error as merge_and_throw does. Returns only when nothing failed.
    template<std::derived_from<throwable> X, typename F>
    void close_and_throw(const throwable_ptr &err, F &&supplier, const std::span<closeable * const> cs)
    {
        merge_and_throw<X>(close_and_catch(err, cs), std::forward<F>(supplier), throwable_ptr {});
    }

    template<std::derived_from<throwable> X, typename F>
    void close_and_throw(const throwable_ptr &err, F &&supplier, const std::initializer_list<closeable *> cs)
    {
        close_and_throw<X>(err, std::forward<F>(supplier), std::span<closeable * const> { cs.begin(), cs.size() });
    }

    /*
     * Closes all, then narrows the merged error to X as wrap does and returns it instead of raising it.
     * The result is absent when nothing failed. Fatal and logic errors are still raised.
     */
    template<std::derived_from<throwable> X, typename F>
    std::shared_ptr<X> close_and_wrap(const throwable_ptr &err, F &&supplier, const std::span<closeable * const> cs)
    {
        return wrap<X>(close_and_catch(err, cs), std::forward<F>(supplier));
    }

    template<std::derived_from<throwable> X, typename F>
    std::shared_ptr<X> close_and_wrap(const throwable_ptr &err, F &&supplier, const std::initializer_list<closeable *> cs)
    {
        return close_and_wrap<X>(err, std::forward<F>(supplier), std::span<closeable * const> { cs.begin(), cs.size() });
    }
}

#endif // !THROWLINE_CLOSEABLES_HPP
