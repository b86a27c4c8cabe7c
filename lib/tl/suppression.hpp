/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_SUPPRESSION_HPP
#define THROWLINE_SUPPRESSION_HPP

#include <tl/throwable.hpp>
#include <tl/wrap.hpp>

namespace throwline {
    extern bool is_suppressed(const throwable &err, const throwable &suppressed);

    /*
     * Combines two errors into one: additional is recorded as suppressed by primary, unless it is absent,
     * the same value as primary, or already suppressed by it. When primary is absent, additional is returned.
     *
     * Two rules keep signals from getting lost:
     * - an interruption merged into a value that is not an interruption interrupts the current task;
     * - a termination signal merged into a value that is not a termination takes precedence: the roles swap,
     *   additional is returned with primary in ITS suppressed list. Code inspecting suppressed errors after
     *   a merge must use the returned value, which may not be the primary it passed in.
     */
    extern throwable_ptr merge(const throwable_ptr &primary, const throwable_ptr &additional);

    /*
     * Merges the errors and raises the result: fatal and logic errors and values of type X directly,
     * anything else wrapped with supplier. Returns only when both errors are absent.
     */
    template<std::derived_from<throwable> X, typename F>
    void merge_and_throw(const throwable_ptr &primary, F &&supplier, const throwable_ptr &additional)
    {
        if (const auto merged = merge(primary, additional); merged)
            wrap<X>(merged, std::forward<F>(supplier))->rethrow();
    }
}

#endif // !THROWLINE_SUPPRESSION_HPP
