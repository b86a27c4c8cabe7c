/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <tl/logger.hpp>
#include <tl/suppression.hpp>
#include <tl/task.hpp>

namespace throwline {
    bool is_suppressed(const throwable &err, const throwable &suppressed)
    {
        const auto &list = err.suppressed();
        return std::any_of(list.begin(), list.end(), [&](const auto &s) { return s->same(suppressed); });
    }

    throwable_ptr merge(const throwable_ptr &primary, const throwable_ptr &additional)
    {
        if (!additional || (primary && additional->same(*primary)))
            return primary;
        if (!primary)
            return additional;
        if (additional->signal() == error_signal::interruption && primary->signal() != error_signal::interruption) {
            logger::debug("restoring the interruption of the current task demoted by {}", primary);
            this_task::interrupt();
        }
        auto res = primary;
        auto sup = additional;
        if (additional->signal() == error_signal::termination && primary->signal() != error_signal::termination) {
            logger::debug("{} takes precedence over {}", additional, primary);
            std::swap(res, sup);
        }
        if (!is_suppressed(*res, *sup))
            res->add_suppressed(sup);
        return res;
    }
}
