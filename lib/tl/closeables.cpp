/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tl/closeables.hpp>

namespace throwline {
    throwable_ptr close_and_catch(throwable_ptr err, closeable *c)
    {
        if (c) {
            try {
                c->close();
            } catch (...) {
                err = merge(err, capture(std::current_exception()));
            }
        }
        return err;
    }

    throwable_ptr close_and_catch(throwable_ptr err, const std::span<closeable * const> cs)
    {
        for (auto *c: cs)
            err = close_and_catch(std::move(err), c);
        return err;
    }
}
