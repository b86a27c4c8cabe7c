/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_TASK_HPP
#define THROWLINE_TASK_HPP

#include <atomic>

namespace throwline {
    struct cancel_token {
        void cancel() noexcept
        {
            _cancelled.store(true, std::memory_order_release);
        }

        [[nodiscard]] bool cancelled() const noexcept
        {
            return _cancelled.load(std::memory_order_acquire);
        }

        // clears the flag and returns its previous state
        bool reset() noexcept
        {
            return _cancelled.exchange(false, std::memory_order_acq_rel);
        }
    private:
        std::atomic_bool _cancelled { false };
    };

    // Makes the token the current task's token on this thread for the lifetime of the scope.
    struct cancel_scope {
        explicit cancel_scope(cancel_token &token);
        ~cancel_scope();

        cancel_scope(const cancel_scope &) =delete;
        cancel_scope &operator=(const cancel_scope &) =delete;
    private:
        cancel_token *_prev;
    };

    /*
     * The interruption state of the current task. Merging or wrapping an interruption error into
     * a value that is not itself an interruption sets it, so cancellation survives demotion of the
     * error to a suppressed entry or a cause.
     */
    namespace this_task {
        // the innermost bound cancel_scope's token or, without one, the thread's own token
        extern cancel_token &token() noexcept;
        extern void interrupt() noexcept;
        extern bool is_interrupted() noexcept;
        // tests and clears the interruption state
        extern bool interrupted() noexcept;
    }
}

#endif // !THROWLINE_TASK_HPP
