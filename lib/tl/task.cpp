/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tl/task.hpp>

namespace throwline {
    static thread_local cancel_token thread_token {};
    static thread_local cancel_token *current_token = nullptr;

    cancel_scope::cancel_scope(cancel_token &token): _prev { current_token }
    {
        current_token = &token;
    }

    cancel_scope::~cancel_scope()
    {
        current_token = _prev;
    }

    namespace this_task {
        cancel_token &token() noexcept
        {
            return current_token ? *current_token : thread_token;
        }

        void interrupt() noexcept
        {
            token().cancel();
        }

        bool is_interrupted() noexcept
        {
            return token().cancelled();
        }

        bool interrupted() noexcept
        {
            return token().reset();
        }
    }
}
