/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <string_view>
#include <tl/config.hpp>

namespace throwline {
    // an unset variable, an empty value, or "0" leave the flag off
    static bool env_flag(const config::env_getter &getenv, const char *name)
    {
        const char *val = getenv(name);
        if (!val)
            return false;
        const std::string_view sv { val };
        return !sv.empty() && sv != "0";
    }

    config config::from_env(const env_getter &getenv)
    {
        config c {};
        if (const char *path = getenv("TL_LOG"); path && *path)
            c.log_path.emplace(path);
        c.log_console = !env_flag(getenv, "TL_LOG_NO_CONSOLE");
        c.tracing = env_flag(getenv, "TL_DEBUG");
        c.stacktrace_logging = env_flag(getenv, "TL_STACKTRACE");
        return c;
    }

    const config &config::get()
    {
        static config c = from_env([](const char *name) { return std::getenv(name); });
        return c;
    }
}
