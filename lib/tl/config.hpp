/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_CONFIG_HPP
#define THROWLINE_CONFIG_HPP

#include <functional>
#include <optional>
#include <string>

namespace throwline {
    struct config {
        using env_getter = std::function<const char *(const char *)>;

        // TL_LOG
        std::optional<std::string> log_path {};
        // TL_LOG_NO_CONSOLE
        bool log_console = true;
        // TL_DEBUG
        bool tracing = false;
        // TL_STACKTRACE
        bool stacktrace_logging = false;

        // Read once from the process environment, must happen before any multi-threading code runs.
        static const config &get();
        static config from_env(const env_getter &getenv);
    };
}

#endif // !THROWLINE_CONFIG_HPP
