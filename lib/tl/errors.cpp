/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tl/errors.hpp>
#include <tl/format.hpp>

namespace throwline {
    static std::string file_error_message(const std::string &path, const std::optional<std::string> &other, const std::optional<std::string> &reason)
    {
        std::string msg { path };
        if (other)
            msg += fmt::format(" -> {}", *other);
        if (reason)
            msg += fmt::format(": {}", *reason);
        return msg;
    }

    file_error::file_error(std::string path):
        throwable_of { std::string_view { path } }, _path { std::move(path) }
    {
    }

    file_error::file_error(std::string path, std::optional<std::string> other, std::optional<std::string> reason):
        throwable_of { file_error_message(path, other, reason) },
        _path { std::move(path) }, _other { std::move(other) }, _reason { std::move(reason) }
    {
    }

    parse_error::parse_error(const std::string_view msg, const size_t offset):
        throwable_of { msg }, _offset { offset }
    {
    }
}
