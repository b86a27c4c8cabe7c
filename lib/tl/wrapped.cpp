/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tl/surrogate.hpp>
#include <tl/wrapped.hpp>

namespace throwline {
    namespace detail {
        std::optional<extra_info_list> inherited_extra_info(const throwable_ptr &cause)
        {
            if (const auto *src = dynamic_cast<const extra_info_source *>(cause.get()); src)
                return src->extra_info();
            return {};
        }
    }

    static surrogate_initializer wrapped_factories { "wrapped", [](surrogate_registry &reg) {
        reg.add<wrapped_exception>([](const wrapped_exception &tmpl, const throwable_ptr &cause) {
            return std::make_shared<wrapped_exception>(cause, tmpl.own_message(), tmpl.extra_info());
        });
        reg.add<wrapped_error>([](const wrapped_error &tmpl, const throwable_ptr &cause) {
            return std::make_shared<wrapped_error>(cause, tmpl.own_message(), tmpl.extra_info());
        });
    } };
}
