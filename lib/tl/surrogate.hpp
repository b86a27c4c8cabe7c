/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_SURROGATE_HPP
#define THROWLINE_SURROGATE_HPP

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <tl/mutex.hpp>
#include <tl/throwable.hpp>

namespace throwline {
    /*
     * Creates a new value of the template's exact type with the template's state and the given cause.
     * Must not modify the template. Types without a cause constructor use init_cause on the new value.
     */
    using surrogate_factory = std::function<throwable_ptr(const throwable &tmpl, const throwable_ptr &cause)>;

    /*
     * Maps exact error types to their surrogate factories. Insert-only: a type can be registered once,
     * lookups may run concurrently with registrations of other types.
     */
    struct surrogate_registry {
        // The process-wide registry with the built-in factories and all discovered initializers applied.
        static surrogate_registry &get();

        surrogate_registry() =default;
        surrogate_registry(const surrogate_registry &) =delete;
        surrogate_registry &operator=(const surrogate_registry &) =delete;

        // throws illegal_state_error when the type already has a factory
        void add(std::type_index type, surrogate_factory factory);

        template<std::derived_from<throwable> T, typename F>
        void add(F factory)
        {
            add(typeid(T), [factory=std::move(factory)](const throwable &tmpl, const throwable_ptr &cause) -> throwable_ptr {
                return factory(static_cast<const T &>(tmpl), cause);
            });
        }

        [[nodiscard]] bool contains(std::type_index type) const;
        [[nodiscard]] size_t size() const;

        /*
         * Creates a value of the template's type with the caller's stack context and the given cause.
         * Returns the template itself when its type has no factory or the factory yields nothing usable,
         * the template then still carries the stack context of the thread that created it.
         */
        [[nodiscard]] throwable_ptr reconstruct(const throwable_ptr &tmpl, const throwable_ptr &cause) const;

        [[nodiscard]] throwable_ptr reconstruct(const throwable_ptr &tmpl) const
        {
            return reconstruct(tmpl, tmpl);
        }

        template<std::derived_from<throwable> T>
        [[nodiscard]] std::shared_ptr<T> reconstruct(const std::shared_ptr<T> &tmpl, const throwable_ptr &cause) const
        {
            const auto res = reconstruct(throwable_ptr { tmpl }, cause);
            if (res == tmpl)
                return tmpl;
            // the untyped overload has verified that res has the exact type of tmpl
            return std::static_pointer_cast<T>(res);
        }

        template<std::derived_from<throwable> T>
        [[nodiscard]] std::shared_ptr<T> reconstruct(const std::shared_ptr<T> &tmpl) const
        {
            return reconstruct(tmpl, tmpl);
        }
    private:
        alignas(mutex::alignment) mutable std::shared_mutex _mutex {};
        std::unordered_map<std::type_index, surrogate_factory> _factories {};

        std::optional<surrogate_factory> _find(std::type_index type) const;
    };

    /*
     * Registration callbacks supplied by other modules or plugins. Declare one at namespace scope:
     * the callback runs exactly once, either while the process-wide registry is first initialized
     * or right away when the registry has been initialized already.
     */
    struct surrogate_initializer {
        using action = std::function<void(surrogate_registry &)>;

        surrogate_initializer(std::string name, action act);
    };

    // The factories of the standard error types from errors.hpp.
    extern void register_builtin_factories(surrogate_registry &reg);

    template<std::derived_from<throwable> T>
    std::shared_ptr<T> reconstruct(const std::shared_ptr<T> &tmpl, const throwable_ptr &cause)
    {
        return surrogate_registry::get().reconstruct(tmpl, cause);
    }

    template<std::derived_from<throwable> T>
    std::shared_ptr<T> reconstruct(const std::shared_ptr<T> &tmpl)
    {
        return surrogate_registry::get().reconstruct(tmpl);
    }

    template<std::derived_from<throwable> T, typename F>
    void register_surrogate_factory(F factory)
    {
        surrogate_registry::get().add<T>(std::move(factory));
    }
}

#endif // !THROWLINE_SURROGATE_HPP
