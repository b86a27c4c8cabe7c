/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_THROWABLE_HPP
#define THROWLINE_THROWABLE_HPP

#include <array>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace throwline {
    struct throwable;
    using throwable_ptr = std::shared_ptr<throwable>;

    // The fixed never-wrap classification used by wrap and merge_and_throw:
    // fatal and logic errors always propagate untouched.
    enum class error_category {
        fatal,
        logic,
        checked
    };

    enum class error_signal {
        none,
        interruption,
        termination
    };

    extern std::string demangle(const char *name);

    struct stack_context {
        static constexpr size_t max_depth = 0x20;

        explicit stack_context(size_t skip);

        [[nodiscard]] std::thread::id thread_id() const noexcept
        {
            return _thread_id;
        }

        [[nodiscard]] size_t depth() const noexcept
        {
            return _depth;
        }

        // Resolves the captured frames into text; slow, meant for reports and debugging.
        [[nodiscard]] std::string to_string() const;
    private:
        std::array<std::byte, sizeof(void*) * max_depth> _trace {};
        size_t _depth = 0;
        std::thread::id _thread_id;
    };

    /*
     * The root of all error values. The runtime copies exception objects when throwing them,
     * so the observable state lives in a shared block: every copy of a value has the same identity,
     * the same cause, and the same suppressed list.
     */
    struct throwable: std::exception {
        throwable();
        explicit throwable(std::string_view msg);
        explicit throwable(const throwable_ptr &cause);
        throwable(std::string_view msg, const throwable_ptr &cause);
        ~throwable() override =default;

        const char *what() const noexcept override;

        [[nodiscard]] virtual std::optional<std::string> message() const;
        [[nodiscard]] virtual std::optional<std::string> localized_message() const;
        [[nodiscard]] virtual error_category category() const noexcept;
        [[nodiscard]] virtual error_signal signal() const noexcept;
        [[nodiscard]] virtual std::string type_name() const;
        [[nodiscard]] virtual throwable_ptr clone() const;
        [[noreturn]] virtual void rethrow() const;

        [[nodiscard]] std::type_index type() const noexcept
        {
            return typeid(*this);
        }

        [[nodiscard]] bool unrecoverable() const noexcept
        {
            return category() != error_category::checked;
        }

        [[nodiscard]] const void *identity() const noexcept
        {
            return _state.get();
        }

        [[nodiscard]] bool same(const throwable &o) const noexcept
        {
            return _state == o._state;
        }

        [[nodiscard]] const throwable_ptr &cause() const noexcept;
        void init_cause(const throwable_ptr &cause);

        [[nodiscard]] const std::vector<throwable_ptr> &suppressed() const noexcept;
        void add_suppressed(const throwable_ptr &err);

        [[nodiscard]] const stack_context &stack() const noexcept;
        [[nodiscard]] std::string to_string() const;
    protected:
        // Leaves the message unset when msg is empty, used by types that derive their message from the cause.
        throwable(const throwable_ptr &cause, std::optional<std::string> msg);
    private:
        struct state;
        std::shared_ptr<state> _state;
    };

    namespace detail {
        // Raises illegal_state_error for a type that derives from Self without going through throwable_of,
        // copying such a value as Self would lose its exact type.
        [[noreturn]] extern void throw_sliced(const throwable &err, const std::type_info &self);
    }

    // Supplies clone and rethrow with the exact dynamic type of a derived error.
    template<typename Self, typename Base>
    struct throwable_of: Base {
        using Base::Base;

        [[nodiscard]] throwable_ptr clone() const override
        {
            if (typeid(*this) != typeid(Self))
                detail::throw_sliced(*this, typeid(Self));
            return std::make_shared<Self>(static_cast<const Self &>(*this));
        }

        [[noreturn]] void rethrow() const override
        {
            if (typeid(*this) != typeid(Self))
                detail::throw_sliced(*this, typeid(Self));
            throw static_cast<const Self &>(*this);
        }
    };

    // Converts any in-flight exception into an error value, std exceptions become foreign wrappers.
    extern throwable_ptr capture(const std::exception_ptr &ptr);
}

#endif // !THROWLINE_THROWABLE_HPP
