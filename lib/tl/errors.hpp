/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_ERRORS_HPP
#define THROWLINE_ERRORS_HPP

#include <cstddef>
#include <tl/throwable.hpp>

namespace throwline {
    struct fatal_error: throwable_of<fatal_error, throwable> {
        using throwable_of::throwable_of;

        error_category category() const noexcept override
        {
            return error_category::fatal;
        }
    };

    // Asks the current thread to stop, takes precedence over any other error in merges.
    struct thread_death: throwable_of<thread_death, fatal_error> {
        thread_death(): throwable_of {}
        {
        }

        error_signal signal() const noexcept override
        {
            return error_signal::termination;
        }
    };

    struct program_error: throwable_of<program_error, throwable> {
        using throwable_of::throwable_of;

        error_category category() const noexcept override
        {
            return error_category::logic;
        }
    };

    struct illegal_state_error: throwable_of<illegal_state_error, program_error> {
        using throwable_of::throwable_of;
    };

    struct illegal_argument_error: throwable_of<illegal_argument_error, program_error> {
        using throwable_of::throwable_of;
    };

    struct unsupported_operation_error: throwable_of<unsupported_operation_error, program_error> {
        using throwable_of::throwable_of;
    };

    struct checked_error: throwable_of<checked_error, throwable> {
        using throwable_of::throwable_of;
    };

    struct interrupted_error: throwable_of<interrupted_error, checked_error> {
        interrupted_error(): throwable_of {}
        {
        }

        explicit interrupted_error(const std::string_view msg): throwable_of { msg }
        {
        }

        error_signal signal() const noexcept override
        {
            return error_signal::interruption;
        }
    };

    struct io_error: throwable_of<io_error, checked_error> {
        using throwable_of::throwable_of;
    };

    struct file_error: throwable_of<file_error, io_error> {
        explicit file_error(std::string path);
        file_error(std::string path, std::optional<std::string> other, std::optional<std::string> reason);

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }

        [[nodiscard]] const std::optional<std::string> &other() const noexcept
        {
            return _other;
        }

        [[nodiscard]] const std::optional<std::string> &reason() const noexcept
        {
            return _reason;
        }
    private:
        std::string _path;
        std::optional<std::string> _other;
        std::optional<std::string> _reason;
    };

    struct parse_error: throwable_of<parse_error, checked_error> {
        parse_error(std::string_view msg, size_t offset);

        [[nodiscard]] size_t offset() const noexcept
        {
            return _offset;
        }
    private:
        size_t _offset;
    };

    struct timeout_error: throwable_of<timeout_error, checked_error> {
        timeout_error(): throwable_of {}
        {
        }

        explicit timeout_error(const std::string_view msg): throwable_of { msg }
        {
        }
    };

    /*
     * An exception that does not derive from throwable, as captured by capture().
     * Re-raising throws the original exception object untouched unless suppressed errors
     * were merged into the wrapper; then the wrapper itself is thrown so they are not lost.
     */
    template<typename Base>
    struct foreign_exception: throwable_of<foreign_exception<Base>, Base> {
        foreign_exception(std::exception_ptr original, std::string original_type, const std::string_view msg)
            : throwable_of<foreign_exception<Base>, Base> { msg }, _original { std::move(original) }, _original_type { std::move(original_type) }
        {
        }

        [[nodiscard]] const std::exception_ptr &original() const noexcept
        {
            return _original;
        }

        std::string type_name() const override
        {
            return _original_type;
        }

        [[noreturn]] void rethrow() const override
        {
            if (this->suppressed().empty())
                std::rethrow_exception(_original);
            throw *this;
        }
    private:
        std::exception_ptr _original;
        std::string _original_type;
    };

    using foreign_error = foreign_exception<checked_error>;
    using foreign_logic_error = foreign_exception<program_error>;
    using foreign_fatal_error = foreign_exception<fatal_error>;
}

#endif // !THROWLINE_ERRORS_HPP
