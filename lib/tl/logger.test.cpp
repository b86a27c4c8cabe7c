/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <stdexcept>
#include <tl/logger.hpp>
#include <tl/errors.hpp>
#include <tl/test.hpp>

using namespace throwline;

suite logger_suite = [] {
    "logger"_test = [] {
        "formatting"_test = [] {
            expect(nothrow([] {
                logger::debug("an error value: {}", std::make_shared<io_error>("disk is full"));
                logger::debug("no error: {}", throwable_ptr {});
                logger::trace("a thread: {}", std::this_thread::get_id());
            }));
        };
        "run_log_errors"_test = [] {
            size_t cleanups = 0;
            const auto ok = logger::run_log_errors([] {}, [&] { ++cleanups; });
            expect(!ok);
            const auto err = logger::run_log_errors([] { throw io_error("disk is full"); }, [&] { ++cleanups; });
            expect(err->type() == typeid(io_error));
            test_same(size_t { 2 }, cleanups);
            const auto foreign = logger::run_log_errors([] { throw std::runtime_error("runtime"); });
            test_same(std::string { "runtime" }, *foreign->message());
        };
        "run_log_errors_rethrow"_test = [] {
            expect(throws<io_error>([] { logger::run_log_errors_rethrow([] { throw io_error("disk is full"); }); }));
            expect(throws<std::runtime_error>([] { logger::run_log_errors_rethrow([] { throw std::runtime_error("runtime"); }); }));
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
        };
    };
};
