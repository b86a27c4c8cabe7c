/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <stdexcept>
#include <tl/call.hpp>
#include <tl/test.hpp>

using namespace throwline;

suite call_suite = [] {
    "call"_test = [] {
        "result"_test = [] {
            test_same(42, throwline::call([] { return 42; }));
            test_same(std::string { "ok" }, throwline::call([] { return std::string { "ok" }; }, "never used"));
        };
        "checked errors are wrapped"_test = [] {
            const auto err = catch_error([] { static_cast<void>(throwline::call([]() -> int { throw io_error("disk is full"); })); });
            const auto w = std::dynamic_pointer_cast<wrapped_exception>(err);
            expect(static_cast<bool>(w));
            expect(w->cause()->type() == typeid(io_error));
            test_same(std::string { "disk is full" }, *w->message());
            expect(!w->own_message());
            expect(!w->extra_info());
        };
        "message and extra info"_test = [] {
            const auto err = catch_error([] {
                static_cast<void>(throwline::call([]() -> int { throw timeout_error("slow"); }, "loading {}", "config.json", 7));
            });
            const auto w = std::dynamic_pointer_cast<wrapped_exception>(err);
            expect(static_cast<bool>(w));
            test_same(std::string { "loading {}" }, *w->own_message());
            test_same(size_t { 2 }, w->extra_info()->size());
            test_same(std::string { "config.json" }, w->extra_info()->at(0));
            test_same(std::string { "7" }, w->extra_info()->at(1));
        };
        "extra info only"_test = [] {
            const auto err = catch_error([] {
                static_cast<void>(throwline::call_with_info([]() -> int { throw std::runtime_error("runtime"); }, 1, 2.5));
            });
            const auto w = std::dynamic_pointer_cast<wrapped_exception>(err);
            expect(static_cast<bool>(w));
            expect(!w->own_message());
            test_same(std::string { "runtime" }, *w->message());
            test_same(std::string { "2.5" }, w->extra_info()->at(1));
        };
        "logic and fatal errors pass"_test = [] {
            expect(throws<illegal_state_error>([] { static_cast<void>(throwline::call([]() -> int { throw illegal_state_error("bug"); })); }));
            expect(throws<std::out_of_range>([] { static_cast<void>(throwline::call([]() -> int { throw std::out_of_range("range"); }, "msg")); }));
            expect(throws<thread_death>([] { static_cast<void>(throwline::call([]() -> int { throw thread_death {}; }, "msg", 1)); }));
        };
        "wrapped errors are not rewrapped"_test = [] {
            const auto inner = std::make_shared<wrapped_exception>(std::make_shared<io_error>("x"));
            const auto err = catch_error([&] { static_cast<void>(throwline::call([&]() -> int { inner->rethrow(); }, "outer")); });
            expect(err->same(*inner));
        };
        "interruption"_test = [] {
            cancel_token tok {};
            cancel_scope scope { tok };
            const auto err = catch_error([] { static_cast<void>(throwline::call([]() -> int { throw interrupted_error {}; })); });
            expect(static_cast<bool>(std::dynamic_pointer_cast<wrapped_exception>(err)));
            expect(this_task::is_interrupted());
        };
    };
    "run"_test = [] {
        size_t runs = 0;
        throwline::run([&] { ++runs; });
        throwline::run([&] { ++runs; }, "msg");
        throwline::run([&] { ++runs; }, "msg", 1);
        throwline::run_with_info([&] { ++runs; }, 1, 2);
        test_same(size_t { 4 }, runs);
        expect(throws<wrapped_exception>([] { throwline::run([] { throw io_error("x"); }); }));
        expect(throws<wrapped_exception>([] { throwline::run([] { throw io_error("x"); }, "msg"); }));
        expect(throws<wrapped_exception>([] { throwline::run([] { throw io_error("x"); }, "msg", "a", "b"); }));
        expect(throws<wrapped_exception>([] { throwline::run_with_info([] { throw io_error("x"); }, "a"); }));
    };
};
