/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tl/wrapped.hpp>
#include <tl/test.hpp>

using namespace throwline;

suite wrapped_suite = [] {
    "wrapped_exception"_test = [] {
        "classification"_test = [] {
            const auto cause = std::make_shared<io_error>("disk is full");
            expect(wrapped_exception { cause }.category() == error_category::logic);
            expect(wrapped_error { cause }.category() == error_category::fatal);
        };
        "message fallback"_test = [] {
            const auto cause = std::make_shared<io_error>("disk is full");
            const wrapped_exception w { cause };
            test_same(std::string { "disk is full" }, *w.message());
            test_same(std::string { "disk is full" }, *w.localized_message());
            test_same(std::string { "disk is full" }, std::string { w.what() });
            expect(!w.own_message());
            const wrapped_exception no_cause { throwable_ptr {} };
            expect(!no_cause.message());
        };
        "own message"_test = [] {
            const auto cause = std::make_shared<io_error>("disk is full");
            const wrapped_exception w { "saving the report", cause };
            test_same(std::string { "saving the report" }, *w.message());
            test_same(std::string { "saving the report" }, *w.own_message());
            expect(w.cause() == cause);
        };
        "extra info"_test = [] {
            const auto cause = std::make_shared<io_error>("disk is full");
            const auto inner = std::make_shared<wrapped_exception>(cause, make_extra_info("report.txt", 3));
            test_same(std::string { "report.txt" }, inner->extra_info()->at(0));
            const wrapped_exception outer { "outer", inner };
            expect(static_cast<bool>(outer.extra_info()));
            test_same(std::string { "3" }, outer.extra_info()->at(1));
            const wrapped_error replaced { inner, extra_info_list { "other" } };
            test_same(size_t { 1 }, replaced.extra_info()->size());
            const wrapped_exception plain { cause };
            expect(!plain.extra_info());
        };
    };
};
