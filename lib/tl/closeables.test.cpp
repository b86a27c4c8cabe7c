/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <stdexcept>
#include <tl/closeables.hpp>
#include <tl/test.hpp>

using namespace throwline;

suite closeables_suite = [] {
    "close_and_catch"_test = [] {
        "all succeed"_test = [] {
            size_t closed = 0;
            closeable_fn a { [&] { ++closed; } };
            closeable_fn b { [&] { ++closed; } };
            expect(!close_and_catch({ &a, nullptr, &b }));
            test_same(size_t { 2 }, closed);
        };
        "failures are merged"_test = [] {
            size_t closed = 0;
            closeable_fn a { [&] { ++closed; throw io_error("a"); } };
            closeable_fn b { [&] { ++closed; throw std::runtime_error("b"); } };
            closeable_fn c { [&] { ++closed; } };
            const auto err = close_and_catch({ &a, &b, &c });
            test_same(size_t { 3 }, closed);
            test_same(std::string { "a" }, *err->message());
            test_same(size_t { 1 }, err->suppressed().size());
            test_same(std::string { "b" }, *err->suppressed().at(0)->message());
        };
        "into an existing error"_test = [] {
            const throwable_ptr primary = std::make_shared<timeout_error>("slow");
            closeable_fn a { [] { throw io_error("a"); } };
            std::array<closeable *, 1> cs { &a };
            const auto err = close_and_catch(primary, std::span<closeable * const> { cs });
            expect(err == primary);
            test_same(size_t { 1 }, primary->suppressed().size());
        };
    };
    "close_and_throw"_test = [] {
        const auto to_io = [](const throwable_ptr &cause) { return std::make_shared<io_error>("closing", cause); };
        "nothing failed"_test = [&] {
            closeable_fn a { [] {} };
            expect(nothrow([&] { close_and_throw<io_error>({}, to_io, { &a }); }));
        };
        "close failure is wrapped"_test = [&] {
            closeable_fn a { [] { throw timeout_error("slow"); } };
            const auto err = catch_error([&] { close_and_throw<io_error>({}, to_io, { &a }); });
            expect(err->type() == typeid(io_error));
            test_same(std::string { "closing" }, *err->message());
            expect(err->cause()->type() == typeid(timeout_error));
        };
        "span of closeables"_test = [&] {
            closeable_fn a { [] { throw timeout_error("slow"); } };
            closeable_fn b { [] { throw io_error("b"); } };
            std::array<closeable *, 2> cs { &a, &b };
            const auto err = catch_error([&] { close_and_throw<io_error>({}, to_io, std::span<closeable * const> { cs }); });
            expect(err->type() == typeid(io_error));
            test_same(std::string { "closing" }, *err->message());
            test_same(size_t { 1 }, err->cause()->suppressed().size());
        };
        "fatal close failure surfaces"_test = [&] {
            const auto primary = std::make_shared<io_error>("body");
            closeable_fn a { [] { throw thread_death {}; } };
            const auto err = catch_error([&] { close_and_throw<io_error>(primary, to_io, { &a }); });
            expect(err->type() == typeid(thread_death));
            expect(is_suppressed(*err, *primary));
        };
    };
    "close_and_wrap"_test = [] {
        const auto to_io = [](const throwable_ptr &cause) { return std::make_shared<io_error>("closing", cause); };
        "nothing failed"_test = [&] {
            closeable_fn a { [] {} };
            expect(!close_and_wrap<io_error>({}, to_io, { &a }));
        };
        "returned instead of raised"_test = [&] {
            const auto primary = std::make_shared<timeout_error>("slow");
            closeable_fn a { [] { throw std::runtime_error("close failed"); } };
            std::array<closeable *, 1> cs { &a };
            const auto res = close_and_wrap<io_error>(primary, to_io, std::span<closeable * const> { cs });
            expect(res->type() == typeid(io_error));
            expect(res->cause() == primary);
            test_same(size_t { 1 }, primary->suppressed().size());
        };
        "expected type kept"_test = [&] {
            closeable_fn a { [] { throw file_error("/tmp/a"); } };
            const auto res = close_and_wrap<io_error>({}, to_io, { &a });
            expect(res->type() == typeid(file_error));
        };
        "logic errors are raised"_test = [&] {
            closeable_fn a { [] { throw illegal_state_error("bug"); } };
            expect(throws<illegal_state_error>([&] { static_cast<void>(close_and_wrap<io_error>({}, to_io, { &a })); }));
        };
    };
};
