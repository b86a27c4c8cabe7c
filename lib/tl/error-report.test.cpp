/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tl/error-report.hpp>
#include <tl/test.hpp>

using namespace throwline;

namespace {
    size_t count_of(const std::string &text, const std::string_view needle)
    {
        size_t cnt = 0;
        for (auto pos = text.find(needle); pos != text.npos; pos = text.find(needle, pos + needle.size()))
            ++cnt;
        return cnt;
    }
}

suite error_report_suite = [] {
    "error report"_test = [] {
        "no error"_test = [] {
            const auto text = report({}, { "run 17" });
            expect(text.find("BEGIN EXCEPTION REPORT") != text.npos);
            expect(text.find("No exceptions") != text.npos);
            expect(text.find("run 17") != text.npos);
            expect(text.find("END EXCEPTION REPORT") != text.npos);
        };
        "causes and suppressed"_test = [] {
            const auto root = std::make_shared<io_error>("disk is full");
            const auto w = std::make_shared<wrapped_exception>("saving the report", root, make_extra_info("report.txt"));
            w->add_suppressed(std::make_shared<timeout_error>("cleanup\ntook too long"));
            const auto text = report(w);
            expect(text.find("throwline::wrapped_exception") != text.npos);
            expect(text.find("Message...........: saving the report") != text.npos);
            expect(text.find("Extra Information.: report.txt") != text.npos);
            expect(text.find("Caused By") != text.npos);
            expect(text.find("throwline::io_error") != text.npos);
            expect(text.find("Suppressed") != text.npos);
            expect(text.find("took too long") != text.npos);
            expect(text.find("\ntook too long") == text.npos);
        };
        "localized message"_test = [] {
            const auto w = std::make_shared<wrapped_exception>(std::make_shared<io_error>("disk is full"));
            const auto text = report(w);
            test_same(size_t { 2 }, count_of(text, "Message...........: disk is full"));
            expect(text.find("Localized Message.:") == text.npos);
        };
        "cycles and shared nodes"_test = [] {
            const auto a = std::make_shared<io_error>("node a");
            const auto b = std::make_shared<io_error>("node b");
            a->add_suppressed(b);
            b->add_suppressed(a);
            const auto c = std::make_shared<checked_error>("node c", b);
            c->add_suppressed(b);
            const auto text = report(c);
            test_same(size_t { 1 }, count_of(text, "Message...........: node a"));
            test_same(size_t { 1 }, count_of(text, "Message...........: node b"));
            test_same(size_t { 1 }, count_of(text, "Message...........: node c"));
        };
    };
};
