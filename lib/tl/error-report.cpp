/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <ctime>
#include <sstream>
#include <unordered_set>
#include <fmt/chrono.h>
#include <tl/error-report.hpp>
#include <tl/format.hpp>

namespace throwline {
    using closed_set = std::unordered_set<const void *>;

    static std::string_view trim(std::string_view sv)
    {
        static constexpr std::string_view space { " \t\r\n" };
        const auto first = sv.find_first_not_of(space);
        if (first == sv.npos)
            return {};
        return sv.substr(first, sv.find_last_not_of(space) - first + 1);
    }

    // continuation lines are aligned with the text after the label
    static void print_message(std::ostream &os, const size_t indent, const std::string_view label, const std::string_view msg)
    {
        os << std::string(indent, ' ') << label;
        for (const char ch: trim(msg)) {
            if (ch == '\n')
                os << '\n' << std::string(indent + label.size(), ' ');
            else if (ch != '\r')
                os << ch;
        }
        os << '\n';
    }

    static void print_error(std::ostream &os, const throwable_ptr &err, const size_t indent, closed_set &closed)
    {
        os << std::string(indent, ' ') << err->type_name() << '\n';
        const auto msg = err->message();
        if (msg)
            print_message(os, indent + 4, "Message...........: ", *msg);
        if (const auto lmsg = err->localized_message(); lmsg && lmsg != msg)
            print_message(os, indent + 4, "Localized Message.: ", *lmsg);
        if (const auto *src = dynamic_cast<const extra_info_source *>(err.get()); src && src->extra_info()) {
            for (const auto &ei: *src->extra_info())
                print_message(os, indent + 4, "Extra Information.: ", ei);
        }
        print_message(os, indent + 4, "Thread............: ", fmt::format("{}", err->stack().thread_id()));
        if (const auto trace = err->stack().to_string(); !trace.empty()) {
            os << std::string(indent + 4, ' ') << "Stack Trace\n";
            std::istringstream is { trace };
            for (std::string line; std::getline(is, line); )
                os << std::string(indent + 8, ' ') << line << '\n';
        }
        for (const auto &s: err->suppressed()) {
            if (closed.emplace(s->identity()).second) {
                os << std::string(indent + 4, ' ') << "Suppressed\n";
                print_error(os, s, indent + 8, closed);
            }
        }
        if (const auto &cause = err->cause(); cause && closed.emplace(cause->identity()).second) {
            os << std::string(indent + 4, ' ') << "Caused By\n";
            print_error(os, cause, indent + 8, closed);
        }
    }

    void print_report(std::ostream &os, const throwable_ptr &err, const extra_info_list &extra)
    {
        os << '\n'
            << "**************************\n"
            << "* BEGIN EXCEPTION REPORT *\n"
            << "**************************\n"
            << '\n';
        os << "    Time\n";
        os << "        " << fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::time(nullptr))) << '\n';
        if (!extra.empty()) {
            os << "    Extra Information\n";
            for (const auto &ei: extra)
                os << "        " << ei << '\n';
        }
        os << "    Threading\n";
        os << "        Thread\n";
        os << "            ID..........: " << fmt::format("{}", std::this_thread::get_id()) << '\n';
        os << "    Exceptions\n";
        if (!err) {
            os << "        No exceptions\n";
        } else {
            closed_set closed { err->identity() };
            print_error(os, err, 8, closed);
        }
        os << '\n'
            << "**************************\n"
            << "*  END EXCEPTION REPORT  *\n"
            << "**************************\n";
        os.flush();
    }

    std::string report(const throwable_ptr &err, const extra_info_list &extra)
    {
        std::ostringstream ss {};
        print_report(ss, err, extra);
        return ss.str();
    }
}
