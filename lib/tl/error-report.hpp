/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_ERROR_REPORT_HPP
#define THROWLINE_ERROR_REPORT_HPP

#include <ostream>
#include <string>
#include <tl/wrapped.hpp>

namespace throwline {
    /*
     * Writes a human readable report of an error: the time, the extra information, the current thread,
     * and then the error with its stack context, its suppressed errors and its causes.
     * Every error is printed once even when the graph has cycles or shared nodes.
     */
    extern void print_report(std::ostream &os, const throwable_ptr &err, const extra_info_list &extra={});
    extern std::string report(const throwable_ptr &err, const extra_info_list &extra={});
}

#endif // !THROWLINE_ERROR_REPORT_HPP
