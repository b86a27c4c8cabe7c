/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THROWLINE_MUTEX_HPP
#define THROWLINE_MUTEX_HPP

#include <cstddef>
#include <mutex>
#include <new>
#include <shared_mutex>

namespace throwline::mutex {
    // keeps frequently locked mutexes of different objects on separate cache lines
#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Winterference-size"
#   endif
#endif
#   ifdef __cpp_lib_hardware_interference_size
    inline constexpr size_t alignment = std::hardware_destructive_interference_size;
#   else
    inline constexpr size_t alignment = 64;
#   endif
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

    // exclusive sections guarding plain state
    using scoped_lock = std::scoped_lock<std::mutex>;
    using unique_lock = std::unique_lock<std::mutex>;

    // lookup tables: many concurrent readers, rare writers
    using read_lock = std::shared_lock<std::shared_mutex>;
    using write_lock = std::unique_lock<std::shared_mutex>;
}

#endif // !THROWLINE_MUTEX_HPP
