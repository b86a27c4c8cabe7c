/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <tl/config.hpp>
#include <tl/errors.hpp>
#include <tl/logger.hpp>

namespace throwline::logger {
    static bool file_writable(const std::string &path)
    {
        std::ofstream os { path, std::ios_base::app };
        return static_cast<bool>(os);
    }

    static spdlog::logger create(const config &cfg)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (cfg.log_console) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (cfg.log_path) {
            if (file_writable(*cfg.log_path)) {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*cfg.log_path);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
                sinks.emplace_back(std::move(file_sink));
            } else {
                std::cerr << fmt::format("TL_INIT: unable to write to the log file: {}; file logging is disabled\n", *cfg.log_path);
            }
        }
        spdlog::logger logger { "tl", sinks.begin(), sinks.end() };
        if (cfg.tracing) {
            logger.set_level(spdlog::level::trace);
        } else {
            logger.set_level(spdlog::level::debug);
        }
        logger.flush_on(spdlog::level::debug);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(config::get());
        return logger;
    }

    void log(level lev, const std::string &msg)
    {
        switch (lev) {
            case level::trace:
                get().trace(msg);
                break;
            case level::debug:
                get().debug(msg);
                break;
            case level::info:
                get().info(msg);
                break;
            case level::warn:
                get().warn(msg);
                break;
            case level::error:
                get().error(msg);
                break;
            default:
                throw illegal_argument_error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }
}
