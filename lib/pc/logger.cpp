/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <pc/logger.hpp>
#include <pc/mutex.hpp>

namespace praos_crypto::logger {
    alignas(mutex::alignment) static mutex::unique_lock::mutex_type last_error_mutex {};
    static std::shared_ptr<std::string> last_error_ptr {};

    std::shared_ptr<std::string> last_error()
    {
        mutex::scoped_lock lk { last_error_mutex };
        return last_error_ptr;
    }

    void reset_last_error()
    {
        mutex::scoped_lock lk { last_error_mutex };
        return last_error_ptr.reset();
    }

    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("PC_DEBUG") != nullptr;
        return enabled;
    }

    static std::optional<std::string> log_path()
    {
        if (const char *env_log_path = std::getenv("PC_LOG"); env_log_path)
            return std::string { env_log_path };
        return {};
    }

    static bool console_enabled()
    {
        return !std::getenv("PC_LOG_NO_CONSOLE");
    }

    static spdlog::logger create(const std::optional<std::string> &path)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (console_enabled()) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (path) {
            std::ofstream os { *path, std::ios_base::app };
            if (os) {
                os.close();
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*path);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
                sinks.emplace_back(std::move(file_sink));
            } else {
                std::cerr << fmt::format("PC_INIT: unable to write to the log file: {}; file logging is disabled\n", *path);
            }
        }
        spdlog::logger logger { "pc", sinks.begin(), sinks.end() };
        if (tracing_enabled()) {
            logger.set_level(spdlog::level::trace);
        } else {
            logger.set_level(spdlog::level::debug);
        }
        logger.flush_on(spdlog::level::debug);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
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
            case level::error: {
                get().error(msg);
                mutex::scoped_lock lk { last_error_mutex };
                last_error_ptr = std::make_shared<std::string>(msg);
                break;
            }
            default:
                throw praos_crypto::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }
}
