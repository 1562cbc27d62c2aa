/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sf/config.hpp>
#include <sf/logger.hpp>

namespace script_forge::logger {
    namespace {
        std::string log_path()
        {
            if (const char *env_path = std::getenv("SF_LOG"); env_path)
                return install_path(env_path);
            return install_path("./log/sf.log");
        }

        std::vector<spdlog::sink_ptr> make_sinks(const std::string &path)
        {
            std::vector<spdlog::sink_ptr> sinks {};
            if (!std::getenv("SF_LOG_NO_CONSOLE")) {
                auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                console->set_level(spdlog::level::info);
                console->set_pattern("[%^%l%$] %v");
                sinks.emplace_back(std::move(console));
            }
            const std::filesystem::path p { path };
            if (p.has_parent_path())
                std::filesystem::create_directories(p.parent_path());
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
            file->set_level(spdlog::level::trace);
            file->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file));
            return sinks;
        }

        spdlog::logger &get()
        {
            static spdlog::logger instance = [] {
                const auto path = log_path();
                auto sinks = make_sinks(path);
                spdlog::logger l { "sf", sinks.begin(), sinks.end() };
                l.set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::debug);
                l.flush_on(spdlog::level::debug);
                l.debug("log path: {} installation directory: {}", path, install_path(""));
                return l;
            }();
            return instance;
        }

        spdlog::level::level_enum spdlog_level(const level lev)
        {
            switch (lev) {
                case level::trace: return spdlog::level::trace;
                case level::debug: return spdlog::level::debug;
                case level::info: return spdlog::level::info;
                case level::warn: return spdlog::level::warn;
                case level::error: return spdlog::level::err;
                default: throw script_forge::error("unsupported log level: {}", static_cast<int>(lev));
            }
        }
    }

    bool tracing_enabled()
    {
        static const bool enabled = std::getenv("SF_DEBUG") != nullptr;
        return enabled;
    }

    void log(const level lev, const std::string &msg)
    {
        get().log(spdlog_level(lev), msg);
    }
}
