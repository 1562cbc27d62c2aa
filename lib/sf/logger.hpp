/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_LOGGER_HPP
#define SCRIPT_FORGE_LOGGER_HPP

#include <exception>
#include <functional>
#include <optional>
#include <source_location>
#include <sf/common/error.hpp>
#include <sf/common/format.hpp>

namespace script_forge::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    extern void log(level lev, const std::string &msg);
    // trace messages are formatted only when SF_DEBUG is set
    extern bool tracing_enabled();

    template<typename... Args>
    void log(const level lev, const std::string_view fmt, Args &&...a)
    {
        log(lev, fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view fmt, Args &&...a)
    {
        if (tracing_enabled())
            log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view fmt, Args &&...a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view fmt, Args &&...a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view fmt, Args &&...a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view fmt, Args &&...a)
    {
        log(level::error, fmt, std::forward<Args>(a)...);
    }

    using action = std::function<void()>;

    // Logs the exception thrown by main, if any, and returns it
    inline std::exception_ptr run_log_errors(const action &main, const std::optional<action> &cleanup={},
            const std::source_location &loc=std::source_location::current())
    {
        std::exception_ptr cur_ex {};
        try {
            main();
        } catch (const std::exception &ex) {
            cur_ex = std::current_exception();
            logger::error("{}:{} failed: {}", loc.file_name(), loc.line(), ex.what());
        }
        if (cleanup)
            (*cleanup)();
        return cur_ex;
    }
}

#endif // !SCRIPT_FORGE_LOGGER_HPP
