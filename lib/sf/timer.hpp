/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_TIMER_HPP
#define SCRIPT_FORGE_TIMER_HPP

#include <chrono>
#include <exception>
#include <string>
#include <sf/logger.hpp>

namespace script_forge {
    // logs the lifetime of a scope once it ends
    struct timer {
        using clock = std::chrono::steady_clock;

        explicit timer(std::string title, const logger::level lev=logger::level::trace):
            _title { std::move(title) }, _level { lev }
        {
        }

        timer(const timer &) = delete;
        timer &operator=(const timer &) = delete;

        ~timer()
        {
            const std::chrono::duration<double> secs = clock::now() - _start;
            logger::log(_level, "{} {} after {:0.3f} secs", _title,
                std::uncaught_exceptions() > _active_exceptions ? "failed" : "finished", secs.count());
        }
    private:
        const std::string _title;
        const logger::level _level;
        const int _active_exceptions = std::uncaught_exceptions();
        const clock::time_point _start = clock::now();
    };
}

#endif // !SCRIPT_FORGE_TIMER_HPP
