/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cerrno>
#include <cstring>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include <sf/common/error.hpp>
#include <sf/logger.hpp>

namespace script_forge {
    namespace {
        // renders a saved stack dump into a fixed per-thread buffer
        const char *render_trace(const std::byte *dump, const size_t size)
        {
            thread_local std::array<char, 0x2000> text {};
            boost::interprocess::obufferstream os { text.data(), text.size() - 1 };
            os << boost::stacktrace::stacktrace::from_dump(dump, size);
            text[os.buffer().second] = '\0';
            return text.data();
        }
    }

    base_error::base_error(const std::string_view msg): _msg { msg }
    {
        // the top frames belong to the error constructors
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    const char *base_error::what() const noexcept
    {
        if (logger::tracing_enabled())
            logger::trace("{} was raised at:\n{}", _msg, render_trace(_trace.data(), _trace.size()));
        return _msg.c_str();
    }

    error::error(const std::string_view msg): base_error { msg }
    {
    }

    error_sys::error_sys(const std::string_view msg):
        error { "{} errno: {} strerror: {}", msg, errno, std::strerror(errno) }
    {
    }
}
