/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <optional>
#include <sf/common/test.hpp>
#include <sf/common/bytes.hpp>

using namespace script_forge;

namespace {
    const std::string no_error_msg {
#ifdef __APPLE__
        "Undefined error: 0"
#elif _WIN32
        "No error"
#else
        "Success"
#endif
    };

    template<typename F>
    void expect_throws_msg(const F &f, const std::string &match, const std::source_location &src_loc=std::source_location::current())
    {
        expect(boost::ut::throws<error>(f)) << "no exception has been thrown";
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const error &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg)) << "exception message is empty";
        if (msg) {
            const auto descr = fmt::format("'{}' does not start with '{}' from {}:{}", *msg, match, src_loc.file_name(), src_loc.line());
            test_same(descr, true, msg->starts_with(match));
        }
    }
}

suite error_suite = [] {
    "error"_test = [] {
        "no_args"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, "Hello!");
        };
        "format args"_test = [] {
            expect_throws_msg([] { throw error("Hello {} and {}!", 123, "world"); }, "Hello 123 and world!");
        };
        "buffer"_test = [] {
            const auto buf = uint8_vector::from_hex("DEADBEEF");
            expect_throws_msg([&] { throw error("Hello {}!", buf); }, "Hello DEADBEEF!");
        };
        "what is stable"_test = [] {
            const error err { "script of {} bytes", 3 };
            test_same(std::string_view { "script of 3 bytes" }, std::string_view { err.what() });
            test_same(std::string_view { err.what() }, std::string_view { err.what() });
        };
        "error_sys_ok"_test = [] {
            expect_throws_msg([] { errno = 0; throw error_sys("Hello world!"); }, "Hello world! errno: 0 strerror: " + no_error_msg);
        };
        "error_sys_fail"_test = [] {
            expect_throws_msg([] { errno = 2; throw error_sys("Hello world!"); }, "Hello world! errno: 2 strerror: No such file or directory");
        };
    };
};
