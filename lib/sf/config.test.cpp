/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/common/test.hpp>
#include <sf/config.hpp>

using namespace script_forge;

suite config_suite = [] {
    "config"_test = [] {
        "install_path"_test = [] {
            const auto p = install_path("log/sf.log");
            expect(std::filesystem::path { p }.is_absolute()) << p;
            expect(p.ends_with("sf.log")) << p;
            test_same(std::string { "/tmp/sf-abs.log" }, install_path("/tmp/sf-abs.log"));
        };
        "config_file"_test = [] {
            const std::string path = install_path("tmp/config-test.json");
            file::write(path, std::string_view { R"({ "args": [ "01", "4101" ], "encoding": "PurePlutusScriptBytes" })" });
            const config_file cfg { path };
            expect(cfg.contains("args"));
            expect(!cfg.contains("script"));
            expect(throws<error>([&] { static_cast<void>(cfg.at("script")); }));
            test_same(size_t { 2 }, json::as_array(cfg.at("args"), "args").size());
            expect(throws<error>([&] { json::as_array(cfg.at("encoding"), "encoding"); }));
            test_same(std::string { "PurePlutusScriptBytes" }, std::string { json::as_string(cfg.at("encoding"), "encoding") });
            expect(throws<error>([&] { json::as_string(cfg.at("args"), "args"); }));
            file::write(path, std::string_view { "[ 1, 2 ]" });
            expect(throws<error>([&] { config_file bad { path }; }));
        };
    };
};
