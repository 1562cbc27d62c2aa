/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <sf/config.hpp>
#include <sf/logger.hpp>

namespace script_forge {
    static bool install_dir_ok(const std::filesystem::path &dir)
    {
        return std::filesystem::is_directory(dir / "log");
    }

    // Must be configured before any multi-threading code is executed
    static std::filesystem::path install_dir(const std::optional<std::filesystem::path> &override_dir={})
    {
        static std::optional<std::filesystem::path> dir {};
        if (override_dir && install_dir_ok(*override_dir)) {
            dir.emplace(*override_dir);
            std::cerr << fmt::format("SF_INIT: install dir: {} resolved using the binary-relative path\n", dir->string());
        }
        if (!dir) {
            if (const char *env_home = std::getenv("SF_HOME"); env_home) {
                dir.emplace(std::filesystem::absolute(env_home));
            } else {
                dir.emplace(std::filesystem::absolute(std::filesystem::current_path()));
            }
        }
        return *dir;
    }

    // The sf binary is expected to be located:
    // 1) in prod: in a bin subdirectory of the installation directory
    // 2) in dev: in a build subdirectory of the source-code directory
    void consider_bin_dir(const std::string_view bin_path)
    {
        const auto bin_dir = std::filesystem::weakly_canonical(std::filesystem::absolute(bin_path)).parent_path().parent_path();
        if (install_dir_ok(bin_dir))
            install_dir(bin_dir);
    }

    std::string install_path(const std::string_view rel_path)
    {
        std::filesystem::path path { rel_path };
        if (path.is_relative())
            path = std::filesystem::absolute(install_dir() / path);
        return std::filesystem::weakly_canonical(path).string();
    }

    config_file::config_file(const std::string &path)
        : _path { path }
    {
        auto jv = json::parse(file::read(path));
        if (!jv.is_object())
            throw error("the top-level element of {} must be a JSON object!", path);
        _parsed = std::move(jv.as_object());
    }

    const json::value &config_file::at(const std::string_view name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error("{} does not have the element {}!", _path, name);
        return it->value();
    }
}
