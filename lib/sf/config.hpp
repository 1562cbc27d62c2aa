/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_CONFIG_HPP
#define SCRIPT_FORGE_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <sf/json.hpp>

namespace script_forge {
    extern void consider_bin_dir(std::string_view bin_path);
    extern std::string install_path(std::string_view rel_path);

    // a JSON document whose top-level element is an object
    struct config_file {
        explicit config_file(const std::string &path);

        [[nodiscard]] const json::value &at(std::string_view name) const;

        [[nodiscard]] bool contains(const std::string_view name) const
        {
            return _parsed.contains(name);
        }
    private:
        std::string _path;
        json::object _parsed;
    };
}

#endif // !SCRIPT_FORGE_CONFIG_HPP
