/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_COMMON_FILE_HPP
#define SCRIPT_FORGE_COMMON_FILE_HPP

#include <cctype>
#include <filesystem>
#include <string>
#include <sf/common/bytes.hpp>
#include <sf/common/error.hpp>

namespace script_forge::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, buffer data);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    // Reads a file with hex text, ignoring the surrounding whitespace.
    inline uint8_vector read_hex(const std::string &path)
    {
        const auto text = read(path);
        auto sv = text.str();
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
        return uint8_vector::from_hex(sv);
    }
}

#endif // !SCRIPT_FORGE_COMMON_FILE_HPP
