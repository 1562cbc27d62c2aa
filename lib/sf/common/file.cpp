/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdio>
#include <memory>
#include <sf/common/file.hpp>
#include <sf/logger.hpp>

namespace script_forge::file {
    namespace {
        struct file_closer {
            void operator()(std::FILE *f) const
            {
                if (std::fclose(f) != 0) [[unlikely]]
                    logger::warn("failed to close a file handle: errno {}", errno);
            }
        };
        using file_ptr = std::unique_ptr<std::FILE, file_closer>;
    }

    void read(const std::string &path, uint8_vector &buf)
    {
        const file_ptr f { std::fopen(path.c_str(), "rb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        const auto sz = std::filesystem::file_size(path);
        buf.resize(sz);
        if (sz && std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", buf.size(), path));
    }

    void write(const std::string &path, const buffer data)
    {
        const std::filesystem::path p { path };
        if (p.has_parent_path() && !std::filesystem::exists(p.parent_path()))
            std::filesystem::create_directories(p.parent_path());
        const file_ptr f { std::fopen(path.c_str(), "wb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for writing", path));
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }
}
