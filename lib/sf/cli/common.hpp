/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_CLI_COMMON_HPP
#define SCRIPT_FORGE_CLI_COMMON_HPP

#include <sf/cli.hpp>
#include <sf/common/file.hpp>
#include <sf/plutus/script.hpp>

namespace script_forge::cli::common {
    inline void add_hex_opt(config &cmd)
    {
        cmd.opts.try_emplace("hex", "input and output files contain hex text instead of binary data");
    }

    inline void add_encoding_opt(config &cmd, const plutus::output_encoding def_enc)
    {
        cmd.opts.try_emplace("encoding", "SingleCBOR, DoubleCBOR or PurePlutusScriptBytes", fmt::format("{}", def_enc),
            [](const std::optional<std::string> &val) -> std::optional<std::string> {
                if (!val)
                    return "a value must be specified";
                try {
                    plutus::output_encoding_from_name(*val);
                } catch (const error &ex) {
                    return ex.what();
                }
                return {};
            });
    }

    inline plutus::output_encoding encoding(const options &opts)
    {
        return plutus::output_encoding_from_name(opts.at("encoding").value());
    }

    inline uint8_vector read_input(const std::string &path, const options &opts)
    {
        if (opts.contains("hex"))
            return file::read_hex(path);
        return file::read(path);
    }

    inline void write_output(const std::string &path, const buffer data, const options &opts)
    {
        if (opts.contains("hex")) {
            const auto text = fmt::format("{}\n", buffer_lowercase { data });
            file::write(path, buffer { text });
        } else {
            file::write(path, data);
        }
        logger::info("wrote {} bytes to {}", data.size(), path);
    }
}

#endif // !SCRIPT_FORGE_CLI_COMMON_HPP
