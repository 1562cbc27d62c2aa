/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/cli/common.hpp>

namespace script_forge::cli::script_normalize {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "script-normalize";
            cmd.desc = "strip the CBOR wrapping of a Plutus script and re-encode it with the requested encoding";
            cmd.args.expect({ "<script-path>", "<out-path>" });
            common::add_hex_opt(cmd);
            common::add_encoding_opt(cmd, plutus::output_encoding::single_cbor);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto script = common::read_input(args.at(0), opts);
            const auto mode = common::encoding(opts);
            const auto res = plutus::normalize(script, mode);
            logger::info("normalized a script of {} bytes into {} bytes with {}", script.size(), res.size(), mode);
            common::write_output(args.at(1), res, opts);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
