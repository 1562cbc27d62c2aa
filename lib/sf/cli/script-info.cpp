/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/cli/common.hpp>
#include <sf/plutus/flat.hpp>

namespace script_forge::cli::script_info {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "script-info";
            cmd.desc = "print the wrapping depth, the language and the UPLC code of a Plutus script";
            cmd.args.expect({ "<script-path>" });
            common::add_hex_opt(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto script = common::read_input(args.at(0), opts);
            size_t depth = 0;
            const auto flat_bytes = plutus::unwrap(script, depth);
            plutus::arena alloc {};
            const auto prog = plutus::flat::decode(alloc, flat_bytes);
            fmt::print("wrap depth: {}\nlanguage: {}\nflat size: {}\n{}\n",
                depth, plutus::supported_language(flat_bytes).value_or("unknown"), flat_bytes.size(), prog);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
