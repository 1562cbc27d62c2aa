/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/cli/common.hpp>

namespace script_forge::cli::script_apply_args {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "script-apply-args";
            cmd.desc = "apply CBOR-encoded Plutus Data arguments to a Plutus script";
            cmd.args.expect({ "<script-path>", "<out-path>", "[arg-path ...]" });
            common::add_hex_opt(cmd);
            common::add_encoding_opt(cmd, plutus::output_encoding::double_cbor);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto script = common::read_input(args.at(0), opts);
            std::vector<uint8_vector> arg_data {};
            for (size_t i = 2; i < args.size(); ++i)
                arg_data.emplace_back(common::read_input(args[i], opts));
            const std::vector<buffer> arg_bufs(arg_data.begin(), arg_data.end());
            const auto res = plutus::apply_args(arg_bufs, script, common::encoding(opts));
            logger::info("applied {} arguments to a script of {} bytes", arg_bufs.size(), script.size());
            common::write_output(args.at(1), res, opts);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
