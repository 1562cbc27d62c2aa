/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/cli/common.hpp>

namespace script_forge::cli::script_apply_params {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "script-apply-params";
            cmd.desc = "apply the arguments listed in a JSON file with script, args and an optional encoding";
            cmd.args.expect({ "<params-path>", "<out-path>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const config_file params { args.at(0) };
            const auto script = uint8_vector::from_hex(json::as_string(params.at("script"), "script"));
            std::vector<uint8_vector> arg_data {};
            for (const auto &arg: json::as_array(params.at("args"), "args"))
                arg_data.emplace_back(uint8_vector::from_hex(json::as_string(arg, "args")));
            const std::vector<buffer> arg_bufs(arg_data.begin(), arg_data.end());
            auto mode = plutus::output_encoding::double_cbor;
            if (params.contains("encoding"))
                mode = plutus::output_encoding_from_name(json::as_string(params.at("encoding"), "encoding"));
            const auto res = plutus::apply_args(arg_bufs, script, mode);
            file::write(args.at(1), res);
            logger::info("wrote {} bytes with {} applied arguments to {}", res.size(), arg_bufs.size(), args.at(1));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
