/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <sf/cli/common.hpp>
#include <sf/common/test.hpp>

using namespace script_forge;
using namespace script_forge::cli;

namespace {
    std::shared_ptr<command> find_command(const std::string_view name)
    {
        for (const auto &cmd: command::registry()) {
            cli::config cfg {};
            cmd->configure(cfg);
            if (cfg.name == name)
                return cmd;
        }
        throw error("command {} is not registered", name);
    }

    int run_cmd(std::initializer_list<std::string> args)
    {
        std::vector<const char *> argv { "sf" };
        for (const auto &a: args)
            argv.emplace_back(a.c_str());
        return cli::run(static_cast<int>(argv.size()), argv.data());
    }

    std::string tmp_path(const std::string_view name)
    {
        return install_path(fmt::format("tmp/cli-test-{}", name));
    }

    std::string write_tmp(const std::string_view name, const std::string_view text)
    {
        const auto path = tmp_path(name);
        file::write(path, buffer { text });
        return path;
    }
}

suite cli_suite = [] {
    using namespace std::string_literals;
    "cli"_test = [] {
        "argument_config"_test = [] {
            argument_config ac {};
            ac.expect({ "<a>", "<b>", "[c]" });
            test_same(size_t { 2 }, ac.min.value());
            test_same(size_t { 3 }, ac.max.value());
            ac.expect({ "<a>", "[b ...]" });
            test_same(size_t { 1 }, ac.min.value());
            test_same(std::numeric_limits<size_t>::max(), ac.max.value());
        };
        "registry"_test = [] {
            for (const auto name: { "script-normalize", "script-apply-args", "script-apply-params", "script-info" })
                expect(nothrow([&] { find_command(name); })) << name;
        };
        "option parsing"_test = [] {
            const auto cmd = find_command("script-apply-args");
            cli::config cfg {};
            cmd->configure(cfg);
            {
                const auto pr = cmd->parse(cfg, { "in.bin", "out.bin" });
                test_same(size_t { 2 }, pr.args.size());
                test_same("DoubleCBOR"s, pr.opts.at("encoding").value());
                expect(!pr.opts.contains("hex"));
            }
            {
                const auto pr = cmd->parse(cfg, { "--encoding=PurePlutusScriptBytes", "in.hex", "--hex", "out.hex", "arg1", "arg2" });
                test_same(size_t { 4 }, pr.args.size());
                test_same(plutus::output_encoding::pure, common::encoding(pr.opts));
                expect(pr.opts.contains("hex"));
            }
            expect(throws<error>([&] { cmd->parse(cfg, { "in.bin" }); }));
            expect(throws<error>([&] { cmd->parse(cfg, { "in.bin", "out.bin", "--unknown" }); }));
            expect(throws<error>([&] { cmd->parse(cfg, { "in.bin", "out.bin", "--encoding=TripleCBOR" }); }));
            expect(throws<error>([&] { cmd->parse(cfg, { "in.bin", "out.bin", "--encoding" }); }));
            expect(throws<error>([&] { cmd->parse(cfg, { "in.bin", "out.bin", "--hex", "--hex" }); }));
        };
        "unknown command and bad arguments"_test = [] {
            test_same(1, run_cmd({}));
            test_same(1, run_cmd({ "no-such-command" }));
            test_same(1, run_cmd({ "script-normalize", tmp_path("missing.hex") }));
        };
        "script-normalize"_test = [] {
            const auto in_path = write_tmp("normalize-in.hex", "4443010000\n");
            const auto out_path = tmp_path("normalize-out.hex");
            test_same(0, run_cmd({ "script-normalize", in_path, out_path, "--hex", "--encoding=PurePlutusScriptBytes" }));
            test_same(uint8_vector::from_hex("010000"), file::read_hex(out_path));
            test_same(0, run_cmd({ "script-normalize", in_path, out_path, "--hex" }));
            test_same(uint8_vector::from_hex("43010000"), file::read_hex(out_path));
            // without --hex the text is read as bytes that have no supported version
            test_same(1, run_cmd({ "script-normalize", in_path, out_path }));
            test_same(1, run_cmd({ "script-normalize", in_path, out_path, "--hex", "--encoding=TripleCBOR" }));
        };
        "script-apply-args"_test = [] {
            const auto script = uint8_vector::from_hex("46010000222601");
            const auto arg = uint8_vector::from_hex("d87980");
            const auto script_path = tmp_path("apply-args-script.bin");
            const auto arg_path = tmp_path("apply-args-arg.bin");
            const auto out_path = tmp_path("apply-args-out.bin");
            file::write(script_path, script);
            file::write(arg_path, arg);
            test_same(0, run_cmd({ "script-apply-args", script_path, out_path, arg_path, arg_path }));
            const std::array<buffer, 2> args { arg, arg };
            test_same(plutus::apply_args(args, script, plutus::output_encoding::double_cbor), file::read(out_path));
            test_same(0, run_cmd({ "script-apply-args", script_path, out_path, "--encoding=PurePlutusScriptBytes" }));
            test_same(uint8_vector::from_hex("010000222601"), file::read(out_path));
            const auto bad_arg_path = tmp_path("apply-args-bad-arg.bin");
            file::write(bad_arg_path, uint8_vector::from_hex("f6"));
            test_same(1, run_cmd({ "script-apply-args", script_path, out_path, arg_path, bad_arg_path }));
            test_same(1, run_cmd({ "script-apply-args", script_path, out_path, tmp_path("missing.bin") }));
        };
        "script-apply-params"_test = [] {
            const auto out_path = tmp_path("apply-params-out.bin");
            const auto ok_path = write_tmp("apply-params-ok.json",
                R"({ "script": "46010000222601", "args": [ "01", "d87980" ], "encoding": "PurePlutusScriptBytes" })");
            test_same(0, run_cmd({ "script-apply-params", ok_path, out_path }));
            const auto arg_int = uint8_vector::from_hex("01");
            const auto arg_constr = uint8_vector::from_hex("d87980");
            const std::array<buffer, 2> args { arg_int, arg_constr };
            test_same(plutus::apply_args(args, uint8_vector::from_hex("46010000222601"), plutus::output_encoding::pure), file::read(out_path));

            const auto default_path = write_tmp("apply-params-default.json", R"({ "script": "46010000222601", "args": [] })");
            test_same(0, run_cmd({ "script-apply-params", default_path, out_path }));
            test_same(uint8_vector::from_hex("4746010000222601"), file::read(out_path));

            for (const auto &[name, text]: std::initializer_list<std::pair<std::string_view, std::string_view>> {
                { "bad-encoding", R"({ "script": "46010000222601", "args": [], "encoding": "TripleCBOR" })" },
                { "args-not-array", R"({ "script": "46010000222601", "args": "01" })" },
                { "arg-not-string", R"({ "script": "46010000222601", "args": [ 1 ] })" },
                { "no-script", R"({ "args": [] })" },
                { "bad-hex", R"({ "script": "4601000022260", "args": [] })" },
                { "not-object", R"([ "46010000222601" ])" },
                { "not-json", "{ script" }
            }) {
                const auto path = write_tmp(fmt::format("apply-params-{}.json", name), text);
                test_same(std::string { name }, 1, run_cmd({ "script-apply-params", path, out_path }));
            }
        };
        "script-info"_test = [] {
            const auto ok_path = write_tmp("info-ok.hex", "46010000222601");
            test_same(0, run_cmd({ "script-info", ok_path, "--hex" }));
            const auto bad_path = write_tmp("info-bad.hex", "4401990000");
            test_same(1, run_cmd({ "script-info", bad_path, "--hex" }));
        };
    };
};
