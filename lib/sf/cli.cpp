/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <limits>
#include <sf/cli.hpp>

namespace script_forge::cli {
    namespace {
        constexpr size_t unlimited = std::numeric_limits<size_t>::max();

        struct usage_error: error {
            usage_error(const config &cfg, const std::string_view reason):
                error { "{}\nusage: {}{}", reason, cfg.make_usage(), describe_options(cfg) }
            {
            }
        private:
            static std::string describe_options(const config &cfg)
            {
                if (cfg.opts.empty())
                    return {};
                std::string res = fmt::format("\n{} supports the following options:", cfg.name);
                for (const auto &[name, opt]: cfg.opts) {
                    const auto dflt = opt.default_value ? fmt::format(" ({} by default)", *opt.default_value) : std::string {};
                    res += fmt::format("\n    --{}{} - {}", name, dflt, opt.desc);
                }
                return res;
            }
        };

        // splits "--name=value" into its parts, the value is optional
        std::pair<std::string, std::optional<std::string>> split_option(const std::string &arg)
        {
            const auto eq_pos = arg.find('=', 2);
            if (eq_pos == std::string::npos)
                return { arg.substr(2), std::nullopt };
            return { arg.substr(2, eq_pos - 2), arg.substr(eq_pos + 1) };
        }

        struct command_meta {
            std::shared_ptr<command> cmd {};
            config cfg {};
        };
    }

    void argument_config::expect(const std::initializer_list<std::string> args)
    {
        names = args;
        size_t required = 0;
        size_t optional = 0;
        for (const auto &a: args) {
            if (!a.starts_with('['))
                ++required;
            else if (a.ends_with("...]"))
                optional = unlimited;
            else if (optional != unlimited)
                ++optional;
        }
        min = required;
        max = optional == unlimited ? unlimited : required + optional;
    }

    std::string config::make_usage() const
    {
        std::string res = name;
        for (const auto &arg: args.names)
            res += ' ' + arg;
        if (!opts.empty())
            res += " [options]";
        return fmt::format("{} - {}", res, desc);
    }

    parse_result command::parse(const config &cfg, const arguments &args) const
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (!arg.starts_with("--")) {
                pr.args.emplace_back(arg);
                continue;
            }
            auto [name, val] = split_option(arg);
            if (!cfg.opts.contains(name))
                throw usage_error { cfg, fmt::format("unknown option '--{}'", name) };
            if (!pr.opts.try_emplace(name, std::move(val)).second)
                throw usage_error { cfg, fmt::format("duplicate option specification '{}'", arg) };
        }
        for (const auto &[name, opt]: cfg.opts) {
            if (opt.default_value)
                pr.opts.try_emplace(name, *opt.default_value);
            const auto it = pr.opts.find(name);
            if (it == pr.opts.end() || !opt.validator)
                continue;
            if (const auto problem = (*opt.validator)(it->second); problem)
                throw usage_error { cfg, fmt::format("value {} is invalid for '--{}': {}", it->second, name, *problem) };
        }
        if (cfg.args.min && pr.args.size() < *cfg.args.min)
            throw usage_error { cfg, fmt::format("expected at least {} arguments but got {}", *cfg.args.min, pr.args.size()) };
        if (cfg.args.max && pr.args.size() > *cfg.args.max)
            throw usage_error { cfg, fmt::format("expected at most {} arguments but got {}", *cfg.args.max, pr.args.size()) };
        return pr;
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { cmd };
            cmd->configure(meta.cfg);
            const auto name = meta.cfg.name;
            if (!commands.try_emplace(name, std::move(meta)).second) [[unlikely]]
                throw error("multiple definitions for {}", name);
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n";
            for (const auto &[name, meta]: commands)
                std::cerr << fmt::format("    {}\n", meta.cfg.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return 1;
        }
        const arguments args(argv + 2, argv + argc);
        const auto ex = logger::run_log_errors([&] {
            const auto &[cmd_ptr, cfg] = cmd_it->second;
            timer t { fmt::format("run {}", cmd), logger::level::debug };
            const auto pr = cmd_ptr->parse(cfg, args);
            cmd_ptr->run(pr.args, pr.opts);
        });
        return ex ? 1 : 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
