/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include "cli.hpp"

namespace edbatch::cli {
    void argument_config::expect(const std::initializer_list<std::string> names)
    {
        _names = names;
        _min = 0;
        _max = 0;
        for (const auto &name: _names) {
            if (name.starts_with("[")) {
                ++_max;
            } else {
                if (_min != _max) [[unlikely]]
                    throw error(fmt::format("a mandatory argument {} follows an optional one!", name));
                ++_min;
                ++_max;
            }
        }
    }

    std::string argument_config::usage() const
    {
        std::string res {};
        for (const auto &name: _names) {
            res += ' ';
            res += name;
        }
        return res;
    }

    command::registry &command::commands()
    {
        static registry reg {};
        return reg;
    }

    command::ptr command::reg(const ptr &cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty()) [[unlikely]]
            throw error("a command must have a name!");
        if (!commands().emplace(cfg.name, cmd).second) [[unlikely]]
            throw error(fmt::format("a command {} has already been registered!", cfg.name));
        return cmd;
    }

    static void print_commands(const std::string_view exe)
    {
        std::cerr << fmt::format("usage: {} <command> [<arg> ...], where <command> is one of:\n", exe);
        for (const auto &[name, cmd]: command::commands()) {
            config cfg {};
            cmd->configure(cfg);
            std::cerr << fmt::format("    {}{}\n        {}\n", name, cfg.args.usage(), cfg.desc);
        }
    }

    int run(const int argc, const char **argv)
    {
        const std::string_view exe { argc > 0 ? argv[0] : "edbatch" };
        if (argc < 2) {
            print_commands(exe);
            return 1;
        }
        const auto it = command::commands().find(argv[1]);
        if (it == command::commands().end()) {
            std::cerr << fmt::format("unknown command: {}\n", argv[1]);
            print_commands(exe);
            return 1;
        }
        config cfg {};
        it->second->configure(cfg);
        const arguments args { argv + 2, argv + argc };
        if (args.size() < cfg.args.min() || args.size() > cfg.args.max()) {
            std::cerr << fmt::format("usage: {} {}{}\n", exe, cfg.name, cfg.args.usage());
            return 1;
        }
        const auto ex = logger::run_log_errors([&] {
            logger::debug("running command {} with {} argument(s)", cfg.name, args.size());
            it->second->run(args);
        }, [] { logger::get().flush(); });
        return ex ? 1 : 0;
    }
}
