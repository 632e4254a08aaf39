/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "cli.hpp"

namespace {
    using namespace edbatch;
    using namespace edbatch::cli;

    struct echo_cmd: command {
        static inline arguments last_args {};

        void configure(config &cmd) const override
        {
            cmd.name = "test-echo";
            cmd.desc = "Remember the passed arguments";
            cmd.args.expect({ "<a>", "[<b>]" });
        }

        void run(const arguments &args) const override
        {
            last_args = args;
            if (args.at(0) == "fail")
                throw error("asked to fail");
        }
    };
}

suite edbatch_common_cli_suite = [] {
    "edbatch::common::cli"_test = [] {
        "argument_config"_test = [] {
            argument_config args {};
            args.expect({ "<x>", "<y>", "[<z>]", "[<w>]" });
            expect_equal(size_t { 2 }, args.min());
            expect_equal(size_t { 4 }, args.max());
            expect_equal(std::string { " <x> <y> [<z>] [<w>]" }, args.usage());
            expect(throws<error>([&] { args.expect({ "[<x>]", "<y>" }); }));
        };
        "run"_test = [] {
            static auto instance = command::reg(std::make_shared<echo_cmd>());
            expect(throws<error>([] { command::reg(std::make_shared<echo_cmd>()); }));
            {
                const char *argv[] = { "edbatch", "test-echo", "one" };
                expect_equal(0, cli::run(3, argv));
                expect(echo_cmd::last_args == arguments { "one" });
            }
            {
                const char *argv[] = { "edbatch", "test-echo", "one", "two" };
                expect_equal(0, cli::run(4, argv));
                expect(echo_cmd::last_args == arguments { "one", "two" });
            }
            {
                const char *argv[] = { "edbatch", "test-echo" };
                expect_equal(1, cli::run(2, argv));
            }
            {
                const char *argv[] = { "edbatch", "test-echo", "1", "2", "3" };
                expect_equal(1, cli::run(5, argv));
            }
            {
                const char *argv[] = { "edbatch", "test-echo", "fail" };
                expect_equal(1, cli::run(3, argv));
            }
            {
                const char *argv[] = { "edbatch", "no-such-command" };
                expect_equal(1, cli::run(2, argv));
            }
            {
                const char *argv[] = { "edbatch" };
                expect_equal(1, cli::run(1, argv));
            }
        };
    };
};
