/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <edbatch/common/cli.hpp>
#include <edbatch/common/file.hpp>
#include "key-file.hpp"

namespace edbatch::cli::sign {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "sign";
            cmd.desc = "Sign the contents of <msg-path> with the secret key from <sk-path> and write the signed message to <signed-path>";
            cmd.args.expect({ "<sk-path>", "<msg-path>", "<signed-path>" });
        }

        void run(const arguments &args) const override
        {
            const auto sk = key_file::load_skey(args.at(0));
            const auto msg = file::read(args.at(1));
            const auto sm = crypto::edwards25519sha512batch::sign(msg, sk);
            file::write(args.at(2), sm);
            logger::info("signed {} bytes into {}", msg.size(), args.at(2));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
