/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <edbatch/common/cli.hpp>
#include "key-file.hpp"

namespace edbatch::cli::keygen {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "keygen";
            cmd.desc = "Generate an edwards25519sha512batch key pair and save it to <key-prefix>.vk and <key-prefix>.sk";
            cmd.args.expect({ "<key-prefix>" });
        }

        void run(const arguments &args) const override
        {
            const auto &prefix = args.at(0);
            const auto kp = crypto::edwards25519sha512batch::create();
            key_file::save(prefix, kp);
            logger::info("public key: {}", kp.vk);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
