/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <edbatch/common/cli.hpp>
#include <edbatch/common/file.hpp>
#include "key-file.hpp"

namespace edbatch::cli::verify {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "verify";
            cmd.desc = "Verify the signed message in <signed-path> with the public key from <vk-path>, optionally saving the message to <msg-path>";
            cmd.args.expect({ "<vk-path>", "<signed-path>", "[<msg-path>]" });
        }

        void run(const arguments &args) const override
        {
            const auto vk = key_file::load_vkey(args.at(0));
            const auto sm = file::read(args.at(1));
            const auto msg = crypto::edwards25519sha512batch::verify(sm, vk);
            if (!msg)
                throw error(fmt::format("signature verification failed for {}", args.at(1)));
            logger::info("signature OK: {} message bytes", msg->size());
            if (args.size() > 2)
                file::write(args.at(2), *msg);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
