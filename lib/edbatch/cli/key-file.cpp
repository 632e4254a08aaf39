/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <edbatch/common/file.hpp>
#include <edbatch/common/logger.hpp>
#include "key-file.hpp"

namespace edbatch::cli::key_file {
    using namespace crypto::edwards25519sha512batch;

    static std::string_view trim_right(const std::string_view s)
    {
        const auto end = s.find_last_not_of(" \t\r\n");
        return end == std::string_view::npos ? std::string_view {} : s.substr(0, end + 1);
    }

    std::string vkey_path(const std::string &prefix)
    {
        return prefix + ".vk";
    }

    std::string skey_path(const std::string &prefix)
    {
        return prefix + ".sk";
    }

    void save(const std::string &prefix, const key_pair_t &kp)
    {
        secure_byte_array<secret_key_bytes * 2> sk_hex;
        fmt::format_to(sk_hex.begin(), "{}", static_cast<buffer>(kp.sk));
        file::write_secret(skey_path(prefix), sk_hex);
        file::write(vkey_path(prefix), fmt::format("{}\n", kp.vk));
        logger::debug("saved a key pair to {} and {}", vkey_path(prefix), skey_path(prefix));
    }

    vkey_t load_vkey(const std::string &path)
    {
        const auto hex = file::read(path);
        return vkey_t::from_hex(trim_right(hex.str()));
    }

    skey_t load_skey(const std::string &path)
    {
        auto hex = file::read_secret(path);
        try {
            auto sk = skey_t::from_hex(trim_right(hex.str()));
            secure_clear(hex);
            return sk;
        } catch (const std::exception &ex) {
            secure_clear(hex);
            throw error(fmt::format("invalid secret key file {}", path), ex);
        }
    }
}
