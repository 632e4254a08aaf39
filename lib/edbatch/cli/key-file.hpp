#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <edbatch/crypto/edwards25519sha512batch.hpp>

/*
 * Keys are stored as hex text: <prefix>.vk holds the 32-byte public key and <prefix>.sk the 64-byte secret key.
 * Trailing whitespace is ignored when loading.
 */
namespace edbatch::cli::key_file {
    using crypto::edwards25519sha512batch::key_pair_t;
    using crypto::edwards25519sha512batch::skey_t;
    using crypto::edwards25519sha512batch::vkey_t;

    extern std::string vkey_path(const std::string &prefix);
    extern std::string skey_path(const std::string &prefix);
    extern void save(const std::string &prefix, const key_pair_t &kp);
    extern vkey_t load_vkey(const std::string &path);
    extern skey_t load_skey(const std::string &path);
}
