/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <edbatch/common/logger.hpp>
#include <edbatch/common/numeric-cast.hpp>
#include "edwards25519sha512batch.hpp"
#include "sodium.hpp"

namespace edbatch::crypto::edwards25519sha512batch {
    namespace {
#if defined(__GNUC__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
        struct sodium_primitive_t final: primitive_t {
            void ensure_initialized() const override
            {
                sodium::ensure_initialized();
            }

            int keypair(const write_buffer vk, const write_buffer sk) const override
            {
                static_assert(crypto_sign_edwards25519sha512batch_PUBLICKEYBYTES == public_key_bytes);
                static_assert(crypto_sign_edwards25519sha512batch_SECRETKEYBYTES == secret_key_bytes);
                if (vk.size() != public_key_bytes || sk.size() != secret_key_bytes) [[unlikely]]
                    return -1;
                return sodium::crypto_sign_edwards25519sha512batch_keypair(vk.data(), sk.data());
            }

            int sign(const write_buffer sm, unsigned long long &sm_len, const buffer &msg, const buffer &sk) const override
            {
                static_assert(crypto_sign_edwards25519sha512batch_BYTES == signature_bytes);
                if (sm.size() < msg.size() + signature_bytes || sk.size() != secret_key_bytes) [[unlikely]]
                    return -1;
                return sodium::crypto_sign_edwards25519sha512batch(sm.data(), &sm_len,
                    msg.data(), numeric_cast<unsigned long long>(msg.size()), sk.data());
            }

            int open(const write_buffer msg, unsigned long long &msg_len, const buffer &sm, const buffer &vk) const override
            {
                if (msg.size() < sm.size() || vk.size() != public_key_bytes) [[unlikely]]
                    return -1;
                return sodium::crypto_sign_edwards25519sha512batch_open(msg.data(), &msg_len,
                    sm.data(), numeric_cast<unsigned long long>(sm.size()), vk.data());
            }
        };
#if defined(__GNUC__)
#   pragma GCC diagnostic pop
#endif
    }

    const primitive_t &default_primitive()
    {
        static const sodium_primitive_t p {};
        return p;
    }

    key_pair_t create(const primitive_t &p)
    {
        p.ensure_initialized();
        key_pair_t res {};
        if (p.keypair(res.vk, res.sk.span()) != 0) [[unlikely]]
            throw entropy_error("failed to generate an edwards25519sha512batch key pair!");
        logger::trace("edwards25519sha512batch: generated a key pair");
        return res;
    }

    uint8_vector sign(const buffer &msg, const skey_t &sk, const primitive_t &p)
    {
        p.ensure_initialized();
        const auto exp_len = msg.size() + signature_bytes;
        uint8_vector sm(exp_len);
        unsigned long long sm_len = 0;
        if (p.sign(sm, sm_len, msg, sk) != 0) [[unlikely]]
            throw signing_error(fmt::format("failed to sign a message of {} bytes!", msg.size()));
        if (sm_len != exp_len) [[unlikely]]
            throw signing_error(fmt::format("the signed message must have {} bytes but got {}!", exp_len, sm_len));
        logger::trace("edwards25519sha512batch: signed a message of {} bytes", msg.size());
        return sm;
    }

    std::optional<uint8_vector> verify(const buffer &sm, const vkey_t &vk, const primitive_t &p)
    {
        p.ensure_initialized();
        if (sm.size() < signature_bytes) {
            logger::trace("edwards25519sha512batch: rejected a signed message of {} bytes", sm.size());
            return {};
        }
        uint8_vector msg(sm.size());
        unsigned long long msg_len = 0;
        if (p.open(msg, msg_len, sm, vk) != 0 || msg_len != sm.size() - signature_bytes) {
            logger::trace("edwards25519sha512batch: rejected a signed message of {} bytes", sm.size());
            return {};
        }
        msg.resize(numeric_cast<size_t>(msg_len));
        return msg;
    }
}
