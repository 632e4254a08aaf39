#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <edbatch/common/bytes.hpp>
#include "errors.hpp"

/*
 * edwards25519sha512batch is the prototype signature scheme that preceded Ed25519.
 * It is deprecated and is kept only to create and check signatures compatible with previously signed data.
 */
namespace edbatch::crypto::edwards25519sha512batch
{
    static constexpr size_t secret_key_bytes = 64;
    static constexpr size_t public_key_bytes = 32;
    static constexpr size_t signature_bytes = 64;

    using skey_t = secure_byte_array<secret_key_bytes>;
    using vkey_t = byte_array<public_key_bytes>;

    struct key_pair_t {
        vkey_t vk;
        skey_t sk;
    };

    /*
     * The low-level signature primitive. The signed message layout is owned by the implementation.
     * All but ensure_initialized return 0 on success and a nonzero value on failure.
     */
    struct primitive_t {
        virtual ~primitive_t() =default;
        // must throw initialization_error if the primitive cannot be used
        virtual void ensure_initialized() const =0;
        virtual int keypair(write_buffer vk, write_buffer sk) const =0;
        // sm must have room for msg.size() + signature_bytes bytes
        virtual int sign(write_buffer sm, unsigned long long &sm_len, const buffer &msg, const buffer &sk) const =0;
        // msg must have room for sm.size() bytes
        virtual int open(write_buffer msg, unsigned long long &msg_len, const buffer &sm, const buffer &vk) const =0;
    };

    // the implementation backed by libsodium
    extern const primitive_t &default_primitive();

    extern key_pair_t create(const primitive_t &p=default_primitive());
    extern uint8_vector sign(const buffer &msg, const skey_t &sk, const primitive_t &p=default_primitive());
    // returns std::nullopt for any input that does not carry a valid signature made with the secret key paired to vk
    extern std::optional<uint8_vector> verify(const buffer &sm, const vkey_t &vk, const primitive_t &p=default_primitive());
}
