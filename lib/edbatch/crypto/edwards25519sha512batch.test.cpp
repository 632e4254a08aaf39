/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <atomic>
#include <memory>
#include <new>
#include <random>
#include <set>
#include <thread>
#include <edbatch/common/test.hpp>
#include "edwards25519sha512batch.hpp"

namespace {
    using namespace edbatch;
    using namespace edbatch::crypto;
    using namespace edbatch::crypto::edwards25519sha512batch;

    uint8_vector random_message(std::mt19937 &rnd, const size_t sz)
    {
        std::uniform_int_distribution<unsigned> dist { 0, 255 };
        uint8_vector m(sz);
        for (auto &b: m)
            b = static_cast<uint8_t>(dist(rnd));
        return m;
    }

    bool all_zero(const buffer &bytes)
    {
        return std::all_of(bytes.begin(), bytes.end(), [](const auto b) { return b == 0; });
    }

    // lays out signed messages as 64 bytes of 0x5A followed by the message and accepts only that layout
    struct fake_primitive_t final: primitive_t {
        bool init_ok = true;
        int keypair_res = 0;
        int sign_res = 0;
        int open_res = 0;
        unsigned long long sign_len_cut = 0;
        unsigned long long open_len_cut = 0;
        mutable size_t open_calls = 0;

        void ensure_initialized() const override
        {
            if (!init_ok)
                throw initialization_error("the fake primitive is not initialized");
        }

        int keypair(const write_buffer vk, const write_buffer sk) const override
        {
            std::fill(vk.begin(), vk.end(), 0xAA);
            std::fill(sk.begin(), sk.end(), 0xBB);
            return keypair_res;
        }

        int sign(const write_buffer sm, unsigned long long &sm_len, const buffer &msg, const buffer &) const override
        {
            std::fill_n(sm.begin(), signature_bytes, 0x5A);
            std::copy(msg.begin(), msg.end(), sm.begin() + signature_bytes);
            sm_len = msg.size() + signature_bytes - sign_len_cut;
            return sign_res;
        }

        int open(const write_buffer msg, unsigned long long &msg_len, const buffer &sm, const buffer &) const override
        {
            ++open_calls;
            const auto body = sm.subbuf(signature_bytes);
            std::copy(body.begin(), body.end(), msg.begin());
            msg_len = body.size() - open_len_cut;
            return open_res;
        }
    };
}

suite edbatch_crypto_edwards25519sha512batch_suite = [] {
    "edbatch::crypto::edwards25519sha512batch"_test = [] {
        "sizes"_test = [] {
            expect_equal(size_t { 64 }, secret_key_bytes);
            expect_equal(size_t { 32 }, public_key_bytes);
            expect_equal(size_t { 64 }, signature_bytes);
            expect_equal(secret_key_bytes, sizeof(skey_t));
            static_assert(!std::is_convertible_v<const skey_t &, byte_array<secret_key_bytes>>);
            static_assert(!std::is_constructible_v<byte_array<secret_key_bytes>, const skey_t &>);
            expect_equal(public_key_bytes, sizeof(vkey_t));
        };
        "sign and verify"_test = [] {
            std::mt19937 rnd { 1 };
            for (size_t i = 0; i < 256; ++i) {
                const auto kp = create();
                const auto m = random_message(rnd, i);
                const auto sm = sign(m, kp.sk);
                expect_equal(m.size() + signature_bytes, sm.size());
                const auto m2 = verify(sm, kp.vk);
                expect(m2.has_value()) << "message size" << i;
                if (m2)
                    expect_equal(m, *m2);
            }
        };
        "tampered signed messages are rejected"_test = [] {
            std::mt19937 rnd { 2 };
            for (size_t i = 0; i < 32; ++i) {
                const auto kp = create();
                const auto m = random_message(rnd, i);
                auto sm = sign(m, kp.sk);
                for (size_t j = 0; j < sm.size(); ++j) {
                    sm[j] ^= 0x20;
                    expect(!verify(sm, kp.vk).has_value()) << "message size" << i << "position" << j;
                    sm[j] ^= 0x20;
                    expect(verify(sm, kp.vk).has_value()) << "message size" << i << "position" << j;
                }
            }
        };
        "signing does not modify its inputs"_test = [] {
            const auto kp = create();
            const uint8_vector sk_before { static_cast<buffer>(kp.sk) };
            const auto m = uint8_vector::from_hex("000102030405060708090A0B0C0D0E0F");
            const auto m_before = m;
            const auto sm1 = sign(m, kp.sk);
            const auto sm2 = sign(m, kp.sk);
            expect_equal(m_before, m);
            expect(sk_before == static_cast<buffer>(kp.sk));
            expect_equal(m, *verify(sm1, kp.vk));
            expect_equal(m, *verify(sm2, kp.vk));
        };
        "a different key pair rejects the signature"_test = [] {
            std::mt19937 rnd { 3 };
            for (size_t i = 0; i < 16; ++i) {
                const auto kp1 = create();
                const auto kp2 = create();
                const auto sm = sign(random_message(rnd, i * 7), kp1.sk);
                expect(!verify(sm, kp2.vk).has_value());
                expect(verify(sm, kp1.vk).has_value());
            }
        };
        "inputs shorter than a signature are rejected"_test = [] {
            std::mt19937 rnd { 4 };
            const auto kp = create();
            for (size_t sz = 0; sz < signature_bytes; ++sz) {
                expect(!verify(uint8_vector(sz), kp.vk).has_value()) << "size" << sz;
                expect(!verify(random_message(rnd, sz), kp.vk).has_value()) << "size" << sz;
            }
            const auto sm = sign(uint8_vector {}, kp.sk);
            expect(!verify(buffer { sm.data(), signature_bytes - 1 }, kp.vk).has_value());
            expect_equal(size_t { 0 }, verify(sm, kp.vk)->size());
        };
        "generated secret keys are unique"_test = [] {
            static constexpr size_t num_keys = 10'000;
            std::set<std::string> sks {};
            std::set<std::string> vks {};
            for (size_t i = 0; i < num_keys; ++i) {
                const auto kp = create();
                sks.emplace(fmt::format("{}", static_cast<buffer>(kp.sk)));
                vks.emplace(fmt::format("{}", kp.vk));
            }
            expect_equal(num_keys, sks.size());
            expect_equal(num_keys, vks.size());
        };
        "secret keys are wiped when destroyed"_test = [] {
            alignas(skey_t) std::array<uint8_t, sizeof(skey_t)> storage {};
            auto *sk = new (storage.data()) skey_t(create().sk);
            expect(!all_zero(buffer { storage.data(), storage.size() }));
            sk->~skey_t();
            expect(all_zero(buffer { storage.data(), storage.size() }));
        };
        "secret keys are wiped during stack unwinding"_test = [] {
            struct destroy_only {
                void operator()(skey_t *p) const
                {
                    p->~skey_t();
                }
            };
            alignas(skey_t) std::array<uint8_t, sizeof(skey_t)> storage {};
            expect(throws<error>([&] {
                std::unique_ptr<skey_t, destroy_only> sk { new (storage.data()) skey_t(create().sk) };
                if (!all_zero(buffer { storage.data(), storage.size() }))
                    throw error("leaving the scope with an exception");
            }));
            expect(all_zero(buffer { storage.data(), storage.size() }));
        };
        "moving a secret key wipes the source"_test = [] {
            auto kp = create();
            const skey_t sk { std::move(kp.sk) };
            expect(all_zero(static_cast<buffer>(kp.sk)));
            expect(!all_zero(static_cast<buffer>(sk)));
            const auto m = uint8_vector::from_hex("DEADBEEF");
            expect_equal(m, *verify(sign(m, sk), kp.vk));
        };
        "concurrent use"_test = [] {
            static constexpr size_t num_threads = 8;
            static constexpr size_t num_iters = 32;
            const auto kp = create();
            std::atomic_size_t num_ok { 0 };
            std::vector<std::thread> threads {};
            for (size_t t = 0; t < num_threads; ++t) {
                threads.emplace_back([&, t] {
                    std::mt19937 rnd { static_cast<unsigned>(t) };
                    for (size_t i = 0; i < num_iters; ++i) {
                        const auto m = random_message(rnd, i);
                        const auto own = create();
                        const auto res = verify(sign(m, kp.sk), kp.vk);
                        if (res && *res == m && verify(sign(m, own.sk), own.vk) && !verify(sign(m, own.sk), kp.vk))
                            num_ok.fetch_add(1);
                    }
                });
            }
            for (auto &th: threads)
                th.join();
            expect_equal(num_threads * num_iters, num_ok.load());
        };
        "primitive failures are reported"_test = [] {
            const auto msg = uint8_vector::from_hex("0011223344");
            "initialization"_test = [&] {
                fake_primitive_t p {};
                p.init_ok = false;
                const skey_t sk {};
                const vkey_t vk {};
                expect(throws<initialization_error>([&] { create(p); }));
                expect(throws<initialization_error>([&] { sign(msg, sk, p); }));
                expect(throws<initialization_error>([&] { verify(uint8_vector(100), vk, p); }));
                expect(throws<initialization_error>([&] { verify(uint8_vector {}, vk, p); }));
            };
            "keypair"_test = [] {
                fake_primitive_t p {};
                const auto kp = create(p);
                vkey_t exp_vk {};
                exp_vk.fill(0xAA);
                expect_equal(exp_vk, kp.vk);
                p.keypair_res = -1;
                expect(throws<entropy_error>([&] { create(p); }));
            };
            "sign"_test = [&] {
                fake_primitive_t p {};
                const auto kp = create(p);
                const auto sm = sign(msg, kp.sk, p);
                expect_equal(msg.size() + signature_bytes, sm.size());
                expect_equal(msg, *verify(sm, kp.vk, p));
                p.sign_res = -1;
                expect(throws<signing_error>([&] { sign(msg, kp.sk, p); }));
                p.sign_res = 0;
                p.sign_len_cut = 1;
                expect(throws<signing_error>([&] { sign(msg, kp.sk, p); }));
            };
            "verify"_test = [&] {
                fake_primitive_t p {};
                const auto kp = create(p);
                const auto sm = sign(msg, kp.sk, p);
                p.open_res = -1;
                expect(nothrow([&] { static_cast<void>(verify(sm, kp.vk, p)); }));
                expect(!verify(sm, kp.vk, p).has_value());
                p.open_res = 0;
                p.open_len_cut = 1;
                expect(!verify(sm, kp.vk, p).has_value());
                p.open_len_cut = 0;
                p.open_calls = 0;
                expect(!verify(buffer { sm.data(), signature_bytes - 1 }, kp.vk, p).has_value());
                expect_equal(size_t { 0 }, p.open_calls);
            };
        };
    };
};
