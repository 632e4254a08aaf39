/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <cstring>
#include "test.hpp"

namespace {
    using namespace edbatch;
}

suite edbatch_common_error_suite = [] {
    "edbatch::common::error"_test = [] {
        "message"_test = [] {
            const error e { "Something bad!" };
            expect_equal(std::string_view { "Something bad!" }, std::string_view { e.what() });
        };
        "caused by"_test = [] {
            const error cause { "the root cause" };
            const error e { "the outer failure", cause };
            const std::string_view msg { e.what() };
            expect(msg.starts_with("the outer failure caused by "));
            expect(msg.ends_with(": the root cause"));
        };
        "error_sys"_test = [] {
            errno = ENOENT;
            const error_sys e { "open failed" };
            const std::string_view msg { e.what() };
            expect(msg.starts_with("open failed errno: "));
            expect(msg.find(std::strerror(ENOENT)) != std::string_view::npos);
            expect_equal(ENOENT, e.code());
        };
        "error_sys keeps errno from before the message is formatted"_test = [] {
            errno = EACCES;
            const error_sys e { fmt::format("{} failed", "chmod") };
            expect_equal(EACCES, e.code());
            expect(std::string_view { e.what() }.starts_with("chmod failed errno: "));
        };
        "all edbatch errors are std::exceptions"_test = [] {
            expect(throws<std::exception>([] { throw error_sys("open failed"); }));
            expect(throws<error>([] { throw error_sys("open failed"); }));
        };
    };
};
