#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdio>
#include <string>
#include <string_view>
#include "bytes.hpp"

namespace edbatch::file {
    // a RAII wrapper over a stdio stream
    // an unbuffered stream leaves no copy of the data in stdio's internal buffer
    struct stream {
        stream(const std::string &path, const char *mode, bool buffered=true);
        stream(const stream &) =delete;
        ~stream();

        uint8_vector read_all();
        void write(const buffer &data);
        void close();

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
        std::FILE *_f;
    };

    extern std::string install_path(std::string_view rel_path);
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, const buffer &data);
    // the caller owns the returned bytes and is responsible for wiping them
    extern uint8_vector read_secret(const std::string &path);
    // creates or truncates the file with permissions restricted to the owner before writing any data without stdio buffering
    extern void write_secret(const std::string &path, const buffer &data);
}
