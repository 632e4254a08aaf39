#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stdexcept>
#include <string>
#include <string_view>

namespace edbatch {
    // the base of all exceptions raised by edbatch code
    struct error: std::exception {
        explicit error(std::string_view msg);
        // chains the cause's type and message after msg
        explicit error(std::string_view msg, const std::exception &cause);
        const char *what() const noexcept override;
    private:
        std::string _msg;
    };

    // a failed system call: captures errno at construction
    struct error_sys: error {
        explicit error_sys(std::string_view msg);

        int code() const noexcept
        {
            return _code;
        }
    private:
        int _code;

        error_sys(std::string_view msg, int code);
    };
}
