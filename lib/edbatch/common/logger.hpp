#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <exception>
#include <functional>
#include <optional>
#include <source_location>
#include <string>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif
#include "format.hpp"

namespace edbatch::logger {
    using level = spdlog::level::level_enum;

    // created on first use from the EDBATCH_LOG, EDBATCH_DEBUG and EDBATCH_LOG_NO_CONSOLE environment variables
    extern spdlog::logger &get();

    // format strings are checked at compile time, and messages below the logger's level are never formatted
    template<typename... Args>
    void log(const level lev, fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        auto &l = get();
        if (l.should_log(lev))
            l.log(lev, fmt::format(fmt_str, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::trace, fmt_str, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::debug, fmt_str, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::info, fmt_str, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::warn, fmt_str, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::err, fmt_str, std::forward<Args>(a)...);
    }

    using action = std::function<void()>;
    using optional_action = std::optional<action>;

    // runs main and then cleanup even when main throws; the exception is logged and returned, not rethrown
    inline std::exception_ptr run_log_errors(const action &main, const optional_action &cleanup={},
            const std::source_location &loc=std::source_location::current())
    {
        std::exception_ptr cur_ex {};
        try {
            main();
        } catch (const std::exception &ex) {
            cur_ex = std::current_exception();
            error("{}:{}: {}", loc.file_name(), loc.line(), ex.what());
        } catch (...) {
            cur_ex = std::current_exception();
            error("{}:{}: an exception not derived from std::exception", loc.file_name(), loc.line());
        }
        if (cleanup)
            (*cleanup)();
        return cur_ex;
    }
}
