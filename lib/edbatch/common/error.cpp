/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <cstring>
#include <typeinfo>
#include "error.hpp"
#include "format.hpp"

#ifdef EDBATCH_STACKTRACE
#   include <boost/stacktrace.hpp>
#   include "logger.hpp"
#endif

namespace edbatch {
    error::error(const std::string_view msg):
        _msg { msg }
    {
#ifdef EDBATCH_STACKTRACE
        logger::debug("error: {} raised at:\n{}", _msg, boost::stacktrace::to_string(boost::stacktrace::stacktrace {}));
#endif
    }

    error::error(const std::string_view msg, const std::exception &cause):
        error { fmt::format("{} caused by {}: {}", msg, typeid(cause).name(), cause.what()) }
    {
    }

    const char *error::what() const noexcept
    {
        return _msg.c_str();
    }

    error_sys::error_sys(const std::string_view msg):
        error_sys { msg, errno }
    {
    }

    error_sys::error_sys(const std::string_view msg, const int code):
        error { fmt::format("{} errno: {} strerror: {}", msg, code, std::strerror(code)) },
        _code { code }
    {
    }
}
