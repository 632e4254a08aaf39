#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <sys/types.h>
#include "errors.hpp"

namespace edbatch::crypto::sodium
{
    extern "C" {
#       include <sodium.h>
    }

    // Runs sodium_init exactly once per process. Throws initialization_error on failure,
    // in which case the next call makes another attempt.
    extern void ensure_initialized();
}
