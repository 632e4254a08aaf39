#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <edbatch/common/error.hpp>

namespace edbatch::crypto {
    // the primitive library could not be initialized, so no operation can be attempted
    struct initialization_error final: error {
        using error::error;
    };

    // the primitive failed to produce fresh key material
    struct entropy_error final: error {
        using error::error;
    };

    struct signing_error final: error {
        using error::error;
    };
}
