/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <edbatch/common/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace edbatch;
    return cli::run(argc, argv);
}
