/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <edbatch/common/logger.hpp>
#include <edbatch/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace edbatch;
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    logger::debug("run-test: starting");
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    logger::debug("run-test: finished with {}", res ? "failures" : "success");
    return res ? 1 : 0;
}
