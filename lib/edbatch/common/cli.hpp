#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "error.hpp"
#include "logger.hpp"

namespace edbatch::cli {
    using arguments = std::vector<std::string>;

    struct argument_config {
        // names in square brackets are optional and must follow the mandatory ones
        void expect(std::initializer_list<std::string> names);
        std::string usage() const;

        size_t min() const noexcept
        {
            return _min;
        }

        size_t max() const noexcept
        {
            return _max;
        }
    private:
        std::vector<std::string> _names {};
        size_t _min = 0;
        size_t _max = 0;
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
    };

    struct command {
        using ptr = std::shared_ptr<command>;
        using registry = std::map<std::string, ptr>;

        static registry &commands();
        static ptr reg(const ptr &cmd);

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;
        virtual void run(const arguments &args) const =0;
    };

    extern int run(int argc, const char **argv);
}
