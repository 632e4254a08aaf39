/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#ifndef _WIN32
#   include <fcntl.h>
#   include <sys/stat.h>
#   include <unistd.h>
#endif
#include "file.hpp"
#include "numeric-cast.hpp"

namespace edbatch::file {
    stream::stream(const std::string &path, const char *mode, const bool buffered):
        _path { path },
        _f { std::fopen(path.c_str(), mode) }
    {
        if (!_f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} with mode {}", _path, mode));
        if (!buffered && std::setvbuf(_f, nullptr, _IONBF, 0) != 0) [[unlikely]] {
            std::fclose(_f);
            _f = nullptr;
            throw error_sys(fmt::format("failed to disable buffering for {}", _path));
        }
    }

    stream::~stream()
    {
        if (_f)
            std::fclose(_f);
    }

    void stream::close()
    {
        if (_f) {
            const auto res = std::fclose(_f);
            _f = nullptr;
            if (res != 0) [[unlikely]]
                throw error_sys(fmt::format("failed to close {}", _path));
        }
    }

    uint8_vector stream::read_all()
    {
        if (std::fseek(_f, 0, SEEK_END) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to seek in {}", _path));
        const auto pos = std::ftell(_f);
        if (pos < 0) [[unlikely]]
            throw error_sys(fmt::format("failed to tell the stream position in {}", _path));
        if (std::fseek(_f, 0, SEEK_SET) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to seek in {}", _path));
        uint8_vector data(numeric_cast<size_t>(pos));
        if (!data.empty() && std::fread(data.data(), 1, data.size(), _f) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", data.size(), _path));
        return data;
    }

    void stream::write(const buffer &data)
    {
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), _f) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), _path));
    }

    std::string install_path(const std::string_view rel_path)
    {
        // provide a dummy implementation at the moment
        return fmt::format("./{}", rel_path);
    }

    uint8_vector read(const std::string &path)
    {
        stream s { path, "rb" };
        return s.read_all();
    }

    void write(const std::string &path, const buffer &data)
    {
        stream s { path, "wb" };
        s.write(data);
        s.close();
    }

    uint8_vector read_secret(const std::string &path)
    {
        stream s { path, "rb", false };
        return s.read_all();
    }

    void write_secret(const std::string &path, const buffer &data)
    {
#ifndef _WIN32
        {
            const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
            if (fd < 0) [[unlikely]]
                throw error_sys(fmt::format("failed to create {}", path));
            // the mode passed to open applies only to newly created files
            const auto chmod_res = ::fchmod(fd, S_IRUSR | S_IWUSR);
            const auto close_res = ::close(fd);
            if (chmod_res != 0 || close_res != 0) [[unlikely]]
                throw error_sys(fmt::format("failed to restrict the permissions of {}", path));
        }
#endif
        stream s { path, "wb", false };
        s.write(data);
        s.close();
    }
}
