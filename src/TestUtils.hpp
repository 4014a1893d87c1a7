// Helpers for unit tests which need real files.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "MiscUtils.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace dupelink
{

/// Scoped temporary directory, removed recursively on destruction.
class TempDir
{
public:
    TempDir()
    {
        static unsigned counter = 0;
        std::filesystem::path base = std::filesystem::temp_directory_path();
        for (;;)
        {
            path = base / ("dupelink_test_" + ut1::toStr(::getpid()) + "_" + ut1::toStr(counter++));
            if (std::filesystem::create_directory(path))
            {
                break;
            }
        }
        path = std::filesystem::canonical(path);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    /// Path below the temp dir.
    std::filesystem::path operator/(const std::string& rel) const { return path / rel; }

    std::filesystem::path path;
};

/// Create a file (and its parent dirs) with the given content.
inline std::filesystem::path writeTestFile(const std::filesystem::path& path, const std::string& content)
{
    std::filesystem::create_directories(path.parent_path());
    ut1::writeFile(path.string(), content);
    return path;
}

/// Set the modification time to a fixed number of seconds before now.
inline void setAge(const std::filesystem::path& path, int seconds)
{
    std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - std::chrono::seconds(seconds));
}

} // namespace dupelink
