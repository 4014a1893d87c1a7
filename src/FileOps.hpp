// Filesystem helpers.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Model.hpp"
#include <ctime>
#include <filesystem>
#include <optional>

namespace dupelink
{

/// Normalize a path for consistent comparisons (absolute, lexically normal, no trailing slash).
std::filesystem::path normalizePath(const std::filesystem::path& path);

/// Resolve a directory argument to its canonical path. Throws SetupError if it is not a directory.
std::filesystem::path canonicalDir(const std::filesystem::path& path);

/// Check if a path is within a root path (or equal to it).
bool isPathWithin(const std::filesystem::path& root, const std::filesystem::path& path);

/// Convert a timespec into nanoseconds since the epoch.
int64_t nsFromTimespec(const timespec& ts);

/// Stat a path without following symlinks. Returns std::nullopt if it does not exist or cannot be stat'ed.
std::optional<FileRecord> lstatRecord(const std::filesystem::path& path);

/// True if both paths name the same inode on the same device.
bool isHardlinkTo(const std::filesystem::path& a, const std::filesystem::path& b);

/// True if duplicate is a symlink that resolves to master.
bool isSymlinkTo(const std::filesystem::path& duplicate, const std::filesystem::path& master);

/// True if the entry exists (without following symlinks).
bool entryExists(const std::filesystem::path& path);

} // namespace dupelink
