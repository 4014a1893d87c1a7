// Content hash index of one directory tree.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ContentHasher.hpp"
#include "Model.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace dupelink
{

class Log;
class ProgressTracker;

/// Mapping from content hash to the files of one tree with that content.
/// Built once by indexDirectory() and read-only afterwards.
class HashIndex
{
public:
    using Map = std::map<std::string, std::vector<FileRecord>>;

    HashIndex(std::filesystem::path root_, Map files_, size_t skippedFiles_);

    /// Canonical root of the indexed tree.
    const std::filesystem::path& getRoot() const { return root; }

    /// All hashes in ascending order, each with its files sorted by path.
    const Map& getFiles() const { return files; }

    /// Files with the given hash or nullptr.
    const std::vector<FileRecord>* find(const std::string& hash) const;

    size_t numFiles() const { return fileCount; }
    FileSize totalSize() const { return totalBytes; }
    size_t numSkipped() const { return skippedFiles; }

private:
    std::filesystem::path root;
    Map files;
    size_t fileCount{};
    FileSize totalBytes{};
    size_t skippedFiles{};
};

/// Digest function used by the indexer. Tests replace it to inject read errors.
using FileHasher = std::function<std::string(const std::filesystem::path&, const HashOptions&, ProgressTracker*)>;

/// Recursively hash all regular files below root.
/// Symlinks are neither followed nor indexed. Unreadable files and directories are reported as
/// warnings, counted as skipped and the walk continues with the rest of the tree.
/// Throws SetupError if root is not a readable directory.
HashIndex indexDirectory(const std::filesystem::path& root, const HashOptions& options, const Log& log,
                         ProgressTracker* progress = nullptr, const FileHasher& hasher = FileHasher(hashFile));

} // namespace dupelink
