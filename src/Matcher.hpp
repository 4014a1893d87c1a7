// Duplicate group construction and master selection.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Model.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace dupelink
{

class HashIndex;

struct MasterSelection
{
    FileRecord master;
    std::vector<FileRecord> duplicates; // Sorted by path.
    MasterReason reason{MasterReason::InMasterTree};
};

/// Pick the master of a set of files with identical content.
///
/// Files below masterRoot win. Among the eligible files the oldest (by mtime) is chosen,
/// ties broken by the smallest path. If no file is below masterRoot the oldest file overall
/// becomes master and the reason is MasterReason::OldestFallback.
/// Throws std::invalid_argument for an empty candidate list.
MasterSelection selectMaster(std::vector<FileRecord> candidates, const std::filesystem::path& masterRoot);

struct MatchOptions
{
    /// Drop groups in which all files share one basename.
    bool differentNamesOnly{};
};

struct MatchResult
{
    std::vector<DuplicateGroup> groups; // Sorted by master path.
    std::vector<FileRecord> unmatchedA; // Sorted by path.
    std::vector<FileRecord> unmatchedB; // Sorted by path.
    std::vector<std::string> warnings;
    size_t alreadyHardlinked{}; // Duplicates sharing the master's inode, dropped from the groups.
};

/// Intersect two indexes by content hash and build one group per common hash.
/// Duplicates which already are hard links of their master save no space and are left out
/// (counted in MatchResult::alreadyHardlinked). A group without remaining duplicates is dropped.
MatchResult findDuplicates(const HashIndex& a, const HashIndex& b, const std::filesystem::path& masterRoot, const MatchOptions& options = MatchOptions());

/// True if both records name the same inode.
inline bool isSameInode(const FileRecord& a, const FileRecord& b)
{
    return a.device == b.device && a.inode == b.inode;
}

/// True if the duplicate lives on a different device than the master.
inline bool isCrossFilesystem(const DuplicateGroup& group, const FileRecord& duplicate)
{
    return group.master.device != duplicate.device;
}

/// Sum of the duplicate sizes of all groups.
FileSize reclaimableBytes(const std::vector<DuplicateGroup>& groups);

/// Number of duplicates of all groups.
size_t numDuplicates(const std::vector<DuplicateGroup>& groups);

} // namespace dupelink
