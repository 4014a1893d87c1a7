// Duplicate group construction and master selection.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "Matcher.hpp"
#include "DirIndexer.hpp"
#include "FileOps.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dupelink
{

/// Oldest first, then smallest path.
static bool olderThan(const FileRecord& a, const FileRecord& b)
{
    if (a.mtimeNs != b.mtimeNs)
    {
        return a.mtimeNs < b.mtimeNs;
    }
    return a.path < b.path;
}

static bool pathLess(const FileRecord& a, const FileRecord& b)
{
    return a.path < b.path;
}

MasterSelection selectMaster(std::vector<FileRecord> candidates, const fs::path& masterRoot)
{
    if (candidates.empty())
    {
        throw std::invalid_argument("selectMaster() called without candidates.");
    }

    auto best = candidates.end();
    for (auto it = candidates.begin(); it != candidates.end(); ++it)
    {
        if (isPathWithin(masterRoot, it->path) && (best == candidates.end() || olderThan(*it, *best)))
        {
            best = it;
        }
    }

    MasterSelection selection;
    if (best == candidates.end())
    {
        best = std::min_element(candidates.begin(), candidates.end(), olderThan);
        selection.reason = MasterReason::OldestFallback;
    }
    selection.master = *best;
    candidates.erase(best);
    std::sort(candidates.begin(), candidates.end(), pathLess);
    selection.duplicates = std::move(candidates);
    return selection;
}

/// True if all files have the same file name (ignoring the directory).
static bool allSameName(const std::vector<FileRecord>& files)
{
    for (const auto& file : files)
    {
        if (fs::path(file.path).filename() != fs::path(files.front().path).filename())
        {
            return false;
        }
    }
    return true;
}

/// Files of one index whose hash does not appear in the other index.
static std::vector<FileRecord> unmatchedFiles(const HashIndex& index, const HashIndex& other)
{
    std::vector<FileRecord> r;
    for (const auto& [hash, records] : index.getFiles())
    {
        if (other.find(hash) == nullptr)
        {
            r.insert(r.end(), records.begin(), records.end());
        }
    }
    std::sort(r.begin(), r.end(), pathLess);
    return r;
}

MatchResult findDuplicates(const HashIndex& a, const HashIndex& b, const fs::path& masterRoot, const MatchOptions& options)
{
    MatchResult result;
    for (const auto& [hash, recordsA] : a.getFiles())
    {
        const std::vector<FileRecord>* recordsB = b.find(hash);
        if (recordsB == nullptr)
        {
            continue;
        }

        // Union of both sides. Overlapping trees may contain the same path twice.
        std::vector<FileRecord> candidates;
        std::set<std::string> seen;
        for (const std::vector<FileRecord>* side : {&recordsA, recordsB})
        {
            for (const auto& record : *side)
            {
                if (seen.insert(record.path).second)
                {
                    candidates.push_back(record);
                }
            }
        }
        if (candidates.size() < 2)
        {
            continue;
        }
        if (options.differentNamesOnly && allSameName(candidates))
        {
            continue;
        }

        size_t inMasterTree = std::count_if(candidates.begin(), candidates.end(), [&](const FileRecord& record)
        {
            return isPathWithin(masterRoot, record.path);
        });
        if (inMasterTree > 1)
        {
            result.warnings.push_back(ut1::toStr(inMasterTree) + " files in master directory share content hash " + hash + ", only the oldest is kept as master.");
        }

        MasterSelection selection = selectMaster(std::move(candidates), masterRoot);
        DuplicateGroup group;
        group.hash = hash;
        group.master = std::move(selection.master);
        group.reason = selection.reason;
        for (auto& duplicate : selection.duplicates)
        {
            if (isSameInode(duplicate, group.master))
            {
                result.alreadyHardlinked++;
            }
            else
            {
                group.duplicates.push_back(std::move(duplicate));
            }
        }
        if (group.duplicates.empty())
        {
            continue;
        }
        result.groups.push_back(std::move(group));
    }

    std::sort(result.groups.begin(), result.groups.end(), [](const DuplicateGroup& x, const DuplicateGroup& y)
    {
        return x.master.path < y.master.path;
    });
    result.unmatchedA = unmatchedFiles(a, b);
    result.unmatchedB = unmatchedFiles(b, a);
    return result;
}

FileSize reclaimableBytes(const std::vector<DuplicateGroup>& groups)
{
    FileSize r = 0;
    for (const auto& group : groups)
    {
        for (const auto& duplicate : group.duplicates)
        {
            r += duplicate.size;
        }
    }
    return r;
}

size_t numDuplicates(const std::vector<DuplicateGroup>& groups)
{
    size_t r = 0;
    for (const auto& group : groups)
    {
        r += group.duplicates.size();
    }
    return r;
}

} // namespace dupelink

using namespace dupelink;

/// Record with a fresh inode unless one is given.
static FileRecord rec(const std::string& path, int64_t mtimeNs, FileSize size = 10, uint64_t inode = 0)
{
    static uint64_t nextInode = 1000;
    FileRecord r;
    r.path = path;
    r.mtimeNs = mtimeNs;
    r.size = size;
    r.device = 1;
    r.inode = (inode != 0) ? inode : nextInode++;
    return r;
}

UNIT_TEST(Matcher_selectMasterPrefersMasterTree)
{
    MasterSelection s = selectMaster({rec("/b/old.txt", 100), rec("/a/new.txt", 500), rec("/a/newer.txt", 900)}, "/a");
    ASSERT_EQ(s.master.path, "/a/new.txt");
    ASSERT_EQ(s.reason == MasterReason::InMasterTree, true);
    ASSERT_EQ(s.duplicates.size(), size_t(2));
    ASSERT_EQ(s.duplicates[0].path, "/a/newer.txt");
    ASSERT_EQ(s.duplicates[1].path, "/b/old.txt");
}

UNIT_TEST(Matcher_selectMasterFallsBackToOldest)
{
    MasterSelection s = selectMaster({rec("/c/x.txt", 300), rec("/b/y.txt", 200), rec("/b/z.txt", 400)}, "/a");
    ASSERT_EQ(s.master.path, "/b/y.txt");
    ASSERT_EQ(s.reason == MasterReason::OldestFallback, true);
    ASSERT_EQ(s.duplicates.size(), size_t(2));
}

UNIT_TEST(Matcher_selectMasterTieBreakByPath)
{
    MasterSelection s = selectMaster({rec("/a/b.txt", 100), rec("/a/a.txt", 100), rec("/a/c.txt", 100)}, "/a");
    ASSERT_EQ(s.master.path, "/a/a.txt");
    s = selectMaster({rec("/a/c.txt", 100), rec("/a/b.txt", 100)}, "/a");
    ASSERT_EQ(s.master.path, "/a/b.txt");
}

UNIT_TEST(Matcher_selectMasterSiblingDirIsNotMasterTree)
{
    MasterSelection s = selectMaster({rec("/data/a2/x", 100), rec("/data/a/x", 900)}, "/data/a");
    ASSERT_EQ(s.master.path, "/data/a/x");
    ASSERT_EQ(s.reason == MasterReason::InMasterTree, true);
}

UNIT_TEST(Matcher_findDuplicates)
{
    HashIndex::Map filesA;
    filesA["h1"] = {rec("/a/one.txt", 100)};
    filesA["h2"] = {rec("/a/two.txt", 100), rec("/a/two_copy.txt", 200)};
    filesA["h3"] = {rec("/a/only_a.txt", 100)};
    HashIndex::Map filesB;
    filesB["h1"] = {rec("/b/one.txt", 50)};
    filesB["h2"] = {rec("/b/zz.txt", 300)};
    filesB["h4"] = {rec("/b/only_b2.txt", 100), rec("/b/only_b1.txt", 100)};
    HashIndex a("/a", filesA, 0);
    HashIndex b("/b", filesB, 0);

    MatchResult r = findDuplicates(a, b, "/a");
    ASSERT_EQ(r.groups.size(), size_t(2));
    ASSERT_EQ(r.groups[0].master.path, "/a/one.txt");
    ASSERT_EQ(r.groups[0].duplicates.size(), size_t(1));
    ASSERT_EQ(r.groups[0].duplicates[0].path, "/b/one.txt");
    ASSERT_EQ(r.groups[1].master.path, "/a/two.txt");
    ASSERT_EQ(r.groups[1].duplicates.size(), size_t(2));
    ASSERT_EQ(r.groups[1].hash, "h2");
    ASSERT_EQ(r.warnings.size(), size_t(1));
    ASSERT_EQ(r.unmatchedA.size(), size_t(1));
    ASSERT_EQ(r.unmatchedA[0].path, "/a/only_a.txt");
    ASSERT_EQ(r.unmatchedB.size(), size_t(2));
    ASSERT_EQ(r.unmatchedB[0].path, "/b/only_b1.txt");
    ASSERT_EQ(numDuplicates(r.groups), size_t(3));
    ASSERT_EQ(reclaimableBytes(r.groups), FileSize(30));

    // Master tree is the second directory.
    r = findDuplicates(a, b, "/b");
    ASSERT_EQ(r.groups[0].master.path, "/b/one.txt");
    ASSERT_EQ(r.groups[1].master.path, "/b/zz.txt");
    ASSERT_EQ(r.warnings.size(), size_t(0));
}

UNIT_TEST(Matcher_differentNamesOnly)
{
    HashIndex::Map filesA;
    filesA["same"] = {rec("/a/photo.jpg", 100)};
    filesA["diff"] = {rec("/a/report.pdf", 100)};
    HashIndex::Map filesB;
    filesB["same"] = {rec("/b/sub/photo.jpg", 100)};
    filesB["diff"] = {rec("/b/report_final.pdf", 100)};
    HashIndex a("/a", filesA, 0);
    HashIndex b("/b", filesB, 0);

    ASSERT_EQ(findDuplicates(a, b, "/a").groups.size(), size_t(2));
    MatchOptions options;
    options.differentNamesOnly = true;
    MatchResult r = findDuplicates(a, b, "/a", options);
    ASSERT_EQ(r.groups.size(), size_t(1));
    ASSERT_EQ(r.groups[0].hash, "diff");
}

UNIT_TEST(Matcher_overlappingTrees)
{
    HashIndex::Map filesA;
    filesA["h"] = {rec("/a/x", 100), rec("/a/sub/y", 200)};
    HashIndex::Map filesB;
    filesB["h"] = {rec("/a/sub/y", 200)};
    HashIndex a("/a", filesA, 0);
    HashIndex b("/a/sub", filesB, 0);

    MatchResult r = findDuplicates(a, b, "/a");
    ASSERT_EQ(r.groups.size(), size_t(1));
    ASSERT_EQ(r.groups[0].master.path, "/a/x");
    ASSERT_EQ(r.groups[0].duplicates.size(), size_t(1));
    ASSERT_EQ(r.groups[0].duplicates[0].path, "/a/sub/y");
}

UNIT_TEST(Matcher_dropsDuplicatesAlreadyHardlinked)
{
    HashIndex::Map filesA;
    filesA["linked"] = {rec("/a/x", 100, 40, 7)};
    filesA["mixed"] = {rec("/a/m", 100, 25, 8)};
    HashIndex::Map filesB;
    filesB["linked"] = {rec("/b/x", 200, 40, 7)};
    filesB["mixed"] = {rec("/b/m1", 200, 25, 8), rec("/b/m2", 200, 25)};
    HashIndex a("/a", filesA, 0);
    HashIndex b("/b", filesB, 0);

    MatchResult r = findDuplicates(a, b, "/a");
    ASSERT_EQ(r.alreadyHardlinked, size_t(2));
    ASSERT_EQ(r.groups.size(), size_t(1));
    ASSERT_EQ(r.groups[0].master.path, "/a/m");
    ASSERT_EQ(r.groups[0].duplicates.size(), size_t(1));
    ASSERT_EQ(r.groups[0].duplicates[0].path, "/b/m2");
    ASSERT_EQ(numDuplicates(r.groups), size_t(1));
    ASSERT_EQ(reclaimableBytes(r.groups), FileSize(25));
    ASSERT_EQ(r.unmatchedA.size(), size_t(0));
    ASSERT_EQ(r.unmatchedB.size(), size_t(0));
}
