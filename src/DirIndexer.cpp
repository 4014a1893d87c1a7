// Content hash index of one directory tree.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "DirIndexer.hpp"
#include "Errors.hpp"
#include "FileOps.hpp"
#include "Log.hpp"
#include "ProgressTracker.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

namespace dupelink
{

HashIndex::HashIndex(fs::path root_, Map files_, size_t skippedFiles_)
    : root(std::move(root_)), files(std::move(files_)), skippedFiles(skippedFiles_)
{
    for (auto& [hash, records] : files)
    {
        std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b)
        {
            return a.path < b.path;
        });
        fileCount += records.size();
        for (const auto& record : records)
        {
            totalBytes += record.size;
        }
    }
}

const std::vector<FileRecord>* HashIndex::find(const std::string& hash) const
{
    auto it = files.find(hash);
    if (it == files.end())
    {
        return nullptr;
    }
    return &it->second;
}

/// Snapshot size, mtime, device and inode of a regular file.
static FileRecord makeRecord(const fs::directory_entry& entry)
{
    ut1::StatInfo statInfo = ut1::getStat(entry, false);
    FileRecord record;
    record.path = entry.path().string();
    record.size = entry.file_size();
    record.mtimeNs = nsFromTimespec(statInfo.getMTimeSpec());
    record.device = static_cast<uint64_t>(statInfo.statData.st_dev);
    record.inode = static_cast<uint64_t>(statInfo.getIno());
    record.numLinks = static_cast<uint64_t>(statInfo.statData.st_nlink);
    return record;
}

/// Index the regular files of one directory and append its subdirectories to pending.
/// A directory that cannot be read is reported and counted as skipped, the rest of the tree continues.
static void scanDir(const fs::path& dirPath, const HashOptions& options, const Log& log, ProgressTracker* progress,
                    const FileHasher& hasher, HashIndex::Map& files, size_t& skipped, std::vector<fs::path>& pending)
{
    log.debug("Scanning " + dirPath.string(), 3);
    if (progress)
    {
        progress->onDirStart(dirPath);
    }

    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dirPath, ec);
    if (ec)
    {
        log.warning("Skipping directory " + dirPath.string() + ": " + ec.message());
        skipped++;
        return;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec))
    {
        entries.push_back(*it);
    }
    if (ec)
    {
        // Entries read so far are still indexed.
        log.warning("Error while scanning directory " + dirPath.string() + ": " + ec.message());
        skipped++;
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b)
    {
        return a.path() < b.path();
    });

    // All entries are classified before the first file is hashed.
    std::vector<fs::directory_entry> regularFiles;
    std::vector<fs::path> subDirs;
    for (const fs::directory_entry& entry : entries)
    {
        try
        {
            auto type = ut1::getFileType(entry, false);
            if (type == ut1::FT_DIR)
            {
                subDirs.push_back(entry.path());
            }
            else if (type == ut1::FT_REGULAR)
            {
                regularFiles.push_back(entry);
            }
        }
        catch (const std::exception& e)
        {
            log.warning("Skipping " + entry.path().string() + ": " + e.what());
            skipped++;
        }
    }

    for (const fs::directory_entry& entry : regularFiles)
    {
        try
        {
            FileRecord record = makeRecord(entry);
            if (progress)
            {
                progress->onFileProcessed(record.size);
            }
            std::string hash = hasher(entry.path(), options, progress);
            log.debug("  " + hash + " " + record.path, 2);
            files[hash].push_back(std::move(record));
        }
        catch (const std::exception& e)
        {
            log.warning("Skipping " + entry.path().string() + ": " + e.what());
            skipped++;
        }
    }

    // Pending is used as a stack: push in reverse so subdirectories are visited in name order.
    pending.insert(pending.end(), subDirs.rbegin(), subDirs.rend());
}

HashIndex indexDirectory(const fs::path& root, const HashOptions& options, const Log& log, ProgressTracker* progress,
                         const FileHasher& hasher)
{
    fs::path canonicalRoot = canonicalDir(root);
    log.debug("Indexing " + canonicalRoot.string());
    std::error_code ec;
    fs::directory_iterator rootIt(canonicalRoot, ec);
    if (ec)
    {
        throw SetupError("Error while scanning directory " + canonicalRoot.string() + ": " + ec.message());
    }
    if (progress)
    {
        progress->onRootStart(canonicalRoot);
    }

    HashIndex::Map files;
    size_t skipped = 0;
    std::vector<fs::path> pending{canonicalRoot};
    while (!pending.empty())
    {
        fs::path dirPath = std::move(pending.back());
        pending.pop_back();
        scanDir(dirPath, options, log, progress, hasher, files, skipped, pending);
    }

    HashIndex index(canonicalRoot, std::move(files), skipped);
    log.debug("Indexed " + canonicalRoot.string() + ": " + ut1::toStr(index.numFiles()) + " files, "
        + ut1::toStr(index.getFiles().size()) + " distinct contents");
    return index;
}

} // namespace dupelink

using namespace dupelink;

UNIT_TEST(DirIndexer_indexTree)
{
    TempDir tmp;
    writeTestFile(tmp / "root/a.txt", "alpha");
    writeTestFile(tmp / "root/sub/b.txt", "alpha");
    writeTestFile(tmp / "root/sub/deeper/c.txt", "gamma");
    writeTestFile(tmp / "outside.txt", "outside");
    fs::create_symlink(tmp / "outside.txt", tmp / "root/link.txt");
    fs::create_directory_symlink(tmp / "root", tmp / "root/sub/loop");

    std::ostringstream os;
    Log log(0, false, os);
    HashIndex index = indexDirectory(tmp / "root", HashOptions(), log);

    ASSERT_EQ(index.getRoot() == tmp / "root", true);
    ASSERT_EQ(index.numFiles(), size_t(3));
    ASSERT_EQ(index.getFiles().size(), size_t(2));
    ASSERT_EQ(index.totalSize(), FileSize(15));
    ASSERT_EQ(index.numSkipped(), size_t(0));

    const std::vector<FileRecord>* alpha = index.find(hashFile(tmp / "root/a.txt", HashOptions()));
    ASSERT_EQ(alpha != nullptr, true);
    ASSERT_EQ(alpha->size(), size_t(2));
    ASSERT_EQ((*alpha)[0].path, (tmp / "root/a.txt").string());
    ASSERT_EQ((*alpha)[1].path, (tmp / "root/sub/b.txt").string());
    ASSERT_EQ((*alpha)[0].size, FileSize(5));
    ASSERT_EQ(index.find("0123") == nullptr, true);
}

UNIT_TEST(DirIndexer_skipsUnreadableFiles)
{
    TempDir tmp;
    writeTestFile(tmp / "root/readable.txt", "ok");
    writeTestFile(tmp / "root/secret.txt", "hidden");
    writeTestFile(tmp / "root/sub/after.txt", "later");
    FileHasher failingHasher = [](const fs::path& path, const HashOptions& options, ProgressTracker* progress)
    {
        if (path.filename() == "secret.txt")
        {
            throw ScanError("Error while reading file for hashing: " + path.string());
        }
        return hashFile(path, options, progress);
    };

    std::ostringstream os;
    Log log(0, false, os);
    HashIndex index = indexDirectory(tmp / "root", HashOptions(), log, nullptr, failingHasher);

    ASSERT_EQ(index.numFiles(), size_t(2));
    ASSERT_EQ(index.numSkipped(), size_t(1));
    ASSERT_EQ(os.str().find("Warning: Skipping") != std::string::npos, true);
    ASSERT_EQ(os.str().find("secret.txt") != std::string::npos, true);
}

UNIT_TEST(DirIndexer_continuesAfterVanishedEntries)
{
    TempDir tmp;
    writeTestFile(tmp / "root/a.txt", "alpha");
    writeTestFile(tmp / "root/b.txt", "beta");
    writeTestFile(tmp / "root/gone/x.txt", "x");
    writeTestFile(tmp / "root/gone/deeper/y.txt", "y");
    writeTestFile(tmp / "root/keep/k.txt", "kept");
    writeTestFile(tmp / "root/zeta.txt", "zeta");
    // Hashing the first file removes a sibling file and a not yet visited directory.
    FileHasher removingHasher = [&](const fs::path& path, const HashOptions& options, ProgressTracker* progress)
    {
        if (path.filename() == "a.txt")
        {
            fs::remove_all(tmp / "root/gone");
            fs::remove(tmp / "root/b.txt");
        }
        return hashFile(path, options, progress);
    };

    std::ostringstream os;
    Log log(0, false, os);
    HashIndex index = indexDirectory(tmp / "root", HashOptions(), log, nullptr, removingHasher);

    ASSERT_EQ(index.numFiles(), size_t(3));
    ASSERT_EQ(index.numSkipped(), size_t(2));
    ASSERT_EQ(index.find(hashFile(tmp / "root/keep/k.txt", HashOptions())) != nullptr, true);
    ASSERT_EQ(index.find(hashFile(tmp / "root/zeta.txt", HashOptions())) != nullptr, true);
    ASSERT_EQ(os.str().find("Warning: Skipping directory") != std::string::npos, true);
}

UNIT_TEST(DirIndexer_rejectsMissingRoot)
{
    TempDir tmp;
    Log log(0, true);
    bool thrown = false;
    try
    {
        indexDirectory(tmp / "missing", HashOptions(), log);
    }
    catch (const SetupError&)
    {
        thrown = true;
    }
    ASSERT_EQ(thrown, true);
}
