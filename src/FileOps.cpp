// Filesystem helpers.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "FileOps.hpp"
#include "Errors.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace dupelink
{

fs::path normalizePath(const fs::path& path)
{
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    fs::path normalized = ec ? path.lexically_normal() : abs.lexically_normal();
    if (normalized.has_filename() == false && normalized != normalized.root_path())
    {
        normalized = normalized.parent_path();
    }
    return normalized;
}

fs::path canonicalDir(const fs::path& path)
{
    std::error_code ec;
    if (!fs::is_directory(path, ec))
    {
        throw SetupError("Path '" + path.string() + "' is not a directory.");
    }
    fs::path canonical = fs::canonical(path, ec);
    if (ec)
    {
        throw SetupError("Cannot resolve '" + path.string() + "': " + ec.message());
    }
    return canonical;
}

bool isPathWithin(const fs::path& root, const fs::path& path)
{
    auto rootIt = root.begin();
    auto pathIt = path.begin();
    for (; rootIt != root.end() && pathIt != path.end(); ++rootIt, ++pathIt)
    {
        if (rootIt->empty())
        {
            // Trailing separator of root.
            break;
        }
        if (*rootIt != *pathIt)
        {
            return false;
        }
    }
    return rootIt == root.end() || rootIt->empty();
}

int64_t nsFromTimespec(const timespec& ts)
{
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + static_cast<int64_t>(ts.tv_nsec);
}

std::optional<FileRecord> lstatRecord(const fs::path& path)
{
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0)
    {
        return std::nullopt;
    }
    FileRecord r;
    r.path = path.string();
    r.size = static_cast<FileSize>(st.st_size);
    r.mtimeNs = nsFromTimespec(st.st_mtim);
    r.device = static_cast<uint64_t>(st.st_dev);
    r.inode = static_cast<uint64_t>(st.st_ino);
    r.numLinks = static_cast<uint64_t>(st.st_nlink);
    return r;
}

bool isHardlinkTo(const fs::path& a, const fs::path& b)
{
    std::optional<FileRecord> ra = lstatRecord(a);
    std::optional<FileRecord> rb = lstatRecord(b);
    if (!ra || !rb)
    {
        return false;
    }
    return ra->inode == rb->inode && ra->device == rb->device;
}

bool isSymlinkTo(const fs::path& duplicate, const fs::path& master)
{
    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(duplicate, ec)))
    {
        return false;
    }
    fs::path target = fs::canonical(duplicate, ec);
    if (ec)
    {
        return false;
    }
    fs::path resolvedMaster = fs::canonical(master, ec);
    if (ec)
    {
        return false;
    }
    return target == resolvedMaster;
}

bool entryExists(const fs::path& path)
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

} // namespace dupelink

using namespace dupelink;

UNIT_TEST(FileOps_isPathWithin)
{
    ASSERT_EQ(isPathWithin("/a/b", "/a/b/c.txt"), true);
    ASSERT_EQ(isPathWithin("/a/b", "/a/b"), true);
    ASSERT_EQ(isPathWithin("/a/b/", "/a/b/c.txt"), true);
    ASSERT_EQ(isPathWithin("/a/b", "/a/bc/d.txt"), false);
    ASSERT_EQ(isPathWithin("/a/b", "/a"), false);
}

UNIT_TEST(FileOps_normalizePath)
{
    ASSERT_EQ(normalizePath("/a/./b/../c/").string(), "/a/c");
    ASSERT_EQ(normalizePath("/").string(), "/");
}

UNIT_TEST(FileOps_linkDetection)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "master.txt", "same");
    fs::path copy = writeTestFile(tmp / "copy.txt", "same");
    fs::path hard = tmp / "hard.txt";
    fs::path sym = tmp / "sym.txt";
    fs::create_hard_link(master, hard);
    fs::create_symlink(master, sym);

    ASSERT_EQ(isHardlinkTo(hard, master), true);
    ASSERT_EQ(isHardlinkTo(copy, master), false);
    ASSERT_EQ(isHardlinkTo(tmp / "missing", master), false);
    ASSERT_EQ(isSymlinkTo(sym, master), true);
    ASSERT_EQ(isSymlinkTo(copy, master), false);
    ASSERT_EQ(isSymlinkTo(hard, master), false);

    fs::remove(master);
    ASSERT_EQ(entryExists(sym), true);
    ASSERT_EQ(entryExists(master), false);
    ASSERT_EQ(lstatRecord(copy)->size, FileSize(4));
}

UNIT_TEST(FileOps_canonicalDirRejectsFiles)
{
    TempDir tmp;
    fs::path file = writeTestFile(tmp / "file", "x");
    bool thrown = false;
    try
    {
        canonicalDir(file);
    }
    catch (const SetupError&)
    {
        thrown = true;
    }
    ASSERT_EQ(thrown, true);
    ASSERT_EQ(canonicalDir(tmp.path / ".") == tmp.path, true);
}
