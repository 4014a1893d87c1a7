// Run configuration from the command line.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "Options.hpp"
#include "Errors.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"

namespace dupelink
{

void validateOptions(const RunOptions& options, bool stdinIsTty)
{
    for (const std::string& path : {options.dirA, options.dirB})
    {
        if (path.empty())
        {
            throw SetupError("Please specify exactly two directories.");
        }
        if (!ut1::fsExists(path))
        {
            throw SetupError("Path '" + path + "' does not exist.");
        }
        if (!ut1::fsIsDirectory(path))
        {
            throw SetupError("Path '" + path + "' is not a directory.");
        }
    }
    if (options.execute && options.action == ActionKind::Compare)
    {
        throw SetupError("--execute requires --action hardlink, symlink or delete.");
    }
    if (options.logPath && !options.execute)
    {
        throw SetupError("--log requires --execute.");
    }
    if (options.fallbackSymlink && options.action != ActionKind::Hardlink)
    {
        throw SetupError("--fallback-symlink requires --action hardlink.");
    }
    if (options.targetDir && options.action != ActionKind::Hardlink && options.action != ActionKind::Symlink)
    {
        throw SetupError("--target-dir requires --action hardlink or symlink.");
    }
    if (options.bufSize == 0)
    {
        throw SetupError("--bufsize must be greater than 0.");
    }
    if (options.execute && !options.yes && !stdinIsTty)
    {
        throw SetupError("--execute without --yes needs an interactive terminal on stdin to confirm each group. Use --yes to confirm all groups.");
    }
}

HashOptions hashOptions(const RunOptions& options)
{
    HashOptions r;
    r.algorithm = options.hash;
    r.fastMode = options.fast;
    r.bufSize = options.bufSize;
    return r;
}

std::vector<std::string> logFlags(const RunOptions& options)
{
    std::vector<std::string> flags;
    if (options.execute)
    {
        flags.push_back("--execute");
    }
    if (options.yes)
    {
        flags.push_back("--yes");
    }
    if (options.fallbackSymlink)
    {
        flags.push_back("--fallback-symlink");
    }
    if (options.targetDir)
    {
        flags.push_back("--target-dir " + *options.targetDir);
    }
    if (options.logPath)
    {
        flags.push_back("--log " + *options.logPath);
    }
    flags.push_back("--hash " + hashAlgorithmName(options.hash));
    if (options.fast)
    {
        flags.push_back("--fast");
    }
    if (options.differentNamesOnly)
    {
        flags.push_back("--different-names-only");
    }
    if (options.verbose)
    {
        flags.push_back("--verbose");
    }
    return flags;
}

} // namespace dupelink

using namespace dupelink;

static bool rejects(const RunOptions& options, bool stdinIsTty = true)
{
    try
    {
        validateOptions(options, stdinIsTty);
    }
    catch (const SetupError&)
    {
        return true;
    }
    return false;
}

UNIT_TEST(Options_validate)
{
    TempDir tmp;
    std::filesystem::create_directories(tmp / "a");
    std::filesystem::create_directories(tmp / "b");
    RunOptions options;
    options.dirA = (tmp / "a").string();
    options.dirB = (tmp / "b").string();
    ASSERT_EQ(rejects(options), false);

    RunOptions missing = options;
    missing.dirB = (tmp / "missing").string();
    ASSERT_EQ(rejects(missing), true);
    RunOptions file = options;
    file.dirB = writeTestFile(tmp / "file", "x").string();
    ASSERT_EQ(rejects(file), true);

    RunOptions o = options;
    o.execute = true;
    ASSERT_EQ(rejects(o), true);
    o.action = ActionKind::Hardlink;
    ASSERT_EQ(rejects(o), false);
    ASSERT_EQ(rejects(o, false), true);
    o.yes = true;
    ASSERT_EQ(rejects(o, false), false);

    o.fallbackSymlink = true;
    ASSERT_EQ(rejects(o), false);
    o.action = ActionKind::Symlink;
    ASSERT_EQ(rejects(o), true);
    o.fallbackSymlink = false;
    o.targetDir = (tmp / "links").string();
    ASSERT_EQ(rejects(o), false);
    o.action = ActionKind::Delete;
    ASSERT_EQ(rejects(o), true);

    RunOptions logWithoutExecute = options;
    logWithoutExecute.logPath = "x.log";
    ASSERT_EQ(rejects(logWithoutExecute), true);
}

UNIT_TEST(Options_logFlags)
{
    RunOptions options;
    options.execute = true;
    options.yes = true;
    options.hash = HashAlgorithm::Sha256;
    std::vector<std::string> flags = logFlags(options);
    ASSERT_EQ(flags.size(), size_t(3));
    ASSERT_EQ(flags[0], "--execute");
    ASSERT_EQ(flags[1], "--yes");
    ASSERT_EQ(flags[2], "--hash sha256");
}
