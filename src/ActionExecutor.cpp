// Safe replacement of duplicates by links and batch execution.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ActionExecutor.hpp"
#include "AuditLog.hpp"
#include "DirIndexer.hpp"
#include "Errors.hpp"
#include "FileOps.hpp"
#include "Log.hpp"
#include "Matcher.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dupelink
{

LinkHooks::LinkHooks()
    : createHardLink([](const fs::path& target, const fs::path& link, std::error_code& ec) { fs::create_hard_link(target, link, ec); }),
      createSymlink([](const fs::path& target, const fs::path& link, std::error_code& ec) { fs::create_symlink(target, link, ec); }),
      rename([](const fs::path& from, const fs::path& to, std::error_code& ec) { fs::rename(from, to, ec); }),
      remove([](const fs::path& path, std::error_code& ec) { return fs::remove(path, ec); })
{
}

ActionExecutor::ActionExecutor(ExecOptions options_, const Log& log_, AuditLog* audit_, LinkHooks hooks_)
    : options(std::move(options_)), log(log_), audit(audit_), hooks(std::move(hooks_))
{
    if (options.action == ActionKind::Compare)
    {
        throw std::invalid_argument("The compare action does not modify any file.");
    }
    if (options.targetDir && options.action == ActionKind::Delete)
    {
        throw std::invalid_argument("A target directory requires action hardlink or symlink.");
    }
    if (options.fallbackSymlink && options.action != ActionKind::Hardlink)
    {
        throw std::invalid_argument("Symlink fallback requires action hardlink.");
    }
}

fs::path ActionExecutor::linkPathFor(const fs::path& duplicate) const
{
    if (!options.targetDir || !isPathWithin(options.targetBase, duplicate))
    {
        return duplicate;
    }
    return *options.targetDir / duplicate.lexically_relative(options.targetBase);
}

fs::path ActionExecutor::tempPathFor(const fs::path& path)
{
    fs::path temp;
    for (int i = 0; i < 100; i++)
    {
        temp = path;
        temp += ".dupelink_tmp";
        if (i > 0)
        {
            temp += ut1::toStr(i);
        }
        if (!entryExists(temp))
        {
            return temp;
        }
    }
    return fs::path();
}

ActionKind ActionExecutor::createLink(const fs::path& master, const fs::path& link, std::error_code& ec)
{
    if (options.action == ActionKind::Symlink)
    {
        hooks.createSymlink(master, link, ec);
        return ActionKind::Symlink;
    }
    hooks.createHardLink(master, link, ec);
    if (ec == std::errc::cross_device_link && options.fallbackSymlink)
    {
        log.debug("Cross-device hardlink for " + link.string() + ", falling back to symlink");
        ec.clear();
        hooks.createSymlink(master, link, ec);
        return ActionKind::Symlink;
    }
    return ActionKind::Hardlink;
}

std::string ActionExecutor::rollback(const fs::path& temp, const fs::path& duplicate)
{
    std::error_code ec;
    hooks.rename(temp, duplicate, ec);
    if (ec)
    {
        log.error("Cannot restore " + duplicate.string() + " from " + temp.string() + ": " + ec.message());
        return " (restore failed, original content kept at " + temp.string() + ")";
    }
    return "";
}

ActionOutcome ActionExecutor::replaceWithLink(const FileRecord& duplicate, const FileRecord& master, const std::string& expectedHash)
{
    const ActionKind action = options.action;
    const fs::path dupPath(duplicate.path);
    const fs::path masterPath(master.path);

    // Re-verify against the scan.
    std::optional<FileRecord> current = lstatRecord(dupPath);
    if (!current)
    {
        return ActionOutcome::skipped(action, "duplicate missing");
    }
    try
    {
        if (hashFile(dupPath, options.hash) != expectedHash)
        {
            return ActionOutcome::skipped(action, "content changed since scan");
        }
    }
    catch (const ScanError& e)
    {
        return ActionOutcome::failed(action, e.what());
    }

    if (isHardlinkTo(dupPath, masterPath) || isSymlinkTo(dupPath, masterPath))
    {
        ActionOutcome outcome = ActionOutcome::succeeded(action, 0);
        outcome.alreadyLinked = true;
        return outcome;
    }

    const fs::path linkPath = linkPathFor(dupPath);
    std::error_code ec;
    if (linkPath != dupPath)
    {
        if (entryExists(linkPath))
        {
            return ActionOutcome::failed(action, "target " + linkPath.string() + " already exists");
        }
        fs::create_directories(linkPath.parent_path(), ec);
        if (ec)
        {
            return ActionOutcome::failed(action, "cannot create directory " + linkPath.parent_path().string() + ": " + ec.message());
        }
    }

    // Stage.
    const fs::path temp = tempPathFor(dupPath);
    if (temp.empty())
    {
        return ActionOutcome::failed(action, "no temporary name available for " + dupPath.string());
    }
    hooks.rename(dupPath, temp, ec);
    if (ec)
    {
        return ActionOutcome::failed(action, "cannot rename to temporary name: " + ec.message());
    }

    // Act.
    ActionKind performed = action;
    if (action != ActionKind::Delete)
    {
        performed = createLink(masterPath, linkPath, ec);
        if (ec)
        {
            std::string reason = "cannot create " + actionName(performed) + ": " + ec.message();
            return ActionOutcome::failed(performed, reason + rollback(temp, dupPath));
        }
    }

    // Finalize.
    hooks.remove(temp, ec);
    if (ec)
    {
        std::string reason = "cannot remove " + temp.string() + ": " + ec.message();
        if (action != ActionKind::Delete && linkPath != dupPath)
        {
            std::error_code rmEc;
            hooks.remove(linkPath, rmEc);
            if (rmEc)
            {
                log.warning("Cannot remove " + linkPath.string() + ": " + rmEc.message());
            }
        }
        // For in-place links the rename replaces the new link atomically.
        return ActionOutcome::failed(performed, reason + rollback(temp, dupPath));
    }

    ActionOutcome outcome = ActionOutcome::succeeded(performed, current->numLinks == 1 ? current->size : 0);
    outcome.fallback = performed != action;
    if (linkPath != dupPath)
    {
        outcome.linkPath = linkPath.string();
    }
    return outcome;
}

std::optional<std::string> ActionExecutor::verifyMaster(const DuplicateGroup& group)
{
    if (!entryExists(group.master.path))
    {
        return std::string("master missing");
    }
    try
    {
        if (hashFile(group.master.path, options.hash) != group.hash)
        {
            return std::string("master changed since scan");
        }
    }
    catch (const ScanError& e)
    {
        return std::string("master unreadable: ") + e.what();
    }
    return std::nullopt;
}

void ActionExecutor::record(ExecutionSummary& summary, GroupResult& groupResult, const DuplicateGroup& group, const FileRecord& duplicate, ActionOutcome outcome)
{
    switch (outcome.kind)
    {
        case OutcomeKind::Succeeded:
            summary.succeeded++;
            summary.bytesReclaimed += outcome.bytesReclaimed;
            if (outcome.alreadyLinked)
            {
                summary.alreadyLinked++;
                log.debug("Already linked: " + duplicate.path);
            }
            else
            {
                if (outcome.fallback)
                {
                    summary.fallbacks++;
                }
                log.debug("Done " + actionName(outcome.performed) + " " + duplicate.path + " -> " + group.master.path);
            }
            break;
        case OutcomeKind::Failed:
            summary.failed++;
            summary.failures.emplace_back(duplicate.path, outcome.reason);
            log.warning("Failed to " + actionName(outcome.performed) + " " + duplicate.path + ": " + outcome.reason);
            break;
        case OutcomeKind::Skipped:
            summary.skipped++;
            log.debug("Skipped " + duplicate.path + ": " + outcome.reason);
            break;
    }
    if (audit)
    {
        audit->logOperation(options.action, duplicate, group.master.path, group.hash, outcome);
    }
    groupResult.results.push_back(DuplicateResult{duplicate, std::move(outcome)});
}

ExecutionSummary ActionExecutor::executeBatch(const std::vector<DuplicateGroup>& groups, const std::vector<ConfirmationDecision>& decisions,
                                              const std::function<bool()>& cancelRequested)
{
    if (decisions.size() != groups.size())
    {
        throw std::invalid_argument("executeBatch() needs exactly one decision per group.");
    }

    ExecutionSummary summary;
    for (size_t i = 0; i < groups.size(); i++)
    {
        const DuplicateGroup& group = groups[i];
        GroupResult groupResult;
        groupResult.groupIndex = i;
        groupResult.decision = decisions[i];

        if (!summary.interrupted && cancelRequested && cancelRequested())
        {
            log.warning("Interrupted. Remaining groups are not processed.");
            summary.interrupted = true;
        }
        if (summary.interrupted)
        {
            groupResult.decision = ConfirmationDecision::Cancelled;
        }

        if (groupResult.decision == ConfirmationDecision::Cancelled)
        {
            summary.cancelled += group.duplicates.size();
        }
        else if (groupResult.decision == ConfirmationDecision::Skipped)
        {
            summary.declined += group.duplicates.size();
            if (audit)
            {
                for (const auto& duplicate : group.duplicates)
                {
                    audit->logDeclined(duplicate, group.master.path, group.hash);
                }
            }
        }
        else
        {
            std::optional<std::string> masterProblem = verifyMaster(group);
            if (masterProblem)
            {
                log.warning("Skipping group of " + group.master.path + ": " + *masterProblem);
            }
            for (const auto& duplicate : group.duplicates)
            {
                ActionOutcome outcome = masterProblem ? ActionOutcome::skipped(options.action, *masterProblem)
                                                      : replaceWithLink(duplicate, group.master, group.hash);
                record(summary, groupResult, group, duplicate, std::move(outcome));
            }
        }
        summary.groups.push_back(std::move(groupResult));
    }
    return summary;
}

int exitCode(const ExecutionSummary& summary, bool wasCancelled)
{
    if (wasCancelled || summary.interrupted)
    {
        return kExitInterrupted;
    }
    if (summary.failed == 0)
    {
        return kExitSuccess;
    }
    if (summary.succeeded == 0)
    {
        return kExitFailure;
    }
    return kExitPartial;
}

} // namespace dupelink

using namespace dupelink;

static FileRecord recordOf(const fs::path& path)
{
    return *lstatRecord(path);
}

static std::string md5Of(const fs::path& path)
{
    return hashFile(path, HashOptions());
}

static DuplicateGroup makeGroup(const fs::path& master, const std::vector<fs::path>& duplicates)
{
    DuplicateGroup group;
    group.hash = md5Of(master);
    group.master = recordOf(master);
    for (const auto& duplicate : duplicates)
    {
        group.duplicates.push_back(recordOf(duplicate));
    }
    return group;
}

static ExecOptions execOptions(ActionKind action)
{
    ExecOptions options;
    options.action = action;
    return options;
}

static bool hasTempFile(const fs::path& duplicate)
{
    fs::path temp = duplicate;
    temp += ".dupelink_tmp";
    return entryExists(temp);
}

UNIT_TEST(ActionExecutor_hardlinkReplacesDuplicate)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "a/file.txt", "same");
    fs::path dup = writeTestFile(tmp / "b/file.txt", "same");
    std::ostringstream os;
    Log log(0, false, os);
    ActionExecutor executor(execOptions(ActionKind::Hardlink), log);

    ActionOutcome outcome = executor.replaceWithLink(recordOf(dup), recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Succeeded, true);
    ASSERT_EQ(outcome.alreadyLinked, false);
    ASSERT_EQ(outcome.bytesReclaimed, FileSize(4));
    ASSERT_EQ(isHardlinkTo(dup, master), true);
    ASSERT_EQ(ut1::readFile(master.string()), "same");
    ASSERT_EQ(hasTempFile(dup), false);

    // Second run is a no-op.
    outcome = executor.replaceWithLink(recordOf(dup), recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Succeeded, true);
    ASSERT_EQ(outcome.alreadyLinked, true);
    ASSERT_EQ(outcome.bytesReclaimed, FileSize(0));
    ASSERT_EQ(isHardlinkTo(dup, master), true);
}

UNIT_TEST(ActionExecutor_symlinkAndDelete)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "a/file.txt", "same");
    fs::path dup1 = writeTestFile(tmp / "b/one.txt", "same");
    fs::path dup2 = writeTestFile(tmp / "b/two.txt", "same");
    Log log(0, true);

    ActionExecutor symlinker(execOptions(ActionKind::Symlink), log);
    ActionOutcome outcome = symlinker.replaceWithLink(recordOf(dup1), recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Succeeded, true);
    ASSERT_EQ(fs::is_symlink(dup1), true);
    ASSERT_EQ(fs::read_symlink(dup1) == master, true);
    ASSERT_EQ(ut1::readFile(dup1.string()), "same");
    ASSERT_EQ(symlinker.replaceWithLink(recordOf(dup1), recordOf(master), md5Of(master)).alreadyLinked, true);

    ActionExecutor deleter(execOptions(ActionKind::Delete), log);
    outcome = deleter.replaceWithLink(recordOf(dup2), recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Succeeded, true);
    ASSERT_EQ(outcome.performed == ActionKind::Delete, true);
    ASSERT_EQ(entryExists(dup2), false);
    ASSERT_EQ(hasTempFile(dup2), false);
    ASSERT_EQ(ut1::readFile(master.string()), "same");
}

UNIT_TEST(ActionExecutor_skipsVanishedOrChangedDuplicates)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "a/file.txt", "same");
    fs::path dup = writeTestFile(tmp / "b/file.txt", "same");
    FileRecord dupRecord = recordOf(dup);
    Log log(0, true);
    ActionExecutor executor(execOptions(ActionKind::Hardlink), log);

    writeTestFile(dup, "changed");
    ActionOutcome outcome = executor.replaceWithLink(dupRecord, recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Skipped, true);
    ASSERT_EQ(outcome.reason, "content changed since scan");
    ASSERT_EQ(ut1::readFile(dup.string()), "changed");

    fs::remove(dup);
    outcome = executor.replaceWithLink(dupRecord, recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Skipped, true);
    ASSERT_EQ(outcome.reason, "duplicate missing");
}

UNIT_TEST(ActionExecutor_rollbackOnLinkFailure)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "a/file.txt", "same");
    fs::path dup = writeTestFile(tmp / "b/file.txt", "same");
    Log log(0, true);
    LinkHooks hooks;
    hooks.createHardLink = [](const fs::path&, const fs::path&, std::error_code& ec)
    {
        ec = std::make_error_code(std::errc::permission_denied);
    };
    ActionExecutor executor(execOptions(ActionKind::Hardlink), log, nullptr, hooks);

    ActionOutcome outcome = executor.replaceWithLink(recordOf(dup), recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Failed, true);
    ASSERT_EQ(outcome.reason.find("Permission denied") != std::string::npos, true);
    ASSERT_EQ(ut1::readFile(dup.string()), "same");
    ASSERT_EQ(isHardlinkTo(dup, master), false);
    ASSERT_EQ(hasTempFile(dup), false);
}

UNIT_TEST(ActionExecutor_rollbackOnFinalizeFailure)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "a/file.txt", "same");
    fs::path dup = writeTestFile(tmp / "b/file.txt", "same");
    Log log(0, true);
    LinkHooks hooks;
    hooks.remove = [](const fs::path&, std::error_code& ec)
    {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    };
    ActionExecutor executor(execOptions(ActionKind::Hardlink), log, nullptr, hooks);

    ActionOutcome outcome = executor.replaceWithLink(recordOf(dup), recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Failed, true);
    ASSERT_EQ(fs::is_regular_file(fs::symlink_status(dup)), true);
    ASSERT_EQ(isHardlinkTo(dup, master), false);
    ASSERT_EQ(ut1::readFile(dup.string()), "same");
    ASSERT_EQ(hasTempFile(dup), false);
}

UNIT_TEST(ActionExecutor_crossDeviceFallback)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "a/file.txt", "same");
    fs::path dup = writeTestFile(tmp / "b/file.txt", "same");
    Log log(0, true);
    LinkHooks hooks;
    hooks.createHardLink = [](const fs::path&, const fs::path&, std::error_code& ec)
    {
        ec = std::make_error_code(std::errc::cross_device_link);
    };

    ActionExecutor strict(execOptions(ActionKind::Hardlink), log, nullptr, hooks);
    ActionOutcome outcome = strict.replaceWithLink(recordOf(dup), recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Failed, true);
    ASSERT_EQ(fs::is_regular_file(fs::symlink_status(dup)), true);
    ASSERT_EQ(ut1::readFile(dup.string()), "same");

    ExecOptions options = execOptions(ActionKind::Hardlink);
    options.fallbackSymlink = true;
    ActionExecutor lenient(options, log, nullptr, hooks);
    outcome = lenient.replaceWithLink(recordOf(dup), recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Succeeded, true);
    ASSERT_EQ(outcome.fallback, true);
    ASSERT_EQ(outcome.performed == ActionKind::Symlink, true);
    ASSERT_EQ(isSymlinkTo(dup, master), true);
}

UNIT_TEST(ActionExecutor_targetDir)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "a/file.txt", "same");
    fs::path dup = writeTestFile(tmp / "b/sub/file.txt", "same");
    Log log(0, true);
    ExecOptions options = execOptions(ActionKind::Hardlink);
    options.targetDir = tmp / "links";
    options.targetBase = tmp / "b";
    ActionExecutor executor(options, log);

    ActionOutcome outcome = executor.replaceWithLink(recordOf(dup), recordOf(master), md5Of(master));
    ASSERT_EQ(outcome.kind == OutcomeKind::Succeeded, true);
    ASSERT_EQ(outcome.linkPath, (tmp / "links/sub/file.txt").string());
    ASSERT_EQ(isHardlinkTo(tmp / "links/sub/file.txt", master), true);
    ASSERT_EQ(entryExists(dup), false);
    ASSERT_EQ(hasTempFile(dup), false);
}

UNIT_TEST(ActionExecutor_rejectsInvalidOptions)
{
    Log log(0, true);
    bool thrown = false;
    try
    {
        ActionExecutor executor(execOptions(ActionKind::Compare), log);
    }
    catch (const std::invalid_argument&)
    {
        thrown = true;
    }
    ASSERT_EQ(thrown, true);
}

UNIT_TEST(ActionExecutor_batchHonorsDecisions)
{
    TempDir tmp;
    std::vector<DuplicateGroup> groups;
    for (int i = 0; i < 3; i++)
    {
        std::string name = "g" + ut1::toStr(i) + ".txt";
        fs::path master = writeTestFile(tmp / ("a/" + name), "content " + ut1::toStr(i));
        fs::path dup = writeTestFile(tmp / ("b/" + name), "content " + ut1::toStr(i));
        groups.push_back(makeGroup(master, {dup}));
    }
    AuditLog audit(tmp / "audit.log");
    Log log(0, true);
    ActionExecutor executor(execOptions(ActionKind::Hardlink), log, &audit);

    ExecutionSummary summary = executor.executeBatch(groups, {ConfirmationDecision::Confirmed, ConfirmationDecision::Skipped, ConfirmationDecision::Cancelled});
    ASSERT_EQ(summary.succeeded, uint64_t(1));
    ASSERT_EQ(summary.declined, uint64_t(1));
    ASSERT_EQ(summary.cancelled, uint64_t(1));
    ASSERT_EQ(summary.failed, uint64_t(0));
    ASSERT_EQ(summary.groups.size(), size_t(3));
    ASSERT_EQ(summary.groups[0].results.size(), size_t(1));
    ASSERT_EQ(summary.groups[1].results.size(), size_t(0));
    ASSERT_EQ(isHardlinkTo(tmp / "b/g0.txt", tmp / "a/g0.txt"), true);
    ASSERT_EQ(isHardlinkTo(tmp / "b/g1.txt", tmp / "a/g1.txt"), false);
    ASSERT_EQ(isHardlinkTo(tmp / "b/g2.txt", tmp / "a/g2.txt"), false);
    ASSERT_EQ(audit.numOperations(), size_t(1));
    ASSERT_EQ(ut1::readFile((tmp / "audit.log").string()).find("DECLINED " + (tmp / "b/g1.txt").string()) != std::string::npos, true);
    ASSERT_EQ(exitCode(summary, false), kExitSuccess);
}

UNIT_TEST(ActionExecutor_batchContinuesOnError)
{
    TempDir tmp;
    fs::path master1 = writeTestFile(tmp / "a/one.txt", "one");
    fs::path dup1 = writeTestFile(tmp / "b/one.txt", "one");
    fs::path master2 = writeTestFile(tmp / "a/two.txt", "two");
    fs::path dup2 = writeTestFile(tmp / "b/two.txt", "two");
    std::vector<DuplicateGroup> groups = {makeGroup(master1, {dup1}), makeGroup(master2, {dup2})};
    Log log(0, true);
    LinkHooks hooks;
    hooks.createHardLink = [&](const fs::path& target, const fs::path& link, std::error_code& ec)
    {
        if (link == dup1)
        {
            ec = std::make_error_code(std::errc::permission_denied);
            return;
        }
        fs::create_hard_link(target, link, ec);
    };
    ActionExecutor executor(execOptions(ActionKind::Hardlink), log, nullptr, hooks);

    ExecutionSummary summary = executor.executeBatch(groups, {ConfirmationDecision::Confirmed, ConfirmationDecision::AutoConfirmedRemaining});
    ASSERT_EQ(summary.failed, uint64_t(1));
    ASSERT_EQ(summary.succeeded, uint64_t(1));
    ASSERT_EQ(summary.failures.size(), size_t(1));
    ASSERT_EQ(summary.failures[0].first, dup1.string());
    ASSERT_EQ(isHardlinkTo(dup2, master2), true);
    ASSERT_EQ(exitCode(summary, false), kExitPartial);
}

UNIT_TEST(ActionExecutor_masterMissingSkipsGroup)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "a/file.txt", "same");
    fs::path dup1 = writeTestFile(tmp / "b/one.txt", "same");
    fs::path dup2 = writeTestFile(tmp / "b/two.txt", "same");
    std::vector<DuplicateGroup> groups = {makeGroup(master, {dup1, dup2})};
    fs::remove(master);
    Log log(0, true);
    ActionExecutor executor(execOptions(ActionKind::Delete), log);

    ExecutionSummary summary = executor.executeBatch(groups, {ConfirmationDecision::Confirmed});
    ASSERT_EQ(summary.skipped, uint64_t(2));
    ASSERT_EQ(summary.groups[0].results[0].outcome.reason, "master missing");
    ASSERT_EQ(entryExists(dup1), true);
    ASSERT_EQ(entryExists(dup2), true);
    ASSERT_EQ(exitCode(summary, false), kExitSuccess);

    writeTestFile(master, "different");
    summary = executor.executeBatch(groups, {ConfirmationDecision::Confirmed});
    ASSERT_EQ(summary.groups[0].results[1].outcome.reason, "master changed since scan");
    ASSERT_EQ(entryExists(dup2), true);
}

UNIT_TEST(ActionExecutor_interruptStopsAtGroupBoundary)
{
    TempDir tmp;
    std::vector<DuplicateGroup> groups;
    for (int i = 0; i < 3; i++)
    {
        std::string name = "g" + ut1::toStr(i) + ".txt";
        groups.push_back(makeGroup(writeTestFile(tmp / ("a/" + name), name), {writeTestFile(tmp / ("b/" + name), name)}));
    }
    Log log(0, true);
    ActionExecutor executor(execOptions(ActionKind::Hardlink), log);
    int polls = 0;
    std::vector<ConfirmationDecision> decisions(3, ConfirmationDecision::AutoConfirmedRemaining);

    ExecutionSummary summary = executor.executeBatch(groups, decisions, [&] { return ++polls > 1; });
    ASSERT_EQ(summary.interrupted, true);
    ASSERT_EQ(summary.succeeded, uint64_t(1));
    ASSERT_EQ(summary.cancelled, uint64_t(2));
    ASSERT_EQ(summary.groups[2].decision == ConfirmationDecision::Cancelled, true);
    ASSERT_EQ(isHardlinkTo(tmp / "b/g1.txt", tmp / "a/g1.txt"), false);
    ASSERT_EQ(exitCode(summary, false), kExitInterrupted);
}

UNIT_TEST(ActionExecutor_exitCode)
{
    ExecutionSummary summary;
    ASSERT_EQ(exitCode(summary, false), kExitSuccess);
    summary.succeeded = 3;
    ASSERT_EQ(exitCode(summary, false), kExitSuccess);
    summary.failed = 1;
    ASSERT_EQ(exitCode(summary, false), kExitPartial);
    summary.succeeded = 0;
    ASSERT_EQ(exitCode(summary, false), kExitFailure);
    ASSERT_EQ(exitCode(summary, true), kExitInterrupted);
    summary.failed = 0;
    summary.succeeded = 5;
    ASSERT_EQ(exitCode(summary, true), kExitInterrupted);
}

UNIT_TEST(ActionExecutor_endToEndHardlink)
{
    TempDir tmp;
    fs::path master = writeTestFile(tmp / "master/photo.jpg", "image data");
    fs::path dup = writeTestFile(tmp / "backup/photo_copy.jpg", "image data");
    writeTestFile(tmp / "backup/unique.txt", "unique");
    setAge(master, 3600);
    Log log(0, true);

    HashIndex a = indexDirectory(tmp / "master", HashOptions(), log);
    HashIndex b = indexDirectory(tmp / "backup", HashOptions(), log);
    MatchResult match = findDuplicates(a, b, a.getRoot());
    ASSERT_EQ(match.groups.size(), size_t(1));
    ASSERT_EQ(match.groups[0].master.path, master.string());

    fs::path logPath = tmp / "run.log";
    ExecutionSummary summary;
    {
        AuditLog audit(logPath);
        RunInfo info;
        info.dirA = a.getRoot().string();
        info.dirB = b.getRoot().string();
        info.masterDir = a.getRoot().string();
        audit.writeHeader(info);
        ActionExecutor executor(execOptions(ActionKind::Hardlink), log, &audit);
        summary = executor.executeBatch(match.groups, {ConfirmationDecision::AutoConfirmedRemaining});
        audit.writeFooter(summary);
        ASSERT_EQ(audit.numOperations(), size_t(1));
    }

    ASSERT_EQ(isHardlinkTo(dup, master), true);
    ASSERT_EQ(exitCode(summary, false), kExitSuccess);
    std::string text = ut1::readFile(logPath.string());
    ASSERT_EQ(text.find("] HARDLINK " + dup.string() + " -> " + master.string() + " (10 bytes)") != std::string::npos, true);
    ASSERT_EQ(text.find("...] OK\n") != std::string::npos, true);

    // A second scan finds nothing left to do.
    MatchResult again = findDuplicates(indexDirectory(tmp / "master", HashOptions(), log),
                                       indexDirectory(tmp / "backup", HashOptions(), log), a.getRoot());
    ASSERT_EQ(again.groups.size(), size_t(0));
    ASSERT_EQ(again.alreadyHardlinked, size_t(1));
}
