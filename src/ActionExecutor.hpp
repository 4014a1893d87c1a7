// Safe replacement of duplicates by links and batch execution.
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
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace dupelink
{

class AuditLog;
class Log;

static constexpr int kExitSuccess = 0;
static constexpr int kExitFailure = 1;
static constexpr int kExitPartial = 2;
static constexpr int kExitInterrupted = 130;

/// Filesystem primitives used by the executor.
/// Defaults call std::filesystem. Tests replace single members to inject failures.
struct LinkHooks
{
    using LinkFn = std::function<void(const std::filesystem::path& target, const std::filesystem::path& link, std::error_code& ec)>;
    using RenameFn = std::function<void(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec)>;
    using RemoveFn = std::function<bool(const std::filesystem::path& path, std::error_code& ec)>;

    LinkHooks();

    LinkFn createHardLink;
    LinkFn createSymlink;
    RenameFn rename;
    RemoveFn remove;
};

struct ExecOptions
{
    ActionKind action{ActionKind::Hardlink};
    /// Create a symlink if a hardlink fails with EXDEV.
    bool fallbackSymlink{};
    /// Used to re-verify content before acting.
    HashOptions hash;
    /// Create links below this directory instead of in place (hardlink and symlink only).
    std::optional<std::filesystem::path> targetDir;
    /// Duplicate paths are made relative to this directory below targetDir.
    std::filesystem::path targetBase;
};

/// Performs the filesystem mutations of a run.
///
/// Every duplicate goes through the same protocol: re-verify, stage by renaming the duplicate
/// to a temporary name in its own directory, act, then remove the temporary file. Any failure
/// after staging renames the temporary file back so the duplicate path is left exactly as it was.
/// Master files are never modified.
class ActionExecutor
{
public:
    /// Throws std::invalid_argument for ActionKind::Compare or an invalid target dir combination.
    ActionExecutor(ExecOptions options_, const Log& log_, AuditLog* audit_ = nullptr, LinkHooks hooks_ = LinkHooks());

    /// Replace one duplicate by a link to master (or delete it).
    /// expectedHash is the content hash recorded at scan time.
    ActionOutcome replaceWithLink(const FileRecord& duplicate, const FileRecord& master, const std::string& expectedHash);

    /// Process all groups whose decision is confirmed, continuing on errors.
    /// decisions must have one entry per group. cancelRequested is polled at each group boundary.
    /// Every outcome is written to the audit log (if any) right after it is known.
    ExecutionSummary executeBatch(const std::vector<DuplicateGroup>& groups, const std::vector<ConfirmationDecision>& decisions,
                                  const std::function<bool()>& cancelRequested = nullptr);

    const ExecOptions& getOptions() const { return options; }

private:
    /// Path at which the link for a duplicate is created.
    std::filesystem::path linkPathFor(const std::filesystem::path& duplicate) const;

    /// Free temporary name next to path. Empty if none is available.
    static std::filesystem::path tempPathFor(const std::filesystem::path& path);

    /// Create the link (with optional cross-device fallback). Returns the action performed.
    ActionKind createLink(const std::filesystem::path& master, const std::filesystem::path& link, std::error_code& ec);

    /// Rename temp back to the duplicate path. Returns an error text suffix if that fails too.
    std::string rollback(const std::filesystem::path& temp, const std::filesystem::path& duplicate);

    /// Check the master of a group before touching its duplicates. Returns a skip reason or std::nullopt.
    std::optional<std::string> verifyMaster(const DuplicateGroup& group);

    void record(ExecutionSummary& summary, GroupResult& groupResult, const DuplicateGroup& group, const FileRecord& duplicate, ActionOutcome outcome);

    ExecOptions options;
    const Log& log;
    AuditLog* audit;
    LinkHooks hooks;
};

/// Process exit code for a finished run.
/// Cancelled runs return kExitInterrupted regardless of the counts. Otherwise no failures gives
/// kExitSuccess, failures without any success kExitFailure and a mix kExitPartial.
int exitCode(const ExecutionSummary& summary, bool wasCancelled);

} // namespace dupelink
