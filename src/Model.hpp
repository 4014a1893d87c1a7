// Data types shared by indexer, matcher, executor and audit log.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dupelink
{

using FileSize = uint64_t;

/// Snapshot of one regular file taken at index time.
struct FileRecord
{
    std::string path; // Absolute, canonical.
    FileSize size{};
    int64_t mtimeNs{}; // Nanoseconds since the Unix epoch.
    uint64_t device{};
    uint64_t inode{};
    uint64_t numLinks{};
};

/// Why a file was chosen as master of its group.
enum class MasterReason
{
    InMasterTree,
    OldestFallback
};

/// Files sharing one content hash. The master is never part of duplicates.
struct DuplicateGroup
{
    std::string hash;
    FileRecord master;
    std::vector<FileRecord> duplicates; // Sorted by path.
    MasterReason reason{MasterReason::InMasterTree};
};

/// What to do with duplicates.
enum class ActionKind
{
    Compare,
    Hardlink,
    Symlink,
    Delete
};

enum class OutcomeKind
{
    Succeeded,
    Failed,
    Skipped
};

/// Result of processing one duplicate.
struct ActionOutcome
{
    OutcomeKind kind{OutcomeKind::Skipped};
    std::string reason;
    ActionKind performed{ActionKind::Compare}; // Symlink when hardlink fell back to symlink.
    bool fallback{};
    bool alreadyLinked{};
    FileSize bytesReclaimed{};
    std::string linkPath; // Where the link was created (differs from the duplicate with a target dir).

    static ActionOutcome succeeded(ActionKind performed, FileSize bytesReclaimed);
    static ActionOutcome failed(ActionKind performed, std::string reason);
    static ActionOutcome skipped(ActionKind performed, std::string reason);
};

/// Per-group decision of the confirmation step.
enum class ConfirmationDecision
{
    Confirmed,
    Skipped,
    AutoConfirmedRemaining,
    Cancelled
};

struct DuplicateResult
{
    FileRecord duplicate;
    ActionOutcome outcome;
};

struct GroupResult
{
    size_t groupIndex{};
    ConfirmationDecision decision{ConfirmationDecision::Cancelled};
    std::vector<DuplicateResult> results;
};

/// Aggregate result of a batch run.
struct ExecutionSummary
{
    uint64_t succeeded{};
    uint64_t failed{};
    uint64_t skipped{};       // Race conditions: duplicate or master vanished/changed.
    uint64_t declined{};      // Duplicates in groups the user answered 'n' for.
    uint64_t cancelled{};     // Duplicates never attempted because of quit/interrupt.
    uint64_t alreadyLinked{}; // Subset of succeeded.
    uint64_t fallbacks{};     // Subset of succeeded.
    FileSize bytesReclaimed{};
    std::vector<std::pair<std::string, std::string>> failures; // (path, error)
    std::vector<GroupResult> groups;
    bool interrupted{};
};

/// Lowercase action name ("hardlink").
std::string actionName(ActionKind action);

/// Parse an action name. Returns std::nullopt for unknown names.
std::optional<ActionKind> parseActionKind(const std::string& name);

/// Human readable reason text.
std::string masterReasonText(MasterReason reason);

/// Decision name for logs and reports.
std::string decisionName(ConfirmationDecision decision);

/// True for Confirmed and AutoConfirmedRemaining.
bool isConfirmed(ConfirmationDecision decision);

} // namespace dupelink
