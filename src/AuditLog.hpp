// Append-only record of what a run did to the filesystem.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Model.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

namespace dupelink
{

/// Run parameters recorded in the header block.
struct RunInfo
{
    std::string dirA;
    std::string dirB;
    std::string masterDir;
    ActionKind action{ActionKind::Hardlink};
    std::vector<std::string> flags;
};

/// One line of the audit log.
struct AuditLogEntry
{
    std::string timestamp;
    std::string action; // Upper case action word ("HARDLINK", "DECLINED").
    std::string duplicate;
    std::string master;
    FileSize size{};
    std::string hashPrefix;
    std::string result;
};

/// Audit log file of one run.
///
/// The file is opened in the constructor and closed in the destructor. Every line is flushed
/// immediately so the log reflects all completed operations even if the process dies.
/// Operation lines are only written after the outcome of an operation is known.
class AuditLog
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// Open (append to) the log file. Throws SetupError if it cannot be opened.
    explicit AuditLog(const std::filesystem::path& path_);

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    const std::filesystem::path& getPath() const { return path; }

    /// Header block. Call once before any operation.
    void writeHeader(const RunInfo& info);

    /// Record the definitive outcome of one duplicate.
    void logOperation(ActionKind requested, const FileRecord& duplicate, const std::string& master, const std::string& hash, const ActionOutcome& outcome);

    /// Record a duplicate of a group the user declined. Not counted as an operation.
    void logDeclined(const FileRecord& duplicate, const std::string& master, const std::string& hash);

    /// Footer block with totals. Call once at the end.
    void writeFooter(const ExecutionSummary& summary);

    /// Number of operation lines written so far.
    size_t numOperations() const { return operations; }

    /// Replace the time source (tests).
    void setClock(Clock clock_) { clock = std::move(clock_); }

    /// Format one operation line (without newline).
    static std::string formatEntry(const AuditLogEntry& entry);

    /// Result column text for an outcome ("OK", "OK (fallback)", "FAILED: reason", ...).
    static std::string resultText(const ActionOutcome& outcome);

    /// dupelink_YYYYMMDD_HHMMSS.log in $DUPELINK_LOG_DIR or the current directory.
    static std::filesystem::path defaultPath();

private:
    /// Current time as ISO-8601, never earlier than the previous timestamp.
    std::string timestamp();

    void writeLine(const std::string& line);

    std::filesystem::path path;
    std::ofstream os;
    Clock clock;
    std::chrono::system_clock::time_point lastTime{};
    size_t operations{};
};

/// Local time formatted as YYYY-MM-DDTHH:MM:SS.uuuuuu.
std::string isoTimestamp(std::chrono::system_clock::time_point t);

} // namespace dupelink
