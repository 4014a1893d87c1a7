// Append-only record of what a run did to the filesystem.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "AuditLog.hpp"
#include "Errors.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dupelink
{

static const std::string kSeparator(80, '=');

std::string isoTimestamp(std::chrono::system_clock::time_point t)
{
    std::time_t secs = std::chrono::system_clock::to_time_t(t);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count() % 1000000;
    if (micros < 0)
    {
        micros += 1000000;
    }
    std::tm tm{};
    ::localtime_r(&secs, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%06lld", static_cast<long long>(micros));
    return buf;
}

AuditLog::AuditLog(const fs::path& path_)
    : path(path_), clock([] { return std::chrono::system_clock::now(); })
{
    os.open(path, std::ios::out | std::ios::app);
    if (!os)
    {
        throw SetupError("Cannot open audit log " + path.string() + " for writing.");
    }
}

std::string AuditLog::timestamp()
{
    std::chrono::system_clock::time_point now = clock();
    if (now < lastTime)
    {
        now = lastTime;
    }
    lastTime = now;
    return isoTimestamp(now);
}

void AuditLog::writeLine(const std::string& line)
{
    os << line << std::endl;
    if (!os)
    {
        throw std::runtime_error("Error while writing audit log " + path.string());
    }
}

void AuditLog::writeHeader(const RunInfo& info)
{
    writeLine(kSeparator);
    writeLine("dupelink execution log");
    writeLine(kSeparator);
    writeLine("Timestamp: " + timestamp());
    writeLine("Directories: " + info.dirA + ", " + info.dirB);
    writeLine("Master: " + info.masterDir);
    writeLine("Action: " + actionName(info.action));
    std::string flags;
    for (const auto& flag : info.flags)
    {
        flags += (flags.empty() ? "" : ", ") + flag;
    }
    writeLine("Flags: " + (flags.empty() ? std::string("none") : flags));
    writeLine(kSeparator);
    writeLine("");
}

std::string AuditLog::formatEntry(const AuditLogEntry& entry)
{
    return "[" + entry.timestamp + "] " + entry.action + " " + entry.duplicate + " -> " + entry.master
        + " (" + ut1::toStr(entry.size) + " bytes) [" + entry.hashPrefix + "...] " + entry.result;
}

std::string AuditLog::resultText(const ActionOutcome& outcome)
{
    switch (outcome.kind)
    {
        case OutcomeKind::Succeeded:
            if (outcome.alreadyLinked)
            {
                return "OK (already linked)";
            }
            return outcome.fallback ? "OK (fallback)" : "OK";
        case OutcomeKind::Skipped:
            return "SKIPPED: " + outcome.reason;
        case OutcomeKind::Failed:
            return "FAILED: " + outcome.reason;
    }
    return "UNKNOWN";
}

static std::string upper(std::string s)
{
    for (char& c : s)
    {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

void AuditLog::logOperation(ActionKind requested, const FileRecord& duplicate, const std::string& master, const std::string& hash, const ActionOutcome& outcome)
{
    AuditLogEntry entry;
    entry.timestamp = timestamp();
    // Report what was actually done (symlink after a hardlink fallback).
    entry.action = upper(actionName(outcome.kind == OutcomeKind::Succeeded ? outcome.performed : requested));
    entry.duplicate = outcome.linkPath.empty() ? duplicate.path : outcome.linkPath;
    entry.master = master;
    entry.size = duplicate.size;
    entry.hashPrefix = hash.substr(0, 8);
    entry.result = resultText(outcome);
    writeLine(formatEntry(entry));
    operations++;
}

void AuditLog::logDeclined(const FileRecord& duplicate, const std::string& master, const std::string& hash)
{
    AuditLogEntry entry;
    entry.timestamp = timestamp();
    entry.action = "DECLINED";
    entry.duplicate = duplicate.path;
    entry.master = master;
    entry.size = duplicate.size;
    entry.hashPrefix = hash.substr(0, 8);
    entry.result = "SKIPPED: user declined";
    writeLine(formatEntry(entry));
}

void AuditLog::writeFooter(const ExecutionSummary& summary)
{
    writeLine("");
    writeLine(kSeparator);
    writeLine("Summary (" + timestamp() + ")");
    writeLine(kSeparator);
    writeLine("Operations logged: " + ut1::toStr(operations));
    writeLine("Succeeded: " + ut1::toStr(summary.succeeded) + " (already linked: " + ut1::toStr(summary.alreadyLinked)
        + ", fallback: " + ut1::toStr(summary.fallbacks) + ")");
    writeLine("Failed: " + ut1::toStr(summary.failed));
    writeLine("Skipped: " + ut1::toStr(summary.skipped));
    writeLine("Declined: " + ut1::toStr(summary.declined));
    writeLine("Cancelled: " + ut1::toStr(summary.cancelled) + (summary.interrupted ? " (run interrupted)" : ""));
    writeLine("Bytes reclaimed: " + ut1::toStr(summary.bytesReclaimed));
    if (!summary.failures.empty())
    {
        writeLine("");
        writeLine("Failed files:");
        for (const auto& [failedPath, error] : summary.failures)
        {
            writeLine("  - " + failedPath + ": " + error);
        }
    }
    writeLine(kSeparator);
}

fs::path AuditLog::defaultPath()
{
    std::time_t secs = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&secs, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "dupelink_%Y%m%d_%H%M%S.log", &tm);
    const char* dir = std::getenv("DUPELINK_LOG_DIR");
    if (dir && *dir)
    {
        return fs::path(dir) / buf;
    }
    return fs::path(buf);
}

} // namespace dupelink

using namespace dupelink;

static std::vector<std::string> readLines(const fs::path& path)
{
    std::istringstream is(ut1::readFile(path.string()));
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(is, line))
    {
        lines.push_back(line);
    }
    return lines;
}

UNIT_TEST(AuditLog_formatEntry)
{
    AuditLogEntry entry;
    entry.timestamp = "2026-01-02T03:04:05.000006";
    entry.action = "HARDLINK";
    entry.duplicate = "/b/x.txt";
    entry.master = "/a/x.txt";
    entry.size = 1234;
    entry.hashPrefix = "0123abcd";
    entry.result = "OK";
    ASSERT_EQ(AuditLog::formatEntry(entry), "[2026-01-02T03:04:05.000006] HARDLINK /b/x.txt -> /a/x.txt (1234 bytes) [0123abcd...] OK");
}

UNIT_TEST(AuditLog_resultText)
{
    ActionOutcome ok = ActionOutcome::succeeded(ActionKind::Hardlink, 10);
    ASSERT_EQ(AuditLog::resultText(ok), "OK");
    ok.fallback = true;
    ASSERT_EQ(AuditLog::resultText(ok), "OK (fallback)");
    ok.alreadyLinked = true;
    ASSERT_EQ(AuditLog::resultText(ok), "OK (already linked)");
    ASSERT_EQ(AuditLog::resultText(ActionOutcome::skipped(ActionKind::Hardlink, "duplicate missing")), "SKIPPED: duplicate missing");
    ASSERT_EQ(AuditLog::resultText(ActionOutcome::failed(ActionKind::Hardlink, "Permission denied")), "FAILED: Permission denied");
}

UNIT_TEST(AuditLog_writesHeaderOperationsAndFooter)
{
    TempDir tmp;
    fs::path logPath = tmp / "audit.log";
    FileRecord dup;
    dup.path = "/b/x.txt";
    dup.size = 5;
    {
        AuditLog log(logPath);
        RunInfo info;
        info.dirA = "/a";
        info.dirB = "/b";
        info.masterDir = "/a";
        info.flags = {"--execute", "--yes"};
        log.writeHeader(info);

        ActionOutcome fallback = ActionOutcome::succeeded(ActionKind::Symlink, 5);
        fallback.fallback = true;
        log.logOperation(ActionKind::Hardlink, dup, "/a/x.txt", "2c1743a391305fbf", fallback);
        log.logDeclined(dup, "/a/x.txt", "2c1743a391305fbf");
        log.logOperation(ActionKind::Hardlink, dup, "/a/x.txt", "2c1743a391305fbf", ActionOutcome::skipped(ActionKind::Hardlink, "duplicate missing"));
        ASSERT_EQ(log.numOperations(), size_t(2));

        ExecutionSummary summary;
        summary.succeeded = 1;
        summary.skipped = 1;
        summary.declined = 1;
        summary.failures.emplace_back("/b/y.txt", "Permission denied");
        log.writeFooter(summary);
    }

    std::vector<std::string> lines = readLines(logPath);
    std::string all = ut1::readFile(logPath.string());
    ASSERT_EQ(lines[0], std::string(80, '='));
    ASSERT_EQ(all.find("Directories: /a, /b") != std::string::npos, true);
    ASSERT_EQ(all.find("Flags: --execute, --yes") != std::string::npos, true);
    ASSERT_EQ(all.find("] SYMLINK /b/x.txt -> /a/x.txt (5 bytes) [2c1743a3...] OK (fallback)") != std::string::npos, true);
    ASSERT_EQ(all.find("] DECLINED /b/x.txt -> /a/x.txt (5 bytes) [2c1743a3...] SKIPPED: user declined") != std::string::npos, true);
    ASSERT_EQ(all.find("] HARDLINK /b/x.txt -> /a/x.txt (5 bytes) [2c1743a3...] SKIPPED: duplicate missing") != std::string::npos, true);
    ASSERT_EQ(all.find("Operations logged: 2") != std::string::npos, true);
    ASSERT_EQ(all.find("  - /b/y.txt: Permission denied") != std::string::npos, true);

    // Appends on reopen.
    {
        AuditLog log(logPath);
        log.writeFooter(ExecutionSummary());
    }
    ASSERT_EQ(readLines(logPath).size() > lines.size(), true);
}

UNIT_TEST(AuditLog_timestampsNeverDecrease)
{
    TempDir tmp;
    AuditLog log(tmp / "audit.log");
    std::vector<std::chrono::system_clock::time_point> times;
    std::chrono::system_clock::time_point base = std::chrono::system_clock::now();
    times.push_back(base);
    times.push_back(base - std::chrono::seconds(5)); // Clock stepped back.
    times.push_back(base + std::chrono::seconds(1));
    size_t next = 0;
    log.setClock([&] { return times[next++]; });
    FileRecord dup;
    dup.path = "/b/x";
    for (size_t i = 0; i < times.size(); i++)
    {
        log.logOperation(ActionKind::Delete, dup, "/a/x", "abc", ActionOutcome::succeeded(ActionKind::Delete, 0));
    }

    std::vector<std::string> lines = readLines(tmp / "audit.log");
    ASSERT_EQ(lines.size() >= 3, true);
    ASSERT_EQ(lines[0].substr(0, 28), lines[1].substr(0, 28));
    ASSERT_EQ(lines[1].substr(0, 28) < lines[2].substr(0, 28), true);
}

UNIT_TEST(AuditLog_openFailureIsSetupError)
{
    TempDir tmp;
    bool thrown = false;
    try
    {
        AuditLog log(tmp / "missing_dir/audit.log");
    }
    catch (const SetupError&)
    {
        thrown = true;
    }
    ASSERT_EQ(thrown, true);
}

UNIT_TEST(AuditLog_defaultPathHonorsEnvironment)
{
    ::setenv("DUPELINK_LOG_DIR", "/var/tmp/dupelink_logs", 1);
    fs::path p = AuditLog::defaultPath();
    ::unsetenv("DUPELINK_LOG_DIR");
    ASSERT_EQ(p.parent_path().string(), "/var/tmp/dupelink_logs");
    ASSERT_EQ(p.filename().string().starts_with("dupelink_"), true);
    ASSERT_EQ(p.extension().string(), ".log");
    ASSERT_EQ(AuditLog::defaultPath().has_parent_path(), false);
}
