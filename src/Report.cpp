// Text output of scan results and execution summaries.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "Report.hpp"
#include "DirIndexer.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace dupelink
{

/// Return decimal position for stat values with optional suffix.
static size_t getStatDecimalPos(const std::string& value)
{
    size_t end = value.find(' ');
    std::string_view number = (end == std::string::npos)
        ? std::string_view(value)
        : std::string_view(value).substr(0, end);
    size_t pos = number.find('.');
    return (pos == std::string::npos) ? number.size() : pos;
}

/// Align stat values on their decimal point.
static std::string formatAlignedStatValue(const std::string& value, size_t labelWidth, size_t decimalCol)
{
    size_t decimalPos = getStatDecimalPos(value);
    size_t currentCol = labelWidth + 1 + decimalPos;
    size_t padding = (decimalCol > currentCol) ? (decimalCol - currentCol) : 0;
    return std::string(padding, ' ') + value;
}

/// Format a percentage with one decimal place.
static std::string formatPercentFixed(double percent)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << percent << "%";
    return os.str();
}

void printStatList(std::ostream& os, const std::vector<StatLine>& lines)
{
    size_t labelWidth = 0;
    size_t maxDecimalPos = 0;
    size_t maxExtraDecimalPos = 0;
    for (const auto& line : lines)
    {
        labelWidth = std::max(labelWidth, line.label.size());
        maxDecimalPos = std::max(maxDecimalPos, getStatDecimalPos(line.value));
        if (!line.extra.empty())
        {
            maxExtraDecimalPos = std::max(maxExtraDecimalPos, getStatDecimalPos(line.extra));
        }
    }
    size_t decimalCol = labelWidth + 1 + maxDecimalPos;
    size_t extraCol = labelWidth + 1 + maxExtraDecimalPos;

    size_t maxValueWidth = 0;
    std::vector<std::string> alignedValues;
    alignedValues.reserve(lines.size());
    for (const auto& line : lines)
    {
        std::string valueAligned = formatAlignedStatValue(line.value, labelWidth, decimalCol);
        maxValueWidth = std::max(maxValueWidth, valueAligned.size());
        alignedValues.push_back(std::move(valueAligned));
    }

    for (size_t i = 0; i < lines.size(); i++)
    {
        const auto& line = lines[i];
        std::string lineOut = line.label + std::string(labelWidth - line.label.size(), ' ') + " " + alignedValues[i];
        if (!line.extra.empty())
        {
            lineOut += std::string(maxValueWidth - alignedValues[i].size(), ' ');
            lineOut += " " + formatAlignedStatValue(line.extra, labelWidth, extraCol);
        }
        os << lineOut << "\n";
    }
}

std::string formatSize(FileSize bytes)
{
    return ut1::getApproxSizeStr(bytes, 3, true, false);
}

static std::string capitalized(std::string s)
{
    if (!s.empty())
    {
        s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    }
    return s;
}

std::string bannerLine(const ReportOptions& options, size_t numGroups, size_t numFiles, FileSize bytes)
{
    std::string tag = options.action == ActionKind::Compare ? "COMPARE" : (options.execute ? "EXECUTE" : "PREVIEW");
    return capitalized(actionName(options.action)) + " mode (" + tag + "): " + ut1::toStr(numGroups) + " groups, "
        + ut1::toStr(numFiles) + " files, " + formatSize(bytes) + " to save";
}

/// Label in front of each duplicate path.
static std::string duplicateLabel(const ReportOptions& options)
{
    switch (options.action)
    {
        case ActionKind::Compare:
            return "DUPLICATE:";
        case ActionKind::Hardlink:
            return options.execute ? "HARDLINK:" : "WOULD HARDLINK:";
        case ActionKind::Symlink:
            return options.execute ? "SYMLINK:" : "WOULD SYMLINK:";
        case ActionKind::Delete:
            return options.execute ? "DELETE:" : "WOULD DELETE:";
    }
    return "DUPLICATE:";
}

void printGroup(std::ostream& os, const DuplicateGroup& group, const ReportOptions& options)
{
    os << "MASTER: " << group.master.path;
    if (group.reason == MasterReason::OldestFallback)
    {
        os << " (" << masterReasonText(group.reason) << ")";
    }
    if (options.verbose)
    {
        os << " (" << formatSize(group.master.size) << ", " << group.hash.substr(0, 8) << "...)";
    }
    os << "\n";

    std::string label = duplicateLabel(options);
    for (const auto& duplicate : group.duplicates)
    {
        os << "    " << label << " " << duplicate.path;
        if (isCrossFilesystem(group, duplicate) && options.action == ActionKind::Hardlink)
        {
            os << " [!cross-fs]";
        }
        if (options.verbose)
        {
            os << " (" << formatSize(duplicate.size) << ")";
        }
        os << "\n";
    }
}

static void printUnmatched(std::ostream& os, const std::string& root, const std::vector<FileRecord>& files)
{
    os << "Files only in " << root << " (" << files.size() << "):\n";
    for (const auto& file : files)
    {
        os << "    " << file.path << "\n";
    }
}

void printScanReport(std::ostream& os, const MatchResult& match, const HashIndex& a, const HashIndex& b, const ReportOptions& options, double elapsedSeconds)
{
    size_t numFiles = numDuplicates(match.groups);
    FileSize bytes = reclaimableBytes(match.groups);
    os << bannerLine(options, match.groups.size(), numFiles, bytes) << "\n";
    for (const auto& warning : match.warnings)
    {
        os << "Warning: " << warning << "\n";
    }
    if (match.alreadyHardlinked > 0)
    {
        os << "Skipped " << match.alreadyHardlinked << " files already hardlinked to master (no space savings).\n";
    }

    if (!options.summaryOnly)
    {
        for (const auto& group : match.groups)
        {
            os << "\n";
            printGroup(os, group, options);
        }
        if (options.showUnmatched)
        {
            os << "\n";
            printUnmatched(os, a.getRoot().string(), match.unmatchedA);
            printUnmatched(os, b.getRoot().string(), match.unmatchedB);
        }
    }

    FileSize totalSize = a.totalSize() + b.totalSize();
    size_t crossFs = 0;
    for (const auto& group : match.groups)
    {
        crossFs += std::count_if(group.duplicates.begin(), group.duplicates.end(), [&](const FileRecord& duplicate)
        {
            return isCrossFilesystem(group, duplicate);
        });
    }
    std::vector<StatLine> stats = {
        {"files-a:", ut1::toStr(a.numFiles()), "(" + ut1::toStr(a.numSkipped()) + " skipped)"},
        {"files-b:", ut1::toStr(b.numFiles()), "(" + ut1::toStr(b.numSkipped()) + " skipped)"},
        {"total-size:", formatSize(totalSize), std::string()},
        {"groups:", ut1::toStr(match.groups.size()), std::string()},
        {"duplicates:", ut1::toStr(numFiles), std::string()},
        {"reclaimable:", formatSize(bytes), "(" + formatPercentFixed(totalSize == 0 ? 0.0 : (100.0 * bytes / totalSize)) + ")"},
        {"unmatched-a:", ut1::toStr(match.unmatchedA.size()), std::string()},
        {"unmatched-b:", ut1::toStr(match.unmatchedB.size()), std::string()},
        {"already-linked:", ut1::toStr(match.alreadyHardlinked), std::string()}
    };
    if (crossFs > 0)
    {
        stats.push_back({"cross-fs:", ut1::toStr(crossFs), std::string()});
    }
    if (elapsedSeconds > 0.0)
    {
        stats.push_back({"elapsed:", ut1::secondsToString(elapsedSeconds), std::string()});
    }
    os << "\n";
    printStatList(os, stats);
}

void printExecutionSummary(std::ostream& os, const ExecutionSummary& summary, const std::string& auditLogPath)
{
    std::vector<StatLine> stats = {
        {"succeeded:", ut1::toStr(summary.succeeded), std::string()},
        {"already-linked:", ut1::toStr(summary.alreadyLinked), std::string()},
        {"fallback:", ut1::toStr(summary.fallbacks), std::string()},
        {"failed:", ut1::toStr(summary.failed), std::string()},
        {"skipped:", ut1::toStr(summary.skipped), std::string()},
        {"declined:", ut1::toStr(summary.declined), std::string()},
        {"cancelled:", ut1::toStr(summary.cancelled), std::string()},
        {"reclaimed:", formatSize(summary.bytesReclaimed), std::string()}
    };
    if (!auditLogPath.empty())
    {
        stats.push_back({"audit-log:", auditLogPath, std::string()});
    }
    os << "\n" << (summary.interrupted ? "Execution interrupted:" : "Execution finished:") << "\n";
    printStatList(os, stats);
    if (!summary.failures.empty())
    {
        os << "Failed files:\n";
        for (const auto& [path, error] : summary.failures)
        {
            os << "    " << path << ": " << error << "\n";
        }
    }
}

} // namespace dupelink

using namespace dupelink;

UNIT_TEST(Report_printStatList)
{
    std::ostringstream os;
    printStatList(os, {{"files:", "12", std::string()}, {"total-size:", "1.5 MB", "(10.0%)"}, {"x:", "100", "(5.25%)"}});
    ASSERT_EQ(os.str(),
        "files:       12\n"
        "total-size:   1.5 MB (10.0%)\n"
        "x:          100       (5.25%)\n");
}

UNIT_TEST(Report_bannerTags)
{
    ReportOptions options;
    options.action = ActionKind::Hardlink;
    ASSERT_EQ(bannerLine(options, 2, 3, 100).rfind("Hardlink mode (PREVIEW): 2 groups, 3 files, ", 0), size_t(0));
    options.execute = true;
    ASSERT_EQ(bannerLine(options, 2, 3, 100).rfind("Hardlink mode (EXECUTE): ", 0), size_t(0));
    options.action = ActionKind::Compare;
    ASSERT_EQ(bannerLine(options, 0, 0, 0).rfind("Compare mode (COMPARE): 0 groups", 0), size_t(0));
}

UNIT_TEST(Report_printGroup)
{
    DuplicateGroup group;
    group.hash = "0123456789abcdef";
    group.master.path = "/a/x";
    group.master.device = 1;
    group.master.inode = 10;
    FileRecord local;
    local.path = "/b/x";
    local.device = 1;
    local.inode = 11;
    FileRecord remote;
    remote.path = "/c/x";
    remote.device = 2;
    remote.inode = 12;
    group.duplicates = {local, remote};

    ReportOptions options;
    options.action = ActionKind::Hardlink;
    std::ostringstream os;
    printGroup(os, group, options);
    ASSERT_EQ(os.str(),
        "MASTER: /a/x\n"
        "    WOULD HARDLINK: /b/x\n"
        "    WOULD HARDLINK: /c/x [!cross-fs]\n");

    group.reason = MasterReason::OldestFallback;
    options.action = ActionKind::Compare;
    std::ostringstream os2;
    printGroup(os2, group, options);
    ASSERT_EQ(os2.str().rfind("MASTER: /a/x (no master-directory candidate, oldest chosen)\n    DUPLICATE: /b/x\n", 0), size_t(0));
}
