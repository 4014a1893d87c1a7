// Text output of scan results and execution summaries.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Matcher.hpp"
#include "Model.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace dupelink
{

class HashIndex;

struct ReportOptions
{
    ActionKind action{ActionKind::Compare};
    bool execute{};
    bool verbose{};
    bool showUnmatched{};
    bool summaryOnly{};
};

struct StatLine
{
    std::string label;
    std::string value;
    std::string extra;
};

/// Print aligned statistics lines (values aligned on their decimal point).
void printStatList(std::ostream& os, const std::vector<StatLine>& lines);

/// Size as printed in reports ("1.23 MB").
std::string formatSize(FileSize bytes);

/// "Hardlink mode (PREVIEW): 2 groups, 3 files, 1.00 kB to save".
std::string bannerLine(const ReportOptions& options, size_t numGroups, size_t numFiles, FileSize bytes);

/// One group: MASTER line and one line per duplicate.
void printGroup(std::ostream& os, const DuplicateGroup& group, const ReportOptions& options);

/// Full scan report: banner, warnings, groups (unless summaryOnly), unmatched files and statistics.
void printScanReport(std::ostream& os, const MatchResult& match, const HashIndex& a, const HashIndex& b, const ReportOptions& options, double elapsedSeconds);

/// Totals after executing a batch.
void printExecutionSummary(std::ostream& os, const ExecutionSummary& summary, const std::string& auditLogPath);

} // namespace dupelink
