// Run configuration from the command line.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ContentHasher.hpp"
#include "Model.hpp"
#include <optional>
#include <string>
#include <vector>

namespace dupelink
{

/// Everything main() needs to know about one run.
struct RunOptions
{
    std::string dirA; // Master directory.
    std::string dirB;
    ActionKind action{ActionKind::Compare};
    bool execute{};
    bool yes{};
    bool fallbackSymlink{};
    std::optional<std::string> targetDir;
    std::optional<std::string> logPath;
    HashAlgorithm hash{HashAlgorithm::Md5};
    bool fast{};
    size_t bufSize{kDefaultBufSize};
    bool differentNamesOnly{};
    bool showUnmatched{};
    bool summary{};
    unsigned progress{};
    size_t width{199};
    unsigned verbose{};
    bool quiet{};
};

/// Check option combinations and directory arguments before anything is read or modified.
/// Throws SetupError with a message suitable for the user.
void validateOptions(const RunOptions& options, bool stdinIsTty);

/// Hash settings derived from the options.
HashOptions hashOptions(const RunOptions& options);

/// Flags in effect, as recorded in the audit log header.
std::vector<std::string> logFlags(const RunOptions& options);

} // namespace dupelink
