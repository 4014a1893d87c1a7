// dupelink - replace duplicate files by links to a master copy.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ActionExecutor.hpp"
#include "AuditLog.hpp"
#include "Confirmation.hpp"
#include "ContentHasher.hpp"
#include "DirIndexer.hpp"
#include "Errors.hpp"
#include "FileOps.hpp"
#include "Log.hpp"
#include "Matcher.hpp"
#include "Options.hpp"
#include "ProgressTracker.hpp"
#include "Report.hpp"
#include "CommandLineParser.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include <algorithm>
#include <csignal>
#include <iostream>
#include <unistd.h>

using namespace dupelink;

static volatile std::sig_atomic_t gInterrupted = 0;

static void onInterrupt(int)
{
    gInterrupted = 1;
}

/// Turn Ctrl-C into a cancel request honored at the next group boundary.
/// No SA_RESTART so a blocking prompt read returns.
static void installInterruptHandler()
{
    struct sigaction sa{};
    sa.sa_handler = onInterrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) != 0)
    {
        throw SetupError("Cannot install SIGINT handler.");
    }
}

/// Index both trees, report, and optionally execute. Returns the process exit code.
static int run(const RunOptions& options)
{
    Log log(options.verbose, options.quiet);
    HashOptions hashOpts = hashOptions(options);
    if (options.fast)
    {
        log.info("Fast mode: files of " + ut1::getApproxSizeStr(hashOpts.fastThreshold, 3, true, false)
            + " and more are identified by size and samples only.");
    }

    ProgressTracker progress(options.width, options.progress > 1);
    ProgressTracker* progressPtr = (options.progress > 0 && !options.quiet) ? &progress : nullptr;
    double start = ut1::getTimeSec();
    HashIndex a = indexDirectory(options.dirA, hashOpts, log, progressPtr);
    HashIndex b = indexDirectory(options.dirB, hashOpts, log, progressPtr);
    if (progressPtr)
    {
        progress.finish();
    }

    MatchOptions matchOpts;
    matchOpts.differentNamesOnly = options.differentNamesOnly;
    MatchResult match = findDuplicates(a, b, a.getRoot(), matchOpts);

    ReportOptions report;
    report.action = options.action;
    report.execute = options.execute;
    report.verbose = options.verbose > 0;
    report.showUnmatched = options.showUnmatched;
    // Interactive runs show each group right before its prompt.
    report.summaryOnly = options.summary || (options.execute && !options.yes);
    printScanReport(std::cout, match, a, b, report, ut1::getTimeSec() - start);

    if (!options.execute)
    {
        if (options.action != ActionKind::Compare && !match.groups.empty())
        {
            log.info("Preview only. Use --execute to apply.");
        }
        return kExitSuccess;
    }
    if (match.groups.empty())
    {
        log.info("No duplicates found. Nothing to do.");
        return kExitSuccess;
    }

    installInterruptHandler();
    auto interrupted = [] { return gInterrupted != 0; };

    AuditLog audit(options.logPath ? std::filesystem::path(*options.logPath) : AuditLog::defaultPath());
    RunInfo info;
    info.dirA = a.getRoot().string();
    info.dirB = b.getRoot().string();
    info.masterDir = a.getRoot().string();
    info.action = options.action;
    info.flags = logFlags(options);
    audit.writeHeader(info);
    log.info("Audit log: " + audit.getPath().string());

    ConfirmationMachine machine(options.yes);
    std::vector<ConfirmationDecision> decisions = confirmGroups(match.groups, options.action, machine,
        [](const std::string& prompt) { return readStdinResponse(prompt); },
        [&](size_t, const DuplicateGroup& group)
        {
            std::cout << "\n";
            printGroup(std::cout, group, report);
        },
        interrupted, std::cerr);
    bool cancelled = std::find(decisions.begin(), decisions.end(), ConfirmationDecision::Cancelled) != decisions.end();

    ExecOptions execOpts;
    execOpts.action = options.action;
    execOpts.fallbackSymlink = options.fallbackSymlink;
    execOpts.hash = hashOpts;
    if (options.targetDir)
    {
        execOpts.targetDir = normalizePath(*options.targetDir);
        execOpts.targetBase = b.getRoot();
    }
    ActionExecutor executor(execOpts, log, &audit);
    ExecutionSummary summary = executor.executeBatch(match.groups, decisions, interrupted);
    audit.writeFooter(summary);
    printExecutionSummary(std::cout, summary, audit.getPath().string());

    int code = exitCode(summary, cancelled);
    log.debug("Exit code " + ut1::toStr(code));
    return code;
}

int main(int argc, char *argv[])
{
    // Run unit tests and exit if enabled at compile time.
    UNIT_TEST_RUN();

    // Command line options.
    const char *usage = "Find files with identical content in two directory trees and replace the copies\n"
                        "in the second tree by hardlinks or symlinks to the first tree (or delete them).\n"
                        "\n"
                        "Usage: $programName [OPTIONS] MASTER_DIR OTHER_DIR\n"
                        "\n"
                        "Files in MASTER_DIR are never modified. Without --execute only a preview is printed.\n"
                        "All sizes may be specified with kMGTPE suffixes indicating powers of 1024.";
    ut1::CommandLineParser cl("dupelink", usage,
        "\n$programName version $version *** Copyright (c) 2026 Johannes Overmann",
        "0.1.0");

    cl.addHeader("\nOptions:\n");
    cl.addOption('a', "action", "Action for duplicates: compare, hardlink, symlink or delete.", "ACTION", "compare");
    cl.addOption(' ', "execute", "Execute the action. Without this only a preview is shown.");
    cl.addOption('y', "yes", "Do not ask for confirmation of each group.");
    cl.addOption(' ', "fallback-symlink", "Create a symlink if a hardlink is not possible across filesystems.");
    cl.addOption(' ', "target-dir", "Create the links below DIR (mirroring OTHER_DIR) and remove the duplicates.", "DIR", "");
    cl.addOption('l', "log", "Audit log file (default: dupelink_YYYYMMDD_HHMMSS.log in $DUPELINK_LOG_DIR or the current dir).", "FILE", "");
    cl.addOption('H', "hash", "Hash algorithm: md5 or sha256.", "ALGO", "md5");
    cl.addOption('f', "fast", "Identify files of 100MB and more by size and five 1MB samples (faster, small risk of false matches).");
    cl.addOption(' ', "bufsize", "Buffer size for reading files.", "N", "1M");
    cl.addOption('d', "different-names-only", "Ignore duplicates which all have the same file name.");
    cl.addOption('u', "show-unmatched", "List files without a match in the other directory.");
    cl.addOption('s', "summary", "Print only counts and statistics, no groups.");
    cl.addOption('p', "progress", "Print progress once per second. Specify twice for one line per update.");
    cl.addOption('W', "width", "Max width for progress line.", "N", "199");
    cl.addOption('q', "quiet", "Suppress status messages and warnings.");
    cl.addOption('v', "verbose", "Increase verbosity. Specify multiple times to be more verbose.");

    // Parse command line options.
    cl.parse(argc, argv);

    int code = kExitSuccess;
    try
    {
        if (cl.getArgs().size() != 2)
        {
            cl.error("Please specify exactly two directories (MASTER_DIR OTHER_DIR).");
        }

        RunOptions options;
        options.dirA = cl.getArgs()[0];
        options.dirB = cl.getArgs()[1];
        std::optional<ActionKind> action = parseActionKind(cl.getStr("action"));
        if (!action)
        {
            cl.error("Unknown action '" + cl.getStr("action") + "'. Use compare, hardlink, symlink or delete.");
        }
        options.action = *action;
        std::optional<HashAlgorithm> hash = parseHashAlgorithm(cl.getStr("hash"));
        if (!hash)
        {
            cl.error("Unknown hash algorithm '" + cl.getStr("hash") + "'. Use md5 or sha256.");
        }
        options.hash = *hash;
        options.execute = cl("execute");
        options.yes = cl("yes");
        options.fallbackSymlink = cl("fallback-symlink");
        if (cl("target-dir"))
        {
            options.targetDir = cl.getStr("target-dir");
        }
        if (cl("log"))
        {
            options.logPath = cl.getStr("log");
        }
        options.fast = cl("fast");
        options.bufSize = static_cast<size_t>(ut1::strToU64(cl.getStr("bufsize")));
        options.differentNamesOnly = cl("different-names-only");
        options.showUnmatched = cl("show-unmatched");
        options.summary = cl("summary");
        options.progress = cl.getCount("progress");
        options.width = cl.getUInt("width");
        options.verbose = cl.getCount("verbose");
        options.quiet = cl("quiet");

        validateOptions(options, ::isatty(STDIN_FILENO) != 0);
        code = run(options);
    }
    catch (const std::exception& e)
    {
        cl.error(e.what());
    }

    return code;
}
