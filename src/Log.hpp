// Console diagnostics.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <iostream>
#include <string>

namespace dupelink
{

/// Status, warning and error output on stderr.
/// One instance is created in main() and passed down by reference.
class Log
{
public:
    /// Initialize with verbosity level and quiet mode.
    explicit Log(unsigned verbose_ = 0, bool quiet_ = false, std::ostream& os_ = std::cerr)
        : verbose(verbose_), quiet(quiet_), os(os_) {}

    /// Print status message unless quiet.
    void info(const std::string& msg) const;

    /// Print message if verbosity is at least level (and not quiet).
    void debug(const std::string& msg, unsigned level = 1) const;

    /// Print "Warning: msg" unless quiet.
    void warning(const std::string& msg) const;

    /// Print "Error: msg". Never suppressed.
    void error(const std::string& msg) const;

    unsigned getVerbose() const { return verbose; }
    bool isQuiet() const { return quiet; }
    std::ostream& stream() const { return os; }

private:
    unsigned verbose{};
    bool quiet{};
    std::ostream& os;
};

} // namespace dupelink
