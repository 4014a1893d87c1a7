// Console diagnostics.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "Log.hpp"
#include "UnitTest.hpp"
#include <sstream>

namespace dupelink
{

void Log::info(const std::string& msg) const
{
    if (quiet)
    {
        return;
    }
    os << msg << "\n" << std::flush;
}

void Log::debug(const std::string& msg, unsigned level) const
{
    if (quiet || verbose < level)
    {
        return;
    }
    os << msg << "\n" << std::flush;
}

void Log::warning(const std::string& msg) const
{
    if (quiet)
    {
        return;
    }
    os << "Warning: " << msg << "\n" << std::flush;
}

void Log::error(const std::string& msg) const
{
    os << "Error: " << msg << "\n" << std::flush;
}

} // namespace dupelink

using namespace dupelink;

UNIT_TEST(Log_levels)
{
    std::ostringstream os;
    Log log(1, false, os);
    log.info("indexing");
    log.debug("level one");
    log.debug("level two", 2);
    log.warning("skipped file");
    ASSERT_EQ(os.str(), "indexing\nlevel one\nWarning: skipped file\n");
}

UNIT_TEST(Log_quietKeepsErrors)
{
    std::ostringstream os;
    Log log(3, true, os);
    log.info("indexing");
    log.debug("details");
    log.warning("skipped file");
    log.error("cannot open log");
    ASSERT_EQ(os.str(), "Error: cannot open log\n");
}
