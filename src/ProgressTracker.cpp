// Progress line while indexing directory trees.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ProgressTracker.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include <sstream>

namespace fs = std::filesystem;

namespace dupelink
{

ProgressTracker::ProgressTracker(size_t maxWidth_, bool linefeed_, std::ostream& os_)
    : startTime(ut1::getTimeSec()),
      lastPrintTime(startTime),
      lastRateTime(startTime),
      maxWidth(maxWidth_),
      linefeed(linefeed_),
      os(os_)
{
}

void ProgressTracker::onRootStart(const fs::path& rootPath)
{
    currentRoot = rootPath.string();
    currentDir = currentRoot;
    tick();
}

void ProgressTracker::onDirStart(const fs::path& dirPath)
{
    if (!hashing)
    {
        currentDir = dirPath.string();
    }
    dirs++;
    tick();
}

void ProgressTracker::onFileProcessed(uint64_t size)
{
    files++;
    bytes += size;
    tick();
}

void ProgressTracker::onHashStart(const fs::path& filePath, uint64_t fileSize)
{
    hashing = true;
    currentFile = filePath.string();
    currentFileSize = fileSize;
    currentFileDone = 0;
    tick();
}

void ProgressTracker::onHashProgress(uint64_t bytesRead)
{
    hashedBytes += bytesRead;
    currentFileDone += bytesRead;
    tick();
}

void ProgressTracker::onHashEnd()
{
    hashing = false;
    currentFile.clear();
    currentFileSize = 0;
    currentFileDone = 0;
    tick();
}

void ProgressTracker::finish()
{
    if (lastLineLen > 0)
    {
        os << "\r" << std::string(lastLineLen, ' ') << "\r" << std::flush;
        lastLineLen = 0;
    }
}

void ProgressTracker::tick()
{
    double now = ut1::getTimeSec();
    if (now - lastPrintTime < 1.0)
    {
        return;
    }
    lastPrintTime = now;
    printLine(now);
}

void ProgressTracker::printLine(double now)
{
    double elapsed = now - startTime;
    double avgRate = (elapsed > 0.0) ? (double(hashedBytes) / elapsed) : 0.0;
    double deltaTime = now - lastRateTime;
    uint64_t deltaBytes = hashedBytes - lastRateBytes;
    double curRate = (deltaTime > 0.0) ? (double(deltaBytes) / deltaTime) : 0.0;
    std::string avgRateStr = ut1::getApproxSizeStr(avgRate, 1, false, true) + "/s";
    std::string curRateStr = ut1::getApproxSizeStr(curRate, 1, false, true) + "/s";
    std::string sizeStr = ut1::getApproxSizeStr(bytes, 1, false, true);
    std::string prefix = ut1::toStr(files) + "f/" + ut1::toStr(dirs) + "d (" + sizeStr + ", " + avgRateStr + ", " + curRateStr + ")";

    std::string suffix;
    if (hashing && !currentFile.empty())
    {
        unsigned percent = 0;
        if (currentFileSize > 0)
        {
            percent = unsigned((currentFileDone * 100) / currentFileSize);
        }
        std::string percentStr = ut1::toStr(percent) + "%";
        size_t maxPath = availablePathLen(prefix.size(), percentStr.size());
        suffix = percentStr + " " + abbreviatePath(currentFile, maxPath);
    }
    else if (!currentDir.empty())
    {
        size_t maxPath = availablePathLen(prefix.size(), 0);
        suffix = abbreviatePath(currentDir, maxPath);
    }

    std::string line = prefix;
    if (!suffix.empty())
    {
        line += " " + suffix;
    }
    if (line.size() > maxWidth)
    {
        line.resize(maxWidth);
    }
    if (linefeed)
    {
        os << line << "\n" << std::flush;
    }
    else
    {
        size_t pad = (lastLineLen > line.size()) ? (lastLineLen - line.size()) : 0;
        os << "\r" << line << std::string(pad, ' ') << "\r" << std::flush;
        lastLineLen = line.size();
    }
    lastRateTime = now;
    lastRateBytes = hashedBytes;
}

size_t ProgressTracker::availablePathLen(size_t prefixLen, size_t extraLen) const
{
    size_t used = prefixLen + 1;
    if (extraLen > 0)
    {
        used += extraLen + 1;
    }
    if (used >= maxWidth)
    {
        return 0;
    }
    return maxWidth - used;
}

std::string ProgressTracker::abbreviatePath(const std::string& path, size_t maxLen)
{
    if (maxLen == 0)
    {
        return std::string();
    }
    if (path.size() <= maxLen)
    {
        return path;
    }
    if (maxLen <= 3)
    {
        return path.substr(path.size() - maxLen);
    }
    return "..." + path.substr(path.size() - (maxLen - 3));
}

} // namespace dupelink

using namespace dupelink;

UNIT_TEST(ProgressTracker_counts)
{
    std::ostringstream os;
    ProgressTracker progress(80, true, os);
    progress.onRootStart("/data/a");
    progress.onDirStart("/data/a/x");
    progress.onFileProcessed(10);
    progress.onHashStart("/data/a/x/f", 10);
    progress.onHashProgress(10);
    progress.onHashEnd();
    progress.finish();
    ASSERT_EQ(progress.getFiles(), uint64_t(1));
    ASSERT_EQ(progress.getHashedBytes(), uint64_t(10));
}
