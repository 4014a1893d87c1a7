// Progress line while indexing directory trees.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

namespace dupelink
{

/// Prints one status line per second to a stream (stderr by default).
class ProgressTracker
{
public:
    /// Initialize progress tracking with width and linefeed mode.
    explicit ProgressTracker(size_t maxWidth_ = 199, bool linefeed_ = false, std::ostream& os_ = std::cerr);

    /// Note that indexing of a directory tree started.
    void onRootStart(const std::filesystem::path& rootPath);

    /// Note that a directory is being scanned.
    void onDirStart(const std::filesystem::path& dirPath);

    /// Note that a file was processed.
    void onFileProcessed(uint64_t size);

    /// Begin tracking hashing of a file.
    void onHashStart(const std::filesystem::path& filePath, uint64_t fileSize);

    /// Update hashing progress for the current file.
    void onHashProgress(uint64_t bytesRead);

    /// End tracking hashing of a file.
    void onHashEnd();

    /// Clear the progress line and finish output.
    void finish();

    uint64_t getFiles() const { return files; }
    uint64_t getHashedBytes() const { return hashedBytes; }

private:
    /// Print an updated progress line once per second.
    void tick();

    /// Render one progress line based on current state.
    void printLine(double now);

    /// Compute available path length for the progress line.
    size_t availablePathLen(size_t prefixLen, size_t extraLen) const;

    /// Abbreviate a path to fit within the given length.
    static std::string abbreviatePath(const std::string& path, size_t maxLen);

    uint64_t dirs = 0;
    uint64_t files = 0;
    uint64_t bytes = 0;
    uint64_t hashedBytes = 0;
    double startTime = 0.0;
    double lastPrintTime = 0.0;
    double lastRateTime = 0.0;
    std::string currentRoot;
    std::string currentDir;
    std::string currentFile;
    uint64_t currentFileSize = 0;
    uint64_t currentFileDone = 0;
    bool hashing = false;
    uint64_t lastRateBytes = 0;
    size_t lastLineLen = 0;
    size_t maxWidth = 199;
    bool linefeed = false;
    std::ostream& os;
};

} // namespace dupelink
