// File content hashing.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ContentHasher.hpp"
#include "Errors.hpp"
#include "Hash.hpp"
#include "HashEvp.hpp"
#include "ProgressTracker.hpp"
#include "MiscUtils.hpp"
#include "UnitTest.hpp"
#include "TestUtils.hpp"
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace dupelink
{

std::string hashAlgorithmName(HashAlgorithm algorithm)
{
    switch (algorithm)
    {
        case HashAlgorithm::Md5:
            return "md5";
        case HashAlgorithm::Sha256:
            return "sha256";
    }
    return "unknown";
}

std::optional<HashAlgorithm> parseHashAlgorithm(const std::string& name)
{
    if (name == "md5")
    {
        return HashAlgorithm::Md5;
    }
    if (name == "sha256")
    {
        return HashAlgorithm::Sha256;
    }
    return std::nullopt;
}

/// Hash the whole file in bufSize chunks.
template <class HASH>
static std::string hashWholeFile(const fs::path& path, uint64_t fileSize, size_t bufSize, ProgressTracker* progress)
{
    std::ifstream is(path, std::ios::binary);
    if (!is)
    {
        throw ScanError("Error while opening file for hashing: " + path.string());
    }
    HASH hasher;
    if (progress)
    {
        progress->onHashStart(path, fileSize);
    }
    std::vector<uint8_t> buffer(bufSize);
    uint64_t hashedBytes = 0;
    while (is)
    {
        is.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = is.gcount();
        if (count > 0)
        {
            hasher.update(buffer.data(), static_cast<size_t>(count));
            hashedBytes += static_cast<uint64_t>(count);
            if (progress)
            {
                progress->onHashProgress(static_cast<uint64_t>(count));
            }
        }
    }
    if (progress)
    {
        progress->onHashEnd();
    }
    if (is.bad())
    {
        throw ScanError("Error while reading file for hashing: " + path.string());
    }
    // A failing read may just look like an early end of file.
    if (hashedBytes != fileSize)
    {
        throw ScanError("Read " + ut1::toStr(hashedBytes) + " of " + ut1::toStr(fileSize) + " bytes while hashing " + path.string());
    }
    return toHex(hasher.finalize());
}

/// Add n bytes starting at offset to the hash.
template <class HASH>
static void hashRange(std::ifstream& is, const fs::path& path, uint64_t offset, uint64_t n, HASH& hasher)
{
    std::vector<uint8_t> buffer(static_cast<size_t>(n));
    is.seekg(static_cast<std::streamoff>(offset));
    is.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(n));
    if (static_cast<uint64_t>(is.gcount()) != n)
    {
        throw ScanError("Short read at offset " + ut1::toStr(offset) + " while sampling " + path.string());
    }
    hasher.update(buffer.data(), buffer.size());
}

template <class HASH>
static std::string hashSampled(const fs::path& path, uint64_t fileSize, uint64_t sampleSize)
{
    std::ifstream is(path, std::ios::binary);
    if (!is)
    {
        throw ScanError("Error while opening file for hashing: " + path.string());
    }
    HASH hasher;
    updateHash(hasher, ut1::toStr(fileSize));
    if (fileSize <= 3 * sampleSize)
    {
        hashRange(is, path, 0, fileSize, hasher);
        return toHex(hasher.finalize());
    }
    uint64_t half = sampleSize / 2;
    const uint64_t offsets[] =
    {
        0,
        fileSize / 4 - half,
        fileSize / 2 - half,
        (fileSize * 3) / 4 - half,
        fileSize - sampleSize
    };
    for (uint64_t offset : offsets)
    {
        hashRange(is, path, offset, sampleSize, hasher);
    }
    return toHex(hasher.finalize());
}

std::string hashFileSparse(const fs::path& path, HashAlgorithm algorithm, uint64_t fileSize, uint64_t sampleSize)
{
    switch (algorithm)
    {
        case HashAlgorithm::Md5:
            return hashSampled<HashMd5>(path, fileSize, sampleSize);
        case HashAlgorithm::Sha256:
            return hashSampled<HashSha256>(path, fileSize, sampleSize);
    }
    throw std::logic_error("Unhandled hash algorithm.");
}

std::string hashFile(const fs::path& path, const HashOptions& options, ProgressTracker* progress)
{
    std::error_code ec;
    uint64_t fileSize = fs::file_size(path, ec);
    if (ec)
    {
        throw ScanError("Cannot get size of " + path.string() + ": " + ec.message());
    }
    if (options.fastMode && fileSize >= options.fastThreshold)
    {
        return hashFileSparse(path, options.algorithm, fileSize, options.sampleSize);
    }
    switch (options.algorithm)
    {
        case HashAlgorithm::Md5:
            return hashWholeFile<HashMd5>(path, fileSize, options.bufSize, progress);
        case HashAlgorithm::Sha256:
            return hashWholeFile<HashSha256>(path, fileSize, options.bufSize, progress);
    }
    throw std::logic_error("Unhandled hash algorithm.");
}

} // namespace dupelink

using namespace dupelink;

UNIT_TEST(ContentHasher_knownDigests)
{
    ASSERT_EQ(toHex(calcHash<HashMd5>(std::string("abc"))), "900150983cd24fb0d6963f7d28e17f72");
    ASSERT_EQ(toHex(calcHash<HashSha256>(std::string("abc"))), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    TempDir tmp;
    fs::path abc = writeTestFile(tmp / "abc.txt", "abc");
    fs::path empty = writeTestFile(tmp / "empty", "");
    HashOptions options;
    ASSERT_EQ(hashFile(abc, options), "900150983cd24fb0d6963f7d28e17f72");
    ASSERT_EQ(hashFile(empty, options), "d41d8cd98f00b204e9800998ecf8427e");
    options.algorithm = HashAlgorithm::Sha256;
    options.bufSize = 2;
    ASSERT_EQ(hashFile(abc, options), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

UNIT_TEST(ContentHasher_fastModeSamples)
{
    TempDir tmp;
    std::string content(64, 'a');
    std::string changedUnsampled = content;
    changedUnsampled[8] = 'b';
    std::string changedStart = content;
    changedStart[1] = 'b';
    fs::path base = writeTestFile(tmp / "base", content);
    fs::path unsampled = writeTestFile(tmp / "unsampled", changedUnsampled);
    fs::path start = writeTestFile(tmp / "start", changedStart);
    fs::path longer = writeTestFile(tmp / "longer", content + "a");

    HashOptions options;
    options.fastMode = true;
    options.fastThreshold = 16;
    options.sampleSize = 4;
    ASSERT_EQ(hashFile(base, options), hashFile(unsampled, options));
    ASSERT_EQ(hashFile(base, options) == hashFile(start, options), false);
    ASSERT_EQ(hashFile(base, options) == hashFile(longer, options), false);

    // Without fast mode every byte counts.
    options.fastMode = false;
    ASSERT_EQ(hashFile(base, options) == hashFile(unsampled, options), false);
}

UNIT_TEST(ContentHasher_fastModeBelowThresholdHashesFully)
{
    TempDir tmp;
    fs::path small = writeTestFile(tmp / "small", "abc");
    HashOptions options;
    options.fastMode = true;
    ASSERT_EQ(hashFile(small, options), "900150983cd24fb0d6963f7d28e17f72");
}

UNIT_TEST(ContentHasher_missingFileThrowsScanError)
{
    TempDir tmp;
    bool thrown = false;
    try
    {
        hashFile(tmp / "missing", HashOptions());
    }
    catch (const ScanError&)
    {
        thrown = true;
    }
    ASSERT_EQ(thrown, true);
}

UNIT_TEST(ContentHasher_sizeMismatchThrowsScanError)
{
    // Proc files report size 0 but deliver content, like a read which ends short of the stat size.
    bool thrown = false;
    try
    {
        hashFile("/proc/self/status", HashOptions());
    }
    catch (const ScanError& e)
    {
        thrown = std::string(e.what()).find("of 0 bytes") != std::string::npos;
    }
    ASSERT_EQ(thrown, true);
}
