// File content hashing.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dupelink
{

class ProgressTracker;

enum class HashAlgorithm
{
    Md5,
    Sha256
};

static constexpr uint64_t kFastModeThreshold = 100ULL * 1024ULL * 1024ULL;
static constexpr uint64_t kSampleSize = 1024ULL * 1024ULL;
static constexpr size_t kDefaultBufSize = 1024ULL * 1024ULL;

/// How file content is turned into a digest.
///
/// Fast mode only applies to files of at least fastThreshold bytes. Such files are
/// identified by their size plus five sampleSize windows (start, 1/4, 1/2, 3/4, end)
/// instead of their full content. Two different large files with identical samples
/// and identical size get the same digest, so fast mode must be requested explicitly.
struct HashOptions
{
    HashAlgorithm algorithm{HashAlgorithm::Md5};
    bool fastMode{};
    uint64_t fastThreshold{kFastModeThreshold};
    uint64_t sampleSize{kSampleSize};
    size_t bufSize{kDefaultBufSize};
};

/// Algorithm name as used on the command line ("md5", "sha256").
std::string hashAlgorithmName(HashAlgorithm algorithm);

/// Parse algorithm name. Returns std::nullopt for unknown names.
std::optional<HashAlgorithm> parseHashAlgorithm(const std::string& name);

/// Hash the content of a file and return the digest as lowercase hex.
/// Throws ScanError if the file cannot be read.
std::string hashFile(const std::filesystem::path& path, const HashOptions& options, ProgressTracker* progress = nullptr);

/// Hash the size and five sample windows of a file.
/// Files of at most three windows are hashed completely (after the size).
/// Throws ScanError if the file cannot be read.
std::string hashFileSparse(const std::filesystem::path& path, HashAlgorithm algorithm, uint64_t fileSize, uint64_t sampleSize);

} // namespace dupelink
