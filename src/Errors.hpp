// Exception types.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <stdexcept>
#include <string>

namespace dupelink
{

/// A file or directory entry could not be read while indexing or hashing.
/// Callers decide whether to skip the file or abort.
class ScanError: public std::runtime_error
{
public:
    explicit ScanError(const std::string& what): std::runtime_error(what) {}
};

/// Invalid arguments or an unusable environment. Raised before any file is modified.
class SetupError: public std::runtime_error
{
public:
    explicit SetupError(const std::string& what): std::runtime_error(what) {}
};

} // namespace dupelink
