// Message digests backed by OpenSSL EVP.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <openssl/evp.h>
#include <stdint.h>
#include <stdexcept>
#include <vector>

namespace dupelink
{

/// Streaming digest with the same update()/finalize() interface as all hash classes in Hash.hpp.
/// Please use class HashMd5 or HashSha256 instead (see bottom of file).
class HashEvp
{
public:
    explicit HashEvp(const EVP_MD *md_):
    md(md_),
    ctx(EVP_MD_CTX_new())
    {
        if (ctx == nullptr)
        {
            throw std::runtime_error("Cannot allocate digest context.");
        }
        clear();
    }

    ~HashEvp()
    {
        EVP_MD_CTX_free(ctx);
    }

    HashEvp(const HashEvp&) = delete;
    HashEvp& operator=(const HashEvp&) = delete;

    /// Initialize hasher.
    /// Call this after retrieving the hash and before calculating a new hash of new data.
    void clear()
    {
        if (EVP_DigestInit_ex(ctx, md, nullptr) != 1)
        {
            throw std::runtime_error("Cannot initialize digest.");
        }
    }

    /// Add data.
    void update(const uint8_t *bytes, size_t n)
    {
        if (n == 0)
        {
            return;
        }
        if (EVP_DigestUpdate(ctx, bytes, n) != 1)
        {
            throw std::runtime_error("Cannot update digest.");
        }
    }

    /// Get hash.
    std::vector<uint8_t> finalize()
    {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx, digest, &len) != 1)
        {
            throw std::runtime_error("Cannot finalize digest.");
        }
        return std::vector<uint8_t>(digest, digest + len);
    }

private:
    /// Digest algorithm.
    const EVP_MD *md;

    /// Digest state.
    EVP_MD_CTX *ctx;
};

/// Supported digests.
class HashMd5: public HashEvp { public: HashMd5(): HashEvp(EVP_md5()) {} };
class HashSha256: public HashEvp { public: HashSha256(): HashEvp(EVP_sha256()) {} };

} // namespace dupelink
