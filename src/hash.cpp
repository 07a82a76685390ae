// Copyright (c) 2013-2014 The Bitcoin developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"

#include <stdexcept>

CHash256::CHash256() : ctx(EVP_MD_CTX_new())
{
    if (!ctx)
        throw std::runtime_error("CHash256: EVP_MD_CTX_new failed");
    Reset();
}

CHash256& CHash256::Reset()
{
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("CHash256: EVP_DigestInit_ex failed");
    return *this;
}

CHash256& CHash256::Write(const unsigned char* data, size_t len)
{
    if (EVP_DigestUpdate(ctx.get(), data, len) != 1)
        throw std::runtime_error("CHash256: EVP_DigestUpdate failed");
    return *this;
}

void CHash256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int nLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), buf, &nLen) != 1 || nLen != OUTPUT_SIZE)
        throw std::runtime_error("CHash256: EVP_DigestFinal_ex failed");
    SHA256Bytes(buf, OUTPUT_SIZE, hash);
}

void SHA256Bytes(const unsigned char* data, size_t len, unsigned char out[CHash256::OUTPUT_SIZE])
{
    unsigned int nLen = 0;
    if (EVP_Digest(data, len, out, &nLen, EVP_sha256(), nullptr) != 1 || nLen != CHash256::OUTPUT_SIZE)
        throw std::runtime_error("SHA256Bytes: EVP_Digest failed");
}
