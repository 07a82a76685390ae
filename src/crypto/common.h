// Copyright (c) 2014 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_CRYPTO_COMMON_H
#define GOVCHAIN_CRYPTO_COMMON_H

#include <stdint.h>
#include <string.h>

// Byte order helpers. All multi-byte integers on the wire are little-endian.

uint16_t static inline ReadLE16(const unsigned char* ptr)
{
    return (uint16_t)ptr[0] | ((uint16_t)ptr[1] << 8);
}

uint32_t static inline ReadLE32(const unsigned char* ptr)
{
    return (uint32_t)ptr[0] | ((uint32_t)ptr[1] << 8) | ((uint32_t)ptr[2] << 16) | ((uint32_t)ptr[3] << 24);
}

uint64_t static inline ReadLE64(const unsigned char* ptr)
{
    return (uint64_t)ReadLE32(ptr) | ((uint64_t)ReadLE32(ptr + 4) << 32);
}

void static inline WriteLE16(unsigned char* ptr, uint16_t x)
{
    ptr[0] = x & 0xff;
    ptr[1] = (x >> 8) & 0xff;
}

void static inline WriteLE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = x & 0xff;
    ptr[1] = (x >> 8) & 0xff;
    ptr[2] = (x >> 16) & 0xff;
    ptr[3] = (x >> 24) & 0xff;
}

void static inline WriteLE64(unsigned char* ptr, uint64_t x)
{
    WriteLE32(ptr, (uint32_t)x);
    WriteLE32(ptr + 4, (uint32_t)(x >> 32));
}

#endif // GOVCHAIN_CRYPTO_COMMON_H
