// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_POW_H
#define GOVCHAIN_POW_H

#include <boost/multiprecision/cpp_int.hpp>

#include <stdint.h>

class CBlockHeader;
class uint256;

namespace Consensus {
struct Params;
}

typedef boost::multiprecision::uint256_t pow_target_t;

/**
 * Decode a compact target. Returns false for a negative, zero or overflowing
 * encoding.
 */
bool DecodeCompactTarget(uint32_t nBits, pow_target_t& targetRet);

/** Block hash read as a little-endian 256-bit integer */
pow_target_t HashToTarget(const uint256& hash);

/** Check whether a block hash satisfies the proof-of-work requirement specified by nBits */
bool CheckProofOfWork(const uint256& hash, unsigned int nBits, const Consensus::Params& params);

/**
 * Search a nonce so that the header hash meets its own nBits target.
 *
 * The nonce range [nStartNonce, nStopNonce] is split in nThreads contiguous
 * slices, one search thread per slice, each on a private copy of the header.
 * The first thread to succeed cancels the others. nThreads 0 means one thread
 * per hardware core. Nonce 0 is never produced.
 *
 * @return false if every slice was exhausted; header is then unchanged
 */
bool SolveBlockHeader(CBlockHeader& header, int nThreads = 0, uint32_t nStartNonce = 1, uint32_t nStopNonce = 0xffffffff);

#endif // GOVCHAIN_POW_H
