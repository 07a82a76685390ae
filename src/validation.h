// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2015-2022 The PIVX Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_VALIDATION_H
#define GOVCHAIN_VALIDATION_H

#include "amount.h"

#include <stdint.h>

class CBlock;
class CBlockHeader;
class CValidationState;

namespace Consensus {
struct Params;
}

/** Coinbase subsidy at nHeight: the initial subsidy halved every halving interval */
CAmount GetBlockSubsidy(int nHeight, const Consensus::Params& consensusParams);

/** Context-independent header checks */
bool CheckBlockHeader(const CBlockHeader& block, CValidationState& state, const Consensus::Params& consensusParams, bool fCheckPOW = true);

/** Context-independent validity checks */
bool CheckBlock(const CBlock& block, CValidationState& state, const Consensus::Params& consensusParams, bool fCheckPOW = true, bool fCheckMerkleRoot = true);

/** Header checks against the parent: height, difficulty bits and time */
bool ContextualCheckBlockHeader(const CBlockHeader& block, CValidationState& state, const Consensus::Params& consensusParams, uint32_t nPrevHeight, int64_t nPrevTime);

/** Coinbase may claim at most the subsidy plus the fees of the block */
bool CheckCoinbaseAmount(const CBlock& block, CAmount nFees, CValidationState& state, const Consensus::Params& consensusParams);

#endif // GOVCHAIN_VALIDATION_H
