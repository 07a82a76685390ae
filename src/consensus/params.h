// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_CONSENSUS_PARAMS_H
#define GOVCHAIN_CONSENSUS_PARAMS_H

#include "amount.h"
#include "uint256.h"

#include <stdint.h>

namespace Consensus {

/**
 * Parameters that influence chain consensus.
 */
struct Params {
    uint256 hashGenesisBlock;

    // Proof of work: highest allowed target and its compact form
    uint256 powLimit;
    uint32_t nPowLimitBits;

    // Blocks a coinbase output has to wait before it can be spent
    int nCoinbaseMaturity;

    // Block reward: nInitialSubsidy, halved every nSubsidyHalvingInterval blocks
    CAmount nInitialSubsidy;
    int nSubsidyHalvingInterval;

    int64_t nTargetSpacing;

    CAmount nMaxMoneyOut;

    bool MoneyRange(const CAmount& nValue) const { return (nValue >= 0 && nValue <= nMaxMoneyOut); }
};
} // namespace Consensus

#endif // GOVCHAIN_CONSENSUS_PARAMS_H
