// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2015-2022 The PIVX Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "validation.h"

#include "consensus/consensus.h"
#include "consensus/merkle.h"
#include "consensus/params.h"
#include "consensus/tx_verify.h"
#include "consensus/validation.h"
#include "logging.h"
#include "pow.h"
#include "primitives/block.h"
#include "utilmoneystr.h"

CAmount GetBlockSubsidy(int nHeight, const Consensus::Params& consensusParams)
{
    const int nHalvings = nHeight / consensusParams.nSubsidyHalvingInterval;
    // Force block reward to zero when right shift is undefined.
    if (nHalvings >= 64)
        return 0;

    CAmount nSubsidy = consensusParams.nInitialSubsidy;
    nSubsidy >>= nHalvings;
    return nSubsidy;
}

bool CheckBlockHeader(const CBlockHeader& block, CValidationState& state, const Consensus::Params& consensusParams, bool fCheckPOW)
{
    // Check proof of work matches claimed amount
    if (fCheckPOW && !CheckProofOfWork(block.GetHash(), block.nBits, consensusParams))
        return state.DoS(50, false, REJECT_INVALID, "high-hash", false, "proof of work failed");

    return true;
}

bool CheckBlock(const CBlock& block, CValidationState& state, const Consensus::Params& consensusParams, bool fCheckPOW, bool fCheckMerkleRoot)
{
    // These are checks that are independent of context.

    if (!CheckBlockHeader(block, state, consensusParams, fCheckPOW))
        return false;

    // Check the merkle root.
    if (fCheckMerkleRoot) {
        bool mutated;
        uint256 hashMerkleRoot2 = BlockMerkleRoot(block, &mutated);
        if (block.hashMerkleRoot != hashMerkleRoot2)
            return state.DoS(100, false, REJECT_INVALID, "bad-txnmrklroot", true, "hashMerkleRoot mismatch");

        // Check for merkle tree malleability (CVE-2012-2459): repeating sequences
        // of transactions in a block without affecting the merkle root of a block,
        // while still invalidating it.
        if (mutated)
            return state.DoS(100, false, REJECT_INVALID, "bad-txns-duplicate", true, "duplicate transaction");
    }

    // Size limits
    const unsigned int nBlockSize = ::GetSerializeSize(block);
    if (block.vtx.empty() || block.vtx.size() > MAX_BLOCK_SIZE || nBlockSize > MAX_BLOCK_SIZE)
        return state.DoS(100, false, REJECT_INVALID, "bad-blk-length", false, "size limits failed");

    // First transaction must be coinbase, the rest must not be
    if (!block.vtx[0]->IsCoinBase())
        return state.DoS(100, false, REJECT_INVALID, "bad-cb-missing", false, "first tx is not coinbase");
    for (unsigned int i = 1; i < block.vtx.size(); i++)
        if (block.vtx[i]->IsCoinBase())
            return state.DoS(100, false, REJECT_INVALID, "bad-cb-multiple", false, "more than one coinbase");

    // Check transactions
    for (const auto& txIn : block.vtx) {
        const CTransaction& tx = *txIn;
        if (!CheckTransaction(tx, state, consensusParams)) {
            return state.Invalid(false, state.GetRejectCode(), state.GetRejectReason(),
                    strprintf("Transaction check failed (tx hash %s) %s", tx.GetHash().ToString(), state.GetDebugMessage()));
        }
    }

    // A coinbase never spends a baton, so it may not create one
    if (!CheckAdminThreadOutputs(*block.vtx[0], false, state))
        return false;

    return true;
}

bool ContextualCheckBlockHeader(const CBlockHeader& block, CValidationState& state, const Consensus::Params& consensusParams, uint32_t nPrevHeight, int64_t nPrevTime)
{
    if (block.nHeight != nPrevHeight + 1)
        return state.DoS(100, false, REJECT_INVALID, "bad-blk-height", false,
                         strprintf("height %u on parent at %u", block.nHeight, nPrevHeight));

    // No difficulty adjustment: every block carries the limit
    if (block.nBits != consensusParams.nPowLimitBits)
        return state.DoS(100, false, REJECT_INVALID, "bad-diffbits", false, "incorrect proof of work");

    if (block.GetBlockTime() <= nPrevTime)
        return state.Invalid(false, REJECT_INVALID, "time-too-old", "block's timestamp is too early");

    return true;
}

bool CheckCoinbaseAmount(const CBlock& block, CAmount nFees, CValidationState& state, const Consensus::Params& consensusParams)
{
    const CAmount nExpected = GetBlockSubsidy(block.nHeight, consensusParams) + nFees;
    const CAmount nActual = block.vtx[0]->GetValueOut();
    if (nActual > nExpected) {
        return state.DoS(100, error("%s: reward pays too much (actual=%s vs limit=%s)", __func__, FormatMoney(nActual), FormatMoney(nExpected)),
                         REJECT_INVALID, "bad-cb-amount");
    }
    return true;
}
