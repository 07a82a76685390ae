// Copyright (c) 2015 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_CONSENSUS_MERKLE_H
#define GOVCHAIN_CONSENSUS_MERKLE_H

#include "primitives/block.h"
#include "uint256.h"

#include <vector>

/**
 * Compute the merkle root of a list of leaf hashes. An odd level duplicates
 * its last entry. When `mutated` is given it is set if two identical
 * adjacent hashes were combined at any level (CVE-2012-2459).
 */
uint256 ComputeMerkleRoot(std::vector<uint256> hashes, bool* mutated = nullptr);

/*
 * Compute the Merkle root of the transactions in a block.
 * *mutated is set to true if a duplicated subtree was found.
 */
uint256 BlockMerkleRoot(const CBlock& block, bool* mutated = nullptr);

#endif // GOVCHAIN_CONSENSUS_MERKLE_H
