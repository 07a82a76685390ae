// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_CONSENSUS_CONSENSUS_H
#define GOVCHAIN_CONSENSUS_CONSENSUS_H

/** The maximum allowed size for a serialized block, in bytes (network rule) */
static const unsigned int MAX_BLOCK_SIZE = 2000000;
/** The maximum allowed size for a serialized transaction, in bytes */
static const unsigned int MAX_TX_SIZE = 100000;
/** Coinbase scriptSig length bounds */
static const unsigned int MIN_COINBASE_SCRIPTSIG_SIZE = 2;
static const unsigned int MAX_COINBASE_SCRIPTSIG_SIZE = 100;

#endif // GOVCHAIN_CONSENSUS_CONSENSUS_H
