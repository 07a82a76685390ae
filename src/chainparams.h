// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2014-2015 The Dash developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_CHAINPARAMS_H
#define GOVCHAIN_CHAINPARAMS_H

#include "consensus/params.h"
#include "governance/adminstate.h"
#include "primitives/block.h"

#include <memory>
#include <string>

namespace CBaseChainParams {
extern const std::string REGTEST;
}

/**
 * CChainParams defines various tweakable parameters of a given instance of the
 * system. Only the regression test network exists: the chain is used to
 * exercise admin thread governance, never to carry real value.
 */
class CChainParams
{
public:
    const Consensus::Params& GetConsensus() const { return consensus; }
    const CBlock& GenesisBlock() const { return genesis; }
    /** Key sets in force before any admin transaction is connected */
    const CAdminKeySnapshot& GenesisAdminKeys() const { return genesisAdminKeys; }
    const std::string& NetworkIDString() const { return strNetworkID; }
    bool IsRegTestNet() const { return NetworkIDString() == CBaseChainParams::REGTEST; }

    void UpdateCoinbaseMaturity(int nMaturity);

protected:
    CChainParams() {}

    std::string strNetworkID;
    CBlock genesis;
    CAdminKeySnapshot genesisAdminKeys;
    Consensus::Params consensus;
};

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CChainParams& Params();

/**
 * Creates and returns a std::unique_ptr<CChainParams> of the chosen chain.
 * @throws a std::runtime_error if the chain is not supported.
 */
std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain);

/**
 * Sets the params returned by Params() to those for the given network.
 * @throws a std::runtime_error if the network is not supported.
 */
void SelectParams(const std::string& chain);

/**
 * Allows modifying the coinbase maturity (regtest only).
 */
void UpdateCoinbaseMaturity(int nMaturity);

#endif // GOVCHAIN_CHAINPARAMS_H
