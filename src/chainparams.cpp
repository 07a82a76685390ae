// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2014-2015 The Dash developers
// Copyright (c) 2015-2022 The PIVX Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"

#include "consensus/merkle.h"
#include "script/standard.h"
#include "utilstrencodings.h"

#include <stdexcept>
#include <string.h>

const std::string CBaseChainParams::REGTEST = "regtest";

/**
 * Build the genesis block. Its coinbase creates the first baton of every
 * admin thread, in thread order, and pays nothing else.
 */
static CBlock CreateGenesisBlock(const char* pszTimestamp, uint32_t nTime, uint32_t nNonce, uint32_t nBits, int32_t nVersion)
{
    CMutableTransaction txNew;
    txNew.nVersion = 1;
    txNew.vin.resize(1);
    txNew.vin[0].scriptSig = CScript() << 486604799 << CScriptNum(4) << std::vector<unsigned char>((const unsigned char*)pszTimestamp, (const unsigned char*)pszTimestamp + strlen(pszTimestamp));

    txNew.vout.resize(THREAD_COUNT);
    for (int i = 0; i < THREAD_COUNT; i++) {
        txNew.vout[i].nValue = 0;
        txNew.vout[i].scriptPubKey = GetScriptForThread((ThreadID)i);
    }

    CBlock genesis;
    genesis.vtx.push_back(std::make_shared<const CTransaction>(std::move(txNew)));
    genesis.hashPrevBlock.SetNull();
    genesis.nVersion = nVersion;
    genesis.nTime    = nTime;
    genesis.nBits    = nBits;
    genesis.nHeight  = 0;
    genesis.nNonce   = nNonce;
    genesis.hashMerkleRoot = BlockMerkleRoot(genesis);
    return genesis;
}

static CPubKey PubKeyFromHex(const char* pszHex)
{
    const std::vector<unsigned char> vch = ParseHex(pszHex);
    CPubKey pubKey(vch);
    if (!pubKey.IsValid() || !pubKey.IsCompressed())
        throw std::runtime_error(strprintf("%s: invalid genesis admin key %s", __func__, pszHex));
    return pubKey;
}

void CChainParams::UpdateCoinbaseMaturity(int nMaturity)
{
    if (!IsRegTestNet())
        throw std::runtime_error(strprintf("%s: only available for regtest", __func__));
    if (nMaturity < 1)
        throw std::runtime_error(strprintf("%s: coinbase maturity must be positive, got %d", __func__, nMaturity));
    consensus.nCoinbaseMaturity = nMaturity;
}

class CRegTestParams : public CChainParams
{
public:
    CRegTestParams()
    {
        strNetworkID = CBaseChainParams::REGTEST;

        // The genesis block is trusted as configured and never checked for
        // proof of work.
        genesis = CreateGenesisBlock("GOVCHAIN regtest genesis - root, provision and issue threads", 1296688602, 0, 0x207fffff, 1);
        consensus.hashGenesisBlock = genesis.GetHash();

        consensus.powLimit = uint256S("0x7fffff0000000000000000000000000000000000000000000000000000000000");
        consensus.nPowLimitBits = 0x207fffff;
        consensus.nCoinbaseMaturity = 100;
        consensus.nInitialSubsidy = 50 * COIN;
        consensus.nSubsidyHalvingInterval = 150;
        consensus.nTargetSpacing = 2 * 60;
        consensus.nMaxMoneyOut = MAX_MONEY;

        // Genesis admin keys: two root keys, one provision key and one
        // validate key. The issue set and the WSP map start empty.
        CPubKeySet& rootKeys = genesisAdminKeys.GetKeySet(ROOT_KEY_SET);
        rootKeys.push_back(PubKeyFromHex("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"));
        rootKeys.push_back(PubKeyFromHex("02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"));
        genesisAdminKeys.GetKeySet(PROVISION_KEY_SET).push_back(PubKeyFromHex("02f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9"));
        genesisAdminKeys.GetKeySet(VALIDATE_KEY_SET).push_back(PubKeyFromHex("02e493dbf1c10d80f3581e4904930b1404cc6c13900ee0758474fa94abe8c4cd13"));
    }
};

static std::unique_ptr<CChainParams> globalChainParams;

const CChainParams& Params()
{
    if (!globalChainParams)
        throw std::runtime_error(strprintf("%s: no chain selected", __func__));
    return *globalChainParams;
}

std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain)
{
    if (chain == CBaseChainParams::REGTEST)
        return std::unique_ptr<CChainParams>(new CRegTestParams());
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}

void SelectParams(const std::string& network)
{
    globalChainParams = CreateChainParams(network);
}

void UpdateCoinbaseMaturity(int nMaturity)
{
    if (!globalChainParams)
        throw std::runtime_error(strprintf("%s: no chain selected", __func__));
    globalChainParams->UpdateCoinbaseMaturity(nMaturity);
}
