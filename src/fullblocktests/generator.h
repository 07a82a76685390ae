// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_FULLBLOCKTESTS_GENERATOR_H
#define GOVCHAIN_FULLBLOCKTESTS_GENERATOR_H

#include "amount.h"
#include "fullblocktests/testinstance.h"
#include "governance/adminstate.h"
#include "primitives/block.h"
#include "primitives/transaction.h"
#include "pubkey.h"
#include "script/adminop.h"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class CChainParams;

//! Blocks of the main chain and of the competing branch in the large reorg test
static const int LARGE_REORG_DEPTH = 15;

/** A transaction output available for spending, with what it pays. */
struct SpendableOutput
{
    COutPoint prevOut;
    CScript scriptPubKey;
    CAmount amount;

    SpendableOutput() : amount(0) {}
    SpendableOutput(const COutPoint& prevOutIn, const CScript& scriptPubKeyIn, CAmount amountIn)
        : prevOut(prevOutIn), scriptPubKey(scriptPubKeyIn), amount(amountIn) {}
};

SpendableOutput MakeSpendableOutForTx(const CTransaction& tx, uint32_t nOut);
SpendableOutput MakeSpendableOut(const CBlock& block, uint32_t nTx, uint32_t nOut);

/** Modifies a draft block before it is sealed */
typedef std::function<void(CBlock&)> BlockMunger;

/** Returns the scriptSig for input nIn of a transaction spending prevOut */
typedef std::function<CScript(const CMutableTransaction& tx, unsigned int nIn, const SpendableOutput& prevOut)> TxSigner;

/** Munger appending tx to the block */
BlockMunger AdditionalTx(const CTransactionRef& tx);

/**
 * Builds chains of blocks on top of the genesis block of a chain.
 *
 * Every block ever built stays addressable by name, so later blocks can
 * extend any of them. Governance state is only followed for the current
 * tip: SetTip() does not rewind it.
 */
class CTestGenerator
{
private:
    const CChainParams& chainParams;
    TxSigner signer;

    std::shared_ptr<CBlock> tip;
    std::string strTipName;
    uint32_t nTipHeight;

    std::map<std::string, std::shared_ptr<CBlock>> mapBlocksByName;
    std::map<std::string, uint32_t> mapBlockHeights;
    //! every transaction built, for baton lookups
    std::map<uint256, CTransactionRef> mapTransactions;

    std::deque<SpendableOutput> spendableOuts;
    uint256 hashPrevCollected;

    CAdminState adminState;
    //! feeds coinbase and output script uniqueness
    uint64_t nUniqueCounter;

    CScript GetUniqueAdminAuthScript();
    CScript Sign(const CMutableTransaction& tx, unsigned int nIn, const SpendableOutput& prevOut) const;
    void ConnectAdminTransactions(const CBlock& block, const std::string& strName);
    void CheckThreadBatons() const;

public:
    explicit CTestGenerator(const CChainParams& params, TxSigner signerIn = TxSigner());

    /**
     * Build a block on the current tip and make it the new tip.
     *
     * The block holds a coinbase paying the subsidy to a unique 2-of-3 admin
     * authorization script and, when spend is given, a transaction spending
     * it with a fee of 1. Mungers run in order on the draft. Afterwards the
     * merkle root is recomputed unless a munger changed it, and the header
     * is solved unless a munger moved the nonce off 0.
     *
     * @throws std::runtime_error when no nonce solves the header
     */
    CBlock& NextBlock(const std::string& strName, const SpendableOutput* spend, const std::vector<BlockMunger>& mungers = {});

    /** @throws std::runtime_error for an unknown name */
    void SetTip(const std::string& strName);

    /**
     * Queue the coinbase output of the tip for later spending.
     * @throws std::runtime_error when called twice for the same tip
     */
    void SaveTipCoinbaseOut();

    /** @throws std::runtime_error when no output is queued */
    SpendableOutput OldestCoinbaseOut();

    CTransactionRef CreateCoinbaseTx(uint32_t nHeight);
    CTransactionRef CreateSpendTx(const SpendableOutput& spend, CAmount nFee);
    CTransactionRef CreateAdminTx(const SpendableOutput& spend, ThreadID thread, AdminOpcode op, const CPubKey& pubKey);
    CTransactionRef CreateWspAdminTx(const SpendableOutput& spend, AdminOpcode op, const CPubKey& pubKey, const KeyID& keyID);

    /** The current baton of thread, as seen from the followed governance state */
    SpendableOutput GetThreadOut(ThreadID thread) const;

    const CBlock& GetTip() const { return *tip; }
    std::shared_ptr<const CBlock> GetTipRef() const { return tip; }
    const std::string& GetTipName() const { return strTipName; }
    uint32_t GetTipHeight() const { return nTipHeight; }
    bool HaveBlock(const std::string& strName) const { return mapBlocksByName.count(strName) != 0; }
    /** @throws std::runtime_error for an unknown name */
    std::shared_ptr<const CBlock> GetBlock(const std::string& strName) const;
    uint32_t GetBlockHeight(const std::string& strName) const;
    size_t GetSpendableOutputCount() const { return spendableOuts.size(); }
    const CAdminState& GetAdminState() const { return adminState; }
};

/**
 * Build the full admin thread scenario for the selected chain.
 *
 * On failure tests is left empty and strError holds the reason.
 */
bool Generate(bool fIncludeLargeReorg, std::vector<std::vector<TestInstance>>& tests, std::string& strError);

#endif // GOVCHAIN_FULLBLOCKTESTS_GENERATOR_H
