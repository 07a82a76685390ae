// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/util/chainharness.h"

#include "chainparams.h"
#include "consensus/tx_verify.h"
#include "consensus/validation.h"
#include "logging.h"
#include "streams.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "validation.h"
#include "version.h"

#include <stdexcept>

CChainHarness::CChainHarness(const CChainParams& params) : chainParams(params)
{
    const CBlock& genesis = params.GenesisBlock();
    std::unique_ptr<BlockIndex> pindex(new BlockIndex());
    pindex->block = std::make_shared<const CBlock>(genesis);
    pindex->hash = genesis.GetHash();
    pindex->pprev = nullptr;
    pindex->nHeight = 0;
    pindex->fInvalid = false;
    vChain.push_back(pindex.get());
    mapBlockIndex.emplace(pindex->hash, std::move(pindex));

    for (const CTransactionRef& tx : genesis.vtx)
        AddCoins(coins, *tx, 0);

    if (!adminState.InitFromGenesis(genesis, params.GenesisAdminKeys()))
        throw std::runtime_error("genesis block lacks an admin thread baton");
}

void CChainHarness::AddCoins(CoinsMap& view, const CTransaction& tx, uint32_t nHeight)
{
    const uint256 txid = tx.GetHash();
    for (uint32_t i = 0; i < tx.vout.size(); i++) {
        if (tx.vout[i].scriptPubKey.IsUnspendable())
            continue;
        view[COutPoint(txid, i)] = Coin{tx.vout[i], nHeight, tx.IsCoinBase()};
    }
}

bool CChainHarness::IsInActiveChain(const uint256& hash) const
{
    auto it = mapBlockIndex.find(hash);
    if (it == mapBlockIndex.end())
        return false;
    const BlockIndex* pindex = it->second.get();
    return pindex->nHeight < vChain.size() && vChain[pindex->nHeight] == pindex;
}

bool CChainHarness::ConnectBlock(const BlockIndex* pindex, CValidationState& state)
{
    const CBlock& block = *pindex->block;
    const Consensus::Params& consensus = chainParams.GetConsensus();

    // Work on copies so a failing block leaves nothing behind
    CoinsMap view(coins);
    CAdminState newAdminState(adminState);
    BlockUndo undo;
    CAmount nFees = 0;

    for (const CTransactionRef& ptx : block.vtx) {
        const CTransaction& tx = *ptx;
        undo.vtxSpent.emplace_back();
        if (!tx.IsCoinBase()) {
            CAmount nValueIn = 0;
            for (const CTxIn& txin : tx.vin) {
                auto it = view.find(txin.prevout);
                if (it == view.end())
                    return state.DoS(100, false, REJECT_INVALID, "bad-txns-inputs-missingorspent", false,
                                     strprintf("%s: inputs missing/spent", __func__));
                const Coin& coin = it->second;
                if (coin.fCoinBase && (int64_t)pindex->nHeight - coin.nHeight < consensus.nCoinbaseMaturity)
                    return state.Invalid(false, REJECT_INVALID, "bad-txns-premature-spend-of-coinbase",
                                         strprintf("tried to spend coinbase at depth %d", pindex->nHeight - coin.nHeight));
                nValueIn += coin.out.nValue;
                if (!consensus.MoneyRange(coin.out.nValue) || !consensus.MoneyRange(nValueIn))
                    return state.DoS(100, false, REJECT_INVALID, "bad-txns-inputvalues-outofrange");
                undo.vtxSpent.back().emplace_back(txin.prevout, coin);
                view.erase(it);
            }

            const CAmount nValueOut = tx.GetValueOut();
            if (nValueIn < nValueOut)
                return state.DoS(100, false, REJECT_INVALID, "bad-txns-in-belowout", false,
                                 strprintf("value in (%s) < value out (%s)", FormatMoney(nValueIn), FormatMoney(nValueOut)));
            nFees += nValueIn - nValueOut;

            ThreadID thread;
            const bool fSpendsBaton = newAdminState.SpendsThreadTip(tx, thread);
            if (!CheckAdminThreadOutputs(tx, fSpendsBaton, state))
                return false;
            if (fSpendsBaton) {
                CAdminTxUndo adminUndo;
                if (!newAdminState.ConnectAdminTransaction(tx, thread, adminUndo, state))
                    return false;
                undo.vAdminUndo.push_back(adminUndo);
                undo.vAdminTx.push_back(ptx);
            }
        }
        AddCoins(view, tx, pindex->nHeight);
    }

    if (!CheckCoinbaseAmount(block, nFees, state, consensus))
        return false;

    coins.swap(view);
    adminState = newAdminState;
    mapUndo[pindex->hash] = std::move(undo);
    LogPrint(BCLog::VALIDATION, "%s: connected %s at height %u\n", __func__, pindex->hash.ToString(), pindex->nHeight);
    return true;
}

bool CChainHarness::DisconnectBlock(const BlockIndex* pindex, CValidationState& state)
{
    auto itUndo = mapUndo.find(pindex->hash);
    if (itUndo == mapUndo.end())
        return state.Error(strprintf("%s: no undo data for %s", __func__, pindex->hash.ToString()));
    const BlockUndo& undo = itUndo->second;
    const CBlock& block = *pindex->block;

    for (size_t i = undo.vAdminUndo.size(); i-- > 0;) {
        if (!adminState.DisconnectAdminTransaction(*undo.vAdminTx[i], undo.vAdminUndo[i], state))
            return false;
    }

    // Reverse order, so outputs spent within the block come back before the
    // transaction creating them is undone
    for (size_t i = block.vtx.size(); i-- > 0;) {
        const CTransaction& tx = *block.vtx[i];
        for (uint32_t j = 0; j < tx.vout.size(); j++)
            coins.erase(COutPoint(tx.GetHash(), j));
        for (const auto& spent : undo.vtxSpent[i])
            coins[spent.first] = spent.second;
    }

    mapUndo.erase(itUndo);
    LogPrint(BCLog::VALIDATION, "%s: disconnected %s at height %u\n", __func__, pindex->hash.ToString(), pindex->nHeight);
    return true;
}

bool CChainHarness::ActivateBranch(BlockIndex* pindexNew, CValidationState& state)
{
    // Blocks to connect, fork point excluded, oldest first
    std::vector<BlockIndex*> vConnect;
    BlockIndex* pindexFork = pindexNew;
    while (!(pindexFork->nHeight < vChain.size() && vChain[pindexFork->nHeight] == pindexFork)) {
        vConnect.insert(vConnect.begin(), pindexFork);
        pindexFork = pindexFork->pprev;
    }

    std::vector<BlockIndex*> vDisconnected;
    while (vChain.back() != pindexFork) {
        if (!DisconnectBlock(vChain.back(), state))
            return false;
        vDisconnected.push_back(vChain.back());
        vChain.pop_back();
    }

    for (size_t i = 0; i < vConnect.size(); i++) {
        if (ConnectBlock(vConnect[i], state)) {
            vChain.push_back(vConnect[i]);
            continue;
        }

        const std::string strReason = state.GetRejectReason();
        for (size_t j = i; j < vConnect.size(); j++) {
            vConnect[j]->fInvalid = true;
            vConnect[j]->strInvalidReason = strReason;
        }
        LogPrint(BCLog::VALIDATION, "%s: %s failed to connect (%s), restoring previous chain\n", __func__,
                 vConnect[i]->hash.ToString(), FormatStateMessage(state));

        CValidationState stateRestore;
        while (vChain.back() != pindexFork) {
            if (!DisconnectBlock(vChain.back(), stateRestore))
                throw std::runtime_error(strprintf("cannot roll back %s: %s", vChain.back()->hash.ToString(), FormatStateMessage(stateRestore)));
            vChain.pop_back();
        }
        for (auto it = vDisconnected.rbegin(); it != vDisconnected.rend(); ++it) {
            if (!ConnectBlock(*it, stateRestore))
                throw std::runtime_error(strprintf("cannot reconnect %s: %s", (*it)->hash.ToString(), FormatStateMessage(stateRestore)));
            vChain.push_back(*it);
        }
        return false;
    }
    return true;
}

bool CChainHarness::ProcessBlock(const std::shared_ptr<const CBlock>& block, CValidationState& state, bool& fOrphanRet)
{
    fOrphanRet = false;
    const uint256 hash = block->GetHash();
    const Consensus::Params& consensus = chainParams.GetConsensus();

    auto itIndex = mapBlockIndex.find(hash);
    if (itIndex != mapBlockIndex.end()) {
        if (itIndex->second->fInvalid)
            return state.Invalid(false, REJECT_INVALID, itIndex->second->strInvalidReason);
        return state.Invalid(false, REJECT_DUPLICATE, "duplicate");
    }

    if (!CheckBlock(*block, state, consensus))
        return false;

    auto itPrev = mapBlockIndex.find(block->hashPrevBlock);
    if (itPrev == mapBlockIndex.end()) {
        mapOrphans[hash] = block;
        fOrphanRet = true;
        LogPrint(BCLog::VALIDATION, "%s: orphan %s, parent %s unknown\n", __func__, hash.ToString(), block->hashPrevBlock.ToString());
        return true;
    }
    BlockIndex* pindexPrev = itPrev->second.get();
    if (pindexPrev->fInvalid)
        return state.DoS(100, false, REJECT_INVALID, "bad-prevblk");

    if (!ContextualCheckBlockHeader(*block, state, consensus, pindexPrev->nHeight, pindexPrev->block->GetBlockTime()))
        return false;

    std::unique_ptr<BlockIndex> pindexNew(new BlockIndex());
    pindexNew->block = block;
    pindexNew->hash = hash;
    pindexNew->pprev = pindexPrev;
    pindexNew->nHeight = pindexPrev->nHeight + 1;
    pindexNew->fInvalid = false;
    BlockIndex* pindex = pindexNew.get();
    mapBlockIndex.emplace(hash, std::move(pindexNew));

    // Side chains are stored unvalidated until they carry the most blocks
    if (pindex->nHeight <= GetTipHeight())
        return true;

    return ActivateBranch(pindex, state);
}

bool CChainHarness::ProcessRawBlock(const std::vector<unsigned char>& vchBlock, CValidationState& state, bool& fOrphanRet)
{
    fOrphanRet = false;
    std::shared_ptr<CBlock> block = std::make_shared<CBlock>();
    CDataStream ssBlock(vchBlock, SER_NETWORK, PROTOCOL_VERSION);
    try {
        ssBlock >> *block;
    } catch (const std::exception& e) {
        return state.DoS(100, false, REJECT_INVALID, "bad-blk-encoding", false, e.what());
    }
    if (!ssBlock.empty())
        return state.DoS(100, false, REJECT_INVALID, "bad-blk-encoding", false, "trailing data");
    return ProcessBlock(block, state, fOrphanRet);
}

namespace {

class CheckInstanceVisitor : public boost::static_visitor<bool>
{
private:
    CChainHarness& harness;
    std::string& strError;

    bool Fail(const std::string& strName, const std::string& strWhat) const
    {
        strError = strprintf("%s: %s", strName, strWhat);
        return false;
    }

public:
    CheckInstanceVisitor(CChainHarness& harnessIn, std::string& strErrorIn) : harness(harnessIn), strError(strErrorIn) {}

    bool operator()(const AcceptedBlock& accepted) const
    {
        CValidationState state;
        bool fOrphan;
        if (!harness.ProcessBlock(accepted.block, state, fOrphan))
            return Fail(accepted.name, strprintf("rejected (%s), expected accepted", FormatStateMessage(state)));
        if (fOrphan != accepted.fOrphan)
            return Fail(accepted.name, strprintf("orphan=%d, expected %d", fOrphan, accepted.fOrphan));
        const bool fMainChain = harness.GetTipHash() == accepted.block->GetHash();
        if (fMainChain != accepted.fMainChain)
            return Fail(accepted.name, strprintf("main chain=%d, expected %d", fMainChain, accepted.fMainChain));
        const CAdminKeySnapshot keys = harness.GetAdminState().GetSnapshot();
        if (keys != accepted.keySnapshot)
            return Fail(accepted.name, strprintf("admin keys %s, expected %s", keys.ToString(), accepted.keySnapshot.ToString()));
        return true;
    }

    bool operator()(const RejectedBlock& rejected) const
    {
        CValidationState state;
        bool fOrphan;
        if (harness.ProcessBlock(rejected.block, state, fOrphan))
            return Fail(rejected.name, strprintf("accepted (orphan=%d), expected rejection %s", fOrphan, rejected.strRejectReason));
        if (state.GetRejectReason() != rejected.strRejectReason)
            return Fail(rejected.name, strprintf("rejected for %s, expected %s", FormatStateMessage(state), rejected.strRejectReason));
        return true;
    }

    bool operator()(const OrphanOrRejectedBlock& orphan) const
    {
        CValidationState state;
        bool fOrphan;
        if (harness.ProcessBlock(orphan.block, state, fOrphan) && !fOrphan)
            return Fail(orphan.name, "accepted, expected orphan or rejection");
        return true;
    }

    bool operator()(const ExpectedTip& tip) const
    {
        if (harness.GetTipHash() != tip.block->GetHash())
            return Fail(tip.name, strprintf("tip is %s at height %u", harness.GetTipHash().ToString(), harness.GetTipHeight()));
        return true;
    }

    bool operator()(const RejectedNonCanonicalBlock& noncanonical) const
    {
        CValidationState state;
        bool fOrphan;
        if (harness.ProcessRawBlock(noncanonical.vchRawBlock, state, fOrphan))
            return Fail(noncanonical.name, "non-canonical encoding accepted");
        return true;
    }
};

} // namespace

bool CheckTestInstance(CChainHarness& harness, const TestInstance& instance, std::string& strError)
{
    return boost::apply_visitor(CheckInstanceVisitor(harness, strError), instance);
}
