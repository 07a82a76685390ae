// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fullblocktests/generator.h"

#include "chainparams.h"
#include "consensus/merkle.h"
#include "consensus/validation.h"
#include "hash.h"
#include "logging.h"
#include "pow.h"
#include "script/standard.h"
#include "streams.h"
#include "util/time.h"
#include "utilstrencodings.h"
#include "validation.h"
#include "version.h"

#include <stdexcept>

//! KeyIDs every generated payment script can be spent with
static const KeyID PAYMENT_KEY_ID1(0x00000001);
static const KeyID PAYMENT_KEY_ID2(0x00000002);

//! Spacing of generated block timestamps
static const int64_t BLOCK_TIME_STEP = 2 * 60;

//! The scenario spends the first 11 collected coinbase outputs
static const int MIN_SCENARIO_MATURITY = 11;

SpendableOutput MakeSpendableOutForTx(const CTransaction& tx, uint32_t nOut)
{
    if (nOut >= tx.vout.size())
        throw std::runtime_error(strprintf("%s: %s has no output %u", __func__, tx.GetHash().ToString(), nOut));
    return SpendableOutput(COutPoint(tx.GetHash(), nOut), tx.vout[nOut].scriptPubKey, tx.vout[nOut].nValue);
}

SpendableOutput MakeSpendableOut(const CBlock& block, uint32_t nTx, uint32_t nOut)
{
    if (nTx >= block.vtx.size())
        throw std::runtime_error(strprintf("%s: block %s has no transaction %u", __func__, block.GetHash().ToString(), nTx));
    return MakeSpendableOutForTx(*block.vtx[nTx], nOut);
}

BlockMunger AdditionalTx(const CTransactionRef& tx)
{
    return [tx](CBlock& block) { block.vtx.push_back(tx); };
}

CTestGenerator::CTestGenerator(const CChainParams& params, TxSigner signerIn)
    : chainParams(params),
      signer(signerIn),
      nTipHeight(0),
      nUniqueCounter(0)
{
    tip = std::make_shared<CBlock>(params.GenesisBlock());
    strTipName = "genesis";
    mapBlocksByName[strTipName] = tip;
    mapBlockHeights[strTipName] = 0;
    for (const CTransactionRef& tx : tip->vtx)
        mapTransactions[tx->GetHash()] = tx;

    if (!adminState.InitFromGenesis(*tip, params.GenesisAdminKeys()))
        throw std::runtime_error("genesis block does not create a baton for every admin thread");
}

CScript CTestGenerator::GetUniqueAdminAuthScript()
{
    // A fresh key hash per script keeps transaction hashes from colliding,
    // while the two KeyIDs stay the same so one signer can spend them all.
    CHashWriter ss(SER_GETHASH, 0);
    ss << std::string("govchain-blockgen") << nUniqueCounter++;
    const uint256 hash = ss.GetHash();
    const uint160 keyHash(std::vector<unsigned char>(hash.begin(), hash.begin() + uint160::size()));
    return GetScriptForAdminAuth(keyHash, {PAYMENT_KEY_ID1, PAYMENT_KEY_ID2});
}

CScript CTestGenerator::Sign(const CMutableTransaction& tx, unsigned int nIn, const SpendableOutput& prevOut) const
{
    if (!signer)
        return CScript();
    return signer(tx, nIn, prevOut);
}

CTransactionRef CTestGenerator::CreateCoinbaseTx(uint32_t nHeight)
{
    CMutableTransaction tx;
    tx.vin.resize(1);
    tx.vin[0].prevout.SetNull();
    tx.vin[0].scriptSig = CScript() << (int64_t)nHeight << (int64_t)nUniqueCounter;
    tx.vout.resize(1);
    tx.vout[0].nValue = GetBlockSubsidy(nHeight, chainParams.GetConsensus());
    tx.vout[0].scriptPubKey = GetUniqueAdminAuthScript();
    return MakeTransactionRef(std::move(tx));
}

CTransactionRef CTestGenerator::CreateSpendTx(const SpendableOutput& spend, CAmount nFee)
{
    CMutableTransaction tx;
    tx.vin.emplace_back(spend.prevOut);
    tx.vout.emplace_back(spend.amount - nFee, GetUniqueAdminAuthScript());
    tx.vin[0].scriptSig = Sign(tx, 0, spend);
    return MakeTransactionRef(std::move(tx));
}

CTransactionRef CTestGenerator::CreateAdminTx(const SpendableOutput& spend, ThreadID thread, AdminOpcode op, const CPubKey& pubKey)
{
    CMutableTransaction tx;
    tx.vin.emplace_back(spend.prevOut);
    // Admin transactions move no value
    tx.vout.emplace_back(0, GetScriptForThread(thread));
    tx.vout.emplace_back(0, GetScriptForAdminAction(op, pubKey));
    tx.vin[0].scriptSig = Sign(tx, 0, spend);
    return MakeTransactionRef(std::move(tx));
}

CTransactionRef CTestGenerator::CreateWspAdminTx(const SpendableOutput& spend, AdminOpcode op, const CPubKey& pubKey, const KeyID& keyID)
{
    CMutableTransaction tx;
    tx.vin.emplace_back(spend.prevOut);
    tx.vout.emplace_back(0, GetScriptForThread(PROVISION_THREAD));
    tx.vout.emplace_back(0, GetScriptForWspAdminAction(op, pubKey, keyID));
    tx.vin[0].scriptSig = Sign(tx, 0, spend);
    return MakeTransactionRef(std::move(tx));
}

void CTestGenerator::ConnectAdminTransactions(const CBlock& block, const std::string& strName)
{
    // All admin transactions of the block apply, or none does
    CAdminState newState(adminState);
    for (size_t i = 1; i < block.vtx.size(); i++) {
        const CTransaction& tx = *block.vtx[i];
        ThreadID thread;
        if (!newState.SpendsThreadTip(tx, thread))
            continue;
        CAdminTxUndo undo;
        CValidationState state;
        if (!newState.ConnectAdminTransaction(tx, thread, undo, state)) {
            LogPrint(BCLog::BLOCKGEN, "%s: admin state not advanced by %s: %s\n", __func__, strName, FormatStateMessage(state));
            return;
        }
    }
    adminState = newState;
}

void CTestGenerator::CheckThreadBatons() const
{
    for (int i = 0; i < THREAD_COUNT; i++) {
        const ThreadID thread = (ThreadID)i;
        const COutPoint& batonOut = adminState.GetThreadTip(thread);
        auto it = mapTransactions.find(batonOut.hash);
        ThreadID batonThread;
        if (batonOut.IsNull() || it == mapTransactions.end() || batonOut.n >= it->second->vout.size() ||
            !IsThreadScript(it->second->vout[batonOut.n].scriptPubKey, batonThread) || batonThread != thread) {
            throw std::runtime_error(strprintf("%s thread has no live baton after %s (%s)", GetThreadName(thread), strTipName, batonOut.ToString()));
        }
    }
}

CBlock& CTestGenerator::NextBlock(const std::string& strName, const SpendableOutput* spend, const std::vector<BlockMunger>& mungers)
{
    const uint32_t nHeight = nTipHeight + 1;

    // Coinbase, claiming the fee of the spend transaction when there is one
    CTransactionRef coinbaseTx = CreateCoinbaseTx(nHeight);
    std::vector<CTransactionRef> vtx;
    if (spend) {
        const CAmount nFee = 1;
        CMutableTransaction coinbase(*coinbaseTx);
        coinbase.vout[0].nValue += nFee;
        vtx.push_back(MakeTransactionRef(std::move(coinbase)));
        vtx.push_back(CreateSpendTx(*spend, nFee));
    } else {
        vtx.push_back(coinbaseTx);
    }

    // First block after genesis takes the current time, then fixed steps
    const int64_t nTime = (nHeight == 1) ? GetTime() : tip->GetBlockTime() + BLOCK_TIME_STEP;

    std::shared_ptr<CBlock> block = std::make_shared<CBlock>();
    block->vtx = vtx;
    block->nVersion = 1;
    block->hashPrevBlock = tip->GetHash();
    block->nTime = nTime;
    block->nBits = chainParams.GetConsensus().nPowLimitBits;
    block->nHeight = nHeight;
    block->nNonce = 0;
    block->hashMerkleRoot = BlockMerkleRoot(*block);

    // Only recompute the merkle root when no munger set one, and only solve
    // when no munger chose a nonce.
    const uint256 hashCurMerkleRoot = block->hashMerkleRoot;
    const uint32_t nCurNonce = block->nNonce;
    for (const BlockMunger& munger : mungers)
        munger(*block);
    if (block->hashMerkleRoot == hashCurMerkleRoot)
        block->hashMerkleRoot = BlockMerkleRoot(*block);
    if (block->nNonce == nCurNonce && !SolveBlockHeader(*block))
        throw std::runtime_error(strprintf("Unable to solve block at height %u", nHeight));

    const uint256 hash = block->GetHash();
    mapBlocksByName[strName] = block;
    mapBlockHeights[strName] = nHeight;
    for (const CTransactionRef& tx : block->vtx)
        mapTransactions[tx->GetHash()] = tx;
    tip = block;
    strTipName = strName;
    nTipHeight = nHeight;

    LogPrint(BCLog::BLOCKGEN, "%s: %s at height %u, %u txs, hash %s\n", __func__, strName, nHeight, block->vtx.size(), hash.ToString());

    ConnectAdminTransactions(*block, strName);
    CheckThreadBatons();
    return *block;
}

void CTestGenerator::SetTip(const std::string& strName)
{
    auto it = mapBlocksByName.find(strName);
    if (it == mapBlocksByName.end())
        throw std::runtime_error(strprintf("%s: unknown block %s", __func__, strName));
    tip = it->second;
    strTipName = strName;
    nTipHeight = mapBlockHeights.at(strName);
}

void CTestGenerator::SaveTipCoinbaseOut()
{
    if (tip->GetHash() == hashPrevCollected)
        throw std::runtime_error(strprintf("%s: coinbase of %s already saved", __func__, strTipName));
    spendableOuts.push_back(MakeSpendableOut(*tip, 0, 0));
    hashPrevCollected = tip->GetHash();
}

SpendableOutput CTestGenerator::OldestCoinbaseOut()
{
    if (spendableOuts.empty())
        throw std::runtime_error(strprintf("%s: no spendable output saved", __func__));
    SpendableOutput out = spendableOuts.front();
    spendableOuts.pop_front();
    return out;
}

SpendableOutput CTestGenerator::GetThreadOut(ThreadID thread) const
{
    const COutPoint& batonOut = adminState.GetThreadTip(thread);
    auto it = mapTransactions.find(batonOut.hash);
    if (it == mapTransactions.end())
        throw std::runtime_error(strprintf("%s: %s baton %s unknown", __func__, GetThreadName(thread), batonOut.ToString()));
    return MakeSpendableOutForTx(*it->second, batonOut.n);
}

std::shared_ptr<const CBlock> CTestGenerator::GetBlock(const std::string& strName) const
{
    auto it = mapBlocksByName.find(strName);
    if (it == mapBlocksByName.end())
        throw std::runtime_error(strprintf("%s: unknown block %s", __func__, strName));
    return it->second;
}

uint32_t CTestGenerator::GetBlockHeight(const std::string& strName) const
{
    auto it = mapBlockHeights.find(strName);
    if (it == mapBlockHeights.end())
        throw std::runtime_error(strprintf("%s: unknown block %s", __func__, strName));
    return it->second;
}

static CPubKey TestPubKey(const char* pszHex)
{
    return CPubKey(ParseHex(pszHex));
}

/** Serialization of block with its transaction count padded to three bytes */
static std::vector<unsigned char> NonCanonicalBlockBytes(const CBlock& block)
{
    CDataStream ssBlock(SER_NETWORK, PROTOCOL_VERSION);
    ssBlock << block;
    const std::string strBlock = ssBlock.str();

    const size_t nHeaderSize = ::GetSerializeSize(block.GetBlockHeader());
    if (block.vtx.size() >= 253 || strBlock.size() <= nHeaderSize)
        throw std::runtime_error(strprintf("%s: unexpected block layout", __func__));

    std::vector<unsigned char> vch(strBlock.begin(), strBlock.begin() + nHeaderSize);
    vch.push_back(253);
    vch.push_back(block.vtx.size() & 0xff);
    vch.push_back((block.vtx.size() >> 8) & 0xff);
    vch.insert(vch.end(), strBlock.begin() + nHeaderSize + 1, strBlock.end());
    return vch;
}

static void GenerateTests(bool fIncludeLargeReorg, std::vector<std::vector<TestInstance>>& tests)
{
    const CChainParams& params = Params();
    const int nCoinbaseMaturity = params.GetConsensus().nCoinbaseMaturity;
    if (nCoinbaseMaturity < MIN_SCENARIO_MATURITY)
        throw std::runtime_error(strprintf("coinbase maturity %d too low, at least %d needed", nCoinbaseMaturity, MIN_SCENARIO_MATURITY));

    CTestGenerator g(params);

    const CPubKey pubKey1 = TestPubKey("022f8bde4d1a07209355b4a7250a5c5128e88b84bddc619ab7cba8d569b240efe4");
    const CPubKey pubKey2 = TestPubKey("03fff97bd5755eeea420453a14355235d382f6472f8568a18b2f057a1460297556");
    const CPubKey pubKey3 = TestPubKey("025cbdf0646e5db4eaa398f365f2ea7a0e3d419b7e0330e39ce92bddedcac4f9bc");
    const KeyID keyID = KeyID::FromBytes({0x00, 0x00, 0x01, 0x00});

    // Admin keys of the active chain as of each block accepted to it
    std::map<std::string, CAdminKeySnapshot> mapSnapshots;
    mapSnapshots["genesis"] = g.GetAdminState().GetSnapshot();

    auto acceptBlock = [&](bool fMainChain, const CAdminKeySnapshot& snapshot) -> TestInstance {
        return AcceptedBlock{g.GetTipName(), g.GetTipRef(), g.GetTipHeight(), fMainChain, false, snapshot};
    };
    auto expectTipBlock = [&](const std::string& strName) -> TestInstance {
        return ExpectedTip{strName, g.GetBlock(strName), g.GetBlockHeight(strName)};
    };
    auto acceptedWithSnapshot = [&](const CAdminKeySnapshot& snapshot) {
        mapSnapshots[g.GetTipName()] = snapshot;
        tests.push_back({acceptBlock(true, snapshot)});
    };
    auto accepted = [&]() {
        acceptedWithSnapshot(g.GetAdminState().GetSnapshot());
    };
    auto acceptedToSideChainWithExpectedTip = [&](const std::string& strTipName) {
        tests.push_back({acceptBlock(false, mapSnapshots.at(strTipName)), expectTipBlock(strTipName)});
    };
    auto rejected = [&](const std::string& strReason) {
        tests.push_back({RejectedBlock{g.GetTipName(), g.GetTipRef(), g.GetTipHeight(), strReason}});
    };
    auto orphanedOrRejected = [&]() {
        tests.push_back({OrphanOrRejectedBlock{g.GetTipName(), g.GetTipRef(), g.GetTipHeight()}});
    };
    auto expectIssueKeys = [&](const CPubKeySet& expected) {
        const CAdminKeySnapshot snapshot = g.GetAdminState().GetSnapshot();
        if (snapshot.GetKeySet(ISSUE_KEY_SET) != expected)
            throw std::runtime_error(strprintf("unexpected issue keys after %s: %s", g.GetTipName(), snapshot.ToString()));
    };

    // Genesis batons of the root, provision and issue threads
    std::vector<SpendableOutput> outs;
    for (uint32_t i = 0; i < THREAD_COUNT; i++)
        outs.push_back(MakeSpendableOut(g.GetTip(), 0, i));

    // ---------------------------------------------------------------------
    // Generate enough blocks to have mature coinbase outputs to work with.
    //
    //   genesis -> bm0 -> bm1 -> ... -> bm99
    // ---------------------------------------------------------------------
    std::vector<TestInstance> testInstances;
    for (int i = 0; i < nCoinbaseMaturity; i++) {
        g.NextBlock(strprintf("bm%d", i), nullptr);
        g.SaveTipCoinbaseOut();
        mapSnapshots[g.GetTipName()] = g.GetAdminState().GetSnapshot();
        testInstances.push_back(acceptBlock(true, g.GetAdminState().GetSnapshot()));
    }
    tests.push_back(testInstances);

    // Collect spendable outputs. outs[3] is the coinbase of bm0.
    for (int i = 0; i < nCoinbaseMaturity; i++)
        outs.push_back(g.OldestCoinbaseOut());

    // ---------------------------------------------------------------------
    // Admin thread operations on the main chain.
    //
    //   ... -> b1(3) -> b2(4) -> b3() -> b4() -> b5() -> b6() -> b7() -> b8(7)
    // ---------------------------------------------------------------------
    g.NextBlock("b1", &outs[3]);
    accepted();

    g.NextBlock("b2", &outs[4]);
    accepted();

    // Add an issue key on the root thread
    CTransactionRef issueKeyAddTx = g.CreateAdminTx(outs[0], ROOT_THREAD, ADMIN_ISSUE_KEY_ADD, pubKey1);
    g.NextBlock("b3", nullptr, {AdditionalTx(issueKeyAddTx)});
    expectIssueKeys({pubKey1});
    accepted();

    // A second one, kept in insertion order
    CTransactionRef issueKeyAddTx2 = g.CreateAdminTx(MakeSpendableOutForTx(*issueKeyAddTx, 0), ROOT_THREAD, ADMIN_ISSUE_KEY_ADD, pubKey2);
    g.NextBlock("b4", nullptr, {AdditionalTx(issueKeyAddTx2)});
    expectIssueKeys({pubKey1, pubKey2});
    accepted();

    g.NextBlock("b5", nullptr);
    accepted();

    // Revoke both in one block, the second spending the baton of the first
    CTransactionRef issueKeyRevokeTx1 = g.CreateAdminTx(MakeSpendableOutForTx(*issueKeyAddTx2, 0), ROOT_THREAD, ADMIN_ISSUE_KEY_REVOKE, pubKey1);
    CTransactionRef issueKeyRevokeTx2 = g.CreateAdminTx(MakeSpendableOutForTx(*issueKeyRevokeTx1, 0), ROOT_THREAD, ADMIN_ISSUE_KEY_REVOKE, pubKey2);
    g.NextBlock("b6", nullptr, {AdditionalTx(issueKeyRevokeTx1), AdditionalTx(issueKeyRevokeTx2)});
    expectIssueKeys({});
    accepted();

    // Map a WSP KeyID on the provision thread
    CTransactionRef wspKeyIdAddTx = g.CreateWspAdminTx(outs[1], ADMIN_WSP_KEY_ADD, pubKey1, keyID);
    g.NextBlock("b7", nullptr, {AdditionalTx(wspKeyIdAddTx)});
    accepted();

    g.NextBlock("b8", &outs[7]);
    accepted();

    // ---------------------------------------------------------------------
    // Basic forking and reorg tests.
    //
    //   ... -> b9(8) -> b10()
    //
    // An issue key is added in b10, then reorganized away.
    // ---------------------------------------------------------------------
    g.NextBlock("b9", &outs[8]);
    accepted();

    CTransactionRef issueKeyAddTx3 = g.CreateAdminTx(MakeSpendableOutForTx(*issueKeyRevokeTx2, 0), ROOT_THREAD, ADMIN_ISSUE_KEY_ADD, pubKey1);
    g.NextBlock("b10", nullptr, {AdditionalTx(issueKeyAddTx3)});
    expectIssueKeys({pubKey1});
    accepted();

    // Fork from b9. No reorg since b10 was seen first.
    //
    //   ... -> b9(8) -> b10()
    //               \-> b11(9)
    g.SetTip("b9");
    g.NextBlock("b11", &outs[9]);
    acceptedToSideChainWithExpectedTip("b10");

    // Extend the fork past b10 to force a reorg, undoing the key added in b10.
    //
    //   ... -> b9(8) -> b10()
    //               \-> b11(9) -> b12(10)
    g.NextBlock("b12", &outs[10]);
    acceptedWithSnapshot(mapSnapshots.at("b9"));

    // Extend b10 twice to make the first chain longer and reorg back.
    //
    //   ... -> b9(8) -> b10() -> b13(10) -> b14(11)
    //               \-> b11(9) -> b12(10)
    g.SetTip("b10");
    g.NextBlock("b13", &outs[10]);
    acceptedToSideChainWithExpectedTip("b12");

    g.NextBlock("b14", &outs[11]);
    if (g.GetAdminState().GetSnapshot() != mapSnapshots.at("b10"))
        throw std::runtime_error("admin keys at b14 differ from b10");
    accepted();

    // ---------------------------------------------------------------------
    // Double spend tests.
    //
    //   ... -> b9(8) -> b10() -> b13(10) -> b14(11)
    //                                   \-> b15(10) -> b16(12)
    //               \-> b11(9) -> b12(10)
    // ---------------------------------------------------------------------
    g.SetTip("b13");
    g.NextBlock("b15", &outs[10]);
    acceptedToSideChainWithExpectedTip("b14");

    // Connecting b15 would spend outs[10] a second time
    g.NextBlock("b16", &outs[12]);
    rejected("bad-txns-inputs-missingorspent");

    // ---------------------------------------------------------------------
    // Provision thread operations and invalid blocks, built on b14.
    //
    //   ... -> b14(11) -> b17() -> b18() -> b26(13)
    //                                   \-> b19() .. b25()
    // ---------------------------------------------------------------------
    g.SetTip("b14");
    g.NextBlock("b17", nullptr, {AdditionalTx(g.CreateAdminTx(g.GetThreadOut(PROVISION_THREAD), PROVISION_THREAD, ADMIN_VALIDATE_KEY_ADD, pubKey3))});
    accepted();

    g.NextBlock("b18", nullptr, {AdditionalTx(g.CreateWspAdminTx(g.GetThreadOut(PROVISION_THREAD), ADMIN_WSP_KEY_REVOKE, pubKey1, keyID))});
    if (!g.GetAdminState().GetSnapshot().mapWspKeyIds.empty())
        throw std::runtime_error("WSP key still mapped after b18");
    accepted();

    // Issue keys are not the provision thread's business
    g.NextBlock("b19", nullptr, {AdditionalTx(g.CreateAdminTx(g.GetThreadOut(PROVISION_THREAD), PROVISION_THREAD, ADMIN_ISSUE_KEY_ADD, pubKey2))});
    rejected("bad-adminop-thread");

    // Revoking a key that was never added
    g.SetTip("b18");
    g.NextBlock("b20", nullptr, {AdditionalTx(g.CreateAdminTx(g.GetThreadOut(ROOT_THREAD), ROOT_THREAD, ADMIN_ISSUE_KEY_REVOKE, pubKey3))});
    rejected("bad-adminkey-missing");

    // Merkle root not matching the transactions
    g.SetTip("b18");
    g.NextBlock("b21", nullptr, {[](CBlock& block) {
        block.hashMerkleRoot = Hash(block.hashMerkleRoot.begin(), block.hashMerkleRoot.end());
    }});
    rejected("bad-txnmrklroot");

    // Nonce chosen so that the header misses its target
    const Consensus::Params& consensus = params.GetConsensus();
    g.SetTip("b18");
    g.NextBlock("b22", nullptr, {[&consensus](CBlock& block) {
        block.hashMerkleRoot = BlockMerkleRoot(block);
        block.nNonce = 1;
        while (CheckProofOfWork(block.GetHash(), block.nBits, consensus))
            block.nNonce++;
    }});
    rejected("high-hash");

    // Parent nobody knows
    g.SetTip("b18");
    g.NextBlock("b23", nullptr, {[](CBlock& block) {
        block.hashPrevBlock = uint256S("0x0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f");
    }});
    orphanedOrRejected();

    // Coinbase of the parent is far from mature
    g.SetTip("b18");
    const SpendableOutput immatureOut = MakeSpendableOut(*g.GetBlock("b18"), 0, 0);
    g.NextBlock("b24", &immatureOut);
    rejected("bad-txns-premature-spend-of-coinbase");

    // Valid block sent with a non-canonical transaction count
    g.SetTip("b18");
    g.NextBlock("b25", nullptr);
    tests.push_back({RejectedNonCanonicalBlock{g.GetTipName(), NonCanonicalBlockBytes(g.GetTip()), g.GetTipHeight()}});

    g.SetTip("b18");
    g.NextBlock("b26", &outs[13]);
    mapSnapshots["b26"] = g.GetAdminState().GetSnapshot();
    tests.push_back({acceptBlock(true, mapSnapshots["b26"]), expectTipBlock("b26")});

    if (!fIncludeLargeReorg)
        return;

    // ---------------------------------------------------------------------
    // Large reorg.
    //
    //   ... -> b26 -> br0 -> ... -> br14 -> br15
    //             \-> bralt0 -> ... -> bralt14 -> bralt15
    // ---------------------------------------------------------------------
    testInstances.clear();
    for (int i = 0; i < LARGE_REORG_DEPTH; i++) {
        g.NextBlock(strprintf("br%d", i), nullptr);
        mapSnapshots[g.GetTipName()] = g.GetAdminState().GetSnapshot();
        testInstances.push_back(acceptBlock(true, mapSnapshots[g.GetTipName()]));
    }
    tests.push_back(testInstances);
    const std::string strMainTip = g.GetTipName();

    // Competing branch of the same length stays on the side
    g.SetTip("b26");
    testInstances.clear();
    for (int i = 0; i < LARGE_REORG_DEPTH; i++) {
        g.NextBlock(strprintf("bralt%d", i), nullptr);
        testInstances.push_back(acceptBlock(false, mapSnapshots.at(strMainTip)));
    }
    testInstances.push_back(expectTipBlock(strMainTip));
    tests.push_back(testInstances);

    // One more block on it reorganizes
    g.NextBlock(strprintf("bralt%d", LARGE_REORG_DEPTH), nullptr);
    accepted();
    const std::string strAltTip = g.GetTipName();

    // Extending the original branch twice reorganizes back
    g.SetTip(strMainTip);
    g.NextBlock(strprintf("br%d", LARGE_REORG_DEPTH), nullptr);
    acceptedToSideChainWithExpectedTip(strAltTip);
    g.NextBlock(strprintf("br%d", LARGE_REORG_DEPTH + 1), nullptr);
    accepted();
}

bool Generate(bool fIncludeLargeReorg, std::vector<std::vector<TestInstance>>& tests, std::string& strError)
{
    tests.clear();
    try {
        GenerateTests(fIncludeLargeReorg, tests);
    } catch (const std::exception& e) {
        tests.clear();
        strError = e.what();
        LogPrintf("%s: generation failed: %s\n", __func__, strError);
        return false;
    }

    size_t nInstances = 0;
    for (const std::vector<TestInstance>& group : tests)
        nInstances += group.size();
    LogPrint(BCLog::BLOCKGEN, "%s: %u groups, %u instances\n", __func__, tests.size(), nInstances);
    return true;
}
