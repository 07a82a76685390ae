// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Chain builder tests
 *
 * Tests:
 *   1. Block layout: coinbase, spend transaction, timestamps, proof of work
 *   2. Mungers and the merkle root / nonce sentinels
 *   3. Coinbase output collection and builder errors
 *   4. Governance state followed along the tip
 *   5. Scenario generation and its maturity floor
 */

#include "chainparams.h"
#include "consensus/merkle.h"
#include "fullblocktests/generator.h"
#include "pow.h"
#include "script/standard.h"
#include "test/test_govchain.h"
#include "utilstrencodings.h"
#include "validation.h"

#include <boost/test/unit_test.hpp>

#include <stdexcept>

BOOST_FIXTURE_TEST_SUITE(generator_tests, BasicTestingSetup)

// =============================================================================
// NextBlock
// =============================================================================

BOOST_AUTO_TEST_CASE(next_block_layout)
{
    const Consensus::Params& consensus = Params().GetConsensus();
    CTestGenerator g(Params());

    const CBlock& b1 = g.NextBlock("b1", nullptr);
    BOOST_CHECK_EQUAL(g.GetTipName(), "b1");
    BOOST_CHECK_EQUAL(g.GetTipHeight(), 1U);
    BOOST_CHECK_EQUAL(b1.nHeight, 1U);
    BOOST_CHECK(b1.hashPrevBlock == Params().GenesisBlock().GetHash());
    BOOST_CHECK_EQUAL(b1.GetBlockTime(), TEST_MOCK_TIME);
    BOOST_REQUIRE_EQUAL(b1.vtx.size(), 1U);
    BOOST_CHECK(b1.vtx[0]->IsCoinBase());
    BOOST_CHECK_EQUAL(b1.vtx[0]->vout[0].nValue, GetBlockSubsidy(1, consensus));
    BOOST_CHECK(GetScriptClass(b1.vtx[0]->vout[0].scriptPubKey) == TX_ADMINAUTH);
    BOOST_CHECK(b1.hashMerkleRoot == BlockMerkleRoot(b1));
    BOOST_CHECK(b1.nNonce != 0);
    BOOST_CHECK(CheckProofOfWork(b1.GetHash(), b1.nBits, consensus));

    const SpendableOutput spend = MakeSpendableOut(b1, 0, 0);
    const CBlock& b2 = g.NextBlock("b2", &spend);
    BOOST_CHECK_EQUAL(b2.GetBlockTime(), TEST_MOCK_TIME + 120);
    BOOST_REQUIRE_EQUAL(b2.vtx.size(), 2U);
    BOOST_CHECK_EQUAL(b2.vtx[0]->vout[0].nValue, GetBlockSubsidy(2, consensus) + 1);
    BOOST_CHECK(b2.vtx[1]->vin[0].prevout == spend.prevOut);
    BOOST_CHECK_EQUAL(b2.vtx[1]->vout[0].nValue, spend.amount - 1);

    // Every payment script is unique
    BOOST_CHECK(b1.vtx[0]->vout[0].scriptPubKey != b2.vtx[0]->vout[0].scriptPubKey);
    BOOST_CHECK(b2.vtx[0]->vout[0].scriptPubKey != b2.vtx[1]->vout[0].scriptPubKey);
    BOOST_CHECK(b1.vtx[0]->GetHash() != b2.vtx[0]->GetHash());

    BOOST_CHECK_THROW(MakeSpendableOut(b2, 2, 0), std::runtime_error);
    BOOST_CHECK_THROW(MakeSpendableOut(b2, 0, 1), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(next_block_mungers)
{
    CTestGenerator g(Params());

    // A munger adding a transaction gets a fresh merkle root
    CTransactionRef tx = g.CreateSpendTx(SpendableOutput(COutPoint(uint256S("0x01"), 0), CScript(), 10), 1);
    const CBlock& b1 = g.NextBlock("b1", nullptr, {AdditionalTx(tx)});
    BOOST_CHECK_EQUAL(b1.vtx.size(), 2U);
    BOOST_CHECK(b1.hashMerkleRoot == BlockMerkleRoot(b1));

    // A merkle root set by a munger is kept
    const uint256 badRoot = uint256S("0x1234");
    const CBlock& b2 = g.NextBlock("b2", nullptr, {[&badRoot](CBlock& block) { block.hashMerkleRoot = badRoot; }});
    BOOST_CHECK(b2.hashMerkleRoot == badRoot);

    // A nonce set by a munger is kept and the block stays unsolved
    const CBlock& b3 = g.NextBlock("b3", nullptr, {[](CBlock& block) { block.nNonce = 7; }});
    BOOST_CHECK_EQUAL(b3.nNonce, 7U);

    // Mungers run in order
    const CBlock& b4 = g.NextBlock("b4", nullptr, {
        [](CBlock& block) { block.nTime = 5; },
        [](CBlock& block) { block.nTime += 1; }});
    BOOST_CHECK_EQUAL(b4.nTime, 6U);
    BOOST_CHECK(CheckProofOfWork(b4.GetHash(), b4.nBits, Params().GetConsensus()));
}

// =============================================================================
// Coinbase collection and naming
// =============================================================================

BOOST_AUTO_TEST_CASE(collect_coinbase_outs)
{
    const int nMaturity = 12;
    UpdateCoinbaseMaturity(nMaturity);
    CTestGenerator g(Params());

    BOOST_CHECK_THROW(g.OldestCoinbaseOut(), std::runtime_error);

    for (int i = 0; i < nMaturity; i++) {
        g.NextBlock(strprintf("bm%d", i), nullptr);
        g.SaveTipCoinbaseOut();
    }
    BOOST_CHECK_EQUAL(g.GetSpendableOutputCount(), (size_t)nMaturity);
    BOOST_CHECK_THROW(g.SaveTipCoinbaseOut(), std::runtime_error);

    // Oldest first
    const SpendableOutput first = g.OldestCoinbaseOut();
    BOOST_CHECK(first.prevOut == COutPoint(g.GetBlock("bm0")->vtx[0]->GetHash(), 0));
    for (int i = 1; i < nMaturity; i++)
        g.OldestCoinbaseOut();
    BOOST_CHECK_EQUAL(g.GetSpendableOutputCount(), 0U);
    BOOST_CHECK_THROW(g.OldestCoinbaseOut(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(tip_by_name)
{
    CTestGenerator g(Params());
    g.NextBlock("a1", nullptr);
    g.NextBlock("a2", nullptr);

    g.SetTip("a1");
    BOOST_CHECK_EQUAL(g.GetTipHeight(), 1U);
    const CBlock& b2 = g.NextBlock("b2", nullptr);
    BOOST_CHECK(b2.hashPrevBlock == g.GetBlock("a1")->GetHash());
    BOOST_CHECK_EQUAL(g.GetBlockHeight("b2"), 2U);

    g.SetTip("genesis");
    BOOST_CHECK_EQUAL(g.GetTipHeight(), 0U);

    BOOST_CHECK(g.HaveBlock("a2"));
    BOOST_CHECK(!g.HaveBlock("zz"));
    BOOST_CHECK_THROW(g.SetTip("zz"), std::runtime_error);
    BOOST_CHECK_THROW(g.GetBlock("zz"), std::runtime_error);
    BOOST_CHECK_THROW(g.GetBlockHeight("zz"), std::runtime_error);
}

// =============================================================================
// Governance along the tip
// =============================================================================

BOOST_AUTO_TEST_CASE(follow_admin_state)
{
    CTestGenerator g(Params());
    const SpendableOutput rootBaton = g.GetThreadOut(ROOT_THREAD);
    BOOST_CHECK(rootBaton.prevOut == COutPoint(Params().GenesisBlock().vtx[0]->GetHash(), ROOT_THREAD));

    CTransactionRef addTx = g.CreateAdminTx(rootBaton, ROOT_THREAD, ADMIN_ISSUE_KEY_ADD, TestPubKey(5));
    BOOST_CHECK_EQUAL(addTx->vout.size(), 2U);
    BOOST_CHECK_EQUAL(addTx->vout[0].nValue, 0);
    g.NextBlock("b1", nullptr, {AdditionalTx(addTx)});
    BOOST_CHECK(g.GetAdminState().HasKey(ISSUE_KEY_SET, TestPubKey(5)));
    BOOST_CHECK(g.GetThreadOut(ROOT_THREAD).prevOut == COutPoint(addTx->GetHash(), 0));

    // A block whose admin transactions do not all connect leaves the state alone
    const CAdminState before = g.GetAdminState();
    CTransactionRef okTx = g.CreateAdminTx(g.GetThreadOut(ROOT_THREAD), ROOT_THREAD, ADMIN_ISSUE_KEY_ADD, TestPubKey(6));
    CTransactionRef badTx = g.CreateAdminTx(MakeSpendableOutForTx(*okTx, 0), ROOT_THREAD, ADMIN_ISSUE_KEY_REVOKE, TestPubKey(7));
    g.NextBlock("b2", nullptr, {AdditionalTx(okTx), AdditionalTx(badTx)});
    BOOST_CHECK(g.GetAdminState() == before);

    CTransactionRef wspTx = g.CreateWspAdminTx(g.GetThreadOut(PROVISION_THREAD), ADMIN_WSP_KEY_ADD, TestPubKey(7), KeyID(9));
    g.NextBlock("b3", nullptr, {AdditionalTx(wspTx)});
    CPubKey pubKey;
    BOOST_CHECK(g.GetAdminState().GetWspKey(KeyID(9), pubKey));
    BOOST_CHECK(pubKey == TestPubKey(7));

    // SetTip does not rewind the followed state
    g.SetTip("genesis");
    BOOST_CHECK(g.GetAdminState().GetWspKey(KeyID(9), pubKey));
}

BOOST_AUTO_TEST_CASE(signer_fills_script_sig)
{
    unsigned int nCalls = 0;
    CTestGenerator g(Params(), [&nCalls](const CMutableTransaction&, unsigned int, const SpendableOutput& prevOut) {
        nCalls++;
        return CScript() << OP_0 << std::vector<unsigned char>(prevOut.prevOut.hash.begin(), prevOut.prevOut.hash.begin() + 4);
    });

    CTransactionRef tx = g.CreateAdminTx(g.GetThreadOut(ISSUE_THREAD), ISSUE_THREAD, ADMIN_ISSUE_KEY_ADD, TestPubKey(5));
    BOOST_CHECK_EQUAL(nCalls, 1U);
    BOOST_CHECK_EQUAL(tx->vin[0].scriptSig.size(), 6U);

    // Unsigned by default
    CTestGenerator gUnsigned(Params());
    tx = gUnsigned.CreateSpendTx(gUnsigned.GetThreadOut(ROOT_THREAD), 0);
    BOOST_CHECK(tx->vin[0].scriptSig.empty());
}

// =============================================================================
// Generate
// =============================================================================

BOOST_AUTO_TEST_CASE(generate_maturity_floor)
{
    UpdateCoinbaseMaturity(10);
    std::vector<std::vector<TestInstance>> tests(1);
    std::string strError;
    BOOST_CHECK(!Generate(false, tests, strError));
    BOOST_CHECK(tests.empty());
    BOOST_CHECK(strError.find("maturity") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(generate_scenario)
{
    const int nMaturity = 11;
    UpdateCoinbaseMaturity(nMaturity);
    std::vector<std::vector<TestInstance>> tests;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(Generate(false, tests, strError), strError);

    // Maturity blocks form the first group
    BOOST_REQUIRE(!tests.empty());
    BOOST_CHECK_EQUAL(tests[0].size(), (size_t)nMaturity);
    BOOST_CHECK_EQUAL(GetTestInstanceName(tests[0].front()), "bm0");
    BOOST_CHECK_EQUAL(GetTestInstanceHeight(tests[0].back()), (uint32_t)nMaturity);

    std::map<std::string, const TestInstance*> byName;
    for (const std::vector<TestInstance>& group : tests) {
        for (const TestInstance& instance : group) {
            if (std::string(GetTestInstanceType(instance)) != "expectedtip")
                byName[GetTestInstanceName(instance)] = &instance;
        }
    }
    for (const char* name : {"b1", "b10", "b14", "b16", "b19", "b20", "b21", "b22", "b23", "b24", "b25", "b26"})
        BOOST_CHECK_MESSAGE(byName.count(name), name);

    BOOST_CHECK_EQUAL(GetTestInstanceType(*byName["b11"]), "accepted");
    BOOST_CHECK(!boost::get<AcceptedBlock>(*byName["b11"]).fMainChain);
    BOOST_CHECK_EQUAL(boost::get<RejectedBlock>(*byName["b16"]).strRejectReason, "bad-txns-inputs-missingorspent");
    BOOST_CHECK_EQUAL(boost::get<RejectedBlock>(*byName["b19"]).strRejectReason, "bad-adminop-thread");
    BOOST_CHECK_EQUAL(boost::get<RejectedBlock>(*byName["b20"]).strRejectReason, "bad-adminkey-missing");
    BOOST_CHECK_EQUAL(boost::get<RejectedBlock>(*byName["b21"]).strRejectReason, "bad-txnmrklroot");
    BOOST_CHECK_EQUAL(boost::get<RejectedBlock>(*byName["b22"]).strRejectReason, "high-hash");
    BOOST_CHECK_EQUAL(GetTestInstanceType(*byName["b23"]), "orphanorrejected");
    BOOST_CHECK_EQUAL(GetTestInstanceType(*byName["b25"]), "noncanonical");

    // Issue keys over the main chain
    const CPubKey pk1 = TestPubKey(5);
    const CPubKey pk2 = TestPubKey(6);
    BOOST_CHECK(boost::get<AcceptedBlock>(*byName["b3"]).keySnapshot.GetKeySet(ISSUE_KEY_SET) == CPubKeySet{pk1});
    BOOST_CHECK(boost::get<AcceptedBlock>(*byName["b4"]).keySnapshot.GetKeySet(ISSUE_KEY_SET) == (CPubKeySet{pk1, pk2}));
    BOOST_CHECK(boost::get<AcceptedBlock>(*byName["b6"]).keySnapshot.GetKeySet(ISSUE_KEY_SET).empty());
    BOOST_CHECK_EQUAL(boost::get<AcceptedBlock>(*byName["b7"]).keySnapshot.mapWspKeyIds.size(), 1U);
    BOOST_CHECK(boost::get<AcceptedBlock>(*byName["b12"]).keySnapshot.GetKeySet(ISSUE_KEY_SET).empty());
    BOOST_CHECK(boost::get<AcceptedBlock>(*byName["b14"]).keySnapshot.GetKeySet(ISSUE_KEY_SET) == CPubKeySet{pk1});
    BOOST_CHECK(boost::get<AcceptedBlock>(*byName["b26"]).keySnapshot.mapWspKeyIds.empty());
    BOOST_CHECK(boost::get<AcceptedBlock>(*byName["b26"]).keySnapshot.GetKeySet(VALIDATE_KEY_SET) == (CPubKeySet{TestPubKey(4), TestPubKey(7)}));

    // The large reorg adds groups
    std::vector<std::vector<TestInstance>> testsReorg;
    BOOST_REQUIRE_MESSAGE(Generate(true, testsReorg, strError), strError);
    BOOST_CHECK_EQUAL(testsReorg.size(), tests.size() + 5);
    BOOST_CHECK_EQUAL(testsReorg[tests.size()].size(), (size_t)LARGE_REORG_DEPTH);
    BOOST_CHECK_EQUAL(testsReorg[tests.size() + 1].size(), (size_t)LARGE_REORG_DEPTH + 1);
}

BOOST_AUTO_TEST_SUITE_END()
