// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Full block replay tests
 *
 * Tests:
 *   1. Every generated instance holds against the in-memory validator
 *   2. Admin keys and batons of the final tip
 *   3. The validator catches outcomes that do not hold
 */

#include "chainparams.h"
#include "consensus/validation.h"
#include "fullblocktests/generator.h"
#include "test/test_govchain.h"
#include "test/util/chainharness.h"
#include "utilstrencodings.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(fullblock_tests, BasicTestingSetup)

static void ReplayTests(CChainHarness& harness, const std::vector<std::vector<TestInstance>>& tests)
{
    for (size_t i = 0; i < tests.size(); i++) {
        for (const TestInstance& instance : tests[i]) {
            std::string strError;
            BOOST_CHECK_MESSAGE(CheckTestInstance(harness, instance, strError),
                                strprintf("group %u %s: %s", i, TestInstanceToString(instance), strError));
        }
    }
}

static const TestInstance& FindInstance(const std::vector<std::vector<TestInstance>>& tests, const std::string& strName)
{
    for (const std::vector<TestInstance>& group : tests) {
        for (const TestInstance& instance : group) {
            if (GetTestInstanceName(instance) == strName && std::string(GetTestInstanceType(instance)) != "expectedtip")
                return instance;
        }
    }
    throw std::runtime_error(strprintf("no instance %s", strName));
}

BOOST_AUTO_TEST_CASE(replay_default_maturity)
{
    std::vector<std::vector<TestInstance>> tests;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(Generate(false, tests, strError), strError);

    CChainHarness harness(Params());
    ReplayTests(harness, tests);

    const AcceptedBlock& b26 = boost::get<AcceptedBlock>(FindInstance(tests, "b26"));
    BOOST_CHECK(harness.GetTipHash() == b26.block->GetHash());
    BOOST_CHECK_EQUAL(harness.GetTipHeight(), b26.nHeight);
}

BOOST_AUTO_TEST_CASE(replay_large_reorg)
{
    UpdateCoinbaseMaturity(11);
    std::vector<std::vector<TestInstance>> tests;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(Generate(true, tests, strError), strError);

    CChainHarness harness(Params());
    ReplayTests(harness, tests);

    const AcceptedBlock& tip = boost::get<AcceptedBlock>(FindInstance(tests, strprintf("br%d", LARGE_REORG_DEPTH + 1)));
    BOOST_CHECK(harness.GetTipHash() == tip.block->GetHash());
    BOOST_CHECK(!harness.IsInActiveChain(boost::get<AcceptedBlock>(FindInstance(tests, "bralt0")).block->GetHash()));
    BOOST_CHECK(harness.IsInActiveChain(boost::get<AcceptedBlock>(FindInstance(tests, "b26")).block->GetHash()));

    // Final keys: issue {pk1} from b10, validate key added in b17, WSP map emptied in b18
    const CAdminKeySnapshot keys = harness.GetAdminState().GetSnapshot();
    BOOST_CHECK(keys == tip.keySnapshot);
    BOOST_CHECK(keys.GetKeySet(ISSUE_KEY_SET) == CPubKeySet{TestPubKey(5)});
    BOOST_CHECK(keys.GetKeySet(VALIDATE_KEY_SET) == (CPubKeySet{TestPubKey(4), TestPubKey(7)}));
    BOOST_CHECK(keys.mapWspKeyIds.empty());

    // Every baton is an unspent output of the active chain
    for (int i = 0; i < THREAD_COUNT; i++)
        BOOST_CHECK(harness.HaveCoin(harness.GetAdminState().GetThreadTip((ThreadID)i)));

    // Rejected blocks stay rejected
    const RejectedBlock& b16 = boost::get<RejectedBlock>(FindInstance(tests, "b16"));
    CValidationState state;
    bool fOrphan;
    BOOST_CHECK(!harness.ProcessBlock(b16.block, state, fOrphan));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-txns-inputs-missingorspent");
}

BOOST_AUTO_TEST_CASE(harness_catches_mismatch)
{
    UpdateCoinbaseMaturity(11);
    std::vector<std::vector<TestInstance>> tests;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(Generate(false, tests, strError), strError);

    CChainHarness harness(Params());
    const AcceptedBlock bm0 = boost::get<AcceptedBlock>(tests[0][0]);

    // Wrong expected keys
    AcceptedBlock wrongKeys = bm0;
    wrongKeys.keySnapshot.GetKeySet(ISSUE_KEY_SET).push_back(TestPubKey(5));
    BOOST_CHECK(!CheckTestInstance(harness, wrongKeys, strError));
    BOOST_CHECK(strError.find("admin keys") != std::string::npos);

    // Second submission is a duplicate, not an acceptance
    BOOST_CHECK(!CheckTestInstance(harness, bm0, strError));
    CValidationState state;
    bool fOrphan;
    BOOST_CHECK(!harness.ProcessBlock(bm0.block, state, fOrphan));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "duplicate");

    // Wrong expected tip
    BOOST_CHECK(!CheckTestInstance(harness, ExpectedTip{"genesis", std::make_shared<const CBlock>(Params().GenesisBlock()), 0}, strError));

    // Wrong reject reason
    const AcceptedBlock bm1 = boost::get<AcceptedBlock>(tests[0][1]);
    BOOST_CHECK(!CheckTestInstance(harness, RejectedBlock{bm1.name, bm1.block, bm1.nHeight, "bad-txnmrklroot"}, strError));
    BOOST_CHECK(strError.find("expected rejection") != std::string::npos);

    // A block whose parent is unknown is held as an orphan
    const AcceptedBlock bm3 = boost::get<AcceptedBlock>(tests[0][3]);
    BOOST_CHECK(harness.ProcessBlock(bm3.block, state, fOrphan));
    BOOST_CHECK(fOrphan);
    BOOST_CHECK(harness.GetTipHash() == bm1.block->GetHash());
}

BOOST_AUTO_TEST_SUITE_END()
