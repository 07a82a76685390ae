// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Key-governance state tests
 *
 * Tests:
 *   1. Seeding from the genesis block
 *   2. Apply/revert of ordered key set and WSP actions, including conflicts
 *   3. Connecting and disconnecting admin transactions against the batons
 */

#include "chainparams.h"
#include "consensus/validation.h"
#include "governance/adminstate.h"
#include "primitives/block.h"
#include "script/adminop.h"
#include "test/test_govchain.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(adminstate_tests, BasicTestingSetup)

static const KeyID wspKeyID(0x00010000);

static CAdminState GenesisState()
{
    CAdminState adminState;
    BOOST_REQUIRE(adminState.InitFromGenesis(Params().GenesisBlock(), Params().GenesisAdminKeys()));
    return adminState;
}

static CTransaction SpendBaton(const CAdminState& adminState, ThreadID thread, const CScript& actionScript)
{
    CMutableTransaction tx;
    tx.vin.emplace_back(adminState.GetThreadTip(thread));
    tx.vout.emplace_back(0, GetScriptForThread(thread));
    tx.vout.emplace_back(0, actionScript);
    return CTransaction(tx);
}

// =============================================================================
// Genesis
// =============================================================================

BOOST_AUTO_TEST_CASE(genesis_state)
{
    const CBlock& genesis = Params().GenesisBlock();
    CAdminState adminState = GenesisState();

    for (int i = 0; i < THREAD_COUNT; i++) {
        const COutPoint& tip = adminState.GetThreadTip((ThreadID)i);
        BOOST_CHECK(tip == COutPoint(genesis.vtx[0]->GetHash(), i));
        ThreadID thread;
        BOOST_CHECK(adminState.IsThreadTip(tip, thread));
        BOOST_CHECK_EQUAL(thread, (ThreadID)i);
    }

    const CAdminKeySnapshot keys = adminState.GetSnapshot();
    BOOST_CHECK(keys.GetKeySet(ROOT_KEY_SET) == (CPubKeySet{TestPubKey(1), TestPubKey(2)}));
    BOOST_CHECK(keys.GetKeySet(PROVISION_KEY_SET) == CPubKeySet{TestPubKey(3)});
    BOOST_CHECK(keys.GetKeySet(VALIDATE_KEY_SET) == CPubKeySet{TestPubKey(4)});
    BOOST_CHECK(keys.GetKeySet(ISSUE_KEY_SET).empty());
    BOOST_CHECK(keys.mapWspKeyIds.empty());
    BOOST_CHECK_THROW(keys.GetKeySet(WSP_KEY_SET), std::out_of_range);

    // A genesis without batons cannot seed the state
    CBlock bare(genesis.GetBlockHeader());
    CMutableTransaction coinbase(*genesis.vtx[0]);
    coinbase.vout.pop_back();
    bare.vtx.push_back(MakeTransactionRef(std::move(coinbase)));
    CAdminState incomplete;
    BOOST_CHECK(!incomplete.InitFromGenesis(bare, Params().GenesisAdminKeys()));
}

// =============================================================================
// ApplyAction / RevertAction
// =============================================================================

BOOST_AUTO_TEST_CASE(apply_revert_ordered)
{
    CAdminState adminState = GenesisState();
    const CAdminKeySnapshot before = adminState.GetSnapshot();

    CValidationState state;
    int nPosition = -2;
    BOOST_CHECK(adminState.ApplyAction(AdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(5)), ISSUE_KEY_SET, state, &nPosition));
    BOOST_CHECK_EQUAL(nPosition, 0);
    BOOST_CHECK(adminState.ApplyAction(AdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(6)), ISSUE_KEY_SET, state, &nPosition));
    BOOST_CHECK_EQUAL(nPosition, 1);
    BOOST_CHECK(adminState.GetSnapshot().GetKeySet(ISSUE_KEY_SET) == (CPubKeySet{TestPubKey(5), TestPubKey(6)}));
    BOOST_CHECK(adminState.HasKey(ISSUE_KEY_SET, TestPubKey(6)));

    const CAdminKeySnapshot added = adminState.GetSnapshot();

    // Revoking the first key and putting it back restores the order
    const AdminAction revoke(ADMIN_ISSUE_KEY_REVOKE, TestPubKey(5));
    BOOST_CHECK(adminState.ApplyAction(revoke, ISSUE_KEY_SET, state, &nPosition));
    BOOST_CHECK_EQUAL(nPosition, 0);
    BOOST_CHECK(adminState.GetSnapshot().GetKeySet(ISSUE_KEY_SET) == CPubKeySet{TestPubKey(6)});
    BOOST_CHECK(adminState.RevertAction(revoke, ISSUE_KEY_SET, state, nPosition));
    BOOST_CHECK(adminState.GetSnapshot() == added);

    BOOST_CHECK(adminState.RevertAction(AdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(6)), ISSUE_KEY_SET, state, 1));
    BOOST_CHECK(adminState.RevertAction(AdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(5)), ISSUE_KEY_SET, state, 0));
    BOOST_CHECK(adminState.GetSnapshot() == before);

    // Revoking a genesis root key and reverting it
    const AdminAction revokeRoot(ADMIN_PROVISION_KEY_REVOKE, TestPubKey(3));
    BOOST_CHECK(adminState.ApplyAction(revokeRoot, PROVISION_KEY_SET, state, &nPosition));
    BOOST_CHECK(adminState.GetSnapshot().GetKeySet(PROVISION_KEY_SET).empty());
    BOOST_CHECK(adminState.RevertAction(revokeRoot, PROVISION_KEY_SET, state, nPosition));
    BOOST_CHECK(adminState.GetSnapshot() == before);
}

BOOST_AUTO_TEST_CASE(apply_conflicts)
{
    CAdminState adminState = GenesisState();
    const CAdminKeySnapshot before = adminState.GetSnapshot();

    {
        CValidationState state;
        BOOST_CHECK(!adminState.ApplyAction(AdminAction(ADMIN_VALIDATE_KEY_ADD, TestPubKey(4)), VALIDATE_KEY_SET, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-adminkey-duplicate");
    }
    {
        CValidationState state;
        BOOST_CHECK(!adminState.ApplyAction(AdminAction(ADMIN_ISSUE_KEY_REVOKE, TestPubKey(7)), ISSUE_KEY_SET, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-adminkey-missing");
    }
    {
        // opcode acting on another role
        CValidationState state;
        BOOST_CHECK(!adminState.ApplyAction(AdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(7)), VALIDATE_KEY_SET, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-adminkey-role");
    }
    {
        CValidationState state;
        const AdminAction revoke(ADMIN_ISSUE_KEY_REVOKE, TestPubKey(7));
        BOOST_CHECK(!adminState.RevertAction(revoke, ISSUE_KEY_SET, state, 3));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-adminkey-undo");
    }

    BOOST_CHECK(adminState.GetSnapshot() == before);
}

BOOST_AUTO_TEST_CASE(revert_revoke_needs_position)
{
    CAdminState adminState = GenesisState();
    CValidationState state;
    BOOST_REQUIRE(adminState.ApplyAction(AdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(5)), ISSUE_KEY_SET, state));
    BOOST_REQUIRE(adminState.ApplyAction(AdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(6)), ISSUE_KEY_SET, state));
    const CAdminKeySnapshot added = adminState.GetSnapshot();

    const AdminAction revoke(ADMIN_ISSUE_KEY_REVOKE, TestPubKey(5));
    int nPosition = -1;
    BOOST_REQUIRE(adminState.ApplyAction(revoke, ISSUE_KEY_SET, state, &nPosition));
    const CAdminKeySnapshot revoked = adminState.GetSnapshot();

    // Appending pk5 would reorder the set, so no position is an error
    {
        CValidationState stateUndo;
        BOOST_CHECK(!adminState.RevertAction(revoke, ISSUE_KEY_SET, stateUndo, -1));
        BOOST_CHECK_EQUAL(stateUndo.GetRejectReason(), "bad-adminkey-undo");
        BOOST_CHECK(adminState.GetSnapshot() == revoked);
    }

    BOOST_CHECK(adminState.RevertAction(revoke, ISSUE_KEY_SET, state, nPosition));
    BOOST_CHECK(adminState.GetSnapshot() == added);
    BOOST_CHECK(adminState.GetSnapshot().GetKeySet(ISSUE_KEY_SET) == (CPubKeySet{TestPubKey(5), TestPubKey(6)}));
}

BOOST_AUTO_TEST_CASE(apply_revert_wsp)
{
    CAdminState adminState = GenesisState();
    const CAdminKeySnapshot before = adminState.GetSnapshot();
    const AdminAction add(ADMIN_WSP_KEY_ADD, TestPubKey(5), wspKeyID);

    CValidationState state;
    int nPosition = 0;
    BOOST_CHECK(adminState.ApplyAction(add, WSP_KEY_SET, state, &nPosition));
    BOOST_CHECK_EQUAL(nPosition, -1);
    CPubKey pubKey;
    BOOST_CHECK(adminState.GetWspKey(wspKeyID, pubKey));
    BOOST_CHECK(pubKey == TestPubKey(5));
    BOOST_CHECK(adminState.HasKey(WSP_KEY_SET, TestPubKey(5)));

    {
        // KeyID already taken, even by another key
        CValidationState stateDup;
        BOOST_CHECK(!adminState.ApplyAction(AdminAction(ADMIN_WSP_KEY_ADD, TestPubKey(6), wspKeyID), WSP_KEY_SET, stateDup));
        BOOST_CHECK_EQUAL(stateDup.GetRejectReason(), "bad-adminkey-duplicate");
    }
    {
        // KeyID bound to another key
        CValidationState stateMissing;
        BOOST_CHECK(!adminState.ApplyAction(AdminAction(ADMIN_WSP_KEY_REVOKE, TestPubKey(6), wspKeyID), WSP_KEY_SET, stateMissing));
        BOOST_CHECK_EQUAL(stateMissing.GetRejectReason(), "bad-adminkey-missing");
    }
    {
        CValidationState stateMissing;
        BOOST_CHECK(!adminState.ApplyAction(AdminAction(ADMIN_WSP_KEY_REVOKE, TestPubKey(5), KeyID(7)), WSP_KEY_SET, stateMissing));
        BOOST_CHECK_EQUAL(stateMissing.GetRejectReason(), "bad-adminkey-missing");
    }

    const AdminAction revoke(ADMIN_WSP_KEY_REVOKE, TestPubKey(5), wspKeyID);
    BOOST_CHECK(adminState.ApplyAction(revoke, WSP_KEY_SET, state));
    BOOST_CHECK(adminState.GetSnapshot() == before);
    BOOST_CHECK(adminState.RevertAction(revoke, WSP_KEY_SET, state, -1));
    BOOST_CHECK(adminState.RevertAction(add, WSP_KEY_SET, state, -1));
    BOOST_CHECK(adminState.GetSnapshot() == before);
}

// =============================================================================
// Connect / disconnect
// =============================================================================

BOOST_AUTO_TEST_CASE(connect_disconnect)
{
    CAdminState adminState = GenesisState();
    const CAdminState genesisState = adminState;

    CTransaction tx1 = SpendBaton(adminState, ROOT_THREAD, GetScriptForAdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(5)));
    ThreadID thread;
    BOOST_REQUIRE(adminState.SpendsThreadTip(tx1, thread));
    BOOST_CHECK_EQUAL(thread, ROOT_THREAD);

    CValidationState state;
    CAdminTxUndo undo1;
    BOOST_CHECK(adminState.ConnectAdminTransaction(tx1, ROOT_THREAD, undo1, state));
    BOOST_CHECK(adminState.GetThreadTip(ROOT_THREAD) == COutPoint(tx1.GetHash(), 0));
    BOOST_CHECK(adminState.HasKey(ISSUE_KEY_SET, TestPubKey(5)));

    // The old baton is gone
    CValidationState stateStale;
    CAdminTxUndo undoStale;
    CTransaction stale = SpendBaton(genesisState, ROOT_THREAD, GetScriptForAdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(6)));
    BOOST_CHECK(!adminState.SpendsThreadTip(stale, thread));
    BOOST_CHECK(!adminState.ConnectAdminTransaction(stale, ROOT_THREAD, undoStale, stateStale));
    BOOST_CHECK_EQUAL(stateStale.GetRejectReason(), "bad-admin-thread-continuity");

    CTransaction tx2 = SpendBaton(adminState, ROOT_THREAD, GetScriptForAdminAction(ADMIN_ISSUE_KEY_REVOKE, TestPubKey(5)));
    CAdminTxUndo undo2;
    BOOST_CHECK(adminState.ConnectAdminTransaction(tx2, ROOT_THREAD, undo2, state));
    BOOST_CHECK(adminState.GetSnapshot().GetKeySet(ISSUE_KEY_SET).empty());

    // Disconnect out of order fails
    CValidationState stateOrder;
    BOOST_CHECK(!adminState.DisconnectAdminTransaction(tx1, undo1, stateOrder));

    BOOST_CHECK(adminState.DisconnectAdminTransaction(tx2, undo2, state));
    BOOST_CHECK(adminState.DisconnectAdminTransaction(tx1, undo1, state));
    BOOST_CHECK(adminState == genesisState);
}

BOOST_AUTO_TEST_CASE(connect_rejects_leave_state)
{
    CAdminState adminState = GenesisState();
    const CAdminState genesisState = adminState;
    CAdminTxUndo undo;

    {
        // Issue key op carried by the provision baton
        CValidationState state;
        CTransaction tx = SpendBaton(adminState, PROVISION_THREAD, GetScriptForAdminAction(ADMIN_ISSUE_KEY_ADD, TestPubKey(5)));
        BOOST_CHECK(!adminState.ConnectAdminTransaction(tx, PROVISION_THREAD, undo, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-adminop-thread");
    }
    {
        CValidationState state;
        CTransaction tx = SpendBaton(adminState, PROVISION_THREAD, GetScriptForAdminAction(ADMIN_VALIDATE_KEY_REVOKE, TestPubKey(5)));
        BOOST_CHECK(!adminState.ConnectAdminTransaction(tx, PROVISION_THREAD, undo, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-adminkey-missing");
    }
    BOOST_CHECK(adminState == genesisState);

    // Coinbase transactions never spend a baton
    CMutableTransaction coinbase;
    coinbase.vin.resize(1);
    coinbase.vout.emplace_back(0, GetScriptForThread(ROOT_THREAD));
    ThreadID thread;
    BOOST_CHECK(!adminState.SpendsThreadTip(CTransaction(coinbase), thread));
}

BOOST_AUTO_TEST_SUITE_END()
