// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_GOVERNANCE_ADMINSTATE_H
#define GOVCHAIN_GOVERNANCE_ADMINSTATE_H

/**
 * Key-Governance State
 *
 * One ordered public key set per role, the WSP KeyID map, and the baton
 * table holding the unspent baton of each admin thread. The state moves only
 * by connecting or disconnecting admin transactions in chain order; every
 * mutation has an exact inverse.
 */

#include "primitives/transaction.h"
#include "pubkey.h"
#include "script/adminop.h"
#include "script/standard.h"

#include <array>
#include <map>
#include <string>
#include <vector>

class CBlock;
class CValidationState;

//! Active keys of a role, in insertion order
typedef std::vector<CPubKey> CPubKeySet;
typedef std::map<KeyID, CPubKey> WspKeyIdMap;

/** Value copy of every key set and the WSP map. */
struct CAdminKeySnapshot
{
    std::array<CPubKeySet, PUBKEY_SET_COUNT> keySets;
    WspKeyIdMap mapWspKeyIds;

    //! Not valid for WSP_KEY_SET, use mapWspKeyIds
    const CPubKeySet& GetKeySet(KeySetType type) const;
    CPubKeySet& GetKeySet(KeySetType type);

    friend bool operator==(const CAdminKeySnapshot& a, const CAdminKeySnapshot& b)
    {
        return a.keySets == b.keySets && a.mapWspKeyIds == b.mapWspKeyIds;
    }
    friend bool operator!=(const CAdminKeySnapshot& a, const CAdminKeySnapshot& b)
    {
        return !(a == b);
    }

    std::string ToString() const;
};

/** What DisconnectAdminTransaction needs to undo one connected admin tx. */
struct CAdminTxUndo
{
    ThreadID thread;
    COutPoint prevThreadTip;
    AdminAction action;
    //! position the key occupied in its ordered set, -1 for WSP actions
    int nPosition;

    CAdminTxUndo() : thread(ROOT_THREAD), nPosition(-1) {}
};

class CAdminState
{
private:
    CAdminKeySnapshot keys;
    std::array<COutPoint, THREAD_COUNT> threadTips;

public:
    CAdminState() {}
    CAdminState(const CAdminKeySnapshot& keysIn, const std::array<COutPoint, THREAD_COUNT>& tipsIn)
        : keys(keysIn), threadTips(tipsIn) {}

    /**
     * Seed from the genesis configuration: the given key sets and the baton
     * outputs found in the genesis coinbase. Fails if a thread has no baton.
     */
    bool InitFromGenesis(const CBlock& genesis, const CAdminKeySnapshot& genesisKeys);

    /**
     * Apply one admin action to the key set of `type`.
     *
     * Effects:
     *   - add:    key appended to the set (WSP: KeyID mapped to the key)
     *   - revoke: key removed from the set (WSP: KeyID unmapped)
     *
     * Adding a present key or KeyID fails with bad-adminkey-duplicate;
     * revoking an absent key, an absent KeyID or a KeyID bound to another
     * key fails with bad-adminkey-missing. Nothing changes on failure.
     *
     * @param[out] pnPositionOut index the key occupied (revoke) or now
     *             occupies (add) in its ordered set; -1 for WSP
     */
    bool ApplyAction(const AdminAction& action, KeySetType type, CValidationState& state, int* pnPositionOut = nullptr);

    /**
     * Exact inverse of ApplyAction. nPosition is the index ApplyAction
     * reported; a revoked key goes back there. Reverting a revoke on an
     * ordered set without a position fails with bad-adminkey-undo.
     * Adds and WSP actions ignore nPosition.
     */
    bool RevertAction(const AdminAction& action, KeySetType type, CValidationState& state, int nPosition);

    CAdminKeySnapshot GetSnapshot() const { return keys; }

    bool HasKey(KeySetType type, const CPubKey& pubKey) const;
    bool GetWspKey(const KeyID& keyID, CPubKey& pubKeyRet) const;

    const COutPoint& GetThreadTip(ThreadID thread) const { return threadTips[thread]; }
    void SetThreadTip(ThreadID thread, const COutPoint& outpoint) { threadTips[thread] = outpoint; }
    bool IsThreadTip(const COutPoint& outpoint, ThreadID& threadRet) const;

    /** True if the transaction spends the current baton of some thread. */
    bool SpendsThreadTip(const CTransaction& tx, ThreadID& threadRet) const;

    /**
     * Connect an admin transaction of `thread`.
     *
     * Effects:
     *   - the action carried by vout[1] is applied to its key set
     *   - the thread baton moves to (txid, 0)
     *
     * Fails with bad-admin-thread-continuity when the transaction does not
     * spend the current baton, or with the codec/key-set reason.
     */
    bool ConnectAdminTransaction(const CTransaction& tx, ThreadID thread, CAdminTxUndo& undo, CValidationState& state);

    /** Restore the key set and baton changed by ConnectAdminTransaction. */
    bool DisconnectAdminTransaction(const CTransaction& tx, const CAdminTxUndo& undo, CValidationState& state);

    friend bool operator==(const CAdminState& a, const CAdminState& b)
    {
        return a.keys == b.keys && a.threadTips == b.threadTips;
    }
};

#endif // GOVCHAIN_GOVERNANCE_ADMINSTATE_H
