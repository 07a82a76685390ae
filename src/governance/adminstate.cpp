// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "governance/adminstate.h"

#include "consensus/validation.h"
#include "logging.h"
#include "primitives/block.h"

#include <algorithm>
#include <stdexcept>

const CPubKeySet& CAdminKeySnapshot::GetKeySet(KeySetType type) const
{
    if (type < ROOT_KEY_SET || type >= PUBKEY_SET_COUNT)
        throw std::out_of_range(strprintf("%s: no ordered key set for %s", __func__, GetKeySetName(type)));
    return keySets[type];
}

CPubKeySet& CAdminKeySnapshot::GetKeySet(KeySetType type)
{
    if (type < ROOT_KEY_SET || type >= PUBKEY_SET_COUNT)
        throw std::out_of_range(strprintf("%s: no ordered key set for %s", __func__, GetKeySetName(type)));
    return keySets[type];
}

std::string CAdminKeySnapshot::ToString() const
{
    std::string str = "CAdminKeySnapshot(";
    for (int i = 0; i < PUBKEY_SET_COUNT; i++) {
        str += strprintf("%s=[", GetKeySetName((KeySetType)i));
        for (size_t j = 0; j < keySets[i].size(); j++) {
            if (j) str += ",";
            str += keySets[i][j].GetHex().substr(0, 10);
        }
        str += "] ";
    }
    str += "wsp={";
    bool fFirst = true;
    for (const auto& entry : mapWspKeyIds) {
        if (!fFirst) str += ",";
        str += strprintf("%s:%s", entry.first.ToString(), entry.second.GetHex().substr(0, 10));
        fFirst = false;
    }
    str += "})";
    return str;
}

bool CAdminState::InitFromGenesis(const CBlock& genesis, const CAdminKeySnapshot& genesisKeys)
{
    keys = genesisKeys;
    for (COutPoint& tip : threadTips)
        tip.SetNull();

    if (genesis.vtx.empty())
        return false;
    const CTransaction& coinbase = *genesis.vtx[0];
    for (uint32_t i = 0; i < coinbase.vout.size(); i++) {
        ThreadID thread;
        if (IsThreadScript(coinbase.vout[i].scriptPubKey, thread))
            threadTips[thread] = COutPoint(coinbase.GetHash(), i);
    }

    for (const COutPoint& tip : threadTips) {
        if (tip.IsNull())
            return false;
    }
    return true;
}

static bool CheckActionRole(const AdminAction& action, KeySetType type, CValidationState& state)
{
    if (!IsKnownAdminOp(action.opcode) || GetKeySetTypeForOp(action.opcode) != type)
        return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-role", false,
                         strprintf("%s does not act on the %s key set", GetAdminOpName(action.opcode), GetKeySetName(type)));
    if (type == WSP_KEY_SET && !action.fHasKeyID)
        return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-role", false, "WSP action without KeyID");
    return true;
}

bool CAdminState::ApplyAction(const AdminAction& action, KeySetType type, CValidationState& state, int* pnPositionOut)
{
    if (!CheckActionRole(action, type, state))
        return false;

    const bool fAdd = IsAddAdminOp(action.opcode);
    int nPosition = -1;

    if (type == WSP_KEY_SET) {
        auto it = keys.mapWspKeyIds.find(action.keyID);
        if (fAdd) {
            if (it != keys.mapWspKeyIds.end())
                return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-duplicate", false,
                                 strprintf("keyid %s already mapped", action.keyID.ToString()));
            keys.mapWspKeyIds.emplace(action.keyID, action.pubKey);
        } else {
            if (it == keys.mapWspKeyIds.end() || it->second != action.pubKey)
                return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-missing", false,
                                 strprintf("keyid %s not mapped to %s", action.keyID.ToString(), action.pubKey.GetHex()));
            keys.mapWspKeyIds.erase(it);
        }
    } else {
        CPubKeySet& keySet = keys.GetKeySet(type);
        auto it = std::find(keySet.begin(), keySet.end(), action.pubKey);
        if (fAdd) {
            if (it != keySet.end())
                return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-duplicate", false,
                                 strprintf("%s already in %s set", action.pubKey.GetHex(), GetKeySetName(type)));
            nPosition = keySet.size();
            keySet.push_back(action.pubKey);
        } else {
            if (it == keySet.end())
                return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-missing", false,
                                 strprintf("%s not in %s set", action.pubKey.GetHex(), GetKeySetName(type)));
            nPosition = it - keySet.begin();
            keySet.erase(it);
        }
    }

    if (pnPositionOut)
        *pnPositionOut = nPosition;

    LogPrint(BCLog::STATE, "%s: %s on %s set\n", __func__, action.ToString(), GetKeySetName(type));
    return true;
}

bool CAdminState::RevertAction(const AdminAction& action, KeySetType type, CValidationState& state, int nPosition)
{
    if (!CheckActionRole(action, type, state))
        return false;

    const bool fAdd = IsAddAdminOp(action.opcode);

    if (type == WSP_KEY_SET) {
        auto it = keys.mapWspKeyIds.find(action.keyID);
        if (fAdd) {
            if (it == keys.mapWspKeyIds.end() || it->second != action.pubKey)
                return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-missing", false,
                                 strprintf("cannot undo add of keyid %s", action.keyID.ToString()));
            keys.mapWspKeyIds.erase(it);
        } else {
            if (it != keys.mapWspKeyIds.end())
                return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-duplicate", false,
                                 strprintf("cannot undo revoke of keyid %s", action.keyID.ToString()));
            keys.mapWspKeyIds.emplace(action.keyID, action.pubKey);
        }
    } else {
        CPubKeySet& keySet = keys.GetKeySet(type);
        auto it = std::find(keySet.begin(), keySet.end(), action.pubKey);
        if (fAdd) {
            if (it == keySet.end())
                return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-missing", false,
                                 strprintf("cannot undo add of %s", action.pubKey.GetHex()));
            keySet.erase(it);
        } else {
            if (it != keySet.end())
                return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-duplicate", false,
                                 strprintf("cannot undo revoke of %s", action.pubKey.GetHex()));
            if (nPosition < 0 || nPosition > (int)keySet.size())
                return state.DoS(100, false, REJECT_INVALID, "bad-adminkey-undo", false,
                                 strprintf("position %d outside %s set", nPosition, GetKeySetName(type)));
            keySet.insert(keySet.begin() + nPosition, action.pubKey);
        }
    }

    LogPrint(BCLog::STATE, "%s: undo %s on %s set\n", __func__, action.ToString(), GetKeySetName(type));
    return true;
}

bool CAdminState::HasKey(KeySetType type, const CPubKey& pubKey) const
{
    if (type == WSP_KEY_SET) {
        for (const auto& entry : keys.mapWspKeyIds) {
            if (entry.second == pubKey)
                return true;
        }
        return false;
    }
    const CPubKeySet& keySet = keys.GetKeySet(type);
    return std::find(keySet.begin(), keySet.end(), pubKey) != keySet.end();
}

bool CAdminState::GetWspKey(const KeyID& keyID, CPubKey& pubKeyRet) const
{
    auto it = keys.mapWspKeyIds.find(keyID);
    if (it == keys.mapWspKeyIds.end())
        return false;
    pubKeyRet = it->second;
    return true;
}

bool CAdminState::IsThreadTip(const COutPoint& outpoint, ThreadID& threadRet) const
{
    if (outpoint.IsNull())
        return false;
    for (int i = 0; i < THREAD_COUNT; i++) {
        if (threadTips[i] == outpoint) {
            threadRet = (ThreadID)i;
            return true;
        }
    }
    return false;
}

bool CAdminState::SpendsThreadTip(const CTransaction& tx, ThreadID& threadRet) const
{
    if (tx.IsCoinBase())
        return false;
    for (const CTxIn& txin : tx.vin) {
        if (IsThreadTip(txin.prevout, threadRet))
            return true;
    }
    return false;
}

bool CAdminState::ConnectAdminTransaction(const CTransaction& tx, ThreadID thread, CAdminTxUndo& undo, CValidationState& state)
{
    const COutPoint& tip = threadTips[thread];
    bool fSpendsTip = false;
    for (const CTxIn& txin : tx.vin) {
        if (!tip.IsNull() && txin.prevout == tip)
            fSpendsTip = true;
    }
    if (!fSpendsTip)
        return state.DoS(100, false, REJECT_INVALID, "bad-admin-thread-continuity", false,
                         strprintf("%s does not spend %s thread tip %s", tx.GetHash().ToString(), GetThreadName(thread), tip.ToString()));

    AdminAction action;
    if (!ValidateAdminTransaction(tx, thread, state, &action))
        return false;

    int nPosition = -1;
    if (!ApplyAction(action, GetKeySetTypeForOp(action.opcode), state, &nPosition))
        return false;

    undo.thread = thread;
    undo.prevThreadTip = tip;
    undo.action = action;
    undo.nPosition = nPosition;

    threadTips[thread] = COutPoint(tx.GetHash(), 0);

    LogPrint(BCLog::STATE, "%s: %s thread tip now %s\n", __func__, GetThreadName(thread), threadTips[thread].ToString());
    return true;
}

bool CAdminState::DisconnectAdminTransaction(const CTransaction& tx, const CAdminTxUndo& undo, CValidationState& state)
{
    if (threadTips[undo.thread] != COutPoint(tx.GetHash(), 0))
        return state.DoS(100, false, REJECT_INVALID, "bad-admin-thread-continuity", false,
                         strprintf("%s is not the %s thread tip", tx.GetHash().ToString(), GetThreadName(undo.thread)));

    if (!RevertAction(undo.action, GetKeySetTypeForOp(undo.action.opcode), state, undo.nPosition))
        return false;

    threadTips[undo.thread] = undo.prevThreadTip;

    LogPrint(BCLog::STATE, "%s: %s thread tip back to %s\n", __func__, GetThreadName(undo.thread), undo.prevThreadTip.ToString());
    return true;
}
