// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "script/adminop.h"

#include "consensus/validation.h"
#include "primitives/transaction.h"
#include "utilstrencodings.h"

#include <stdexcept>

bool IsKnownAdminOp(unsigned char op)
{
    switch (op) {
    case ADMIN_ISSUE_KEY_ADD:
    case ADMIN_ISSUE_KEY_REVOKE:
    case ADMIN_PROVISION_KEY_ADD:
    case ADMIN_PROVISION_KEY_REVOKE:
    case ADMIN_VALIDATE_KEY_ADD:
    case ADMIN_VALIDATE_KEY_REVOKE:
    case ADMIN_WSP_KEY_ADD:
    case ADMIN_WSP_KEY_REVOKE:
        return true;
    }
    return false;
}

bool IsWspAdminOp(AdminOpcode op)
{
    return op == ADMIN_WSP_KEY_ADD || op == ADMIN_WSP_KEY_REVOKE;
}

bool IsAddAdminOp(AdminOpcode op)
{
    return op == ADMIN_ISSUE_KEY_ADD ||
           op == ADMIN_PROVISION_KEY_ADD ||
           op == ADMIN_VALIDATE_KEY_ADD ||
           op == ADMIN_WSP_KEY_ADD;
}

std::string GetAdminOpName(AdminOpcode op)
{
    switch (op) {
    case ADMIN_ISSUE_KEY_ADD: return "issuekeyadd";
    case ADMIN_ISSUE_KEY_REVOKE: return "issuekeyrevoke";
    case ADMIN_PROVISION_KEY_ADD: return "provisionkeyadd";
    case ADMIN_PROVISION_KEY_REVOKE: return "provisionkeyrevoke";
    case ADMIN_VALIDATE_KEY_ADD: return "validatekeyadd";
    case ADMIN_VALIDATE_KEY_REVOKE: return "validatekeyrevoke";
    case ADMIN_WSP_KEY_ADD: return "wspkeyadd";
    case ADMIN_WSP_KEY_REVOKE: return "wspkeyrevoke";
    }
    return strprintf("unknown(0x%02x)", (int)op);
}

KeySetType GetKeySetTypeForOp(AdminOpcode op)
{
    switch (op) {
    case ADMIN_ISSUE_KEY_ADD:
    case ADMIN_ISSUE_KEY_REVOKE:
        return ISSUE_KEY_SET;
    case ADMIN_PROVISION_KEY_ADD:
    case ADMIN_PROVISION_KEY_REVOKE:
        return PROVISION_KEY_SET;
    case ADMIN_VALIDATE_KEY_ADD:
    case ADMIN_VALIDATE_KEY_REVOKE:
        return VALIDATE_KEY_SET;
    case ADMIN_WSP_KEY_ADD:
    case ADMIN_WSP_KEY_REVOKE:
        return WSP_KEY_SET;
    }
    throw std::invalid_argument(strprintf("%s: unknown admin opcode 0x%02x", __func__, (int)op));
}

const char* GetKeySetName(KeySetType type)
{
    switch (type) {
    case ROOT_KEY_SET: return "root";
    case PROVISION_KEY_SET: return "provision";
    case ISSUE_KEY_SET: return "issue";
    case VALIDATE_KEY_SET: return "validate";
    case WSP_KEY_SET: return "wsp";
    }
    return "unknown";
}

bool IsAdminOpLegalForThread(AdminOpcode op, ThreadID thread)
{
    switch (thread) {
    case ROOT_THREAD:
        return op == ADMIN_PROVISION_KEY_ADD ||
               op == ADMIN_PROVISION_KEY_REVOKE ||
               op == ADMIN_ISSUE_KEY_ADD ||
               op == ADMIN_ISSUE_KEY_REVOKE;
    case PROVISION_THREAD:
        return op == ADMIN_VALIDATE_KEY_ADD ||
               op == ADMIN_VALIDATE_KEY_REVOKE ||
               op == ADMIN_WSP_KEY_ADD ||
               op == ADMIN_WSP_KEY_REVOKE;
    case ISSUE_THREAD:
        // No operations are defined for the issue thread yet
        return false;
    }
    return false;
}

std::string AdminAction::ToString() const
{
    std::string str = strprintf("AdminAction(%s, %s", GetAdminOpName(opcode), pubKey.GetHex());
    if (fHasKeyID)
        str += strprintf(", keyid=%s", keyID.ToString());
    str += ")";
    return str;
}

bool ExtractAdminAction(const CScript& script, AdminAction& actionRet, CValidationState& state)
{
    std::vector<ParsedOp> ops;
    if (!ParseScript(script, ops) || !IsAdminActionScript(ops))
        return state.DoS(100, false, REJECT_INVALID, "bad-adminop-script");

    const std::vector<unsigned char>& payload = ops[1].data;
    if (!IsKnownAdminOp(payload[0]))
        return state.DoS(100, false, REJECT_INVALID, "bad-adminop-opcode", false,
                         strprintf("opcode 0x%02x", (int)payload[0]));
    const AdminOpcode op = (AdminOpcode)payload[0];

    // 38-byte payloads are reserved for WSP operations, which require them
    const bool fWsp = IsWspAdminOp(op);
    if (fWsp != (payload.size() == ADMIN_WSP_ACTION_SIZE))
        return state.DoS(100, false, REJECT_INVALID, "bad-adminop-length", false,
                         strprintf("%s with %u byte payload", GetAdminOpName(op), payload.size()));

    CPubKey pubKey(payload.begin() + 1, payload.begin() + ADMIN_ACTION_SIZE);
    if (!pubKey.IsValid() || !pubKey.IsCompressed())
        return state.DoS(100, false, REJECT_INVALID, "bad-adminop-pubkey");

    if (fWsp) {
        std::vector<unsigned char> vchKeyID(payload.begin() + ADMIN_ACTION_SIZE, payload.end());
        actionRet = AdminAction(op, pubKey, KeyID::FromBytes(vchKeyID));
    } else {
        actionRet = AdminAction(op, pubKey);
    }
    return true;
}

bool ValidateAdminTransaction(const CTransaction& tx, ThreadID thread, CValidationState& state, AdminAction* pActionOut)
{
    // Baton plus at least one admin output
    if (tx.vout.size() < 2)
        return state.DoS(100, false, REJECT_INVALID, "bad-adminop-outputs");

    ThreadID batonThread;
    if (!IsThreadScript(tx.vout[0].scriptPubKey, batonThread) || batonThread != thread)
        return state.DoS(100, false, REJECT_INVALID, "bad-adminop-baton", false,
                         strprintf("expected %s thread baton", GetThreadName(thread)));

    AdminAction action;
    if (!ExtractAdminAction(tx.vout[1].scriptPubKey, action, state))
        return false;

    if (!IsAdminOpLegalForThread(action.opcode, thread))
        return state.DoS(100, false, REJECT_INVALID, "bad-adminop-thread", false,
                         strprintf("%s not allowed on %s thread", GetAdminOpName(action.opcode), GetThreadName(thread)));

    if (pActionOut)
        *pActionOut = action;
    return true;
}

bool GetAdminDetails(const CTransaction& tx, ThreadID& threadRet, std::vector<CScript>& adminOutputsRet)
{
    if (tx.vout.empty())
        return false;
    if (!IsThreadScript(tx.vout[0].scriptPubKey, threadRet))
        return false;

    adminOutputsRet.clear();
    for (size_t i = 1; i < tx.vout.size(); i++) {
        std::vector<ParsedOp> ops;
        if (!ParseScript(tx.vout[i].scriptPubKey, ops))
            return false;
        adminOutputsRet.push_back(tx.vout[i].scriptPubKey);
    }
    return true;
}

CScript GetScriptForAdminAction(AdminOpcode op, const CPubKey& pubKey)
{
    std::vector<unsigned char> payload;
    payload.reserve(ADMIN_ACTION_SIZE);
    payload.push_back((unsigned char)op);
    payload.insert(payload.end(), pubKey.begin(), pubKey.end());

    CScript script;
    script << OP_RETURN << payload;
    return script;
}

CScript GetScriptForWspAdminAction(AdminOpcode op, const CPubKey& pubKey, const KeyID& keyID)
{
    std::vector<unsigned char> payload;
    payload.reserve(ADMIN_WSP_ACTION_SIZE);
    payload.push_back((unsigned char)op);
    payload.insert(payload.end(), pubKey.begin(), pubKey.end());
    const std::vector<unsigned char> vchKeyID = keyID.ToBytes();
    payload.insert(payload.end(), vchKeyID.begin(), vchKeyID.end());

    CScript script;
    script << OP_RETURN << payload;
    return script;
}
