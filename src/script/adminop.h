// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_SCRIPT_ADMINOP_H
#define GOVCHAIN_SCRIPT_ADMINOP_H

/**
 * Admin Op Codec
 *
 * An admin transaction spends the current baton of a thread and carries:
 *   vout[0] = new baton         <thread> OP_CHECKTHREAD
 *   vout[1] = admin action      OP_RETURN <opcode|pubkey[33]|keyid[4]?>
 *
 * Further outputs are ignored. Which opcodes a thread may carry:
 *   ROOT       provision key add/revoke, issue key add/revoke
 *   PROVISION  validate key add/revoke, WSP key add/revoke
 *   ISSUE      none (reserved)
 */

#include "pubkey.h"
#include "script/standard.h"

#include <string>
#include <vector>

class CTransaction;
class CValidationState;

enum AdminOpcode : unsigned char
{
    ADMIN_ISSUE_KEY_ADD = 0x01,
    ADMIN_ISSUE_KEY_REVOKE = 0x02,
    ADMIN_PROVISION_KEY_ADD = 0x03,
    ADMIN_PROVISION_KEY_REVOKE = 0x04,
    ADMIN_VALIDATE_KEY_ADD = 0x11,
    ADMIN_VALIDATE_KEY_REVOKE = 0x12,
    ADMIN_WSP_KEY_ADD = 0x13,
    ADMIN_WSP_KEY_REVOKE = 0x14,
};

/** Role whose keys an admin opcode mutates. */
enum KeySetType
{
    ROOT_KEY_SET = 0,
    PROVISION_KEY_SET = 1,
    ISSUE_KEY_SET = 2,
    VALIDATE_KEY_SET = 3,
    //! the KeyID -> pubkey map of WSP keys
    WSP_KEY_SET = 4,
};

//! Number of ordered public key sets (all roles but WSP)
static const int PUBKEY_SET_COUNT = 4;

struct AdminAction
{
    AdminOpcode opcode;
    CPubKey pubKey;
    //! only meaningful for WSP opcodes
    KeyID keyID;
    bool fHasKeyID;

    AdminAction() : opcode(ADMIN_ISSUE_KEY_ADD), fHasKeyID(false) {}
    AdminAction(AdminOpcode opcodeIn, const CPubKey& pubKeyIn) : opcode(opcodeIn), pubKey(pubKeyIn), fHasKeyID(false) {}
    AdminAction(AdminOpcode opcodeIn, const CPubKey& pubKeyIn, const KeyID& keyIDIn) : opcode(opcodeIn), pubKey(pubKeyIn), keyID(keyIDIn), fHasKeyID(true) {}

    friend bool operator==(const AdminAction& a, const AdminAction& b)
    {
        return a.opcode == b.opcode && a.pubKey == b.pubKey &&
               a.fHasKeyID == b.fHasKeyID && (!a.fHasKeyID || a.keyID == b.keyID);
    }

    std::string ToString() const;
};

bool IsKnownAdminOp(unsigned char op);
bool IsWspAdminOp(AdminOpcode op);
bool IsAddAdminOp(AdminOpcode op);
std::string GetAdminOpName(AdminOpcode op);
KeySetType GetKeySetTypeForOp(AdminOpcode op);
const char* GetKeySetName(KeySetType type);

/** Root -> {Provision*, Issue*}; Provision -> {Validate*, Wsp*}; Issue -> none. */
bool IsAdminOpLegalForThread(AdminOpcode op, ThreadID thread);

/**
 * Decode the action carried by an `OP_RETURN <payload>` admin script.
 *
 * Errors (bad-adminop-*): script is not an admin action, unknown opcode,
 * payload length not matching the opcode (38 bytes is reserved for WSP
 * opcodes and WSP opcodes require it), key not a compressed public key.
 */
bool ExtractAdminAction(const CScript& script, AdminAction& actionRet, CValidationState& state);

/**
 * Check the shape of an admin transaction for `thread` without touching any
 * governance state: baton output first, then an action legal for the thread.
 */
bool ValidateAdminTransaction(const CTransaction& tx, ThreadID thread, CValidationState& state, AdminAction* pActionOut = nullptr);

/**
 * Thread and admin outputs of a transaction whose first output is a thread
 * baton. The admin outputs are every output after the baton.
 */
bool GetAdminDetails(const CTransaction& tx, ThreadID& threadRet, std::vector<CScript>& adminOutputsRet);

CScript GetScriptForAdminAction(AdminOpcode op, const CPubKey& pubKey);
CScript GetScriptForWspAdminAction(AdminOpcode op, const CPubKey& pubKey, const KeyID& keyID);

#endif // GOVCHAIN_SCRIPT_ADMINOP_H
