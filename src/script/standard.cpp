// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "script/standard.h"

#include "primitives/transaction.h"

#include <set>

const char* GetThreadName(ThreadID thread)
{
    switch (thread) {
    case ROOT_THREAD: return "root";
    case PROVISION_THREAD: return "provision";
    case ISSUE_THREAD: return "issue";
    }
    return "unknown";
}

const char* GetTxnOutputType(txnouttype t)
{
    switch (t) {
    case TX_NONSTANDARD: return "nonstandard";
    case TX_PUBKEY: return "pubkey";
    case TX_PUBKEYHASH: return "pubkeyhash";
    case TX_SCRIPTHASH: return "scripthash";
    case TX_MULTISIG: return "multisig";
    case TX_NULL_DATA: return "nulldata";
    case TX_ADMINAUTH: return "adminauth";
    case TX_GENERAL_ADMINAUTH: return "adminauth";
    case TX_ADMINOP: return "adminop";
    }
    return nullptr;
}

bool ParseScript(const CScript& script, std::vector<ParsedOp>& ops)
{
    ops.clear();
    CScript::const_iterator pc = script.begin();
    while (pc < script.end()) {
        opcodetype opcode;
        std::vector<unsigned char> vch;
        if (!script.GetOp(pc, opcode, vch))
            return false;
        ops.emplace_back(opcode, std::move(vch));
    }
    return true;
}

bool IsSmallInt(opcodetype opcode)
{
    return opcode == OP_0 || (opcode >= OP_1 && opcode <= OP_16);
}

static bool IsDataPush(const ParsedOp& op)
{
    return op.opcode <= OP_PUSHDATA4;
}

bool IsNullDataScript(const std::vector<ParsedOp>& ops)
{
    if (ops.size() == 1 && ops[0].opcode == OP_RETURN)
        return true;

    return ops.size() == 2 &&
           ops[0].opcode == OP_RETURN &&
           IsDataPush(ops[1]) &&
           ops[1].data.size() <= MAX_DATA_CARRIER_SIZE;
}

bool IsAdminActionScript(const std::vector<ParsedOp>& ops)
{
    if (ops.size() != 2 || ops[0].opcode != OP_RETURN)
        return false;
    // Direct push only: the opcode is the payload length
    const ParsedOp& push = ops[1];
    if (push.opcode != ADMIN_ACTION_SIZE && push.opcode != ADMIN_WSP_ACTION_SIZE)
        return false;
    return push.data.size() == (size_t)push.opcode;
}

bool IsGeneralAdminAuthScript(const std::vector<ParsedOp>& ops)
{
    // The absolute minimum is 3 keys:
    // OP_2 <hash> <keyid> <keyid> OP_3 OP_CHECKSAFEMULTISIG
    const size_t nOps = ops.size();
    if (nOps < 6)
        return false;
    if (!IsSmallInt(ops[0].opcode) || !IsSmallInt(ops[nOps - 2].opcode))
        return false;
    if (ops[nOps - 1].opcode != OP_CHECKSAFEMULTISIG)
        return false;

    const int nSigs = CScript::DecodeOP_N(ops[0].opcode);
    const int nKeys = CScript::DecodeOP_N(ops[nOps - 2].opcode);

    // No effective single-sig
    if (nSigs < 2)
        return false;
    if ((size_t)nKeys != nOps - 3)
        return false;

    int nKeyHashes = 0;
    int nKeyIDs = 0;
    std::set<KeyID> setSeen;
    for (size_t i = 1; i < nOps - 2; i++) {
        const ParsedOp& op = ops[i];
        if (!IsDataPush(op))
            return false;
        if (op.data.size() == KEY_HASH_SIZE) {
            // key hashes must come before any KeyID
            if (nKeyIDs > 0)
                return false;
            nKeyHashes++;
        } else if (op.data.size() == KeyID::SIZE) {
            if (!setSeen.insert(KeyID::FromBytes(op.data)).second)
                return false;
            nKeyIDs++;
        } else {
            return false;
        }
    }

    // Raw key hashes alone can never move funds, and enough KeyIDs must
    // be present to reach the threshold without them.
    if (nKeyHashes >= nSigs)
        return false;
    if (nKeyIDs < nSigs)
        return false;

    return true;
}

bool IsStandardAdminAuthScript(const std::vector<ParsedOp>& ops)
{
    return ops.size() == 6 &&
           ops[0].opcode == OP_2 &&
           ops[1].data.size() == KEY_HASH_SIZE &&
           ops[4].opcode == OP_3 &&
           IsGeneralAdminAuthScript(ops);
}

bool ExtractThreadID(const std::vector<ParsedOp>& ops, ThreadID& threadRet)
{
    if (ops.size() != 2 || ops[1].opcode != OP_CHECKTHREAD)
        return false;
    if (!IsSmallInt(ops[0].opcode))
        return false;
    int n = CScript::DecodeOP_N(ops[0].opcode);
    if (n < ROOT_THREAD || n > ISSUE_THREAD)
        return false;
    threadRet = (ThreadID)n;
    return true;
}

bool IsThreadScript(const CScript& script, ThreadID& threadRet)
{
    std::vector<ParsedOp> ops;
    if (!ParseScript(script, ops))
        return false;
    return ExtractThreadID(ops, threadRet);
}

txnouttype TypeOfScript(const std::vector<ParsedOp>& ops)
{
    ThreadID thread;
    // Admin actions are OP_RETURN outputs too; they take precedence over null data
    if (IsAdminActionScript(ops))
        return TX_ADMINOP;
    if (IsNullDataScript(ops))
        return TX_NULL_DATA;
    if (IsStandardAdminAuthScript(ops))
        return TX_ADMINAUTH;
    if (IsGeneralAdminAuthScript(ops))
        return TX_GENERAL_ADMINAUTH;
    if (ExtractThreadID(ops, thread))
        return TX_ADMINOP;
    return TX_NONSTANDARD;
}

txnouttype GetScriptClass(const CScript& script)
{
    std::vector<ParsedOp> ops;
    if (!ParseScript(script, ops))
        return TX_NONSTANDARD;
    return TypeOfScript(ops);
}

bool DecodeGeneralAdminAuth(const CScript& script, int& nSigs, std::vector<uint160>& keyHashes, std::vector<KeyID>& keyIDs)
{
    std::vector<ParsedOp> ops;
    if (!ParseScript(script, ops) || !IsGeneralAdminAuthScript(ops))
        return false;

    nSigs = CScript::DecodeOP_N(ops[0].opcode);
    keyHashes.clear();
    keyIDs.clear();
    for (size_t i = 1; i < ops.size() - 2; i++) {
        if (ops[i].data.size() == KEY_HASH_SIZE)
            keyHashes.push_back(uint160(ops[i].data));
        else
            keyIDs.push_back(KeyID::FromBytes(ops[i].data));
    }
    return true;
}

bool ExtractAdminAuthDestination(const CScript& scriptPubKey, txnouttype& typeRet, CAdminAuthDestination& destRet, int& nRequiredRet)
{
    destRet.keyHashes.clear();
    destRet.keyIDs.clear();

    typeRet = GetScriptClass(scriptPubKey);
    switch (typeRet) {
    case TX_ADMINAUTH:
    case TX_GENERAL_ADMINAUTH:
        return DecodeGeneralAdminAuth(scriptPubKey, nRequiredRet, destRet.keyHashes, destRet.keyIDs);
    case TX_ADMINOP:
        // Admin outputs are authorized by two keys of the governing thread
        nRequiredRet = 2;
        return true;
    default:
        return false;
    }
}

int ScriptSigArgsExpected(txnouttype t, const std::vector<ParsedOp>& ops)
{
    switch (t) {
    case TX_ADMINAUTH:
    case TX_GENERAL_ADMINAUTH:
        // Only key hashes and KeyIDs are in the script, so every signature
        // is accompanied by its public key.
        if (ops.empty() || !IsSmallInt(ops[0].opcode))
            return -1;
        return CScript::DecodeOP_N(ops[0].opcode) * 2;
    case TX_ADMINOP:
        // 2 pubkeys + 2 sigs
        return 4;
    default:
        return -1;
    }
}

bool PushedData(const CScript& script, std::vector<std::vector<unsigned char> >& vDataRet)
{
    std::vector<ParsedOp> ops;
    if (!ParseScript(script, ops))
        return false;
    vDataRet.clear();
    for (const ParsedOp& op : ops) {
        if (!op.data.empty())
            vDataRet.push_back(op.data);
    }
    return true;
}

bool CalcMultiSigStats(const CScript& script, int& nKeysRet, int& nSigsRet)
{
    std::vector<ParsedOp> ops;
    if (!ParseScript(script, ops))
        return false;

    // NUM_SIGS KEY KEY ... NUM_KEYS OP_CHECK(SAFE)MULTISIG, at least
    // OP_1 KEY OP_1 OP_CHECKMULTISIG
    if (ops.size() < 4)
        return false;
    if (!IsSmallInt(ops[0].opcode) || !IsSmallInt(ops[ops.size() - 2].opcode))
        return false;
    nSigsRet = CScript::DecodeOP_N(ops[0].opcode);
    nKeysRet = CScript::DecodeOP_N(ops[ops.size() - 2].opcode);
    return true;
}

bool IsAdminAuthTx(const CTransaction& tx)
{
    if (tx.vout.empty())
        return false;

    for (const CTxOut& txout : tx.vout) {
        std::vector<ParsedOp> ops;
        if (!ParseScript(txout.scriptPubKey, ops))
            return false;
        if (IsNullDataScript(ops)) {
            if (txout.nValue != 0)
                return false;
        } else if (!IsGeneralAdminAuthScript(ops)) {
            return false;
        }
    }
    return true;
}

CScript GetScriptForGeneralAdminAuth(int nSigs, const std::vector<uint160>& keyHashes, const std::vector<KeyID>& keyIDs)
{
    CScript script;
    script << (int64_t)nSigs;
    for (const uint160& hash : keyHashes)
        script << ToByteVector(hash);
    for (const KeyID& id : keyIDs)
        script << id.ToBytes();
    script << (int64_t)(keyHashes.size() + keyIDs.size()) << OP_CHECKSAFEMULTISIG;
    return script;
}

CScript GetScriptForAdminAuth(const uint160& keyHash, const std::vector<KeyID>& keyIDs)
{
    if (keyIDs.size() != 2)
        return CScript();
    return GetScriptForGeneralAdminAuth(2, std::vector<uint160>(1, keyHash), keyIDs);
}

CScript GetScriptForThread(ThreadID thread)
{
    CScript script;
    script << CScript::EncodeOP_N((int)thread) << OP_CHECKTHREAD;
    return script;
}

CScript GetScriptForMultisig(int nRequired, const std::vector<CPubKey>& keys)
{
    CScript script;

    script << CScript::EncodeOP_N(nRequired);
    for (const CPubKey& key : keys)
        script << ToByteVector(key);
    script << CScript::EncodeOP_N(keys.size()) << OP_CHECKMULTISIG;
    return script;
}
