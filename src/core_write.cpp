// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2017-2021 The PIVX Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "consensus/validation.h"
#include "governance/adminstate.h"
#include "primitives/block.h"
#include "primitives/transaction.h"
#include "script/adminop.h"
#include "script/script.h"
#include "script/standard.h"
#include "serialize.h"
#include "streams.h"
#include <univalue.h>
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "version.h"

/**
 * Create the assembly string representation of a CScript object.
 * Pushes of up to 4 bytes are shown as numbers, longer ones as hex.
 */
std::string ScriptToAsmStr(const CScript& script)
{
    std::string str;
    opcodetype opcode;
    std::vector<unsigned char> vch;
    CScript::const_iterator pc = script.begin();
    while (pc < script.end()) {
        if (!str.empty()) {
            str += " ";
        }
        if (!script.GetOp(pc, opcode, vch)) {
            str += "[error]";
            return str;
        }
        if (0 <= opcode && opcode <= OP_PUSHDATA4) {
            if (vch.size() <= static_cast<std::vector<unsigned char>::size_type>(4)) {
                str += strprintf("%d", CScriptNum(vch, false).getint());
            } else {
                str += HexStr(vch);
            }
        } else {
            str += GetOpName(opcode);
        }
    }
    return str;
}

std::string EncodeHexTx(const CTransaction& tx)
{
    CDataStream ssTx(SER_NETWORK, PROTOCOL_VERSION);
    ssTx << tx;
    return HexStr(ssTx.str());
}

std::string EncodeHexBlk(const CBlock& block)
{
    CDataStream ssBlock(SER_NETWORK, PROTOCOL_VERSION);
    ssBlock << block;
    return HexStr(ssBlock.str());
}

void ScriptPubKeyToUniv(const CScript& scriptPubKey,
    UniValue& out,
    bool fIncludeHex)
{
    txnouttype type;
    CAdminAuthDestination dest;
    int nRequired;

    out.pushKV("asm", ScriptToAsmStr(scriptPubKey));
    if (fIncludeHex)
        out.pushKV("hex", HexStr(scriptPubKey));

    if (!ExtractAdminAuthDestination(scriptPubKey, type, dest, nRequired)) {
        out.pushKV("type", GetTxnOutputType(type));
        return;
    }

    out.pushKV("reqSigs", nRequired);
    out.pushKV("type", GetTxnOutputType(type));

    ThreadID thread;
    if (IsThreadScript(scriptPubKey, thread))
        out.pushKV("thread", GetThreadName(thread));

    if (dest.keyHashes.empty() && dest.keyIDs.empty())
        return;

    UniValue hashes(UniValue::VARR);
    for (const uint160& keyHash : dest.keyHashes)
        hashes.push_back(keyHash.GetHex());
    out.pushKV("keyhashes", hashes);

    UniValue keyIDs(UniValue::VARR);
    for (const KeyID& keyID : dest.keyIDs)
        keyIDs.push_back(keyID.ToString());
    out.pushKV("keyids", keyIDs);
}

void AdminActionToUniv(const AdminAction& action, UniValue& out)
{
    out.pushKV("op", GetAdminOpName(action.opcode));
    out.pushKV("keyset", GetKeySetName(GetKeySetTypeForOp(action.opcode)));
    out.pushKV("pubkey", action.pubKey.GetHex());
    if (action.fHasKeyID)
        out.pushKV("keyid", action.keyID.ToString());
}

void AdminKeySnapshotToUniv(const CAdminKeySnapshot& snapshot, UniValue& out)
{
    for (int i = 0; i < PUBKEY_SET_COUNT; i++) {
        UniValue keys(UniValue::VARR);
        for (const CPubKey& pubKey : snapshot.keySets[i])
            keys.push_back(pubKey.GetHex());
        out.pushKV(GetKeySetName((KeySetType)i), keys);
    }

    UniValue wsp(UniValue::VOBJ);
    for (const auto& entry : snapshot.mapWspKeyIds)
        wsp.pushKV(entry.first.ToString(), entry.second.GetHex());
    out.pushKV(GetKeySetName(WSP_KEY_SET), wsp);
}

void TxToUniv(const CTransaction& tx, const uint256& hashBlock, UniValue& entry)
{
    entry.pushKV("txid", tx.GetHash().GetHex());
    entry.pushKV("version", tx.nVersion);
    entry.pushKV("size", (int)::GetSerializeSize(tx));
    entry.pushKV("locktime", (int64_t)tx.nLockTime);

    UniValue vin(UniValue::VARR);
    for (const CTxIn& txin : tx.vin) {
        UniValue in(UniValue::VOBJ);
        if (tx.IsCoinBase())
            in.pushKV("coinbase", HexStr(txin.scriptSig));
        else {
            in.pushKV("txid", txin.prevout.hash.GetHex());
            in.pushKV("vout", (int64_t)txin.prevout.n);
            UniValue o(UniValue::VOBJ);
            o.pushKV("asm", ScriptToAsmStr(txin.scriptSig));
            o.pushKV("hex", HexStr(txin.scriptSig));
            in.pushKV("scriptSig", o);
        }
        in.pushKV("sequence", (int64_t)txin.nSequence);
        vin.push_back(in);
    }
    entry.pushKV("vin", vin);

    UniValue vout(UniValue::VARR);
    for (unsigned int i = 0; i < tx.vout.size(); i++) {
        const CTxOut& txout = tx.vout[i];

        UniValue out(UniValue::VOBJ);

        UniValue outValue(UniValue::VNUM, FormatMoney(txout.nValue));
        out.pushKV("value", outValue);
        out.pushKV("n", (int64_t)i);

        UniValue o(UniValue::VOBJ);
        ScriptPubKeyToUniv(txout.scriptPubKey, o, true);
        out.pushKV("scriptPubKey", o);
        vout.push_back(out);
    }
    entry.pushKV("vout", vout);

    // Admin transactions: the action carried by the output after the baton
    ThreadID thread;
    if (!tx.IsCoinBase() && tx.vout.size() >= 2 && IsThreadScript(tx.vout[0].scriptPubKey, thread)) {
        AdminAction action;
        CValidationState state;
        if (ExtractAdminAction(tx.vout[1].scriptPubKey, action, state)) {
            UniValue admin(UniValue::VOBJ);
            admin.pushKV("thread", GetThreadName(thread));
            AdminActionToUniv(action, admin);
            entry.pushKV("adminAction", admin);
        }
    }

    if (!hashBlock.IsNull())
        entry.pushKV("blockhash", hashBlock.GetHex());

    entry.pushKV("hex", EncodeHexTx(tx));
}

void BlockToUniv(const CBlock& block, UniValue& entry)
{
    const uint256 hash = block.GetHash();
    entry.pushKV("hash", hash.GetHex());
    entry.pushKV("height", (int64_t)block.nHeight);
    entry.pushKV("version", block.nVersion);
    entry.pushKV("merkleroot", block.hashMerkleRoot.GetHex());
    entry.pushKV("time", block.GetBlockTime());
    entry.pushKV("nonce", (uint64_t)block.nNonce);
    entry.pushKV("bits", strprintf("%08x", block.nBits));
    entry.pushKV("previousblockhash", block.hashPrevBlock.GetHex());

    UniValue txs(UniValue::VARR);
    for (const CTransactionRef& tx : block.vtx) {
        UniValue objTx(UniValue::VOBJ);
        TxToUniv(*tx, hash, objTx);
        txs.push_back(objTx);
    }
    entry.pushKV("tx", txs);
}
