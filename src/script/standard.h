// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_SCRIPT_STANDARD_H
#define GOVCHAIN_SCRIPT_STANDARD_H

#include "pubkey.h"
#include "script/script.h"
#include "uint256.h"

#include <stdint.h>
#include <vector>

class CTransaction;

/**
 * Script Classifier
 *
 * Decides which script family a locking script belongs to. The ledger only
 * recognises its own families:
 *
 *   nulldata           OP_RETURN [<= 80 byte push]
 *   adminauth          OP_2 <hash> <keyid> <keyid> OP_3 OP_CHECKSAFEMULTISIG
 *   adminauth (m-of-n) <m> <hash>... <keyid>... <n> OP_CHECKSAFEMULTISIG
 *   adminop            <thread> OP_CHECKTHREAD         (thread baton)
 *                      OP_RETURN <34|38 byte payload>  (admin action)
 */

static const unsigned int MAX_DATA_CARRIER_SIZE = 80;

//! Admin action payload: opcode byte + compressed pubkey
static const unsigned int ADMIN_ACTION_SIZE = 1 + CPubKey::COMPRESSED_PUBLIC_KEY_SIZE;
//! WSP admin action payload: opcode byte + compressed pubkey + KeyID
static const unsigned int ADMIN_WSP_ACTION_SIZE = ADMIN_ACTION_SIZE + KeyID::SIZE;

//! Size of a key hash pushed into an authorization script
static const unsigned int KEY_HASH_SIZE = 20;

enum ThreadID
{
    ROOT_THREAD = 0,
    PROVISION_THREAD = 1,
    ISSUE_THREAD = 2,
};

static const int THREAD_COUNT = 3;

const char* GetThreadName(ThreadID thread);

enum txnouttype
{
    TX_NONSTANDARD,
    // 'standard' transaction types of other ledgers, never produced here:
    TX_PUBKEY,
    TX_PUBKEYHASH,
    TX_SCRIPTHASH,
    TX_MULTISIG,
    // governance-aware families:
    TX_NULL_DATA,
    TX_ADMINAUTH,
    TX_GENERAL_ADMINAUTH,
    TX_ADMINOP,
};

/** Get the name of a txnouttype as a C string, or nullptr if unknown. */
const char* GetTxnOutputType(txnouttype t);

/** One decoded script element. */
struct ParsedOp
{
    opcodetype opcode;
    std::vector<unsigned char> data;

    ParsedOp() : opcode(OP_INVALIDOPCODE) {}
    ParsedOp(opcodetype opcodeIn, std::vector<unsigned char> dataIn) : opcode(opcodeIn), data(std::move(dataIn)) {}
};

/** Split a script into its elements. Returns false on a truncated push. */
bool ParseScript(const CScript& script, std::vector<ParsedOp>& ops);

/** True for OP_0 and OP_1..OP_16. */
bool IsSmallInt(opcodetype opcode);

/** Classify an already parsed script. Total: unknown shapes are TX_NONSTANDARD. */
txnouttype TypeOfScript(const std::vector<ParsedOp>& ops);

/** Classify a script; scripts that do not parse are TX_NONSTANDARD. */
txnouttype GetScriptClass(const CScript& script);

bool IsNullDataScript(const std::vector<ParsedOp>& ops);
bool IsAdminActionScript(const std::vector<ParsedOp>& ops);
bool IsGeneralAdminAuthScript(const std::vector<ParsedOp>& ops);
bool IsStandardAdminAuthScript(const std::vector<ParsedOp>& ops);

/** Read the thread id of a `<thread> OP_CHECKTHREAD` baton script. */
bool ExtractThreadID(const std::vector<ParsedOp>& ops, ThreadID& threadRet);
bool IsThreadScript(const CScript& script, ThreadID& threadRet);

/** Destination of an admin authorization output. */
struct CAdminAuthDestination
{
    std::vector<uint160> keyHashes;
    std::vector<KeyID> keyIDs;

    friend bool operator==(const CAdminAuthDestination& a, const CAdminAuthDestination& b)
    {
        return a.keyHashes == b.keyHashes && a.keyIDs == b.keyIDs;
    }
};

/**
 * Decode an m-of-n admin authorization script.
 * @return false unless the script classifies as adminauth
 */
bool DecodeGeneralAdminAuth(const CScript& script, int& nSigs, std::vector<uint160>& keyHashes, std::vector<KeyID>& keyIDs);

/**
 * Extract the destination of an output.
 *
 * Both admin authorization forms report their key hashes and KeyIDs with
 * nRequiredRet = nSigs. Thread batons and admin actions report no
 * destination and nRequiredRet = 2. Everything else fails.
 */
bool ExtractAdminAuthDestination(const CScript& scriptPubKey, txnouttype& typeRet, CAdminAuthDestination& destRet, int& nRequiredRet);

/** Number of scriptSig elements needed to spend a script of the given class, -1 if unknown. */
int ScriptSigArgsExpected(txnouttype t, const std::vector<ParsedOp>& ops);

/** All data pushed by the script, in order. */
bool PushedData(const CScript& script, std::vector<std::vector<unsigned char> >& vDataRet);

/** Read nKeys/nSigs of a multisig-shaped script (the caller knows it is one). */
bool CalcMultiSigStats(const CScript& script, int& nKeysRet, int& nSigsRet);

/** Every output is an admin authorization or zero-value null data; at least one output. */
bool IsAdminAuthTx(const CTransaction& tx);

CScript GetScriptForGeneralAdminAuth(int nSigs, const std::vector<uint160>& keyHashes, const std::vector<KeyID>& keyIDs);
/** 2-of-3 admin authorization. Empty script unless exactly two KeyIDs are given. */
CScript GetScriptForAdminAuth(const uint160& keyHash, const std::vector<KeyID>& keyIDs);
CScript GetScriptForThread(ThreadID thread);
CScript GetScriptForMultisig(int nRequired, const std::vector<CPubKey>& keys);

#endif // GOVCHAIN_SCRIPT_STANDARD_H
