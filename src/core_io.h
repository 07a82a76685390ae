// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_CORE_IO_H
#define GOVCHAIN_CORE_IO_H

#include <string>
#include <vector>

class CBlock;
class CScript;
class CTransaction;
class uint256;
class UniValue;
struct AdminAction;
struct CAdminKeySnapshot;

// core_read.cpp
bool DecodeHexBlk(CBlock& block, const std::string& strHexBlk);

// core_write.cpp
std::string ScriptToAsmStr(const CScript& script);
std::string EncodeHexTx(const CTransaction& tx);
std::string EncodeHexBlk(const CBlock& block);
void ScriptPubKeyToUniv(const CScript& scriptPubKey, UniValue& out, bool fIncludeHex);
void AdminActionToUniv(const AdminAction& action, UniValue& out);
void AdminKeySnapshotToUniv(const CAdminKeySnapshot& snapshot, UniValue& out);
void TxToUniv(const CTransaction& tx, const uint256& hashBlock, UniValue& entry);
void BlockToUniv(const CBlock& block, UniValue& entry);

#endif // GOVCHAIN_CORE_IO_H
