// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2013 The Bitcoin developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_PRIMITIVES_BLOCK_H
#define GOVCHAIN_PRIMITIVES_BLOCK_H

#include "primitives/transaction.h"
#include "serialize.h"
#include "uint256.h"

/** Nodes collect new transactions into a block, hash them into a hash tree,
 * and scan through nonce values to make the block's hash satisfy proof-of-work
 * requirements.  When they solve the proof-of-work, they broadcast the block
 * to everyone and the block is added to the block chain.  The first transaction
 * in the block is a special one that creates a new coin owned by the creator
 * of the block.
 *
 * The header carries its own height so that a block can be placed without
 * walking back to genesis.
 */
class CBlockHeader
{
public:
    static const int32_t CURRENT_VERSION = 1;

    // header
    int32_t nVersion;
    uint256 hashPrevBlock;
    uint256 hashMerkleRoot;
    uint32_t nTime;
    uint32_t nBits;
    uint32_t nHeight;
    uint32_t nNonce;

    CBlockHeader()
    {
        SetNull();
    }

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        s << nVersion << hashPrevBlock << hashMerkleRoot << nTime << nBits << nHeight << nNonce;
    }
    template <typename Stream>
    void Unserialize(Stream& s)
    {
        s >> nVersion >> hashPrevBlock >> hashMerkleRoot >> nTime >> nBits >> nHeight >> nNonce;
    }

    void SetNull()
    {
        nVersion = CBlockHeader::CURRENT_VERSION;
        hashPrevBlock.SetNull();
        hashMerkleRoot.SetNull();
        nTime = 0;
        nBits = 0;
        nHeight = 0;
        nNonce = 0;
    }

    bool IsNull() const
    {
        return (nBits == 0);
    }

    uint256 GetHash() const;

    int64_t GetBlockTime() const
    {
        return (int64_t)nTime;
    }
};


class CBlock : public CBlockHeader
{
public:
    // network and disk
    std::vector<CTransactionRef> vtx;

    CBlock()
    {
        SetNull();
    }

    CBlock(const CBlockHeader& header)
    {
        SetNull();
        *((CBlockHeader*)this) = header;
    }

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        CBlockHeader::Serialize(s);
        s << vtx;
    }
    template <typename Stream>
    void Unserialize(Stream& s)
    {
        CBlockHeader::Unserialize(s);
        s >> vtx;
    }

    void SetNull()
    {
        CBlockHeader::SetNull();
        vtx.clear();
    }

    CBlockHeader GetBlockHeader() const
    {
        CBlockHeader block;
        block.nVersion       = nVersion;
        block.hashPrevBlock  = hashPrevBlock;
        block.hashMerkleRoot = hashMerkleRoot;
        block.nTime          = nTime;
        block.nBits          = nBits;
        block.nHeight        = nHeight;
        block.nNonce         = nNonce;
        return block;
    }

    std::string ToString() const;
};

#endif // GOVCHAIN_PRIMITIVES_BLOCK_H
