// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_FULLBLOCKTESTS_TESTINSTANCE_H
#define GOVCHAIN_FULLBLOCKTESTS_TESTINSTANCE_H

#include "governance/adminstate.h"
#include "primitives/block.h"

#include <boost/variant.hpp>

#include <memory>
#include <string>
#include <vector>

/**
 * Expected outcome of submitting one generated block to a validator. A
 * stream of groups of these is what the block generator produces; groups
 * are replayed in order, instances of a group in order.
 */

/** Block is accepted. fMainChain tells whether it becomes the tip. */
struct AcceptedBlock
{
    std::string name;
    std::shared_ptr<const CBlock> block;
    uint32_t nHeight;
    bool fMainChain;
    bool fOrphan;
    //! admin keys of the active chain once the block is processed
    CAdminKeySnapshot keySnapshot;
};

/** Block is rejected for strRejectReason. */
struct RejectedBlock
{
    std::string name;
    std::shared_ptr<const CBlock> block;
    uint32_t nHeight;
    std::string strRejectReason;
};

/**
 * Block is either an orphan or rejected. Covers blocks whose parent is
 * unknown, where a validator may legitimately do either.
 */
struct OrphanOrRejectedBlock
{
    std::string name;
    std::shared_ptr<const CBlock> block;
    uint32_t nHeight;
};

/** The active chain tip is expected to be block. */
struct ExpectedTip
{
    std::string name;
    std::shared_ptr<const CBlock> block;
    uint32_t nHeight;
};

/** Raw bytes that must fail to decode as a block. */
struct RejectedNonCanonicalBlock
{
    std::string name;
    std::vector<unsigned char> vchRawBlock;
    uint32_t nHeight;
};

typedef boost::variant<AcceptedBlock, RejectedBlock, OrphanOrRejectedBlock, ExpectedTip, RejectedNonCanonicalBlock> TestInstance;

std::string GetTestInstanceName(const TestInstance& instance);
uint32_t GetTestInstanceHeight(const TestInstance& instance);
/** Kind of the instance: "accepted", "rejected", "orphanorrejected", "expectedtip", "noncanonical" */
const char* GetTestInstanceType(const TestInstance& instance);
std::string TestInstanceToString(const TestInstance& instance);

#endif // GOVCHAIN_FULLBLOCKTESTS_TESTINSTANCE_H
