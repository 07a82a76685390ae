// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fullblocktests/testinstance.h"

#include "utilstrencodings.h"

namespace {

class NameVisitor : public boost::static_visitor<std::string>
{
public:
    template <typename T>
    std::string operator()(const T& instance) const { return instance.name; }
};

class HeightVisitor : public boost::static_visitor<uint32_t>
{
public:
    template <typename T>
    uint32_t operator()(const T& instance) const { return instance.nHeight; }
};

class TypeVisitor : public boost::static_visitor<const char*>
{
public:
    const char* operator()(const AcceptedBlock&) const { return "accepted"; }
    const char* operator()(const RejectedBlock&) const { return "rejected"; }
    const char* operator()(const OrphanOrRejectedBlock&) const { return "orphanorrejected"; }
    const char* operator()(const ExpectedTip&) const { return "expectedtip"; }
    const char* operator()(const RejectedNonCanonicalBlock&) const { return "noncanonical"; }
};

class DescribeVisitor : public boost::static_visitor<std::string>
{
public:
    std::string operator()(const AcceptedBlock& instance) const
    {
        return strprintf("AcceptedBlock(%s, height=%u, hash=%s, mainchain=%d, orphan=%d, %s)",
                         instance.name, instance.nHeight, instance.block->GetHash().ToString(),
                         instance.fMainChain, instance.fOrphan, instance.keySnapshot.ToString());
    }
    std::string operator()(const RejectedBlock& instance) const
    {
        return strprintf("RejectedBlock(%s, height=%u, hash=%s, reason=%s)",
                         instance.name, instance.nHeight, instance.block->GetHash().ToString(), instance.strRejectReason);
    }
    std::string operator()(const OrphanOrRejectedBlock& instance) const
    {
        return strprintf("OrphanOrRejectedBlock(%s, height=%u, hash=%s)",
                         instance.name, instance.nHeight, instance.block->GetHash().ToString());
    }
    std::string operator()(const ExpectedTip& instance) const
    {
        return strprintf("ExpectedTip(%s, height=%u, hash=%s)",
                         instance.name, instance.nHeight, instance.block->GetHash().ToString());
    }
    std::string operator()(const RejectedNonCanonicalBlock& instance) const
    {
        return strprintf("RejectedNonCanonicalBlock(%s, height=%u, %u bytes)",
                         instance.name, instance.nHeight, instance.vchRawBlock.size());
    }
};

} // namespace

std::string GetTestInstanceName(const TestInstance& instance)
{
    return boost::apply_visitor(NameVisitor(), instance);
}

uint32_t GetTestInstanceHeight(const TestInstance& instance)
{
    return boost::apply_visitor(HeightVisitor(), instance);
}

const char* GetTestInstanceType(const TestInstance& instance)
{
    return boost::apply_visitor(TypeVisitor(), instance);
}

std::string TestInstanceToString(const TestInstance& instance)
{
    return boost::apply_visitor(DescribeVisitor(), instance);
}
