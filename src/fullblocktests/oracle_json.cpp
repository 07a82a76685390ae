// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fullblocktests/oracle_json.h"

#include "core_io.h"
#include "utilstrencodings.h"

namespace {

class InstanceToUnivVisitor : public boost::static_visitor<void>
{
private:
    UniValue& obj;
    const bool fVerbose;

    void PushBlock(const CBlock& block) const
    {
        obj.pushKV("hash", block.GetHash().GetHex());
        obj.pushKV("hex", EncodeHexBlk(block));
        if (fVerbose) {
            UniValue objBlock(UniValue::VOBJ);
            BlockToUniv(block, objBlock);
            obj.pushKV("block", objBlock);
        }
    }

public:
    InstanceToUnivVisitor(UniValue& objIn, bool fVerboseIn) : obj(objIn), fVerbose(fVerboseIn) {}

    void operator()(const AcceptedBlock& accepted) const
    {
        PushBlock(*accepted.block);
        obj.pushKV("mainchain", accepted.fMainChain);
        obj.pushKV("orphan", accepted.fOrphan);
        UniValue keys(UniValue::VOBJ);
        AdminKeySnapshotToUniv(accepted.keySnapshot, keys);
        obj.pushKV("adminkeys", keys);
    }

    void operator()(const RejectedBlock& rejected) const
    {
        PushBlock(*rejected.block);
        obj.pushKV("reason", rejected.strRejectReason);
    }

    void operator()(const OrphanOrRejectedBlock& orphan) const
    {
        PushBlock(*orphan.block);
    }

    void operator()(const ExpectedTip& tip) const
    {
        obj.pushKV("hash", tip.block->GetHash().GetHex());
    }

    void operator()(const RejectedNonCanonicalBlock& noncanonical) const
    {
        obj.pushKV("hex", HexStr(noncanonical.vchRawBlock));
    }
};

} // namespace

UniValue TestInstanceToUniv(const TestInstance& instance, bool fVerbose)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("type", GetTestInstanceType(instance));
    obj.pushKV("name", GetTestInstanceName(instance));
    obj.pushKV("height", (int64_t)GetTestInstanceHeight(instance));
    boost::apply_visitor(InstanceToUnivVisitor(obj, fVerbose), instance);
    return obj;
}

UniValue TestGroupsToUniv(const std::vector<std::vector<TestInstance>>& tests, bool fVerbose)
{
    UniValue groups(UniValue::VARR);
    for (const std::vector<TestInstance>& group : tests) {
        UniValue instances(UniValue::VARR);
        for (const TestInstance& instance : group)
            instances.push_back(TestInstanceToUniv(instance, fVerbose));
        groups.push_back(instances);
    }
    return groups;
}
