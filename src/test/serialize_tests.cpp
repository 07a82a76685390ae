// Copyright (c) 2012-2017 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "primitives/block.h"
#include "serialize.h"
#include "streams.h"
#include "test/test_govchain.h"
#include "utilstrencodings.h"
#include "version.h"

#include <boost/test/unit_test.hpp>

#include <ios>

BOOST_FIXTURE_TEST_SUITE(serialize_tests, BasicTestingSetup)

static uint64_t ReadSize(const std::string& hex)
{
    CDataStream ss(ParseHex(hex), SER_NETWORK, PROTOCOL_VERSION);
    return ReadCompactSize(ss);
}

BOOST_AUTO_TEST_CASE(compactsize)
{
    CDataStream ss(SER_NETWORK, PROTOCOL_VERSION);
    for (uint64_t n : {0ULL, 252ULL, 253ULL, 0xffffULL, 0x10000ULL}) {
        WriteCompactSize(ss, n);
        BOOST_CHECK_EQUAL(ReadCompactSize(ss), n);
    }
    BOOST_CHECK(ss.empty());

    BOOST_CHECK_EQUAL(ReadSize("fdfd00"), 253U);
    BOOST_CHECK_EQUAL(ReadSize("fe00000100"), 0x10000U);
}

BOOST_AUTO_TEST_CASE(noncanonical)
{
    BOOST_CHECK_THROW(ReadSize("fd0000"), std::ios_base::failure);
    BOOST_CHECK_THROW(ReadSize("fdfc00"), std::ios_base::failure);
    BOOST_CHECK_THROW(ReadSize("fe0000ffff"), std::ios_base::failure);
    BOOST_CHECK_THROW(ReadSize("ffffffffff00000000"), std::ios_base::failure);
    // truncated
    BOOST_CHECK_THROW(ReadSize("fd01"), std::ios_base::failure);
}

BOOST_AUTO_TEST_CASE(block_serialization)
{
    const CBlock& genesis = Params().GenesisBlock();

    CDataStream ss(SER_NETWORK, PROTOCOL_VERSION);
    ss << genesis;
    BOOST_CHECK_EQUAL(ss.size(), GetSerializeSize(genesis));

    CBlock block;
    ss >> block;
    BOOST_CHECK(ss.empty());
    BOOST_CHECK(block.GetHash() == genesis.GetHash());
    BOOST_REQUIRE_EQUAL(block.vtx.size(), 1U);
    BOOST_CHECK(*block.vtx[0] == *genesis.vtx[0]);

    // The header carries its height and is 4+32+32+4+4+4+4 bytes
    CDataStream ssHeader(SER_NETWORK, PROTOCOL_VERSION);
    ssHeader << genesis.GetBlockHeader();
    BOOST_CHECK_EQUAL(ssHeader.size(), 84U);
}

BOOST_AUTO_TEST_SUITE_END()
