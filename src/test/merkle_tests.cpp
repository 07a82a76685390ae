// Copyright (c) 2015-2017 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/merkle.h"
#include "hash.h"
#include "test/test_govchain.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(merkle_tests, BasicTestingSetup)

static uint256 HashPair(const uint256& a, const uint256& b)
{
    return Hash(a.begin(), a.end(), b.begin(), b.end());
}

BOOST_AUTO_TEST_CASE(merkle_root_shapes)
{
    const uint256 a = uint256S("0x0a");
    const uint256 b = uint256S("0x0b");
    const uint256 c = uint256S("0x0c");

    BOOST_CHECK(ComputeMerkleRoot({}) == uint256());
    BOOST_CHECK(ComputeMerkleRoot({a}) == a);
    BOOST_CHECK(ComputeMerkleRoot({a, b}) == HashPair(a, b));

    // odd levels duplicate their last entry
    BOOST_CHECK(ComputeMerkleRoot({a, b, c}) == HashPair(HashPair(a, b), HashPair(c, c)));
}

BOOST_AUTO_TEST_CASE(merkle_root_mutation)
{
    const uint256 a = uint256S("0x0a");
    const uint256 b = uint256S("0x0b");
    const uint256 c = uint256S("0x0c");

    bool fMutated = true;
    const uint256 root = ComputeMerkleRoot({a, b, c}, &fMutated);
    BOOST_CHECK(!fMutated);

    // repeating the last leaf gives the same root but is flagged
    BOOST_CHECK(ComputeMerkleRoot({a, b, c, c}, &fMutated) == root);
    BOOST_CHECK(fMutated);

    ComputeMerkleRoot({a, a}, &fMutated);
    BOOST_CHECK(fMutated);
}

BOOST_AUTO_TEST_CASE(block_merkle_root)
{
    const CBlock& genesis = Params().GenesisBlock();
    bool fMutated = true;
    BOOST_CHECK(BlockMerkleRoot(genesis, &fMutated) == genesis.hashMerkleRoot);
    BOOST_CHECK(!fMutated);
    BOOST_CHECK(genesis.hashMerkleRoot == genesis.vtx[0]->GetHash());
}

BOOST_AUTO_TEST_SUITE_END()
