// Copyright (c) 2011-2018 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Govchain Test Suite

#include "test/test_govchain.h"

#include "logging.h"
#include "util/system.h"
#include "util/time.h"
#include "utilstrencodings.h"

#include <boost/test/unit_test.hpp>

#include <stdexcept>

BasicTestingSetup::BasicTestingSetup(const std::string& chainName)
{
    LogInstance().m_print_to_console = false;
    LogInstance().m_print_to_file = false;
    SelectParams(chainName);
    SetMockTime(TEST_MOCK_TIME);
}

BasicTestingSetup::~BasicTestingSetup()
{
    SetMockTime(0);
    gArgs.ClearArgs();
}

CPubKey TestPubKey(int n)
{
    static const char* const pszKeys[] = {
        "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798",
        "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5",
        "02f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9",
        "02e493dbf1c10d80f3581e4904930b1404cc6c13900ee0758474fa94abe8c4cd13",
        "022f8bde4d1a07209355b4a7250a5c5128e88b84bddc619ab7cba8d569b240efe4",
        "03fff97bd5755eeea420453a14355235d382f6472f8568a18b2f057a1460297556",
        "025cbdf0646e5db4eaa398f365f2ea7a0e3d419b7e0330e39ce92bddedcac4f9bc",
    };
    if (n < 1 || n > 7)
        throw std::out_of_range(strprintf("%s: no test key %d", __func__, n));
    return CPubKey(ParseHex(pszKeys[n - 1]));
}
