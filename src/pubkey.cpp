// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pubkey.h"

#include "hash.h"
#include "utilstrencodings.h"

uint160 CPubKey::GetHash160() const
{
    uint256 hash = Hash(begin(), end());
    uint160 result;
    memcpy(result.begin(), hash.begin(), uint160::size());
    return result;
}

std::string CPubKey::GetHex() const
{
    return HexStr(begin(), end());
}

std::string KeyID::ToString() const
{
    return strprintf("%08x", nID);
}
