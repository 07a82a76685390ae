// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_FULLBLOCKTESTS_ORACLE_JSON_H
#define GOVCHAIN_FULLBLOCKTESTS_ORACLE_JSON_H

#include "fullblocktests/testinstance.h"

#include <univalue.h>

#include <vector>

/**
 * JSON form of one expected outcome. Every instance carries "type", "name"
 * and "height"; blocks are hex encoded, and fVerbose adds the decoded block.
 */
UniValue TestInstanceToUniv(const TestInstance& instance, bool fVerbose = false);

/** Array of groups, each an array of instances, in replay order. */
UniValue TestGroupsToUniv(const std::vector<std::vector<TestInstance>>& tests, bool fVerbose = false);

#endif // GOVCHAIN_FULLBLOCKTESTS_ORACLE_JSON_H
