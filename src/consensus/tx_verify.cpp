// Copyright (c) 2017-2017 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/tx_verify.h"

#include "consensus/consensus.h"
#include "consensus/params.h"
#include "consensus/validation.h"
#include "logging.h"
#include "primitives/transaction.h"
#include "script/standard.h"

#include <set>

bool CheckTransaction(const CTransaction& tx, CValidationState& state, const Consensus::Params& consensus)
{
    // Basic checks that don't depend on any context
    if (tx.vin.empty())
        return state.DoS(10, false, REJECT_INVALID, "bad-txns-vin-empty");
    if (tx.vout.empty())
        return state.DoS(10, false, REJECT_INVALID, "bad-txns-vout-empty");

    // Size limits
    if (tx.GetTotalSize() > MAX_TX_SIZE)
        return state.DoS(100, error("tx oversize: %d > %d", tx.GetTotalSize(), MAX_TX_SIZE), REJECT_INVALID, "bad-txns-oversize");

    // Check for negative or overflow output values
    CAmount nValueOut = 0;
    for (const CTxOut& txout : tx.vout) {
        if (txout.nValue < 0)
            return state.DoS(100, false, REJECT_INVALID, "bad-txns-vout-negative");
        if (txout.nValue > consensus.nMaxMoneyOut)
            return state.DoS(100, false, REJECT_INVALID, "bad-txns-vout-toolarge");
        nValueOut += txout.nValue;
        if (!consensus.MoneyRange(nValueOut))
            return state.DoS(100, false, REJECT_INVALID, "bad-txns-txouttotal-toolarge");
    }

    // Check for duplicate inputs
    std::set<COutPoint> vInOutPoints;
    for (const CTxIn& txin : tx.vin) {
        if (!vInOutPoints.insert(txin.prevout).second)
            return state.DoS(100, false, REJECT_INVALID, "bad-txns-inputs-duplicate");
    }

    if (tx.IsCoinBase()) {
        const size_t nSize = tx.vin[0].scriptSig.size();
        if (nSize < MIN_COINBASE_SCRIPTSIG_SIZE || nSize > MAX_COINBASE_SCRIPTSIG_SIZE)
            return state.DoS(100, false, REJECT_INVALID, "bad-cb-length");
    } else {
        for (const CTxIn& txin : tx.vin)
            if (txin.prevout.IsNull())
                return state.DoS(10, false, REJECT_INVALID, "bad-txns-prevout-null");
    }

    return true;
}

bool CheckAdminThreadOutputs(const CTransaction& tx, bool fSpendsBaton, CValidationState& state)
{
    for (unsigned int i = 0; i < tx.vout.size(); i++) {
        ThreadID thread;
        if (!IsThreadScript(tx.vout[i].scriptPubKey, thread))
            continue;
        if (!fSpendsBaton || i != 0)
            return state.DoS(100, false, REJECT_INVALID, "bad-txns-thread-forged", false,
                             strprintf("%s baton created by %s:%u", GetThreadName(thread), tx.GetHash().ToString(), i));
    }
    return true;
}
