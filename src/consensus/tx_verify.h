// Copyright (c) 2017-2017 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_CONSENSUS_TX_VERIFY_H
#define GOVCHAIN_CONSENSUS_TX_VERIFY_H

class CTransaction;
class CValidationState;

namespace Consensus {
struct Params;
}

/** Context-independent validity checks */
bool CheckTransaction(const CTransaction& tx, CValidationState& state, const Consensus::Params& consensus);

/**
 * Thread batons may only be created by the transaction that spends the
 * previous baton of the same thread, and only as its first output.
 * fSpendsBaton tells whether tx spends a current thread baton.
 */
bool CheckAdminThreadOutputs(const CTransaction& tx, bool fSpendsBaton, CValidationState& state);

#endif // GOVCHAIN_CONSENSUS_TX_VERIFY_H
