// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pow.h"

#include "consensus/params.h"
#include "logging.h"
#include "primitives/block.h"
#include "uint256.h"
#include "util/time.h"

#include <boost/thread.hpp>

#include <algorithm>
#include <atomic>
#include <exception>

bool DecodeCompactTarget(uint32_t nBits, pow_target_t& targetRet)
{
    const int nSize = nBits >> 24;
    uint32_t nWord = nBits & 0x007fffff;

    const bool fNegative = nWord != 0 && (nBits & 0x00800000) != 0;
    const bool fOverflow = nWord != 0 && ((nSize > 34) ||
                                          (nWord > 0xff && nSize > 33) ||
                                          (nWord > 0xffff && nSize > 32));
    if (fNegative || fOverflow)
        return false;

    if (nSize <= 3) {
        nWord >>= 8 * (3 - nSize);
        targetRet = nWord;
    } else {
        targetRet = nWord;
        targetRet <<= 8 * (nSize - 3);
    }
    return targetRet != 0;
}

pow_target_t HashToTarget(const uint256& hash)
{
    pow_target_t value;
    boost::multiprecision::import_bits(value, hash.begin(), hash.end(), 8, false);
    return value;
}

bool CheckProofOfWork(const uint256& hash, unsigned int nBits, const Consensus::Params& params)
{
    pow_target_t bnTarget;

    // Check range
    if (!DecodeCompactTarget(nBits, bnTarget) || bnTarget > HashToTarget(params.powLimit))
        return false;

    // Check proof of work matches claimed amount
    return HashToTarget(hash) <= bnTarget;
}

namespace {

/** Shared between the solver threads of one SolveBlockHeader call. */
struct SolverContext
{
    std::atomic<bool> fCancel{false};

    boost::mutex mutex;
    boost::condition_variable cond;
    int nFinished = 0;
    bool fFound = false;
    uint32_t nFoundNonce = 0;
};

void SolveRange(CBlockHeader header, pow_target_t target, uint32_t nStart, uint32_t nStop, SolverContext& ctx)
{
    bool fFound = false;
    uint32_t nNonce = nStart;
    try {
        for (; !ctx.fCancel.load(std::memory_order_relaxed); nNonce++) {
            header.nNonce = nNonce;
            if (HashToTarget(header.GetHash()) <= target) {
                fFound = true;
                break;
            }
            if (nNonce == nStop)
                break;
        }
    } catch (const std::exception& e) {
        // The worker finishes without a result
        error("%s: nonce %u: %s", __func__, nNonce, e.what());
        fFound = false;
    }

    boost::unique_lock<boost::mutex> lock(ctx.mutex);
    if (fFound && !ctx.fFound) {
        ctx.fFound = true;
        ctx.nFoundNonce = nNonce;
        ctx.fCancel = true;
    }
    ctx.nFinished++;
    ctx.cond.notify_all();
}

} // namespace

bool SolveBlockHeader(CBlockHeader& header, int nThreads, uint32_t nStartNonce, uint32_t nStopNonce)
{
    // 0 is the "not solved" marker of block builders
    nStartNonce = std::max<uint32_t>(nStartNonce, 1);
    if (nStopNonce < nStartNonce)
        return false;

    pow_target_t target;
    if (!DecodeCompactTarget(header.nBits, target))
        return error("%s: invalid nBits %08x", __func__, header.nBits);

    if (nThreads <= 0)
        nThreads = std::max<int>(boost::thread::hardware_concurrency(), 1);
    const uint64_t nRange = (uint64_t)nStopNonce - nStartNonce + 1;
    if ((uint64_t)nThreads > nRange)
        nThreads = nRange;

    const int64_t nStartTime = GetTimeMillis();
    SolverContext ctx;
    boost::thread_group threads;
    const uint64_t nPerThread = nRange / nThreads;
    try {
        for (int i = 0; i < nThreads; i++) {
            const uint32_t nBegin = nStartNonce + nPerThread * i;
            const uint32_t nEnd = (i == nThreads - 1) ? nStopNonce : (uint32_t)(nBegin + nPerThread - 1);
            threads.create_thread([&ctx, header, target, nBegin, nEnd] { SolveRange(header, target, nBegin, nEnd, ctx); });
        }
    } catch (const std::exception& e) {
        // Workers already started still reference ctx
        ctx.fCancel = true;
        threads.join_all();
        return error("%s: cannot start solver threads: %s", __func__, e.what());
    }

    {
        boost::unique_lock<boost::mutex> lock(ctx.mutex);
        while (!ctx.fFound && ctx.nFinished < nThreads)
            ctx.cond.wait(lock);
    }
    ctx.fCancel = true;
    threads.join_all();

    if (!ctx.fFound) {
        LogPrint(BCLog::MINING, "%s: no nonce in [%u, %u] for height %u\n", __func__, nStartNonce, nStopNonce, header.nHeight);
        return false;
    }

    header.nNonce = ctx.nFoundNonce;
    LogPrint(BCLog::MINING, "%s: height %u nonce %u (%d threads, %dms)\n", __func__, header.nHeight, header.nNonce, nThreads, GetTimeMillis() - nStartTime);
    return true;
}
