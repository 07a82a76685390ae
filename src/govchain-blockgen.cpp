// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "fullblocktests/generator.h"
#include "fullblocktests/oracle_json.h"
#include "logging.h"
#include "util/system.h"
#include "util/time.h"
#include "utilstrencodings.h"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <iostream>
#include <stdio.h>

static std::string HelpMessage()
{
    std::string strUsage = "Usage:\n  govchain-blockgen [options]\n\n";
    strUsage += "Writes the admin thread block test scenario as JSON.\n\n";
    strUsage += "Options:\n";
    strUsage += "  -?                  This help message\n";
    strUsage += "  -largereorg         Include the large reorg test blocks (default: 0)\n";
    strUsage += strprintf("  -maturity=<n>       Coinbase maturity of the generated chain (default: %d)\n",
                          Params().GetConsensus().nCoinbaseMaturity);
    strUsage += "  -output=<file>      Write to <file> instead of standard output\n";
    strUsage += "  -verbose            Include decoded blocks next to their hex (default: 0)\n";
    strUsage += "  -mocktime=<n>       Use <n> as the current time for the first block\n";
    strUsage += "  -printtoconsole     Send log output to the console (default: 0)\n";
    strUsage += strprintf("  -debuglogfile=<file> Also log to <file> (default: none, %s if empty)\n", DEFAULT_DEBUGLOGFILE);
    strUsage += "  -debug=<category>   Output debugging information for <category>, or everything when\n";
    strUsage += "                      <category> is omitted or 1. Categories: " + ListLogCategories() + "\n";
    return strUsage;
}

static bool InitLogging()
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debuglogfile")) {
        std::string strFile = gArgs.GetArg("-debuglogfile", "");
        logger.m_file_path = strFile.empty() ? DEFAULT_DEBUGLOGFILE : strFile;
        logger.m_print_to_file = true;
        if (!logger.OpenDebugLog()) {
            tfm::format(std::cerr, "Error: could not open debug log file %s\n", logger.m_file_path);
            return false;
        }
    }

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (cat.empty() || cat == "1") {
            logger.EnableCategory(BCLog::ALL);
        } else if (!logger.EnableCategory(cat)) {
            tfm::format(std::cerr, "Warning: unsupported logging category -debug=%s\n", cat);
        }
    }
    return true;
}

static bool AppInit(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        tfm::format(std::cerr, "Error parsing command line arguments: %s\n", error);
        return false;
    }

    SelectParams(CBaseChainParams::REGTEST);

    if (HelpRequested(gArgs)) {
        std::cout << HelpMessage();
        return true;
    }

    if (!InitLogging())
        return false;

    if (gArgs.IsArgSet("-mocktime"))
        SetMockTime(gArgs.GetArg("-mocktime", (int64_t)0));

    try {
        if (gArgs.IsArgSet("-maturity"))
            UpdateCoinbaseMaturity(gArgs.GetArg("-maturity", (int64_t)Params().GetConsensus().nCoinbaseMaturity));
    } catch (const std::exception& e) {
        tfm::format(std::cerr, "Error: %s\n", e.what());
        return false;
    }

    std::vector<std::vector<TestInstance>> tests;
    if (!Generate(gArgs.GetBoolArg("-largereorg", false), tests, error)) {
        tfm::format(std::cerr, "Error: %s\n", error);
        return false;
    }

    const std::string strJSON = TestGroupsToUniv(tests, gArgs.GetBoolArg("-verbose", false)).write(2) + "\n";

    if (!gArgs.IsArgSet("-output")) {
        std::cout << strJSON;
        return true;
    }

    const boost::filesystem::path pathOut(gArgs.GetArg("-output", ""));
    boost::filesystem::ofstream file(pathOut, std::ios_base::out | std::ios_base::trunc);
    if (!file.is_open()) {
        tfm::format(std::cerr, "Error: cannot open %s for writing\n", pathOut.string());
        return false;
    }
    file << strJSON;
    file.close();
    if (file.fail()) {
        tfm::format(std::cerr, "Error: failed to write %s\n", pathOut.string());
        return false;
    }
    LogPrintf("Wrote %u test groups to %s\n", tests.size(), pathOut.string());
    return true;
}

int main(int argc, char* argv[])
{
    return (AppInit(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE);
}
