// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2015-2023 The Zcash developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "init.h"

#include "crypto/common.h"
#include "logging.h"
#include "shieldpool/ShieldPool.h"
#include "util/system.h"
#include "validationinterface.h"

#include <stdio.h>

using namespace libshieldpool;

CPoolRuntime::CPoolRuntime(const std::string& strCurveBackend, const Consensus::Params& paramsIn) :
    hasher(poseidon),
    curve(MakeCurveBackend(strCurveBackend)),
    verifier(ProofVerifier::Strict(*curve)),
    params(paramsIn)
{
}

bool static InitError(const std::string &str)
{
    LogPrintf("Error: %s\n", str);
    fprintf(stderr, "Error: %s\n", str.c_str());
    return false;
}

bool static InitWarning(const std::string &str)
{
    LogPrintf("Warning: %s\n", str);
    fprintf(stderr, "Warning: %s\n", str.c_str());
    return true;
}

std::string HelpMessage()
{
    std::string strUsage = HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message");
    strUsage += HelpMessageOpt("-conf=<file>", tfm::format("Specify configuration file (default: %s)", SHIELDPOOL_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-network=<name>", "Pool parameters to use, main or regtest (default: main)");

    strUsage += HelpMessageGroup("Pool options:");
    {
        std::string strBackends;
        for (const std::string& name : CurveBackendNames())
            strBackends += (strBackends.empty() ? "" : ", ") + name;
        strUsage += HelpMessageOpt("-curvebackend=<name>", tfm::format(
            "Curve arithmetic used for proof verification, one of %s (default: %s)", strBackends, DEFAULT_CURVE_BACKEND));
    }
    strUsage += HelpMessageOpt("-treedepth=<n>", tfm::format(
        "Depth of the commitment tree, %d to %d (default: %d)", SP_MIN_TREE_DEPTH, SP_MAX_TREE_DEPTH, SP_TREE_DEPTH));
    strUsage += HelpMessageOpt("-roothistory=<n>", tfm::format(
        "Number of replaced roots that proofs may still refer to, at least %d (default: %d)",
        SP_MIN_ROOT_HISTORY, SP_DEFAULT_ROOT_HISTORY));

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>",
        "Output debugging information (default: 0, supplying <category> is optional). "
        "If <category> is not supplied or if <category> = 1, output all debugging information. "
        "<category> can be: pool, merkle, nullifier, groth16, curve, batch, bench.");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", tfm::format(
        "Specify location of debug log file: this can be an absolute path or a path relative to the data directory (default: %s)",
        DEFAULT_DEBUGLOGFILE));
    strUsage += HelpMessageOpt("-logtimestamps", tfm::format("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console instead of debug.log file");
    strUsage += HelpMessageOpt("-shrinkdebugfile", "Shrink debug.log file on client startup (default: 1 when no -debug)");

    return strUsage;
}

void InitParameterInteraction()
{
    // Console output replaces the debug log entirely.
    if (GetBoolArg("-printtoconsole", false)) {
        if (SoftSetBoolArg("-shrinkdebugfile", false))
            LogPrintf("%s: parameter interaction: -printtoconsole=1 -> setting -shrinkdebugfile=0\n", __func__);
    }

    // A regtest pool is meant to be filled by tests; keep its tree small
    // unless the depth was given explicitly.
    if (GetArg("-network", "main") == "regtest") {
        if (SoftSetArg("-treedepth", tfm::format("%d", SP_TREE_DEPTH_TESTING)))
            LogPrintf("%s: parameter interaction: -network=regtest -> setting -treedepth=%d\n", __func__, SP_TREE_DEPTH_TESTING);
        if (SoftSetArg("-roothistory", tfm::format("%d", SP_MIN_ROOT_HISTORY)))
            LogPrintf("%s: parameter interaction: -network=regtest -> setting -roothistory=%d\n", __func__, SP_MIN_ROOT_HISTORY);
    }
}

void InitLogging()
{
    fPrintToConsole = GetBoolArg("-printtoconsole", false);
    fLogTimestamps = GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    fDebug = !mapMultiArgs["-debug"].empty();

    if (!fPrintToConsole) {
        if (GetBoolArg("-shrinkdebugfile", !fDebug))
            ShrinkDebugFile();
        OpenDebugLog();
    }

    LogPrintf("\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n\n");
    LogPrintf("Shieldpool starting, log filter %s\n", LogConfigFilter());
}

bool AppInitPool(std::unique_ptr<CPoolRuntime>& runtimeOut)
{
    // ********************************************************* Step 1: sanity checks

    if (init_and_check_sodium() == -1) {
        return InitError("libsodium failed its self-test. Aborting.");
    }

    // ********************************************************* Step 2: parameters

    std::string strNetwork = GetArg("-network", "main");
    Consensus::Params params;
    try {
        params = Consensus::ParamsFor(strNetwork);
    } catch (const std::runtime_error& e) {
        return InitError(tfm::format("Unknown -network '%s'", strNetwork));
    }

    int64_t nDepth = GetArg("-treedepth", (int64_t)params.nTreeDepth);
    if (nDepth < SP_MIN_TREE_DEPTH || nDepth > SP_MAX_TREE_DEPTH) {
        return InitError(tfm::format("-treedepth must be between %d and %d, not %d",
                                     SP_MIN_TREE_DEPTH, SP_MAX_TREE_DEPTH, nDepth));
    }
    params.nTreeDepth = nDepth;

    int64_t nHistory = GetArg("-roothistory", (int64_t)params.nRootHistorySize);
    if (nHistory < SP_MIN_ROOT_HISTORY) {
        return InitError(tfm::format("-roothistory must be at least %d, not %d", SP_MIN_ROOT_HISTORY, nHistory));
    }
    if (nHistory > 10 * SP_DEFAULT_ROOT_HISTORY) {
        InitWarning(tfm::format("-roothistory=%d keeps far more roots than the default %d", nHistory, SP_DEFAULT_ROOT_HISTORY));
    }
    params.nRootHistorySize = nHistory;

    // ********************************************************* Step 3: verification backend

    std::string strBackend = GetArg("-curvebackend", DEFAULT_CURVE_BACKEND);
    try {
        runtimeOut.reset(new CPoolRuntime(strBackend, params));
    } catch (const std::invalid_argument& e) {
        return InitError(tfm::format("Unknown -curvebackend '%s'", strBackend));
    }

    LogPrintf("Pool parameters: network=%s depth=%d roothistory=%d curve=%s\n",
              params.strNetworkID, params.nTreeDepth, params.nRootHistorySize,
              runtimeOut->curve->Name());
    return true;
}

void Shutdown()
{
    LogPrintf("%s: In progress...\n", __func__);
    UnregisterAllValidationInterfaces();
    LogPrintf("%s: done\n", __func__);
}
