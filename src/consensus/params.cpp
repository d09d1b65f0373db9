// Copyright (c) 2019-2023 The Zcash developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "params.h"

#include "shieldpool/ShieldPool.h"

#include <stdexcept>

namespace Consensus {

static Params MakeMainParams()
{
    Params params;
    params.strNetworkID = "main";
    params.nTreeDepth = SP_TREE_DEPTH;
    params.nRootHistorySize = SP_DEFAULT_ROOT_HISTORY;
    params.nMinWithdrawalAmount = SP_MIN_WITHDRAWAL_AMOUNT;
    params.nMaxRelayerFeeDivisor = SP_MAX_FEE_DIVISOR;
    params.nMaxPendingDeposits = SP_MAX_PENDING_DEPOSITS;
    params.nMaxBatchSize = SP_MAX_BATCH_SIZE;
    return params;
}

static Params MakeRegtestParams()
{
    Params params = MakeMainParams();
    params.strNetworkID = "regtest";
    params.nTreeDepth = SP_TREE_DEPTH_TESTING;
    params.nRootHistorySize = SP_MIN_ROOT_HISTORY;
    return params;
}

const Params& MainParams()
{
    static const Params params = MakeMainParams();
    return params;
}

const Params& RegtestParams()
{
    static const Params params = MakeRegtestParams();
    return params;
}

const Params& ParamsFor(const std::string& network)
{
    if (network == "main")
        return MainParams();
    if (network == "regtest")
        return RegtestParams();
    throw std::runtime_error("ParamsFor: unknown network " + network);
}

} // namespace Consensus
