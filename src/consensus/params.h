// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_CONSENSUS_PARAMS_H
#define SHIELDPOOL_CONSENSUS_PARAMS_H

#include <stdint.h>
#include <string>

namespace Consensus {

/**
 * Parameters that influence which instructions the pool accepts.
 */
struct Params {
    std::string strNetworkID;
    /** Depth of the ledger commitment tree */
    uint32_t nTreeDepth;
    /** Number of replaced roots a proof may still refer to */
    uint32_t nRootHistorySize;
    /** Smallest amount a schema-v2 withdrawal may move */
    uint64_t nMinWithdrawalAmount;
    /** The relayer fee may be at most amount / nMaxRelayerFeeDivisor */
    uint64_t nMaxRelayerFeeDivisor;
    /** Capacity of the pending-commitment buffer */
    uint32_t nMaxPendingDeposits;
    /** Largest settlement or direct insertion batch */
    uint32_t nMaxBatchSize;
};

/** Parameters of a production pool. */
const Params& MainParams();
/** A depth-4 tree and a three-root window, small enough to fill in tests. */
const Params& RegtestParams();

/**
 * Parameters for the named network, "main" or "regtest".
 * Throws std::runtime_error for any other name.
 */
const Params& ParamsFor(const std::string& network);

} // namespace Consensus

#endif // SHIELDPOOL_CONSENSUS_PARAMS_H
