// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_INIT_H
#define SHIELDPOOL_INIT_H

#include "consensus/params.h"
#include "instructions.h"
#include "shieldpool/Groth16.hpp"
#include "shieldpool/IncrementalMerkleTree.hpp"
#include "shieldpool/Poseidon.hpp"
#include "shieldpool/curve/CurveBackend.hpp"

#include <memory>
#include <string>

/**
 * The hashing and verification context every instruction runs with,
 * assembled once from configuration. Not copyable: the verifier and the
 * hasher hold references into it.
 */
class CPoolRuntime
{
public:
    libshieldpool::PoseidonHasher poseidon;
    libshieldpool::MerkleHasher hasher;
    std::unique_ptr<libshieldpool::CurveBackend> curve;
    libshieldpool::ProofVerifier verifier;
    Consensus::Params params;

    /** Throws std::invalid_argument for an unknown backend name. */
    CPoolRuntime(const std::string& strCurveBackend, const Consensus::Params& paramsIn);

    CPoolRuntime(const CPoolRuntime&) = delete;
    CPoolRuntime& operator=(const CPoolRuntime&) = delete;

    CInstructionContext Context() const { return CInstructionContext(hasher, verifier, params); }
};

//!Initialize the logging infrastructure
void InitLogging();
//!Parameter interaction: change current parameters depending on various rules
void InitParameterInteraction();
/**
 * Check the crypto libraries and build the runtime from -network,
 * -curvebackend, -treedepth and -roothistory.
 * @pre Parameters should be parsed and config file should be read.
 */
bool AppInitPool(std::unique_ptr<CPoolRuntime>& runtimeOut);
void Shutdown();

/** Help for the options understood by the tools */
std::string HelpMessage();

#endif // SHIELDPOOL_INIT_H
