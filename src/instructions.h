// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_INSTRUCTIONS_H
#define SHIELDPOOL_INSTRUCTIONS_H

#include "consensus/params.h"
#include "consensus/validation.h"
#include "poolstate.h"
#include "primitives/instruction.h"
#include "shieldpool/Groth16.hpp"
#include "shieldpool/IncrementalMerkleTree.hpp"

/** DoS score of a rejection that the submitter could have checked locally. */
static const int DOS_MALFORMED = 100;
/** DoS score of a rejection caused by state the submitter may not have seen. */
static const int DOS_STATE = 0;

/**
 * What every instruction needs besides the pool state: the hasher the
 * ledger tree was built with, the proof verifier bound to the configured
 * curve backend, and the pool parameters.
 */
class CInstructionContext
{
public:
    const libshieldpool::MerkleHasher& hasher;
    const libshieldpool::ProofVerifier& verifier;
    const Consensus::Params& params;

    CInstructionContext(const libshieldpool::MerkleHasher& hasherIn,
                        const libshieldpool::ProofVerifier& verifierIn,
                        const Consensus::Params& paramsIn) :
        hasher(hasherIn), verifier(verifierIn), params(paramsIn) {}
};

/**
 * Each Apply function runs one instruction against a fresh
 * CPoolStateViewCache on top of view. On success every change is written
 * to view with a single BatchWrite, the receipt is published through
 * GetMainSignals() and copied to *receipt, and true is returned. On failure
 * nothing is written, state carries the reject code and reason, and false
 * is returned.
 */

bool ApplyInitializePool(CPoolStateView& view, const CInstructionContext& ctx,
                         const CInitializePool& ins, CValidationState& state,
                         CPoolReceipt* receipt = nullptr);
bool ApplyRegisterAsset(CPoolStateView& view, const CInstructionContext& ctx,
                        const CRegisterAsset& ins, CValidationState& state,
                        CPoolReceipt* receipt = nullptr);
bool ApplyConfigureAsset(CPoolStateView& view, const CInstructionContext& ctx,
                         const CConfigureAsset& ins, CValidationState& state,
                         CPoolReceipt* receipt = nullptr);

bool ApplyInitializeVerificationKey(CPoolStateView& view, const CInstructionContext& ctx,
                                    const CInitializeVerificationKey& ins, CValidationState& state,
                                    CPoolReceipt* receipt = nullptr);
/** The key becomes initialized when the last announced IC point arrives. */
bool ApplyAppendVerificationKeyIC(CPoolStateView& view, const CInstructionContext& ctx,
                                  const CAppendVerificationKeyIC& ins, CValidationState& state,
                                  CPoolReceipt* receipt = nullptr);
bool ApplySetVerificationKey(CPoolStateView& view, const CInstructionContext& ctx,
                             const CSetVerificationKey& ins, CValidationState& state,
                             CPoolReceipt* receipt = nullptr);
bool ApplyLockVerificationKey(CPoolStateView& view, const CInstructionContext& ctx,
                              const CLockVerificationKey& ins, CValidationState& state,
                              CPoolReceipt* receipt = nullptr);

bool ApplyPausePool(CPoolStateView& view, const CInstructionContext& ctx,
                    const uint256& signer, CValidationState& state,
                    CPoolReceipt* receipt = nullptr);
bool ApplyUnpausePool(CPoolStateView& view, const CInstructionContext& ctx,
                      const uint256& signer, CValidationState& state,
                      CPoolReceipt* receipt = nullptr);

bool ApplyInitiateAuthorityTransfer(CPoolStateView& view, const CInstructionContext& ctx,
                                    const uint256& signer, const uint256& newAuthority,
                                    CValidationState& state, CPoolReceipt* receipt = nullptr);
bool ApplyAcceptAuthorityTransfer(CPoolStateView& view, const CInstructionContext& ctx,
                                  const uint256& signer, CValidationState& state,
                                  CPoolReceipt* receipt = nullptr);
bool ApplyCancelAuthorityTransfer(CPoolStateView& view, const CInstructionContext& ctx,
                                  const uint256& signer, CValidationState& state,
                                  CPoolReceipt* receipt = nullptr);

bool ApplyConfigureRelayerRegistry(CPoolStateView& view, const CInstructionContext& ctx,
                                   const CConfigureRelayerRegistry& ins, CValidationState& state,
                                   CPoolReceipt* receipt = nullptr);
bool ApplyRegisterRelayer(CPoolStateView& view, const CInstructionContext& ctx,
                          const CRegisterRelayer& ins, CValidationState& state,
                          CPoolReceipt* receipt = nullptr);
bool ApplyUpdateRelayer(CPoolStateView& view, const CInstructionContext& ctx,
                        const CUpdateRelayer& ins, CValidationState& state,
                        CPoolReceipt* receipt = nullptr);
bool ApplyDeactivateRelayer(CPoolStateView& view, const CInstructionContext& ctx,
                            const CDeactivateRelayer& ins, CValidationState& state,
                            CPoolReceipt* receipt = nullptr);

bool ApplyDeposit(CPoolStateView& view, const CInstructionContext& ctx,
                  const CDepositInstruction& ins, CValidationState& state,
                  CPoolReceipt* receipt = nullptr);
bool ApplyWithdraw(CPoolStateView& view, const CInstructionContext& ctx,
                   const CWithdrawInstruction& ins, CValidationState& state,
                   CPoolReceipt* receipt = nullptr);
bool ApplyWithdrawV2(CPoolStateView& view, const CInstructionContext& ctx,
                     const CWithdrawV2Instruction& ins, CValidationState& state,
                     CPoolReceipt* receipt = nullptr);
bool ApplyJoinSplit(CPoolStateView& view, const CInstructionContext& ctx,
                    const CJoinSplitInstruction& ins, CValidationState& state,
                    CPoolReceipt* receipt = nullptr);
/** Verifies a membership proof. Writes nothing. */
bool ApplyProveMembership(CPoolStateView& view, const CInstructionContext& ctx,
                          const CMembershipInstruction& ins, CValidationState& state,
                          CPoolReceipt* receipt = nullptr);

bool ApplySettleDepositsBatch(CPoolStateView& view, const CInstructionContext& ctx,
                              const CSettleDepositsBatch& ins, CValidationState& state,
                              CPoolReceipt* receipt = nullptr);
bool ApplyBatchProcessDeposits(CPoolStateView& view, const CInstructionContext& ctx,
                               const CBatchProcessDeposits& ins, CValidationState& state,
                               CPoolReceipt* receipt = nullptr);

#endif // SHIELDPOOL_INSTRUCTIONS_H
