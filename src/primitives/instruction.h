// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_PRIMITIVES_INSTRUCTION_H
#define SHIELDPOOL_PRIMITIVES_INSTRUCTION_H

#include "uint256.h"
#include "shieldpool/Groth16.hpp"
#include "shieldpool/PublicInputs.hpp"
#include "shieldpool/VerificationKey.hpp"

#include <optional>
#include <string>
#include <vector>

using libshieldpool::G1Point;
using libshieldpool::G2Point;
using libshieldpool::GrothProof;
using libshieldpool::ProofType;
using libshieldpool::VerificationKey;

//
// Admin instructions. The signer is the key that authorized the
// instruction; most of them must be signed by the pool authority.
//

struct CInitializePool
{
    uint256 authority;
    uint256 poolId;
    uint32_t treeDepth;
    uint32_t rootHistorySize;
};

struct CRegisterAsset
{
    uint256 signer;
    uint256 mint;
};

struct CConfigureAsset
{
    uint256 signer;
    uint256 assetId;
    std::optional<bool> active;
    std::optional<bool> depositsEnabled;
    std::optional<bool> withdrawalsEnabled;
    std::optional<uint64_t> minDeposit;
    std::optional<uint64_t> maxDeposit;
};

/** Starts chunked key provisioning; IC points follow in CAppendVerificationKeyIC. */
struct CInitializeVerificationKey
{
    uint256 signer;
    ProofType proofType;
    G1Point alpha;
    G2Point beta;
    G2Point gamma;
    G2Point delta;
    uint32_t icLength;
};

struct CAppendVerificationKeyIC
{
    uint256 signer;
    ProofType proofType;
    std::vector<G1Point> points;
};

/** Sets a complete key in one step. */
struct CSetVerificationKey
{
    uint256 signer;
    ProofType proofType;
    VerificationKey vk;
};

struct CLockVerificationKey
{
    uint256 signer;
    ProofType proofType;
};

struct CConfigureRelayerRegistry
{
    uint256 signer;
    uint16_t minFeeBps;
    uint16_t maxFeeBps;
    bool registrationsOpen;
};

struct CRegisterRelayer
{
    uint256 operatorKey;
    uint16_t feeBps;
};

/** Signed by the relayer operator. Absent fields keep their value. */
struct CUpdateRelayer
{
    uint256 operatorKey;
    std::optional<uint16_t> feeBps;
    std::optional<bool> active;
};

/** Signed by the operator or the pool authority. */
struct CDeactivateRelayer
{
    uint256 signer;
    uint256 operatorKey;
};

//
// User instructions. Each carries its proof and the statement it proves.
//

struct CDepositInstruction
{
    uint256 depositor;
    libshieldpool::DepositPublicInputs inputs;
    GrothProof proof;
};

struct CWithdrawInstruction
{
    libshieldpool::WithdrawPublicInputs inputs;
    GrothProof proof;
};

struct CWithdrawV2Instruction
{
    libshieldpool::WithdrawV2PublicInputs inputs;
    GrothProof proof;
};

struct CJoinSplitInstruction
{
    libshieldpool::JoinSplitPublicInputs inputs;
    GrothProof proof;
};

struct CMembershipInstruction
{
    libshieldpool::MembershipPublicInputs inputs;
    GrothProof proof;
};

/** Settles the oldest batchSize pending commitments with one update proof. */
struct CSettleDepositsBatch
{
    uint256 submitter;
    uint256 newRoot;
    uint64_t batchSize;
    GrothProof proof;
};

/** Inserts up to maxCount pending commitments leaf by leaf. */
struct CBatchProcessDeposits
{
    uint256 signer;
    uint64_t maxCount;
};

enum ReceiptType : uint8_t {
    RECEIPT_POOL_INITIALIZED,
    RECEIPT_ASSET_REGISTERED,
    RECEIPT_ASSET_CONFIGURED,
    RECEIPT_VK_UPDATED,
    RECEIPT_VK_LOCKED,
    RECEIPT_POOL_PAUSED,
    RECEIPT_POOL_UNPAUSED,
    RECEIPT_AUTHORITY_TRANSFER_INITIATED,
    RECEIPT_AUTHORITY_TRANSFERRED,
    RECEIPT_AUTHORITY_TRANSFER_CANCELLED,
    RECEIPT_RELAYER_REGISTRY_CONFIGURED,
    RECEIPT_RELAYER_REGISTERED,
    RECEIPT_RELAYER_UPDATED,
    RECEIPT_RELAYER_DEACTIVATED,
    RECEIPT_DEPOSIT,
    RECEIPT_WITHDRAW,
    RECEIPT_WITHDRAW_V2,
    RECEIPT_JOINSPLIT,
    RECEIPT_MEMBERSHIP,
    RECEIPT_BATCH_SETTLED,
    RECEIPT_BATCH_PROCESSED,
};

std::string ReceiptTypeName(ReceiptType type);

/**
 * What an accepted instruction did. Fields that do not apply to the
 * instruction stay null or zero.
 */
class CPoolReceipt
{
public:
    ReceiptType type;
    uint256 pool;
    uint256 assetId;
    //! nullifier hashes marked spent
    std::vector<uint256> nullifiers;
    //! commitments inserted into the tree or queued
    std::vector<uint256> commitments;
    //! index of the first inserted leaf
    uint64_t leafIndex;
    uint64_t amount;
    uint64_t fee;
    int64_t publicAmount;
    uint256 recipient;
    uint256 relayer;
    uint256 merkleRoot;
    int64_t nTime;

    CPoolReceipt() : type(RECEIPT_POOL_INITIALIZED), leafIndex(0), amount(0), fee(0),
        publicAmount(0), nTime(0) {}

    std::string ToString() const;
};

#endif // SHIELDPOOL_PRIMITIVES_INSTRUCTION_H
