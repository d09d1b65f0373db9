// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "instructions.h"

#include "logging.h"
#include "shieldpool/BatchUpdate.hpp"
#include "shieldpool/PublicInputs.hpp"
#include "util/system.h"
#include "utiltime.h"
#include "validationinterface.h"

#include <algorithm>
#include <functional>
#include <stdexcept>

using namespace libshieldpool;

namespace {

typedef std::function<bool (CPoolStateViewCache&, CPoolReceipt&)> InstructionBody;

/**
 * Runs body against a cache over view, converts lower-layer exceptions into
 * reject codes, and commits the cache only if the body accepted.
 */
bool RunInstruction(const char* name, CPoolStateView& view, CValidationState& state,
                    CPoolReceipt* receiptOut, const InstructionBody& body)
{
    CPoolStateViewCache cache(&view);
    CPoolReceipt receipt;
    receipt.nTime = GetTime();

    std::optional<MerkleTreeState> treeBefore = cache.GetTreeState();
    std::optional<MerkleTreeState> treeAfter;

    bool fOk = false;
    try {
        fOk = body(cache, receipt);
        treeAfter = cache.GetTreeState();
    } catch (const CryptographyError& e) {
        fOk = state.DoS(DOS_MALFORMED, error("%s: %s", name, e.what()),
                        REJECT_CRYPTOGRAPHY, "bad-curve-encoding");
    } catch (const VerificationKeyError& e) {
        fOk = state.DoS(DOS_STATE, error("%s: %s", name, e.what()),
                        REJECT_CONFIG, "vk-not-usable");
    } catch (const std::domain_error& e) {
        fOk = state.DoS(DOS_MALFORMED, error("%s: %s", name, e.what()),
                        REJECT_CRYPTOGRAPHY, "non-canonical-field-element");
    } catch (const std::length_error& e) {
        fOk = state.DoS(DOS_STATE, error("%s: %s", name, e.what()),
                        REJECT_CONFLICT, "pending-buffer-full");
    } catch (const std::logic_error& e) {
        fOk = state.DoS(DOS_MALFORMED, error("%s: %s", name, e.what()),
                        REJECT_VALIDATION, "bad-instruction");
    } catch (const TreeFullError& e) {
        fOk = state.DoS(DOS_STATE, error("%s: %s", name, e.what()),
                        REJECT_CONFLICT, "tree-full");
    } catch (const std::runtime_error& e) {
        fOk = state.DoS(DOS_STATE, error("%s: %s", name, e.what()),
                        REJECT_VALIDATION, "instruction-failed");
    }

    if (fOk && !cache.Flush()) {
        fOk = state.DoS(DOS_STATE, error("%s: pool state changed while the instruction ran", name),
                        REJECT_CONFLICT, "state-conflict");
    }

    GetMainSignals().InstructionChecked(name, state);
    if (!fOk)
        return false;

    LogPrint("pool", "%s accepted: %s\n", name, receipt.ToString());
    for (const uint256& nf : receipt.nullifiers)
        GetMainSignals().NullifierSpent(nf);
    if (treeAfter && (!treeBefore ||
                      treeBefore->currentRoot() != treeAfter->currentRoot() ||
                      treeBefore->nextIndex() != treeAfter->nextIndex())) {
        GetMainSignals().UpdatedTreeRoot(treeAfter->currentRoot(), treeAfter->nextIndex());
    }
    GetMainSignals().InstructionAccepted(receipt);
    if (receiptOut)
        *receiptOut = receipt;
    return true;
}

bool LoadPool(const CPoolStateViewCache& view, PoolConfig& config,
              CValidationState& state, const char* name)
{
    if (!view.GetPoolConfig(config))
        return state.DoS(DOS_STATE, error("%s: pool is not initialized", name),
                         REJECT_CONFIG, "pool-not-initialized");
    return true;
}

bool LoadTree(const CPoolStateViewCache& view, std::optional<MerkleTreeState>& tree,
              CValidationState& state, const char* name)
{
    tree = view.GetTreeState();
    if (!tree)
        return state.DoS(DOS_STATE, error("%s: pool has no commitment tree", name),
                         REJECT_CONFIG, "pool-not-initialized");
    return true;
}

bool LoadRegistry(const CPoolStateViewCache& view, RelayerRegistry& registry,
                  CValidationState& state, const char* name)
{
    if (!view.GetRelayerRegistry(registry))
        return state.DoS(DOS_STATE, error("%s: pool has no relayer registry", name),
                         REJECT_CONFIG, "pool-not-initialized");
    return true;
}

bool LoadPending(const CPoolStateViewCache& view, PendingDepositsBuffer& pending,
                 CValidationState& state, const char* name)
{
    if (!view.GetPendingDeposits(pending))
        return state.DoS(DOS_STATE, error("%s: pool has no pending-commitment buffer", name),
                         REJECT_CONFIG, "pool-not-initialized");
    return true;
}

bool CheckAuthority(const PoolConfig& config, const uint256& signer,
                    CValidationState& state, const char* name)
{
    if (signer != config.authority)
        return state.DoS(DOS_MALFORMED, error("%s: %s is not the pool authority", name, signer.GetHex()),
                         REJECT_VALIDATION, "unauthorized");
    return true;
}

bool CheckNotPaused(const PoolConfig& config, CValidationState& state, const char* name)
{
    if (config.paused)
        return state.DoS(DOS_STATE, error("%s: pool is paused", name),
                         REJECT_CONFIG, "pool-paused");
    return true;
}

bool CheckProofLength(const GrothProof& proof, CValidationState& state, const char* name)
{
    if (proof.size() != SP_PROOF_SIZE)
        return state.DoS(DOS_MALFORMED, error("%s: proof is %d bytes, expected %d", name, proof.size(), SP_PROOF_SIZE),
                         REJECT_VALIDATION, "bad-proof-length");
    return true;
}

bool CheckStatement(bool fValid, const std::string& strReason,
                    CValidationState& state, const char* name)
{
    if (!fValid)
        return state.DoS(DOS_MALFORMED, error("%s: public inputs rejected: %s", name, strReason),
                         REJECT_VALIDATION, strReason);
    return true;
}

bool LoadUsableKey(const CPoolStateViewCache& view, ProofType type, VerificationKey& vk,
                   CValidationState& state, const char* name)
{
    if (!view.GetVerificationKey(type, vk) || !vk.IsUsable())
        return state.DoS(DOS_STATE, error("%s: %s verification key is not initialized and locked", name, ProofTypeName(type)),
                         REJECT_CONFIG, "vk-not-locked");
    return true;
}

bool CheckKnownRoot(const MerkleTreeState& tree, const uint256& root,
                    CValidationState& state, const char* name)
{
    if (!tree.isKnownRoot(root))
        return state.DoS(DOS_STATE, error("%s: merkle root %s is not in the history window", name, root.GetHex()),
                         REJECT_CONFLICT, "unknown-merkle-root");
    return true;
}

bool CheckUnspent(const CPoolStateViewCache& view, const uint256& nullifierHash,
                  CValidationState& state, const char* name)
{
    if (view.IsSpent(nullifierHash))
        return state.DoS(DOS_STATE, error("%s: nullifier %s already spent", name, nullifierHash.GetHex()),
                         REJECT_CONFLICT, "nullifier-already-spent");
    return true;
}

bool VerifyStatement(const CInstructionContext& ctx, const VerificationKey& vk,
                     const std::vector<uint256>& inputs, const GrothProof& proof,
                     CValidationState& state, const char* name)
{
    if (!ctx.verifier.Verify(vk, inputs, proof))
        return state.DoS(DOS_MALFORMED, error("%s: proof does not verify", name),
                         REJECT_PROOF, "invalid-proof");
    return true;
}

bool LoadVault(const CPoolStateViewCache& view, const uint256& assetId, AssetVault& vault,
               CValidationState& state, const char* name)
{
    if (!view.GetAssetVault(assetId, vault))
        return state.DoS(DOS_MALFORMED, error("%s: asset %s is not registered", name, assetId.GetHex()),
                         REJECT_VALIDATION, "unknown-asset");
    if (!vault.active)
        return state.DoS(DOS_STATE, error("%s: asset %s is not active", name, assetId.GetHex()),
                         REJECT_CONFIG, "asset-not-active");
    return true;
}

bool CheckWithdrawable(const AssetVault& vault, uint64_t amount,
                       CValidationState& state, const char* name)
{
    if (!vault.withdrawalsEnabled)
        return state.DoS(DOS_STATE, error("%s: withdrawals are disabled for asset %s", name, vault.assetId.GetHex()),
                         REJECT_CONFIG, "withdrawals-disabled");
    if (amount > vault.shieldedBalance)
        return state.DoS(DOS_STATE, error("%s: amount %u exceeds shielded balance %u", name, amount, vault.shieldedBalance),
                         REJECT_CONFLICT, "insufficient-shielded-balance");
    return true;
}

/**
 * A relayer that is registered must be active and may charge at most its
 * advertised rate. Unregistered relayers are only bound by the pool-wide
 * fee ceiling.
 */
bool CheckRelayer(const CPoolStateViewCache& view, const uint256& relayer,
                  uint64_t amount, uint64_t fee, std::optional<RelayerNode>& node,
                  CValidationState& state, const char* name)
{
    RelayerNode found;
    if (relayer.IsNull() || !view.GetRelayerNode(relayer, found))
        return true;
    if (!found.active)
        return state.DoS(DOS_STATE, error("%s: relayer %s is not active", name, relayer.GetHex()),
                         REJECT_CONFLICT, "relayer-not-active");
    if (fee > found.CalculateFee(amount))
        return state.DoS(DOS_MALFORMED, error("%s: fee %u exceeds the relayer rate of %u bps", name, fee, found.feeBps),
                         REJECT_VALIDATION, "relayer-fee-above-rate");
    node = found;
    return true;
}

void RecordRelayerFee(CPoolStateViewCache& view, std::optional<RelayerNode>& node,
                      uint64_t fee, int64_t nTime)
{
    if (!node)
        return;
    node->transactionsProcessed++;
    node->feesEarned += fee;
    node->lastActiveAt = nTime;
    view.SetRelayerNode(*node);

    RelayerRegistry registry;
    if (view.GetRelayerRegistry(registry)) {
        registry.totalTransactions++;
        registry.totalFeesCollected += fee;
        view.SetRelayerRegistry(registry);
    }
}

SpentNullifierRecord MakeSpentRecord(const PoolConfig& config, const uint256& nullifierHash,
                                     const uint256& assetId, SpendType type,
                                     const uint256& relayer, int64_t nTime)
{
    SpentNullifierRecord record;
    record.pool = config.poolId;
    record.nullifierHash = nullifierHash;
    record.assetId = assetId;
    record.spendType = type;
    record.spentAt = nTime;
    record.relayer = relayer;
    return record;
}

bool MarkAllSpent(CPoolStateViewCache& view, const std::vector<SpentNullifierRecord>& records,
                  CValidationState& state, const char* name)
{
    for (const SpentNullifierRecord& record : records) {
        if (!view.MarkSpent(record))
            return state.DoS(DOS_STATE, error("%s: nullifier %s already spent", name, record.nullifierHash.GetHex()),
                             REJECT_CONFLICT, "nullifier-already-spent");
    }
    return true;
}

} // anon namespace

bool ApplyInitializePool(CPoolStateView& view, const CInstructionContext& ctx,
                         const CInitializePool& ins, CValidationState& state,
                         CPoolReceipt* receipt)
{
    static const char* name = "InitializePool";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig existing;
        if (cache.GetPoolConfig(existing))
            return state.DoS(DOS_STATE, error("%s: pool is already initialized", name),
                             REJECT_CONFLICT, "pool-already-initialized");
        if (ins.authority.IsNull() || ins.poolId.IsNull())
            return state.DoS(DOS_MALFORMED, error("%s: authority and pool id must be set", name),
                             REJECT_VALIDATION, "bad-pool-identity");
        if (ins.treeDepth < SP_MIN_TREE_DEPTH || ins.treeDepth > SP_MAX_TREE_DEPTH)
            return state.DoS(DOS_MALFORMED, error("%s: tree depth %d outside %d..%d", name,
                                                  ins.treeDepth, SP_MIN_TREE_DEPTH, SP_MAX_TREE_DEPTH),
                             REJECT_VALIDATION, "bad-tree-depth");
        if (ins.rootHistorySize < SP_MIN_ROOT_HISTORY)
            return state.DoS(DOS_MALFORMED, error("%s: root history %d below %d", name,
                                                  ins.rootHistorySize, SP_MIN_ROOT_HISTORY),
                             REJECT_VALIDATION, "bad-root-history");

        PoolConfig config;
        config.poolId = ins.poolId;
        config.authority = ins.authority;
        config.treeDepth = ins.treeDepth;
        config.rootHistorySize = ins.rootHistorySize;
        config.createdAt = out.nTime;
        config.lastActivityAt = out.nTime;

        MerkleTreeState tree(ctx.hasher, ins.treeDepth, ins.rootHistorySize);

        cache.SetPoolConfig(config);
        cache.SetTreeState(tree);
        cache.SetPendingDeposits(PendingDepositsBuffer());
        cache.SetRelayerRegistry(RelayerRegistry());

        out.type = RECEIPT_POOL_INITIALIZED;
        out.pool = config.poolId;
        out.merkleRoot = tree.currentRoot();
        return true;
    });
}

bool ApplyRegisterAsset(CPoolStateView& view, const CInstructionContext& ctx,
                        const CRegisterAsset& ins, CValidationState& state,
                        CPoolReceipt* receipt)
{
    static const char* name = "RegisterAsset";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, ins.signer, state, name))
            return false;
        if (ins.mint.IsNull())
            return state.DoS(DOS_MALFORMED, error("%s: mint must be set", name),
                             REJECT_VALIDATION, "bad-asset-mint");

        uint256 assetId = DeriveAssetId(ins.mint);
        AssetVault vault;
        if (cache.GetAssetVault(assetId, vault))
            return state.DoS(DOS_STATE, error("%s: asset %s is already registered", name, assetId.GetHex()),
                             REJECT_CONFLICT, "asset-already-registered");
        if (!config.CanRegisterAsset())
            return state.DoS(DOS_STATE, error("%s: pool already holds %d assets", name, config.registeredAssetCount),
                             REJECT_CONFLICT, "too-many-assets");

        vault.assetId = assetId;
        vault.mint = ins.mint;
        vault.active = true;
        vault.depositsEnabled = true;
        vault.withdrawalsEnabled = true;
        vault.registeredAt = out.nTime;
        vault.lastActivityAt = out.nTime;
        cache.SetAssetVault(vault);

        config.registeredAssetCount++;
        config.lastActivityAt = out.nTime;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_ASSET_REGISTERED;
        out.pool = config.poolId;
        out.assetId = assetId;
        return true;
    });
}

bool ApplyConfigureAsset(CPoolStateView& view, const CInstructionContext& ctx,
                         const CConfigureAsset& ins, CValidationState& state,
                         CPoolReceipt* receipt)
{
    static const char* name = "ConfigureAsset";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, ins.signer, state, name))
            return false;
        AssetVault vault;
        if (!cache.GetAssetVault(ins.assetId, vault))
            return state.DoS(DOS_MALFORMED, error("%s: asset %s is not registered", name, ins.assetId.GetHex()),
                             REJECT_VALIDATION, "unknown-asset");

        if (ins.active)
            vault.active = *ins.active;
        if (ins.depositsEnabled)
            vault.depositsEnabled = *ins.depositsEnabled;
        if (ins.withdrawalsEnabled)
            vault.withdrawalsEnabled = *ins.withdrawalsEnabled;
        if (ins.minDeposit)
            vault.minDeposit = *ins.minDeposit;
        if (ins.maxDeposit)
            vault.maxDeposit = *ins.maxDeposit;
        if (vault.minDeposit > vault.maxDeposit)
            return state.DoS(DOS_MALFORMED, error("%s: minimum deposit %u above maximum %u", name,
                                                  vault.minDeposit, vault.maxDeposit),
                             REJECT_VALIDATION, "bad-deposit-limits");
        vault.lastActivityAt = out.nTime;
        cache.SetAssetVault(vault);

        out.type = RECEIPT_ASSET_CONFIGURED;
        out.pool = config.poolId;
        out.assetId = vault.assetId;
        return true;
    });
}

bool ApplyInitializeVerificationKey(CPoolStateView& view, const CInstructionContext& ctx,
                                    const CInitializeVerificationKey& ins, CValidationState& state,
                                    CPoolReceipt* receipt)
{
    static const char* name = "InitializeVerificationKey";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, ins.signer, state, name))
            return false;
        VerificationKey vk;
        if (cache.GetVerificationKey(ins.proofType, vk) && vk.locked)
            return state.DoS(DOS_STATE, error("%s: %s key is locked", name, ProofTypeName(ins.proofType)),
                             REJECT_CONFIG, "vk-locked");
        if (!AcceptsICLength(ins.proofType, ins.icLength))
            return state.DoS(DOS_MALFORMED, error("%s: %d IC points do not fit a %s key", name,
                                                  ins.icLength, ProofTypeName(ins.proofType)),
                             REJECT_VALIDATION, "bad-vk-ic-length");

        vk = VerificationKey();
        vk.alpha = ins.alpha;
        vk.beta = ins.beta;
        vk.gamma = ins.gamma;
        vk.delta = ins.delta;
        vk.declaredICLength = ins.icLength;
        cache.SetVerificationKey(ins.proofType, vk);

        out.type = RECEIPT_VK_UPDATED;
        out.pool = config.poolId;
        return true;
    });
}

bool ApplyAppendVerificationKeyIC(CPoolStateView& view, const CInstructionContext& ctx,
                                  const CAppendVerificationKeyIC& ins, CValidationState& state,
                                  CPoolReceipt* receipt)
{
    static const char* name = "AppendVerificationKeyIC";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, ins.signer, state, name))
            return false;
        VerificationKey vk;
        if (!cache.GetVerificationKey(ins.proofType, vk))
            return state.DoS(DOS_STATE, error("%s: no %s key is being provisioned", name, ProofTypeName(ins.proofType)),
                             REJECT_CONFIG, "vk-not-started");
        if (vk.locked)
            return state.DoS(DOS_STATE, error("%s: %s key is locked", name, ProofTypeName(ins.proofType)),
                             REJECT_CONFIG, "vk-locked");
        if (vk.initialized)
            return state.DoS(DOS_STATE, error("%s: %s key already has every IC point", name, ProofTypeName(ins.proofType)),
                             REJECT_CONFIG, "vk-already-finalized");
        if (vk.ic.size() + ins.points.size() > vk.declaredICLength)
            return state.DoS(DOS_MALFORMED, error("%s: %d more IC points exceed the announced %d", name,
                                                  ins.points.size(), vk.declaredICLength),
                             REJECT_VALIDATION, "bad-vk-ic-length");

        vk.ic.insert(vk.ic.end(), ins.points.begin(), ins.points.end());
        if (vk.ic.size() == vk.declaredICLength)
            vk.initialized = true;
        LogPrint("pool", "%s: %s key has %d/%d IC points\n", name, ProofTypeName(ins.proofType),
                 vk.ic.size(), vk.declaredICLength);
        cache.SetVerificationKey(ins.proofType, vk);

        out.type = RECEIPT_VK_UPDATED;
        out.pool = config.poolId;
        return true;
    });
}

bool ApplySetVerificationKey(CPoolStateView& view, const CInstructionContext& ctx,
                             const CSetVerificationKey& ins, CValidationState& state,
                             CPoolReceipt* receipt)
{
    static const char* name = "SetVerificationKey";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, ins.signer, state, name))
            return false;
        VerificationKey existing;
        if (cache.GetVerificationKey(ins.proofType, existing) && existing.locked)
            return state.DoS(DOS_STATE, error("%s: %s key is locked", name, ProofTypeName(ins.proofType)),
                             REJECT_CONFIG, "vk-locked");
        if (!AcceptsICLength(ins.proofType, ins.vk.ic.size()))
            return state.DoS(DOS_MALFORMED, error("%s: %d IC points do not fit a %s key", name,
                                                  ins.vk.ic.size(), ProofTypeName(ins.proofType)),
                             REJECT_VALIDATION, "bad-vk-ic-length");

        VerificationKey vk = ins.vk;
        vk.declaredICLength = vk.ic.size();
        vk.initialized = true;
        vk.locked = false;
        cache.SetVerificationKey(ins.proofType, vk);

        out.type = RECEIPT_VK_UPDATED;
        out.pool = config.poolId;
        return true;
    });
}

bool ApplyLockVerificationKey(CPoolStateView& view, const CInstructionContext& ctx,
                              const CLockVerificationKey& ins, CValidationState& state,
                              CPoolReceipt* receipt)
{
    static const char* name = "LockVerificationKey";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, ins.signer, state, name))
            return false;
        VerificationKey vk;
        if (!cache.GetVerificationKey(ins.proofType, vk) || !vk.initialized)
            return state.DoS(DOS_STATE, error("%s: %s key is not initialized", name, ProofTypeName(ins.proofType)),
                             REJECT_CONFIG, "vk-not-initialized");
        if (vk.locked)
            return state.DoS(DOS_STATE, error("%s: %s key is already locked", name, ProofTypeName(ins.proofType)),
                             REJECT_CONFIG, "vk-locked");
        if (!AcceptsICLength(ins.proofType, vk.ic.size()))
            return state.DoS(DOS_MALFORMED, error("%s: %d IC points do not fit a %s key", name,
                                                  vk.ic.size(), ProofTypeName(ins.proofType)),
                             REJECT_VALIDATION, "bad-vk-ic-length");

        vk.locked = true;
        cache.SetVerificationKey(ins.proofType, vk);
        LogPrintf("%s: locked %s key %s\n", name, ProofTypeName(ins.proofType), vk.GetHash().GetHex());

        out.type = RECEIPT_VK_LOCKED;
        out.pool = config.poolId;
        return true;
    });
}

bool ApplyPausePool(CPoolStateView& view, const CInstructionContext& ctx,
                    const uint256& signer, CValidationState& state,
                    CPoolReceipt* receipt)
{
    static const char* name = "PausePool";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, signer, state, name))
            return false;
        if (config.paused)
            return state.DoS(DOS_STATE, error("%s: pool is already paused", name),
                             REJECT_CONFLICT, "pool-already-paused");
        config.paused = true;
        config.lastActivityAt = out.nTime;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_POOL_PAUSED;
        out.pool = config.poolId;
        return true;
    });
}

bool ApplyUnpausePool(CPoolStateView& view, const CInstructionContext& ctx,
                      const uint256& signer, CValidationState& state,
                      CPoolReceipt* receipt)
{
    static const char* name = "UnpausePool";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, signer, state, name))
            return false;
        if (!config.paused)
            return state.DoS(DOS_STATE, error("%s: pool is not paused", name),
                             REJECT_CONFLICT, "pool-not-paused");
        config.paused = false;
        config.lastActivityAt = out.nTime;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_POOL_UNPAUSED;
        out.pool = config.poolId;
        return true;
    });
}

bool ApplyInitiateAuthorityTransfer(CPoolStateView& view, const CInstructionContext& ctx,
                                    const uint256& signer, const uint256& newAuthority,
                                    CValidationState& state, CPoolReceipt* receipt)
{
    static const char* name = "InitiateAuthorityTransfer";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, signer, state, name))
            return false;
        if (newAuthority.IsNull() || newAuthority == config.authority)
            return state.DoS(DOS_MALFORMED, error("%s: %s cannot become the authority", name, newAuthority.GetHex()),
                             REJECT_VALIDATION, "bad-new-authority");
        config.pendingAuthority = newAuthority;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_AUTHORITY_TRANSFER_INITIATED;
        out.pool = config.poolId;
        out.recipient = newAuthority;
        return true;
    });
}

bool ApplyAcceptAuthorityTransfer(CPoolStateView& view, const CInstructionContext& ctx,
                                  const uint256& signer, CValidationState& state,
                                  CPoolReceipt* receipt)
{
    static const char* name = "AcceptAuthorityTransfer";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name))
            return false;
        if (!config.HasPendingTransfer())
            return state.DoS(DOS_STATE, error("%s: no authority transfer is pending", name),
                             REJECT_CONFLICT, "no-pending-authority");
        if (signer != config.pendingAuthority)
            return state.DoS(DOS_MALFORMED, error("%s: %s is not the pending authority", name, signer.GetHex()),
                             REJECT_VALIDATION, "unauthorized");
        config.authority = config.pendingAuthority;
        config.pendingAuthority.SetNull();
        cache.SetPoolConfig(config);

        out.type = RECEIPT_AUTHORITY_TRANSFERRED;
        out.pool = config.poolId;
        out.recipient = config.authority;
        return true;
    });
}

bool ApplyCancelAuthorityTransfer(CPoolStateView& view, const CInstructionContext& ctx,
                                  const uint256& signer, CValidationState& state,
                                  CPoolReceipt* receipt)
{
    static const char* name = "CancelAuthorityTransfer";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, signer, state, name))
            return false;
        if (!config.HasPendingTransfer())
            return state.DoS(DOS_STATE, error("%s: no authority transfer is pending", name),
                             REJECT_CONFLICT, "no-pending-authority");
        config.pendingAuthority.SetNull();
        cache.SetPoolConfig(config);

        out.type = RECEIPT_AUTHORITY_TRANSFER_CANCELLED;
        out.pool = config.poolId;
        return true;
    });
}

bool ApplyConfigureRelayerRegistry(CPoolStateView& view, const CInstructionContext& ctx,
                                   const CConfigureRelayerRegistry& ins, CValidationState& state,
                                   CPoolReceipt* receipt)
{
    static const char* name = "ConfigureRelayerRegistry";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name) || !CheckAuthority(config, ins.signer, state, name))
            return false;
        if (ins.minFeeBps > ins.maxFeeBps || ins.maxFeeBps > RelayerRegistry::MAX_FEE_BPS)
            return state.DoS(DOS_MALFORMED, error("%s: fee bounds %d..%d are invalid", name, ins.minFeeBps, ins.maxFeeBps),
                             REJECT_VALIDATION, "bad-fee-bounds");
        RelayerRegistry registry;
        if (!LoadRegistry(cache, registry, state, name))
            return false;
        registry.minFeeBps = ins.minFeeBps;
        registry.maxFeeBps = ins.maxFeeBps;
        registry.registrationsOpen = ins.registrationsOpen;
        cache.SetRelayerRegistry(registry);

        out.type = RECEIPT_RELAYER_REGISTRY_CONFIGURED;
        out.pool = config.poolId;
        return true;
    });
}

bool ApplyRegisterRelayer(CPoolStateView& view, const CInstructionContext& ctx,
                          const CRegisterRelayer& ins, CValidationState& state,
                          CPoolReceipt* receipt)
{
    static const char* name = "RegisterRelayer";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name))
            return false;
        if (ins.operatorKey.IsNull())
            return state.DoS(DOS_MALFORMED, error("%s: operator must be set", name),
                             REJECT_VALIDATION, "bad-relayer-operator");
        RelayerRegistry registry;
        if (!LoadRegistry(cache, registry, state, name))
            return false;
        if (!registry.registrationsOpen)
            return state.DoS(DOS_STATE, error("%s: relayer registrations are closed", name),
                             REJECT_CONFIG, "relayer-registrations-closed");
        if (!registry.AcceptsFee(ins.feeBps))
            return state.DoS(DOS_MALFORMED, error("%s: fee %d bps outside %d..%d", name,
                                                  ins.feeBps, registry.minFeeBps, registry.maxFeeBps),
                             REJECT_VALIDATION, "bad-relayer-fee");
        RelayerNode node;
        if (cache.GetRelayerNode(ins.operatorKey, node))
            return state.DoS(DOS_STATE, error("%s: %s is already registered", name, ins.operatorKey.GetHex()),
                             REJECT_CONFLICT, "relayer-already-registered");

        node.operatorKey = ins.operatorKey;
        node.feeBps = ins.feeBps;
        node.active = true;
        node.registeredAt = out.nTime;
        node.lastActiveAt = out.nTime;
        cache.SetRelayerNode(node);

        registry.relayerCount++;
        registry.activeRelayerCount++;
        cache.SetRelayerRegistry(registry);

        out.type = RECEIPT_RELAYER_REGISTERED;
        out.pool = config.poolId;
        out.relayer = ins.operatorKey;
        return true;
    });
}

bool ApplyUpdateRelayer(CPoolStateView& view, const CInstructionContext& ctx,
                        const CUpdateRelayer& ins, CValidationState& state,
                        CPoolReceipt* receipt)
{
    static const char* name = "UpdateRelayer";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name))
            return false;
        RelayerNode node;
        if (!cache.GetRelayerNode(ins.operatorKey, node))
            return state.DoS(DOS_MALFORMED, error("%s: %s is not registered", name, ins.operatorKey.GetHex()),
                             REJECT_VALIDATION, "unknown-relayer");
        RelayerRegistry registry;
        if (!LoadRegistry(cache, registry, state, name))
            return false;

        if (ins.feeBps) {
            if (!registry.AcceptsFee(*ins.feeBps))
                return state.DoS(DOS_MALFORMED, error("%s: fee %d bps outside %d..%d", name,
                                                      *ins.feeBps, registry.minFeeBps, registry.maxFeeBps),
                                 REJECT_VALIDATION, "bad-relayer-fee");
            node.feeBps = *ins.feeBps;
        }
        if (ins.active && *ins.active != node.active) {
            if (*ins.active)
                registry.activeRelayerCount++;
            else
                registry.activeRelayerCount--;
            node.active = *ins.active;
            cache.SetRelayerRegistry(registry);
        }
        node.lastActiveAt = out.nTime;
        cache.SetRelayerNode(node);

        out.type = RECEIPT_RELAYER_UPDATED;
        out.pool = config.poolId;
        out.relayer = ins.operatorKey;
        return true;
    });
}

bool ApplyDeactivateRelayer(CPoolStateView& view, const CInstructionContext& ctx,
                            const CDeactivateRelayer& ins, CValidationState& state,
                            CPoolReceipt* receipt)
{
    static const char* name = "DeactivateRelayer";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        if (!LoadPool(cache, config, state, name))
            return false;
        if (ins.signer != ins.operatorKey && ins.signer != config.authority)
            return state.DoS(DOS_MALFORMED, error("%s: %s may not deactivate %s", name,
                                                  ins.signer.GetHex(), ins.operatorKey.GetHex()),
                             REJECT_VALIDATION, "unauthorized");
        RelayerNode node;
        if (!cache.GetRelayerNode(ins.operatorKey, node))
            return state.DoS(DOS_MALFORMED, error("%s: %s is not registered", name, ins.operatorKey.GetHex()),
                             REJECT_VALIDATION, "unknown-relayer");
        if (!node.active)
            return state.DoS(DOS_STATE, error("%s: %s is not active", name, ins.operatorKey.GetHex()),
                             REJECT_CONFLICT, "relayer-not-active");

        node.active = false;
        cache.SetRelayerNode(node);
        RelayerRegistry registry;
        if (!LoadRegistry(cache, registry, state, name))
            return false;
        registry.activeRelayerCount--;
        cache.SetRelayerRegistry(registry);

        out.type = RECEIPT_RELAYER_DEACTIVATED;
        out.pool = config.poolId;
        out.relayer = ins.operatorKey;
        return true;
    });
}

bool ApplyDeposit(CPoolStateView& view, const CInstructionContext& ctx,
                  const CDepositInstruction& ins, CValidationState& state,
                  CPoolReceipt* receipt)
{
    static const char* name = "Deposit";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        const DepositPublicInputs& inputs = ins.inputs;
        std::string strReason;
        PoolConfig config;
        std::optional<MerkleTreeState> tree;
        if (!LoadPool(cache, config, state, name) ||
            !CheckNotPaused(config, state, name) ||
            !CheckProofLength(ins.proof, state, name) ||
            !CheckStatement(inputs.Validate(strReason), strReason, state, name) ||
            !LoadTree(cache, tree, state, name))
            return false;

        AssetVault vault;
        if (!LoadVault(cache, inputs.assetId, vault, state, name))
            return false;
        if (!vault.depositsEnabled)
            return state.DoS(DOS_STATE, error("%s: deposits are disabled for asset %s", name, vault.assetId.GetHex()),
                             REJECT_CONFIG, "deposits-disabled");
        if (inputs.amount < vault.minDeposit)
            return state.DoS(DOS_MALFORMED, error("%s: amount %u below minimum %u", name, inputs.amount, vault.minDeposit),
                             REJECT_VALIDATION, "deposit-below-minimum");
        if (inputs.amount > vault.maxDeposit)
            return state.DoS(DOS_MALFORMED, error("%s: amount %u above maximum %u", name, inputs.amount, vault.maxDeposit),
                             REJECT_VALIDATION, "deposit-above-maximum");
        if (tree->isFull())
            return state.DoS(DOS_STATE, error("%s: commitment tree is full", name),
                             REJECT_CONFLICT, "tree-full");

        VerificationKey vk;
        if (!LoadUsableKey(cache, ProofType::Deposit, vk, state, name) ||
            !VerifyStatement(ctx, vk, inputs.ToFieldElements(), ins.proof, state, name))
            return false;

        if (!vault.RecordDeposit(inputs.amount, out.nTime))
            return state.DoS(DOS_MALFORMED, error("%s: deposit overflows the asset balance", name),
                             REJECT_VALIDATION, "amount-overflow");
        uint64_t leafIndex = tree->insert(inputs.commitment);
        cache.SetTreeState(*tree);
        cache.SetAssetVault(vault);
        config.totalDeposits++;
        config.lastActivityAt = out.nTime;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_DEPOSIT;
        out.pool = config.poolId;
        out.assetId = inputs.assetId;
        out.commitments.push_back(inputs.commitment);
        out.leafIndex = leafIndex;
        out.amount = inputs.amount;
        out.merkleRoot = tree->currentRoot();
        return true;
    });
}

bool ApplyWithdraw(CPoolStateView& view, const CInstructionContext& ctx,
                   const CWithdrawInstruction& ins, CValidationState& state,
                   CPoolReceipt* receipt)
{
    static const char* name = "Withdraw";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        const WithdrawPublicInputs& inputs = ins.inputs;
        std::string strReason;
        PoolConfig config;
        std::optional<MerkleTreeState> tree;
        if (!LoadPool(cache, config, state, name) ||
            !CheckNotPaused(config, state, name) ||
            !CheckProofLength(ins.proof, state, name) ||
            !CheckStatement(inputs.Validate(strReason), strReason, state, name))
            return false;
        if (inputs.relayerFee > inputs.amount / ctx.params.nMaxRelayerFeeDivisor)
            return state.DoS(DOS_MALFORMED, error("%s: fee %u above 1/%u of %u", name, inputs.relayerFee,
                                                  ctx.params.nMaxRelayerFeeDivisor, inputs.amount),
                             REJECT_VALIDATION, "relayer-fee-too-high");
        if (!LoadTree(cache, tree, state, name) ||
            !CheckKnownRoot(*tree, inputs.merkleRoot, state, name))
            return false;

        AssetVault vault;
        std::optional<RelayerNode> node;
        if (!LoadVault(cache, inputs.assetId, vault, state, name) ||
            !CheckWithdrawable(vault, inputs.amount, state, name) ||
            !CheckRelayer(cache, inputs.relayer, inputs.amount, inputs.relayerFee, node, state, name) ||
            !CheckUnspent(cache, inputs.nullifierHash, state, name))
            return false;

        VerificationKey vk;
        if (!LoadUsableKey(cache, ProofType::Withdraw, vk, state, name) ||
            !VerifyStatement(ctx, vk, inputs.ToFieldElements(), ins.proof, state, name))
            return false;

        std::vector<SpentNullifierRecord> records;
        records.push_back(MakeSpentRecord(config, inputs.nullifierHash, inputs.assetId,
                                          SPEND_WITHDRAW, inputs.relayer, out.nTime));
        if (!MarkAllSpent(cache, records, state, name))
            return false;
        if (!vault.RecordWithdrawal(inputs.amount, out.nTime))
            return state.DoS(DOS_STATE, error("%s: shielded balance no longer covers %u", name, inputs.amount),
                             REJECT_CONFLICT, "insufficient-shielded-balance");
        cache.SetAssetVault(vault);
        RecordRelayerFee(cache, node, inputs.relayerFee, out.nTime);
        config.totalWithdrawals++;
        config.lastActivityAt = out.nTime;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_WITHDRAW;
        out.pool = config.poolId;
        out.assetId = inputs.assetId;
        out.nullifiers.push_back(inputs.nullifierHash);
        out.amount = inputs.amount;
        out.fee = inputs.relayerFee;
        out.recipient = inputs.recipient;
        out.relayer = inputs.relayer;
        out.merkleRoot = inputs.merkleRoot;
        return true;
    });
}

bool ApplyWithdrawV2(CPoolStateView& view, const CInstructionContext& ctx,
                     const CWithdrawV2Instruction& ins, CValidationState& state,
                     CPoolReceipt* receipt)
{
    static const char* name = "WithdrawV2";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        const WithdrawV2PublicInputs& inputs = ins.inputs;
        std::string strReason;
        PoolConfig config;
        std::optional<MerkleTreeState> tree;
        if (!LoadPool(cache, config, state, name) ||
            !CheckNotPaused(config, state, name) ||
            !CheckProofLength(ins.proof, state, name) ||
            !CheckStatement(inputs.Validate(strReason), strReason, state, name))
            return false;
        if (inputs.amount < ctx.params.nMinWithdrawalAmount)
            return state.DoS(DOS_MALFORMED, error("%s: amount %u below minimum %u", name,
                                                  inputs.amount, ctx.params.nMinWithdrawalAmount),
                             REJECT_VALIDATION, "withdraw-below-minimum");
        if (inputs.relayerFee > UINT64_MAX / ctx.params.nMaxRelayerFeeDivisor)
            return state.DoS(DOS_MALFORMED, error("%s: fee %u overflows the fee check", name, inputs.relayerFee),
                             REJECT_VALIDATION, "relayer-fee-overflow");
        if (inputs.relayerFee * ctx.params.nMaxRelayerFeeDivisor > inputs.amount)
            return state.DoS(DOS_MALFORMED, error("%s: fee %u above 1/%u of %u", name, inputs.relayerFee,
                                                  ctx.params.nMaxRelayerFeeDivisor, inputs.amount),
                             REJECT_VALIDATION, "relayer-fee-too-high");
        if (!LoadTree(cache, tree, state, name) ||
            !CheckKnownRoot(*tree, inputs.merkleRoot, state, name))
            return false;

        AssetVault vault;
        std::optional<RelayerNode> node;
        if (!LoadVault(cache, inputs.assetId, vault, state, name) ||
            !CheckWithdrawable(vault, inputs.amount, state, name) ||
            !CheckRelayer(cache, inputs.relayer, inputs.amount, inputs.relayerFee, node, state, name) ||
            !CheckUnspent(cache, inputs.nullifierHash0, state, name))
            return false;
        if (inputs.HasSecondNullifier() && !CheckUnspent(cache, inputs.nullifierHash1, state, name))
            return false;

        PendingDepositsBuffer pending;
        if (!LoadPending(cache, pending, state, name))
            return false;
        if (pending.Size() >= ctx.params.nMaxPendingDeposits)
            return state.DoS(DOS_STATE, error("%s: pending buffer holds %d commitments", name, pending.Size()),
                             REJECT_CONFLICT, "pending-buffer-full");

        VerificationKey vk;
        if (!LoadUsableKey(cache, ProofType::WithdrawV2, vk, state, name) ||
            !VerifyStatement(ctx, vk, inputs.ToFieldElements(), ins.proof, state, name))
            return false;

        std::vector<SpentNullifierRecord> records;
        records.push_back(MakeSpentRecord(config, inputs.nullifierHash0, inputs.assetId,
                                          SPEND_WITHDRAW, inputs.relayer, out.nTime));
        if (inputs.HasSecondNullifier())
            records.push_back(MakeSpentRecord(config, inputs.nullifierHash1, inputs.assetId,
                                              SPEND_WITHDRAW, inputs.relayer, out.nTime));
        if (!MarkAllSpent(cache, records, state, name))
            return false;
        if (!vault.RecordWithdrawal(inputs.amount, out.nTime))
            return state.DoS(DOS_STATE, error("%s: shielded balance no longer covers %u", name, inputs.amount),
                             REJECT_CONFLICT, "insufficient-shielded-balance");
        size_t position = pending.Add(inputs.changeCommitment);
        cache.SetPendingDeposits(pending);
        cache.SetAssetVault(vault);
        RecordRelayerFee(cache, node, inputs.relayerFee, out.nTime);
        config.totalWithdrawals++;
        config.lastActivityAt = out.nTime;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_WITHDRAW_V2;
        out.pool = config.poolId;
        out.assetId = inputs.assetId;
        for (const SpentNullifierRecord& record : records)
            out.nullifiers.push_back(record.nullifierHash);
        out.commitments.push_back(inputs.changeCommitment);
        out.leafIndex = position;
        out.amount = inputs.amount;
        out.fee = inputs.relayerFee;
        out.recipient = inputs.recipient;
        out.relayer = inputs.relayer;
        out.merkleRoot = inputs.merkleRoot;
        return true;
    });
}

bool ApplyJoinSplit(CPoolStateView& view, const CInstructionContext& ctx,
                    const CJoinSplitInstruction& ins, CValidationState& state,
                    CPoolReceipt* receipt)
{
    static const char* name = "JoinSplit";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        const JoinSplitPublicInputs& inputs = ins.inputs;
        std::string strReason;
        PoolConfig config;
        std::optional<MerkleTreeState> tree;
        if (!LoadPool(cache, config, state, name) ||
            !CheckNotPaused(config, state, name) ||
            !CheckProofLength(ins.proof, state, name) ||
            !CheckStatement(inputs.Validate(strReason), strReason, state, name) ||
            !LoadTree(cache, tree, state, name) ||
            !CheckKnownRoot(*tree, inputs.merkleRoot, state, name))
            return false;

        AssetVault vault;
        if (!LoadVault(cache, inputs.assetId, vault, state, name))
            return false;
        uint64_t magnitude = inputs.PublicMagnitude();
        std::optional<RelayerNode> node;
        if (inputs.IsWithdrawal()) {
            if (!CheckWithdrawable(vault, magnitude, state, name) ||
                !CheckRelayer(cache, inputs.relayer, magnitude, inputs.relayerFee, node, state, name))
                return false;
        } else if (inputs.IsDeposit() && !vault.depositsEnabled) {
            return state.DoS(DOS_STATE, error("%s: deposits are disabled for asset %s", name, vault.assetId.GetHex()),
                             REJECT_CONFIG, "deposits-disabled");
        }
        for (const uint256& nf : inputs.inputNullifiers) {
            if (!CheckUnspent(cache, nf, state, name))
                return false;
        }
        if (tree->availableSpace() < inputs.outputCommitments.size())
            return state.DoS(DOS_STATE, error("%s: %d outputs do not fit in the tree", name, inputs.outputCommitments.size()),
                             REJECT_CONFLICT, "tree-full");

        VerificationKey vk;
        if (!LoadUsableKey(cache, ProofType::JoinSplit, vk, state, name))
            return false;
        if (vk.ic.size() != inputs.Count() + 1)
            return state.DoS(DOS_MALFORMED, error("%s: key has %d IC points, statement needs %d", name,
                                                  vk.ic.size(), inputs.Count() + 1),
                             REJECT_CONFIG, "vk-arity-mismatch");
        if (!VerifyStatement(ctx, vk, inputs.ToFieldElements(), ins.proof, state, name))
            return false;

        std::vector<SpentNullifierRecord> records;
        for (const uint256& nf : inputs.inputNullifiers)
            records.push_back(MakeSpentRecord(config, nf, inputs.assetId, SPEND_JOINSPLIT,
                                              inputs.relayer, out.nTime));
        if (!MarkAllSpent(cache, records, state, name))
            return false;

        if (inputs.IsDeposit() && !vault.RecordDeposit(magnitude, out.nTime))
            return state.DoS(DOS_MALFORMED, error("%s: inflow overflows the asset balance", name),
                             REJECT_VALIDATION, "amount-overflow");
        if (inputs.IsWithdrawal() && !vault.RecordWithdrawal(magnitude, out.nTime))
            return state.DoS(DOS_STATE, error("%s: shielded balance no longer covers %u", name, magnitude),
                             REJECT_CONFLICT, "insufficient-shielded-balance");
        uint64_t firstIndex = tree->insertBatch(inputs.outputCommitments);
        cache.SetTreeState(*tree);
        cache.SetAssetVault(vault);
        RecordRelayerFee(cache, node, inputs.relayerFee, out.nTime);
        config.totalJoinSplits++;
        config.lastActivityAt = out.nTime;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_JOINSPLIT;
        out.pool = config.poolId;
        out.assetId = inputs.assetId;
        out.nullifiers = inputs.inputNullifiers;
        out.commitments = inputs.outputCommitments;
        out.leafIndex = firstIndex;
        out.publicAmount = inputs.publicAmount;
        out.fee = inputs.relayerFee;
        out.relayer = inputs.relayer;
        out.merkleRoot = tree->currentRoot();
        return true;
    });
}

bool ApplyProveMembership(CPoolStateView& view, const CInstructionContext& ctx,
                          const CMembershipInstruction& ins, CValidationState& state,
                          CPoolReceipt* receipt)
{
    static const char* name = "ProveMembership";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        const MembershipPublicInputs& inputs = ins.inputs;
        std::string strReason;
        PoolConfig config;
        std::optional<MerkleTreeState> tree;
        VerificationKey vk;
        if (!LoadPool(cache, config, state, name) ||
            !CheckProofLength(ins.proof, state, name) ||
            !CheckStatement(inputs.Validate(strReason), strReason, state, name) ||
            !LoadTree(cache, tree, state, name) ||
            !CheckKnownRoot(*tree, inputs.merkleRoot, state, name) ||
            !LoadUsableKey(cache, ProofType::Membership, vk, state, name) ||
            !VerifyStatement(ctx, vk, inputs.ToFieldElements(), ins.proof, state, name))
            return false;

        out.type = RECEIPT_MEMBERSHIP;
        out.pool = config.poolId;
        out.assetId = inputs.assetId;
        out.amount = inputs.threshold;
        out.merkleRoot = inputs.merkleRoot;
        return true;
    });
}

bool ApplySettleDepositsBatch(CPoolStateView& view, const CInstructionContext& ctx,
                              const CSettleDepositsBatch& ins, CValidationState& state,
                              CPoolReceipt* receipt)
{
    static const char* name = "SettleDepositsBatch";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        std::optional<MerkleTreeState> tree;
        if (!LoadPool(cache, config, state, name) ||
            !CheckNotPaused(config, state, name) ||
            !CheckProofLength(ins.proof, state, name) ||
            !LoadTree(cache, tree, state, name))
            return false;
        if (ins.batchSize == 0 || ins.batchSize > ctx.params.nMaxBatchSize)
            return state.DoS(DOS_MALFORMED, error("%s: batch size %u outside 1..%u", name,
                                                  ins.batchSize, ctx.params.nMaxBatchSize),
                             REJECT_VALIDATION, "bad-batch-size");
        PendingDepositsBuffer pending;
        if (!LoadPending(cache, pending, state, name))
            return false;
        if (ins.batchSize > pending.Size())
            return state.DoS(DOS_STATE, error("%s: batch of %u but only %d pending", name, ins.batchSize, pending.Size()),
                             REJECT_CONFLICT, "batch-exceeds-pending");
        if (ins.batchSize > tree->availableSpace())
            return state.DoS(DOS_STATE, error("%s: batch of %u does not fit in the tree", name, ins.batchSize),
                             REJECT_CONFLICT, "tree-full");

        std::vector<uint256> commitments = pending.Front(ins.batchSize);
        MerkleBatchUpdatePublicInputs inputs;
        inputs.oldRoot = tree->currentRoot();
        inputs.newRoot = ins.newRoot;
        inputs.startIndex = tree->nextIndex();
        inputs.batchSize = ins.batchSize;
        inputs.commitmentsHash = BatchCommitmentsHash(commitments);

        std::string strReason;
        VerificationKey vk;
        if (!CheckStatement(inputs.Validate(strReason), strReason, state, name) ||
            !LoadUsableKey(cache, ProofType::MerkleBatchUpdate, vk, state, name) ||
            !VerifyStatement(ctx, vk, inputs.ToFieldElements(), ins.proof, state, name))
            return false;

        if (!tree->settleBatch(commitments, ins.newRoot))
            return state.DoS(DOS_MALFORMED, error("%s: new root %s does not match the pending commitments", name,
                                                  ins.newRoot.GetHex()),
                             REJECT_PROOF, "batch-root-mismatch");
        pending.Drain(ins.batchSize, out.nTime);
        cache.SetTreeState(*tree);
        cache.SetPendingDeposits(pending);
        config.totalBatches++;
        config.lastActivityAt = out.nTime;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_BATCH_SETTLED;
        out.pool = config.poolId;
        out.commitments = commitments;
        out.leafIndex = inputs.startIndex;
        out.relayer = ins.submitter;
        out.merkleRoot = ins.newRoot;
        return true;
    });
}

bool ApplyBatchProcessDeposits(CPoolStateView& view, const CInstructionContext& ctx,
                               const CBatchProcessDeposits& ins, CValidationState& state,
                               CPoolReceipt* receipt)
{
    static const char* name = "BatchProcessDeposits";
    return RunInstruction(name, view, state, receipt, [&](CPoolStateViewCache& cache, CPoolReceipt& out) {
        PoolConfig config;
        std::optional<MerkleTreeState> tree;
        if (!LoadPool(cache, config, state, name) ||
            !CheckAuthority(config, ins.signer, state, name) ||
            !CheckNotPaused(config, state, name) ||
            !LoadTree(cache, tree, state, name))
            return false;
        if (ins.maxCount == 0)
            return state.DoS(DOS_MALFORMED, error("%s: batch size must be positive", name),
                             REJECT_VALIDATION, "bad-batch-size");
        PendingDepositsBuffer pending;
        if (!LoadPending(cache, pending, state, name))
            return false;
        if (pending.IsEmpty())
            return state.DoS(DOS_STATE, error("%s: no pending commitments", name),
                             REJECT_CONFLICT, "no-pending-deposits");

        uint64_t count = std::min<uint64_t>(std::min<uint64_t>(ins.maxCount, pending.Size()),
                                            ctx.params.nMaxBatchSize);
        if (count > tree->availableSpace())
            return state.DoS(DOS_STATE, error("%s: %u commitments do not fit in the tree", name, count),
                             REJECT_CONFLICT, "tree-full");

        std::vector<uint256> commitments = pending.Front(count);
        uint64_t firstIndex = tree->nextIndex();
        for (const uint256& cm : commitments)
            tree->insert(cm);
        pending.Drain(count, out.nTime);
        cache.SetTreeState(*tree);
        cache.SetPendingDeposits(pending);
        config.totalBatches++;
        config.lastActivityAt = out.nTime;
        cache.SetPoolConfig(config);

        out.type = RECEIPT_BATCH_PROCESSED;
        out.pool = config.poolId;
        out.commitments = commitments;
        out.leafIndex = firstIndex;
        out.merkleRoot = tree->currentRoot();
        return true;
    });
}
