// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_POOLSTATE_H
#define SHIELDPOOL_POOLSTATE_H

#include "uint256.h"
#include "shieldpool/BatchUpdate.hpp"
#include "shieldpool/MerkleTreeState.hpp"
#include "shieldpool/VerificationKey.hpp"

#include <map>
#include <optional>
#include <stdint.h>

#include <boost/thread/mutex.hpp>

using libshieldpool::MerkleTreeState;
using libshieldpool::PendingDepositsBuffer;
using libshieldpool::ProofType;
using libshieldpool::VerificationKey;

enum SpendType : uint8_t {
    SPEND_WITHDRAW = 0,
    SPEND_JOINSPLIT = 1,
};

/** Write-once marker that a nullifier hash has been revealed. */
class SpentNullifierRecord
{
public:
    uint256 pool;
    uint256 nullifierHash;
    uint256 assetId;
    SpendType spendType;
    int64_t spentAt;
    uint256 relayer;

    SpentNullifierRecord() : spendType(SPEND_WITHDRAW), spentAt(0) {}

    friend bool operator==(const SpentNullifierRecord& a, const SpentNullifierRecord& b)
    {
        return a.pool == b.pool && a.nullifierHash == b.nullifierHash &&
               a.assetId == b.assetId && a.spendType == b.spendType &&
               a.spentAt == b.spentAt && a.relayer == b.relayer;
    }
};

/** keccak256("nullifier_v2" || pool || nullifierHash) */
uint256 NullifierAddress(const uint256& pool, const uint256& nullifierHash);

class PoolConfig
{
public:
    uint256 poolId;
    uint256 authority;
    //! null unless an authority transfer is in progress
    uint256 pendingAuthority;
    bool paused;
    uint32_t treeDepth;
    uint32_t rootHistorySize;
    uint32_t registeredAssetCount;
    uint32_t maxAssets;

    uint64_t totalDeposits;
    uint64_t totalWithdrawals;
    uint64_t totalJoinSplits;
    uint64_t totalMembershipProofs;
    uint64_t totalBatches;
    int64_t createdAt;
    int64_t lastActivityAt;

    static const uint32_t DEFAULT_MAX_ASSETS = 100;

    PoolConfig() : paused(false), treeDepth(0), rootHistorySize(0),
        registeredAssetCount(0), maxAssets(DEFAULT_MAX_ASSETS),
        totalDeposits(0), totalWithdrawals(0), totalJoinSplits(0),
        totalMembershipProofs(0), totalBatches(0), createdAt(0), lastActivityAt(0) {}

    bool HasPendingTransfer() const { return !pendingAuthority.IsNull(); }
    bool CanRegisterAsset() const { return registeredAssetCount < maxAssets; }

    friend bool operator==(const PoolConfig& a, const PoolConfig& b)
    {
        return a.poolId == b.poolId && a.authority == b.authority &&
               a.pendingAuthority == b.pendingAuthority && a.paused == b.paused &&
               a.treeDepth == b.treeDepth && a.rootHistorySize == b.rootHistorySize &&
               a.registeredAssetCount == b.registeredAssetCount && a.maxAssets == b.maxAssets &&
               a.totalDeposits == b.totalDeposits && a.totalWithdrawals == b.totalWithdrawals &&
               a.totalJoinSplits == b.totalJoinSplits &&
               a.totalMembershipProofs == b.totalMembershipProofs &&
               a.totalBatches == b.totalBatches && a.createdAt == b.createdAt &&
               a.lastActivityAt == b.lastActivityAt;
    }
};

/**
 * Accounting for one registered asset. The pool does not move tokens; the
 * shielded balance is the amount currently backing unspent notes.
 */
class AssetVault
{
public:
    uint256 assetId;
    uint256 mint;
    bool active;
    bool depositsEnabled;
    bool withdrawalsEnabled;
    uint64_t minDeposit;
    uint64_t maxDeposit;
    uint64_t totalDeposited;
    uint64_t totalWithdrawn;
    uint64_t shieldedBalance;
    uint64_t depositCount;
    uint64_t withdrawalCount;
    int64_t registeredAt;
    int64_t lastActivityAt;

    AssetVault() : active(false), depositsEnabled(false), withdrawalsEnabled(false),
        minDeposit(0), maxDeposit(UINT64_MAX), totalDeposited(0), totalWithdrawn(0),
        shieldedBalance(0), depositCount(0), withdrawalCount(0),
        registeredAt(0), lastActivityAt(0) {}

    /** Adds to the balance. Returns false on overflow and leaves the vault unchanged. */
    bool RecordDeposit(uint64_t amount, int64_t nTime);
    /** Removes from the balance. Returns false if the balance does not cover it. */
    bool RecordWithdrawal(uint64_t amount, int64_t nTime);

    friend bool operator==(const AssetVault& a, const AssetVault& b)
    {
        return a.assetId == b.assetId && a.mint == b.mint && a.active == b.active &&
               a.depositsEnabled == b.depositsEnabled &&
               a.withdrawalsEnabled == b.withdrawalsEnabled &&
               a.minDeposit == b.minDeposit && a.maxDeposit == b.maxDeposit &&
               a.totalDeposited == b.totalDeposited && a.totalWithdrawn == b.totalWithdrawn &&
               a.shieldedBalance == b.shieldedBalance && a.depositCount == b.depositCount &&
               a.withdrawalCount == b.withdrawalCount && a.registeredAt == b.registeredAt &&
               a.lastActivityAt == b.lastActivityAt;
    }
};

class RelayerRegistry
{
public:
    uint16_t minFeeBps;
    uint16_t maxFeeBps;
    bool registrationsOpen;
    uint64_t relayerCount;
    uint64_t activeRelayerCount;
    uint64_t totalFeesCollected;
    uint64_t totalTransactions;

    static const uint16_t DEFAULT_MIN_FEE_BPS = 10;
    static const uint16_t DEFAULT_MAX_FEE_BPS = 500;
    static const uint16_t MAX_FEE_BPS = 10000;

    RelayerRegistry() : minFeeBps(DEFAULT_MIN_FEE_BPS), maxFeeBps(DEFAULT_MAX_FEE_BPS),
        registrationsOpen(true), relayerCount(0), activeRelayerCount(0),
        totalFeesCollected(0), totalTransactions(0) {}

    bool AcceptsFee(uint16_t feeBps) const { return feeBps >= minFeeBps && feeBps <= maxFeeBps; }

    friend bool operator==(const RelayerRegistry& a, const RelayerRegistry& b)
    {
        return a.minFeeBps == b.minFeeBps && a.maxFeeBps == b.maxFeeBps &&
               a.registrationsOpen == b.registrationsOpen && a.relayerCount == b.relayerCount &&
               a.activeRelayerCount == b.activeRelayerCount &&
               a.totalFeesCollected == b.totalFeesCollected &&
               a.totalTransactions == b.totalTransactions;
    }
};

class RelayerNode
{
public:
    uint256 operatorKey;
    uint16_t feeBps;
    bool active;
    uint64_t transactionsProcessed;
    uint64_t feesEarned;
    int64_t registeredAt;
    int64_t lastActiveAt;

    RelayerNode() : feeBps(0), active(false), transactionsProcessed(0), feesEarned(0),
        registeredAt(0), lastActiveAt(0) {}

    //! amount * feeBps / 10000, rounded down
    uint64_t CalculateFee(uint64_t amount) const;

    friend bool operator==(const RelayerNode& a, const RelayerNode& b)
    {
        return a.operatorKey == b.operatorKey && a.feeBps == b.feeBps && a.active == b.active &&
               a.transactionsProcessed == b.transactionsProcessed &&
               a.feesEarned == b.feesEarned && a.registeredAt == b.registeredAt &&
               a.lastActiveAt == b.lastActiveAt;
    }
};

/**
 * One cached state object. origin is the parent's value when the entry
 * was first read (nullopt if it did not exist); value is the current one
 * (nullopt if absent).
 */
template<typename T>
struct CPoolCacheEntry
{
    std::optional<T> origin;
    std::optional<T> value;
    unsigned char flags;

    enum Flags {
        DIRTY = (1 << 0), // This cache entry is potentially different from the version in the parent view.
    };

    CPoolCacheEntry() : flags(0) {}
    explicit CPoolCacheEntry(const std::optional<T>& loaded) : origin(loaded), value(loaded), flags(0) {}

    bool IsDirty() const { return flags & DIRTY; }
};

typedef std::map<uint256, CPoolCacheEntry<AssetVault> > CAssetVaultMap;
typedef std::map<ProofType, CPoolCacheEntry<VerificationKey> > CVerificationKeyMap;
typedef std::map<uint256, CPoolCacheEntry<RelayerNode> > CRelayerNodeMap;
//! keyed by NullifierAddress
typedef std::map<uint256, CPoolCacheEntry<SpentNullifierRecord> > CNullifierRecordMap;

/** Everything one cache hands to its parent in a single BatchWrite. */
struct CPoolStateDelta
{
    std::optional<CPoolCacheEntry<PoolConfig> > config;
    std::optional<CPoolCacheEntry<RelayerRegistry> > relayerRegistry;
    std::optional<CPoolCacheEntry<MerkleTreeState> > tree;
    std::optional<CPoolCacheEntry<PendingDepositsBuffer> > pending;
    CAssetVaultMap vaults;
    CVerificationKeyMap keys;
    CRelayerNodeMap relayers;
    CNullifierRecordMap nullifiers;
};

/** Abstract view on the pool state. */
class CPoolStateView
{
public:
    virtual bool GetPoolConfig(PoolConfig& config) const;
    virtual bool GetAssetVault(const uint256& assetId, AssetVault& vault) const;
    virtual bool GetVerificationKey(ProofType type, VerificationKey& vk) const;
    virtual bool GetRelayerRegistry(RelayerRegistry& registry) const;
    virtual bool GetRelayerNode(const uint256& operatorKey, RelayerNode& node) const;

    //! The ledger tree, or nullopt before the pool is initialized
    virtual std::optional<MerkleTreeState> GetTreeState() const;

    virtual bool GetPendingDeposits(PendingDepositsBuffer& buffer) const;

    //! Look up the spent record stored at a nullifier address
    virtual bool GetNullifierRecord(const uint256& address, SpentNullifierRecord& record) const;

    //! Apply every dirty entry of the delta, or none of them. The passed delta can be modified.
    virtual bool BatchWrite(CPoolStateDelta& delta);

    //! As we use CPoolStateViews polymorphically, have a virtual destructor
    virtual ~CPoolStateView() {}
};


/** CPoolStateView backed by another CPoolStateView */
class CPoolStateViewBacked : public CPoolStateView
{
protected:
    CPoolStateView *base;

public:
    CPoolStateViewBacked(CPoolStateView *viewIn);
    bool GetPoolConfig(PoolConfig& config) const;
    bool GetAssetVault(const uint256& assetId, AssetVault& vault) const;
    bool GetVerificationKey(ProofType type, VerificationKey& vk) const;
    bool GetRelayerRegistry(RelayerRegistry& registry) const;
    bool GetRelayerNode(const uint256& operatorKey, RelayerNode& node) const;
    std::optional<MerkleTreeState> GetTreeState() const;
    bool GetPendingDeposits(PendingDepositsBuffer& buffer) const;
    bool GetNullifierRecord(const uint256& address, SpentNullifierRecord& record) const;
    void SetBackend(CPoolStateView &viewIn);
    bool BatchWrite(CPoolStateDelta& delta);
};


/**
 * CPoolStateView that adds a memory cache to another CPoolStateView.
 * Instructions read and write through a cache; Flush() hands every change
 * to the parent in one BatchWrite.
 */
class CPoolStateViewCache : public CPoolStateViewBacked
{
protected:
    /**
     * Make mutable so that we can "fill the cache" even from Get-methods
     * declared as "const".
     */
    mutable CPoolStateDelta cache;

public:
    CPoolStateViewCache(CPoolStateView *baseIn);
    ~CPoolStateViewCache();

    // Standard CPoolStateView methods
    bool GetPoolConfig(PoolConfig& config) const;
    bool GetAssetVault(const uint256& assetId, AssetVault& vault) const;
    bool GetVerificationKey(ProofType type, VerificationKey& vk) const;
    bool GetRelayerRegistry(RelayerRegistry& registry) const;
    bool GetRelayerNode(const uint256& operatorKey, RelayerNode& node) const;
    std::optional<MerkleTreeState> GetTreeState() const;
    bool GetPendingDeposits(PendingDepositsBuffer& buffer) const;
    bool GetNullifierRecord(const uint256& address, SpentNullifierRecord& record) const;
    bool BatchWrite(CPoolStateDelta& delta);

    void SetPoolConfig(const PoolConfig& config);
    void SetAssetVault(const AssetVault& vault);
    void SetVerificationKey(ProofType type, const VerificationKey& vk);
    void SetRelayerRegistry(const RelayerRegistry& registry);
    void SetRelayerNode(const RelayerNode& node);
    void SetTreeState(const MerkleTreeState& tree);
    void SetPendingDeposits(const PendingDepositsBuffer& buffer);

    //! Whether the nullifier hash has been spent in this pool
    bool IsSpent(const uint256& nullifierHash) const;

    /**
     * Create the spent record for record.nullifierHash under record.pool.
     * Returns false and changes nothing if a record already exists.
     */
    bool MarkSpent(const SpentNullifierRecord& record);

    /**
     * Push the modifications applied to this cache to its base.
     * Failure to call this method before destruction will cause the changes to be forgotten.
     * If false is returned, the base rejected the write and nothing was applied.
     * The cache is emptied either way.
     */
    bool Flush();

    //! Drop every cached entry without writing it.
    void Discard();

    //! Calculate the number of dirty entries in the cache
    size_t GetDirtyCount() const;

private:
    CPoolStateViewCache(const CPoolStateViewCache &);
};


/**
 * The backing store: the pool state as committed. BatchWrite takes the
 * store lock and applies a delta only if every entry still holds the value
 * the writing cache originally read, so two operations that spend the same
 * nullifier or advance the same tree never both commit.
 */
class CPoolStateViewMemory : public CPoolStateView
{
private:
    mutable boost::mutex cs_state;

    std::optional<PoolConfig> config;
    std::optional<RelayerRegistry> relayerRegistry;
    std::optional<MerkleTreeState> tree;
    std::optional<PendingDepositsBuffer> pending;
    std::map<uint256, AssetVault> vaults;
    std::map<ProofType, VerificationKey> keys;
    std::map<uint256, RelayerNode> relayers;
    std::map<uint256, SpentNullifierRecord> nullifiers;

public:
    bool GetPoolConfig(PoolConfig& config) const;
    bool GetAssetVault(const uint256& assetId, AssetVault& vault) const;
    bool GetVerificationKey(ProofType type, VerificationKey& vk) const;
    bool GetRelayerRegistry(RelayerRegistry& registry) const;
    bool GetRelayerNode(const uint256& operatorKey, RelayerNode& node) const;
    std::optional<MerkleTreeState> GetTreeState() const;
    bool GetPendingDeposits(PendingDepositsBuffer& buffer) const;
    bool GetNullifierRecord(const uint256& address, SpentNullifierRecord& record) const;
    bool BatchWrite(CPoolStateDelta& delta);

    size_t NullifierCount() const;
};

#endif // SHIELDPOOL_POOLSTATE_H
