// Copyright (c) 2012-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "poolstate.h"

#include "crypto/keccak.h"
#include "logging.h"

#include <string.h>

static const char NULLIFIER_ADDRESS_DOMAIN[] = "nullifier_v2";

uint256 NullifierAddress(const uint256& pool, const uint256& nullifierHash)
{
    uint256 address;
    CKeccak256()
        .Write((const unsigned char*)NULLIFIER_ADDRESS_DOMAIN, strlen(NULLIFIER_ADDRESS_DOMAIN))
        .Write(pool.begin(), pool.size())
        .Write(nullifierHash.begin(), nullifierHash.size())
        .Finalize(address.begin());
    return address;
}

bool AssetVault::RecordDeposit(uint64_t amount, int64_t nTime)
{
    if (amount > UINT64_MAX - shieldedBalance || amount > UINT64_MAX - totalDeposited)
        return false;
    totalDeposited += amount;
    shieldedBalance += amount;
    depositCount++;
    lastActivityAt = nTime;
    return true;
}

bool AssetVault::RecordWithdrawal(uint64_t amount, int64_t nTime)
{
    if (amount > shieldedBalance || amount > UINT64_MAX - totalWithdrawn)
        return false;
    totalWithdrawn += amount;
    shieldedBalance -= amount;
    withdrawalCount++;
    lastActivityAt = nTime;
    return true;
}

uint64_t RelayerNode::CalculateFee(uint64_t amount) const
{
    // Split the amount so the product stays within 64 bits.
    const uint64_t base = RelayerRegistry::MAX_FEE_BPS;
    return (amount / base) * feeBps + ((amount % base) * feeBps) / base;
}

bool CPoolStateView::GetPoolConfig(PoolConfig& config) const { return false; }
bool CPoolStateView::GetAssetVault(const uint256& assetId, AssetVault& vault) const { return false; }
bool CPoolStateView::GetVerificationKey(ProofType type, VerificationKey& vk) const { return false; }
bool CPoolStateView::GetRelayerRegistry(RelayerRegistry& registry) const { return false; }
bool CPoolStateView::GetRelayerNode(const uint256& operatorKey, RelayerNode& node) const { return false; }
std::optional<MerkleTreeState> CPoolStateView::GetTreeState() const { return std::nullopt; }
bool CPoolStateView::GetPendingDeposits(PendingDepositsBuffer& buffer) const { return false; }
bool CPoolStateView::GetNullifierRecord(const uint256& address, SpentNullifierRecord& record) const { return false; }
bool CPoolStateView::BatchWrite(CPoolStateDelta& delta) { return false; }


CPoolStateViewBacked::CPoolStateViewBacked(CPoolStateView *viewIn) : base(viewIn) { }

bool CPoolStateViewBacked::GetPoolConfig(PoolConfig& config) const { return base->GetPoolConfig(config); }
bool CPoolStateViewBacked::GetAssetVault(const uint256& assetId, AssetVault& vault) const { return base->GetAssetVault(assetId, vault); }
bool CPoolStateViewBacked::GetVerificationKey(ProofType type, VerificationKey& vk) const { return base->GetVerificationKey(type, vk); }
bool CPoolStateViewBacked::GetRelayerRegistry(RelayerRegistry& registry) const { return base->GetRelayerRegistry(registry); }
bool CPoolStateViewBacked::GetRelayerNode(const uint256& operatorKey, RelayerNode& node) const { return base->GetRelayerNode(operatorKey, node); }
std::optional<MerkleTreeState> CPoolStateViewBacked::GetTreeState() const { return base->GetTreeState(); }
bool CPoolStateViewBacked::GetPendingDeposits(PendingDepositsBuffer& buffer) const { return base->GetPendingDeposits(buffer); }
bool CPoolStateViewBacked::GetNullifierRecord(const uint256& address, SpentNullifierRecord& record) const { return base->GetNullifierRecord(address, record); }
void CPoolStateViewBacked::SetBackend(CPoolStateView &viewIn) { base = &viewIn; }
bool CPoolStateViewBacked::BatchWrite(CPoolStateDelta& delta) { return base->BatchWrite(delta); }


// Adapts a bool-returning getter to an optional result.
template<typename T, typename Getter>
static std::optional<T> Load(Getter getter)
{
    T tmp;
    if (getter(tmp))
        return tmp;
    return std::nullopt;
}

template<typename T, typename Fetch>
static CPoolCacheEntry<T>& FetchSingle(std::optional<CPoolCacheEntry<T> >& slot, Fetch fetch)
{
    if (!slot)
        slot = CPoolCacheEntry<T>(fetch());
    return *slot;
}

template<typename Map, typename Fetch>
static typename Map::mapped_type& FetchMapped(Map& map, const typename Map::key_type& key, Fetch fetch)
{
    typename Map::iterator it = map.find(key);
    if (it == map.end())
        it = map.emplace(key, typename Map::mapped_type(fetch())).first;
    return it->second;
}

template<typename T>
static bool ReadEntry(const CPoolCacheEntry<T>& entry, T& out)
{
    if (!entry.value)
        return false;
    out = *entry.value;
    return true;
}

template<typename T>
static void WriteEntry(CPoolCacheEntry<T>& entry, const T& value)
{
    entry.value = value;
    entry.flags |= CPoolCacheEntry<T>::DIRTY;
}

CPoolStateViewCache::CPoolStateViewCache(CPoolStateView *baseIn) : CPoolStateViewBacked(baseIn) { }

CPoolStateViewCache::~CPoolStateViewCache() { }

bool CPoolStateViewCache::GetPoolConfig(PoolConfig& config) const {
    return ReadEntry(FetchSingle(cache.config, [&]() {
        return Load<PoolConfig>([&](PoolConfig& tmp) { return base->GetPoolConfig(tmp); });
    }), config);
}

bool CPoolStateViewCache::GetAssetVault(const uint256& assetId, AssetVault& vault) const {
    return ReadEntry(FetchMapped(cache.vaults, assetId, [&]() {
        return Load<AssetVault>([&](AssetVault& tmp) { return base->GetAssetVault(assetId, tmp); });
    }), vault);
}

bool CPoolStateViewCache::GetVerificationKey(ProofType type, VerificationKey& vk) const {
    return ReadEntry(FetchMapped(cache.keys, type, [&]() {
        return Load<VerificationKey>([&](VerificationKey& tmp) { return base->GetVerificationKey(type, tmp); });
    }), vk);
}

bool CPoolStateViewCache::GetRelayerRegistry(RelayerRegistry& registry) const {
    return ReadEntry(FetchSingle(cache.relayerRegistry, [&]() {
        return Load<RelayerRegistry>([&](RelayerRegistry& tmp) { return base->GetRelayerRegistry(tmp); });
    }), registry);
}

bool CPoolStateViewCache::GetRelayerNode(const uint256& operatorKey, RelayerNode& node) const {
    return ReadEntry(FetchMapped(cache.relayers, operatorKey, [&]() {
        return Load<RelayerNode>([&](RelayerNode& tmp) { return base->GetRelayerNode(operatorKey, tmp); });
    }), node);
}

std::optional<MerkleTreeState> CPoolStateViewCache::GetTreeState() const {
    return FetchSingle(cache.tree, [&]() { return base->GetTreeState(); }).value;
}

bool CPoolStateViewCache::GetPendingDeposits(PendingDepositsBuffer& buffer) const {
    return ReadEntry(FetchSingle(cache.pending, [&]() {
        return Load<PendingDepositsBuffer>([&](PendingDepositsBuffer& tmp) { return base->GetPendingDeposits(tmp); });
    }), buffer);
}

bool CPoolStateViewCache::GetNullifierRecord(const uint256& address, SpentNullifierRecord& record) const {
    return ReadEntry(FetchMapped(cache.nullifiers, address, [&]() {
        return Load<SpentNullifierRecord>([&](SpentNullifierRecord& tmp) { return base->GetNullifierRecord(address, tmp); });
    }), record);
}

void CPoolStateViewCache::SetPoolConfig(const PoolConfig& config) {
    PoolConfig ignored;
    GetPoolConfig(ignored);
    WriteEntry(*cache.config, config);
}

void CPoolStateViewCache::SetAssetVault(const AssetVault& vault) {
    AssetVault ignored;
    GetAssetVault(vault.assetId, ignored);
    WriteEntry(cache.vaults[vault.assetId], vault);
}

void CPoolStateViewCache::SetVerificationKey(ProofType type, const VerificationKey& vk) {
    VerificationKey ignored;
    GetVerificationKey(type, ignored);
    WriteEntry(cache.keys[type], vk);
}

void CPoolStateViewCache::SetRelayerRegistry(const RelayerRegistry& registry) {
    RelayerRegistry ignored;
    GetRelayerRegistry(ignored);
    WriteEntry(*cache.relayerRegistry, registry);
}

void CPoolStateViewCache::SetRelayerNode(const RelayerNode& node) {
    RelayerNode ignored;
    GetRelayerNode(node.operatorKey, ignored);
    WriteEntry(cache.relayers[node.operatorKey], node);
}

void CPoolStateViewCache::SetTreeState(const MerkleTreeState& tree) {
    GetTreeState();
    WriteEntry(*cache.tree, tree);
}

void CPoolStateViewCache::SetPendingDeposits(const PendingDepositsBuffer& buffer) {
    PendingDepositsBuffer ignored;
    GetPendingDeposits(ignored);
    WriteEntry(*cache.pending, buffer);
}

bool CPoolStateViewCache::IsSpent(const uint256& nullifierHash) const {
    PoolConfig config;
    if (!GetPoolConfig(config))
        return false;
    SpentNullifierRecord record;
    return GetNullifierRecord(NullifierAddress(config.poolId, nullifierHash), record);
}

bool CPoolStateViewCache::MarkSpent(const SpentNullifierRecord& record) {
    uint256 address = NullifierAddress(record.pool, record.nullifierHash);
    SpentNullifierRecord existing;
    if (GetNullifierRecord(address, existing)) {
        LogPrint("nullifier", "nullifier %s already spent at %d\n",
                 record.nullifierHash.GetHex(), existing.spentAt);
        return false;
    }
    WriteEntry(cache.nullifiers[address], record);
    return true;
}

// The parent accepts a child entry only if it still holds the value the
// child started from. Nullifier records never had an origin, so this is
// also the write-once check.
template<typename T>
static bool EntryApplies(const std::optional<T>& current, const CPoolCacheEntry<T>& child)
{
    return !child.IsDirty() || current == child.origin;
}

template<typename T>
static bool SingleApplies(const std::optional<CPoolCacheEntry<T> >& parent,
                          const std::optional<CPoolCacheEntry<T> >& child)
{
    if (!child || !parent)
        return true;
    return EntryApplies(parent->value, *child);
}

template<typename Map>
static bool MapApplies(const Map& parent, const Map& child)
{
    for (typename Map::const_iterator child_it = child.begin(); child_it != child.end(); ++child_it) {
        typename Map::const_iterator parent_it = parent.find(child_it->first);
        if (parent_it != parent.end() && !EntryApplies(parent_it->second.value, child_it->second))
            return false;
    }
    return true;
}

template<typename T>
static void BatchWriteSingle(std::optional<CPoolCacheEntry<T> >& parent,
                             std::optional<CPoolCacheEntry<T> >& child)
{
    if (!child || !child->IsDirty())
        return;
    if (!parent) {
        parent = child;
    } else {
        parent->value = child->value;
        parent->flags |= CPoolCacheEntry<T>::DIRTY;
    }
}

template<typename Map>
static void BatchWriteMap(Map& parent, Map& child)
{
    for (typename Map::iterator child_it = child.begin(); child_it != child.end();) {
        if (child_it->second.IsDirty()) { // Ignore non-dirty entries (optimization).
            typename Map::iterator parent_it = parent.find(child_it->first);
            if (parent_it == parent.end()) {
                parent.emplace(child_it->first, child_it->second);
            } else {
                parent_it->second.value = child_it->second.value;
                parent_it->second.flags |= Map::mapped_type::DIRTY;
            }
        }
        child_it = child.erase(child_it);
    }
}

bool CPoolStateViewCache::BatchWrite(CPoolStateDelta& delta) {
    if (!SingleApplies(cache.config, delta.config) ||
        !SingleApplies(cache.relayerRegistry, delta.relayerRegistry) ||
        !SingleApplies(cache.tree, delta.tree) ||
        !SingleApplies(cache.pending, delta.pending) ||
        !MapApplies(cache.vaults, delta.vaults) ||
        !MapApplies(cache.keys, delta.keys) ||
        !MapApplies(cache.relayers, delta.relayers) ||
        !MapApplies(cache.nullifiers, delta.nullifiers)) {
        return false;
    }

    BatchWriteSingle(cache.config, delta.config);
    BatchWriteSingle(cache.relayerRegistry, delta.relayerRegistry);
    BatchWriteSingle(cache.tree, delta.tree);
    BatchWriteSingle(cache.pending, delta.pending);
    BatchWriteMap(cache.vaults, delta.vaults);
    BatchWriteMap(cache.keys, delta.keys);
    BatchWriteMap(cache.relayers, delta.relayers);
    BatchWriteMap(cache.nullifiers, delta.nullifiers);
    return true;
}

bool CPoolStateViewCache::Flush() {
    bool fOk = base->BatchWrite(cache);
    Discard();
    return fOk;
}

void CPoolStateViewCache::Discard() {
    cache = CPoolStateDelta();
}

template<typename Map>
static size_t CountDirty(const Map& map)
{
    size_t count = 0;
    for (typename Map::const_iterator it = map.begin(); it != map.end(); ++it) {
        if (it->second.IsDirty())
            count++;
    }
    return count;
}

template<typename T>
static size_t CountDirty(const std::optional<CPoolCacheEntry<T> >& slot)
{
    return (slot && slot->IsDirty()) ? 1 : 0;
}

size_t CPoolStateViewCache::GetDirtyCount() const {
    return CountDirty(cache.config) + CountDirty(cache.relayerRegistry) +
           CountDirty(cache.tree) + CountDirty(cache.pending) +
           CountDirty(cache.vaults) + CountDirty(cache.keys) +
           CountDirty(cache.relayers) + CountDirty(cache.nullifiers);
}


template<typename Map, typename Key, typename T>
static bool FindStored(const Map& map, const Key& key, T& out)
{
    typename Map::const_iterator it = map.find(key);
    if (it == map.end())
        return false;
    out = it->second;
    return true;
}

template<typename T>
static bool FindStored(const std::optional<T>& slot, T& out)
{
    if (!slot)
        return false;
    out = *slot;
    return true;
}

bool CPoolStateViewMemory::GetPoolConfig(PoolConfig& configOut) const {
    boost::mutex::scoped_lock lock(cs_state);
    return FindStored(config, configOut);
}

bool CPoolStateViewMemory::GetAssetVault(const uint256& assetId, AssetVault& vault) const {
    boost::mutex::scoped_lock lock(cs_state);
    return FindStored(vaults, assetId, vault);
}

bool CPoolStateViewMemory::GetVerificationKey(ProofType type, VerificationKey& vk) const {
    boost::mutex::scoped_lock lock(cs_state);
    return FindStored(keys, type, vk);
}

bool CPoolStateViewMemory::GetRelayerRegistry(RelayerRegistry& registry) const {
    boost::mutex::scoped_lock lock(cs_state);
    return FindStored(relayerRegistry, registry);
}

bool CPoolStateViewMemory::GetRelayerNode(const uint256& operatorKey, RelayerNode& node) const {
    boost::mutex::scoped_lock lock(cs_state);
    return FindStored(relayers, operatorKey, node);
}

std::optional<MerkleTreeState> CPoolStateViewMemory::GetTreeState() const {
    boost::mutex::scoped_lock lock(cs_state);
    return tree;
}

bool CPoolStateViewMemory::GetPendingDeposits(PendingDepositsBuffer& buffer) const {
    boost::mutex::scoped_lock lock(cs_state);
    return FindStored(pending, buffer);
}

bool CPoolStateViewMemory::GetNullifierRecord(const uint256& address, SpentNullifierRecord& record) const {
    boost::mutex::scoped_lock lock(cs_state);
    return FindStored(nullifiers, address, record);
}

size_t CPoolStateViewMemory::NullifierCount() const {
    boost::mutex::scoped_lock lock(cs_state);
    return nullifiers.size();
}

template<typename Map>
static bool StoredMapApplies(const Map& stored,
                             const std::map<typename Map::key_type, CPoolCacheEntry<typename Map::mapped_type> >& delta)
{
    for (auto it = delta.begin(); it != delta.end(); ++it) {
        std::optional<typename Map::mapped_type> current;
        typename Map::const_iterator found = stored.find(it->first);
        if (found != stored.end())
            current = found->second;
        if (!EntryApplies(current, it->second))
            return false;
    }
    return true;
}

template<typename T>
static void ApplyStored(std::optional<T>& stored, const std::optional<CPoolCacheEntry<T> >& entry)
{
    if (entry && entry->IsDirty())
        stored = entry->value;
}

template<typename Map>
static void ApplyStoredMap(Map& stored,
                           const std::map<typename Map::key_type, CPoolCacheEntry<typename Map::mapped_type> >& delta)
{
    for (auto it = delta.begin(); it != delta.end(); ++it) {
        if (!it->second.IsDirty())
            continue;
        if (it->second.value)
            stored[it->first] = *it->second.value;
        else
            stored.erase(it->first);
    }
}

bool CPoolStateViewMemory::BatchWrite(CPoolStateDelta& delta) {
    boost::mutex::scoped_lock lock(cs_state);

    if (!StoredMapApplies(nullifiers, delta.nullifiers)) {
        LogPrint("nullifier", "BatchWrite rejected: a nullifier record already exists\n");
        return false;
    }
    if (delta.tree && !EntryApplies(tree, *delta.tree)) {
        LogPrint("merkle", "BatchWrite rejected: the tree advanced since it was read\n");
        return false;
    }
    if ((delta.config && !EntryApplies(config, *delta.config)) ||
        (delta.relayerRegistry && !EntryApplies(relayerRegistry, *delta.relayerRegistry)) ||
        (delta.pending && !EntryApplies(pending, *delta.pending)) ||
        !StoredMapApplies(vaults, delta.vaults) ||
        !StoredMapApplies(keys, delta.keys) ||
        !StoredMapApplies(relayers, delta.relayers)) {
        LogPrint("pool", "BatchWrite rejected: pool state changed since it was read\n");
        return false;
    }

    ApplyStored(config, delta.config);
    ApplyStored(relayerRegistry, delta.relayerRegistry);
    ApplyStored(tree, delta.tree);
    ApplyStored(pending, delta.pending);
    ApplyStoredMap(vaults, delta.vaults);
    ApplyStoredMap(keys, delta.keys);
    ApplyStoredMap(relayers, delta.relayers);
    ApplyStoredMap(nullifiers, delta.nullifiers);
    return true;
}
