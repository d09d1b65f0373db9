#include <gtest/gtest.h>

#include "poolstate.h"
#include "shieldpool/IncrementalMerkleTree.hpp"
#include "shieldpool/Poseidon.hpp"

#include <boost/thread/barrier.hpp>
#include <boost/thread/thread.hpp>

#include <atomic>

namespace
{

SpentNullifierRecord Record(const uint256& pool, uint64_t n)
{
    SpentNullifierRecord record;
    record.pool = pool;
    record.nullifierHash = uint256::FromUint64(n);
    record.assetId = uint256::FromUint64(77);
    record.spentAt = 1700000000 + n;
    return record;
}

PoolConfig Config()
{
    PoolConfig config;
    config.poolId = uint256::FromUint64(0xabcdef);
    config.authority = uint256::FromUint64(1);
    config.treeDepth = 4;
    config.rootHistorySize = 3;
    return config;
}

class PoolStateTest : public ::testing::Test {
protected:
    static libshieldpool::PoseidonHasher* poseidon;
    static libshieldpool::MerkleHasher* hasher;

    static void SetUpTestSuite() {
        poseidon = new libshieldpool::PoseidonHasher();
        hasher = new libshieldpool::MerkleHasher(*poseidon);
    }

    static void TearDownTestSuite() {
        delete hasher;
        delete poseidon;
    }

    CPoolStateViewMemory store;

    void SetUp() {
        CPoolStateViewCache cache(&store);
        cache.SetPoolConfig(Config());
        cache.SetTreeState(MerkleTreeState(*hasher, 4, 3));
        ASSERT_TRUE(cache.Flush());
    }
};

libshieldpool::PoseidonHasher* PoolStateTest::poseidon = nullptr;
libshieldpool::MerkleHasher* PoolStateTest::hasher = nullptr;

}

TEST(PoolState, NullifierAddressIsDomainSeparated) {
    uint256 pool = uint256::FromUint64(1);
    uint256 nf = uint256::FromUint64(2);
    EXPECT_EQ(NullifierAddress(pool, nf), NullifierAddress(pool, nf));
    EXPECT_NE(NullifierAddress(pool, nf), NullifierAddress(uint256::FromUint64(3), nf));
    EXPECT_NE(NullifierAddress(pool, nf), NullifierAddress(nf, pool));
}

TEST(PoolState, VaultAccounting) {
    AssetVault vault;
    EXPECT_TRUE(vault.RecordDeposit(1000, 10));
    EXPECT_TRUE(vault.RecordDeposit(500, 11));
    EXPECT_EQ(vault.shieldedBalance, 1500u);
    EXPECT_EQ(vault.depositCount, 2u);
    EXPECT_EQ(vault.lastActivityAt, 11);

    EXPECT_FALSE(vault.RecordWithdrawal(1501, 12));
    EXPECT_EQ(vault.shieldedBalance, 1500u);
    EXPECT_TRUE(vault.RecordWithdrawal(1500, 12));
    EXPECT_EQ(vault.shieldedBalance, 0u);
    EXPECT_EQ(vault.totalWithdrawn, 1500u);
    EXPECT_EQ(vault.withdrawalCount, 1u);

    AssetVault full;
    full.shieldedBalance = UINT64_MAX - 1;
    AssetVault before = full;
    EXPECT_FALSE(full.RecordDeposit(2, 13));
    EXPECT_TRUE(full == before);
}

TEST(PoolState, RelayerFee) {
    RelayerNode node;
    node.feeBps = 50;
    EXPECT_EQ(node.CalculateFee(1000000), 5000u);
    EXPECT_EQ(node.CalculateFee(199), 0u);
    EXPECT_EQ(node.CalculateFee(UINT64_MAX), UINT64_MAX / 10000 * 50 + (UINT64_MAX % 10000) * 50 / 10000);

    RelayerRegistry registry;
    EXPECT_TRUE(registry.AcceptsFee(RelayerRegistry::DEFAULT_MIN_FEE_BPS));
    EXPECT_TRUE(registry.AcceptsFee(RelayerRegistry::DEFAULT_MAX_FEE_BPS));
    EXPECT_FALSE(registry.AcceptsFee(RelayerRegistry::DEFAULT_MAX_FEE_BPS + 1));
}

TEST_F(PoolStateTest, CacheReadsThrough) {
    CPoolStateViewCache cache(&store);
    PoolConfig config;
    ASSERT_TRUE(cache.GetPoolConfig(config));
    EXPECT_TRUE(config == Config());
    ASSERT_TRUE(cache.GetTreeState().has_value());
    EXPECT_EQ(cache.GetTreeState()->depth(), 4u);

    AssetVault vault;
    EXPECT_FALSE(cache.GetAssetVault(uint256::FromUint64(5), vault));
    libshieldpool::VerificationKey vk;
    EXPECT_FALSE(cache.GetVerificationKey(ProofType::Deposit, vk));
    EXPECT_EQ(cache.GetDirtyCount(), 0u);
}

TEST_F(PoolStateTest, MarkSpentIsWriteOnce) {
    uint256 pool = Config().poolId;
    CPoolStateViewCache cache(&store);

    EXPECT_FALSE(cache.IsSpent(uint256::FromUint64(9)));
    EXPECT_TRUE(cache.MarkSpent(Record(pool, 9)));
    EXPECT_TRUE(cache.IsSpent(uint256::FromUint64(9)));
    EXPECT_FALSE(cache.MarkSpent(Record(pool, 9)));
    EXPECT_EQ(cache.GetDirtyCount(), 1u);

    // Nothing reaches the store before the flush.
    EXPECT_EQ(store.NullifierCount(), 0u);
    EXPECT_TRUE(cache.Flush());
    EXPECT_EQ(store.NullifierCount(), 1u);
    EXPECT_EQ(cache.GetDirtyCount(), 0u);

    SpentNullifierRecord stored;
    ASSERT_TRUE(store.GetNullifierRecord(NullifierAddress(pool, uint256::FromUint64(9)), stored));
    EXPECT_TRUE(stored == Record(pool, 9));

    CPoolStateViewCache next(&store);
    EXPECT_TRUE(next.IsSpent(uint256::FromUint64(9)));
    EXPECT_FALSE(next.MarkSpent(Record(pool, 9)));
}

TEST_F(PoolStateTest, DiscardForgetsChanges) {
    CPoolStateViewCache cache(&store);
    cache.MarkSpent(Record(Config().poolId, 4));
    PoolConfig config = Config();
    config.paused = true;
    cache.SetPoolConfig(config);
    EXPECT_EQ(cache.GetDirtyCount(), 2u);

    cache.Discard();
    EXPECT_EQ(cache.GetDirtyCount(), 0u);
    EXPECT_TRUE(cache.Flush());
    PoolConfig stored;
    ASSERT_TRUE(store.GetPoolConfig(stored));
    EXPECT_FALSE(stored.paused);
    EXPECT_EQ(store.NullifierCount(), 0u);
}

TEST_F(PoolStateTest, ConflictingSpendsRejectWholeDelta) {
    uint256 pool = Config().poolId;
    CPoolStateViewCache first(&store);
    CPoolStateViewCache second(&store);

    ASSERT_TRUE(first.MarkSpent(Record(pool, 1)));
    ASSERT_TRUE(second.MarkSpent(Record(pool, 1)));

    // The second cache also touches the config; none of it may land.
    PoolConfig config;
    ASSERT_TRUE(second.GetPoolConfig(config));
    config.totalWithdrawals++;
    second.SetPoolConfig(config);
    ASSERT_TRUE(second.MarkSpent(Record(pool, 2)));

    EXPECT_TRUE(first.Flush());
    EXPECT_FALSE(second.Flush());

    EXPECT_EQ(store.NullifierCount(), 1u);
    PoolConfig stored;
    ASSERT_TRUE(store.GetPoolConfig(stored));
    EXPECT_EQ(stored.totalWithdrawals, 0u);
}

TEST_F(PoolStateTest, TreeAdvanceConflicts) {
    CPoolStateViewCache first(&store);
    CPoolStateViewCache second(&store);

    MerkleTreeState a = *first.GetTreeState();
    a.insert(uint256::FromUint64(1));
    first.SetTreeState(a);

    MerkleTreeState b = *second.GetTreeState();
    b.insert(uint256::FromUint64(2));
    second.SetTreeState(b);

    EXPECT_TRUE(first.Flush());
    EXPECT_FALSE(second.Flush());
    EXPECT_TRUE(*store.GetTreeState() == a);
}

TEST_F(PoolStateTest, NestedCaches) {
    uint256 pool = Config().poolId;
    CPoolStateViewCache outer(&store);
    {
        CPoolStateViewCache inner(&outer);
        AssetVault vault;
        vault.assetId = uint256::FromUint64(5);
        vault.active = true;
        inner.SetAssetVault(vault);
        inner.MarkSpent(Record(pool, 3));
        EXPECT_TRUE(inner.Flush());
    }
    EXPECT_EQ(outer.GetDirtyCount(), 2u);
    EXPECT_TRUE(outer.IsSpent(uint256::FromUint64(3)));
    EXPECT_EQ(store.NullifierCount(), 0u);

    // A sibling that read the record as absent conflicts with the outer cache.
    {
        CPoolStateViewCache stale(&outer);
        CPoolStateViewCache fresh(&outer);
        EXPECT_TRUE(stale.IsSpent(uint256::FromUint64(3)));
        EXPECT_TRUE(fresh.MarkSpent(Record(pool, 8)));
        EXPECT_FALSE(stale.MarkSpent(Record(pool, 3)));
        EXPECT_TRUE(fresh.Flush());
    }

    EXPECT_TRUE(outer.Flush());
    EXPECT_EQ(store.NullifierCount(), 2u);
    AssetVault vault;
    ASSERT_TRUE(store.GetAssetVault(uint256::FromUint64(5), vault));
    EXPECT_TRUE(vault.active);
}

TEST_F(PoolStateTest, ConcurrentSpendsCommitOnce) {
    const int nThreads = 8;
    uint256 pool = Config().poolId;
    boost::barrier start(nThreads);
    std::atomic<int> committed(0);

    boost::thread_group threads;
    for (int i = 0; i < nThreads; i++) {
        threads.create_thread([&]() {
            CPoolStateViewCache cache(&store);
            bool fMarked = cache.MarkSpent(Record(pool, 42));
            start.wait();
            if (fMarked && cache.Flush())
                committed++;
        });
    }
    threads.join_all();

    EXPECT_EQ(committed.load(), 1);
    EXPECT_EQ(store.NullifierCount(), 1u);
}
