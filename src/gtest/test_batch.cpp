#include <gtest/gtest.h>

#include "test/data/groth16_fixture.json.h"

#include "crypto/common.h"
#include "shieldpool/BatchUpdate.hpp"
#include "shieldpool/Field.hpp"

#include "gtest/json_test_vectors.h"

#include <stdexcept>

using namespace libshieldpool;

TEST(BatchCommitmentsHash, SodiumSelfTest) {
    // The hash is only as good as libsodium's SHA-256.
    EXPECT_NE(init_and_check_sodium(), -1);
}

TEST(BatchCommitmentsHash, TestVector) {
    UniValue batch = find_value(read_json_object(JSON_TEST_DATA(groth16_fixture)), "batch_hash");
    const UniValue& cms = find_value(batch, "commitments");
    std::vector<uint256> commitments;
    for (size_t i = 0; i < cms.size(); i++) {
        commitments.push_back(uint256_from_json(cms[i]));
    }
    uint256 hash = BatchCommitmentsHash(commitments);
    EXPECT_EQ(hash, uint256_from_json(find_value(batch, "hash")));
    EXPECT_TRUE(IsCanonicalScalar(hash));
}

TEST(BatchCommitmentsHash, PaddingAndOrder) {
    std::vector<uint256> ab = {uint256::FromUint64(1), uint256::FromUint64(2)};
    std::vector<uint256> ba = {uint256::FromUint64(2), uint256::FromUint64(1)};
    EXPECT_NE(BatchCommitmentsHash(ab), BatchCommitmentsHash(ba));

    // Trailing zero commitments are indistinguishable from padding.
    std::vector<uint256> padded = ab;
    padded.push_back(uint256());
    EXPECT_EQ(BatchCommitmentsHash(ab), BatchCommitmentsHash(padded));

    for (int i = 0; i < 8; i++) {
        std::vector<uint256> one = {uint256::FromUint64(i * 1000003)};
        EXPECT_EQ(*BatchCommitmentsHash(one).begin() & 0xE0, 0);
    }

    std::vector<uint256> full(SP_MAX_BATCH_SIZE, uint256::FromUint64(3));
    EXPECT_NO_THROW(BatchCommitmentsHash(full));
    full.push_back(uint256::FromUint64(3));
    EXPECT_THROW(BatchCommitmentsHash(full), std::invalid_argument);
}

TEST(PendingDepositsBuffer, FifoAndCounters) {
    PendingDepositsBuffer buffer;
    EXPECT_TRUE(buffer.IsEmpty());
    EXPECT_THROW(buffer.Add(uint256()), std::invalid_argument);

    for (uint64_t i = 1; i <= 5; i++) {
        EXPECT_EQ(buffer.Add(uint256::FromUint64(i)), i - 1);
    }
    EXPECT_EQ(buffer.Size(), 5u);

    std::vector<uint256> front = buffer.Front(3);
    ASSERT_EQ(front.size(), 3u);
    EXPECT_EQ(front[0], uint256::FromUint64(1));
    EXPECT_EQ(front[2], uint256::FromUint64(3));
    EXPECT_EQ(buffer.Front(50).size(), 5u);

    buffer.Drain(3, 1700000000);
    EXPECT_EQ(buffer.Size(), 2u);
    EXPECT_EQ(buffer.Front(1)[0], uint256::FromUint64(4));
    EXPECT_EQ(buffer.totalBatched, 3u);
    EXPECT_EQ(buffer.batchCount, 1u);
    EXPECT_EQ(buffer.lastBatchTime, 1700000000);

    PendingDepositsBuffer before = buffer;
    EXPECT_THROW(buffer.Drain(3, 1700000001), std::out_of_range);
    EXPECT_TRUE(buffer == before);
}

TEST(PendingDepositsBuffer, Capacity) {
    PendingDepositsBuffer buffer;
    for (uint64_t i = 1; i <= SP_MAX_PENDING_DEPOSITS; i++) {
        buffer.Add(uint256::FromUint64(i));
    }
    EXPECT_TRUE(buffer.IsFull());
    EXPECT_THROW(buffer.Add(uint256::FromUint64(1000)), std::length_error);
    EXPECT_EQ(buffer.Size(), (size_t)SP_MAX_PENDING_DEPOSITS);
}
