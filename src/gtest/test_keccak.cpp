#include <gtest/gtest.h>

#include "test/data/keccak.json.h"
#include "test/data/asset_id.json.h"

#include "crypto/keccak.h"
#include "shieldpool/PublicInputs.hpp"
#include "utilstrencodings.h"

#include "json_test_vectors.h"

using namespace libshieldpool;

static std::string Keccak256Hex(const std::vector<unsigned char>& data)
{
    unsigned char digest[CKeccak256::OUTPUT_SIZE];
    CKeccak256().Write(data.data(), data.size()).Finalize(digest);
    return HexStr(digest, digest + sizeof(digest));
}

TEST(Keccak, TestVectors) {
    UniValue tests = read_json(JSON_TEST_DATA(keccak));

    for (size_t i = 0; i < tests.size(); i++) {
        const UniValue& test = tests[i];
        std::vector<unsigned char> input = bytes_from_json(test[0]);
        EXPECT_EQ(Keccak256Hex(input), test[1].get_str()) << "vector " << i;
    }
}

TEST(Keccak, IncrementalWritesMatchOneShot) {
    // Cross the 136-byte rate boundary in uneven pieces.
    std::vector<unsigned char> data(300);
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = i * 31;
    }

    unsigned char incremental[CKeccak256::OUTPUT_SIZE];
    CKeccak256 hasher;
    hasher.Write(data.data(), 1).Write(data.data() + 1, 135).Write(data.data() + 136, 164);
    hasher.Finalize(incremental);

    EXPECT_EQ(HexStr(incremental, incremental + sizeof(incremental)), Keccak256Hex(data));
}

TEST(Keccak, ResetStartsOver) {
    unsigned char first[CKeccak256::OUTPUT_SIZE];
    unsigned char second[CKeccak256::OUTPUT_SIZE];
    const unsigned char abc[] = {'a', 'b', 'c'};

    CKeccak256 hasher;
    hasher.Write(abc, 1).Reset().Write(abc, 3).Finalize(first);
    CKeccak256().Write(abc, 3).Finalize(second);
    EXPECT_EQ(0, memcmp(first, second, sizeof(first)));
}

TEST(AssetId, TestVectors) {
    UniValue tests = read_json(JSON_TEST_DATA(asset_id));

    for (size_t i = 0; i < tests.size(); i++) {
        const UniValue& test = tests[i];
        uint256 mint = uint256_from_json(test[0]);
        uint256 assetId = DeriveAssetId(mint);
        EXPECT_EQ(assetId, uint256_from_json(test[1]));
        // The leading byte is always zero, so the id is a canonical scalar.
        EXPECT_EQ(0, *assetId.begin());
    }
}
