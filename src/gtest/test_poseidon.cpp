#include <gtest/gtest.h>

#include "test/data/poseidon.json.h"
#include "test/data/groth16_fixture.json.h"

#include "shieldpool/Field.hpp"
#include "shieldpool/Note.hpp"
#include "shieldpool/Poseidon.hpp"

#include "json_test_vectors.h"

#include <stdexcept>

using namespace libshieldpool;

static uint256 FieldFromDecimal(const std::string& str)
{
    return FromMpz(mpz_class(str, 10));
}

class PoseidonTest : public ::testing::Test {
protected:
    static PoseidonHasher* hasher;

    static void SetUpTestSuite() {
        hasher = new PoseidonHasher();
    }

    static void TearDownTestSuite() {
        delete hasher;
        hasher = nullptr;
    }
};

PoseidonHasher* PoseidonTest::hasher = nullptr;

TEST_F(PoseidonTest, TestVectors) {
    UniValue tests = read_json(JSON_TEST_DATA(poseidon));
    ASSERT_GT(tests.size(), 0u);

    for (size_t i = 0; i < tests.size(); i++) {
        const UniValue& test = tests[i];
        std::vector<uint256> inputs;
        for (size_t j = 0; j < test[0].size(); j++) {
            inputs.push_back(FieldFromDecimal(test[0][j].get_str()));
        }
        EXPECT_EQ(hasher->Hash(inputs), uint256_from_json(test[1])) << "vector " << i;
    }
}

TEST_F(PoseidonTest, FixedArityOverloads) {
    uint256 one = uint256::FromUint64(1);
    uint256 two = uint256::FromUint64(2);
    uint256 three = uint256::FromUint64(3);
    uint256 four = uint256::FromUint64(4);

    EXPECT_EQ(hasher->Hash(one, two), hasher->Hash({one, two}));
    EXPECT_EQ(hasher->Hash(one, two, three, four), hasher->Hash({one, two, three, four}));
    EXPECT_EQ(hasher->Hash(one, two).GetHex(),
              "115cc0f5e7d690413df64c6b9662e9cf2a3617f2743245519e19607a4417189a");
    EXPECT_NE(hasher->Hash(one, two), hasher->Hash(two, one));
}

TEST_F(PoseidonTest, RejectsOtherArities) {
    uint256 one = uint256::FromUint64(1);
    EXPECT_THROW(hasher->Hash(std::vector<uint256>()), std::invalid_argument);
    EXPECT_THROW(hasher->Hash({one}), std::invalid_argument);
    EXPECT_THROW(hasher->Hash({one, one, one}), std::invalid_argument);
    EXPECT_THROW(hasher->Hash({one, one, one, one, one}), std::invalid_argument);
}

TEST_F(PoseidonTest, RejectsNonCanonicalInputs) {
    uint256 r = FromMpz(ScalarModulus());
    uint256 rMinusOne = FromMpz(ScalarModulus() - 1);
    uint256 one = uint256::FromUint64(1);

    EXPECT_THROW(hasher->Hash(r, one), std::domain_error);
    EXPECT_THROW(hasher->Hash(one, one, one, r), std::domain_error);
    EXPECT_NO_THROW(hasher->Hash(rMinusOne, one));
}

TEST_F(PoseidonTest, ParametersHaveCircomlibShape) {
    const PoseidonHasher::Params& p3 = hasher->ParamsForWidth(3);
    EXPECT_EQ(p3.full_rounds, 8u);
    EXPECT_EQ(p3.partial_rounds, 57u);
    EXPECT_EQ(p3.round_constants.size(), 3u * (8 + 57));
    EXPECT_EQ(p3.mds.size(), 3u);

    const PoseidonHasher::Params& p5 = hasher->ParamsForWidth(5);
    EXPECT_EQ(p5.full_rounds, 8u);
    EXPECT_EQ(p5.partial_rounds, 60u);
    EXPECT_EQ(p5.round_constants.size(), 5u * (8 + 60));
    EXPECT_EQ(p5.mds.size(), 5u);
}

TEST_F(PoseidonTest, NoteCommitmentAndNullifierHash) {
    UniValue fixture = read_json_object(JSON_TEST_DATA(groth16_fixture));
    const UniValue& expected = find_value(fixture, "endtoend");

    Note note(uint256::FromUint64(12345), uint256::FromUint64(67890), 1000000000, uint256());
    EXPECT_EQ(note.cm(*hasher), uint256_from_json(find_value(expected, "commitment")));
    EXPECT_EQ(note.nullifier_hash(*hasher, 0), uint256_from_json(find_value(expected, "nullifier_hash")));
    EXPECT_NE(note.nullifier_hash(*hasher, 0), note.nullifier_hash(*hasher, 1));
}
