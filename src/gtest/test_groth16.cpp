#include <gtest/gtest.h>

#include "test/data/groth16_fixture.json.h"

#include "shieldpool/Field.hpp"
#include "shieldpool/Groth16.hpp"
#include "shieldpool/VerificationKey.hpp"
#include "shieldpool/curve/CurveBackend.hpp"

#include "gtest/json_test_vectors.h"
#include "gtest/utils.h"

#include <memory>
#include <stdexcept>

using namespace libshieldpool;

class Groth16Test : public ::testing::TestWithParam<std::string> {
protected:
    std::unique_ptr<CurveBackend> curve;
    std::unique_ptr<TestProver> prover;

    void SetUp() {
        curve = MakeCurveBackend(GetParam());
        prover.reset(new TestProver(*curve));
    }
};

TEST_P(Groth16Test, FixtureProofVerifies) {
    ProofVerifier verifier = ProofVerifier::Strict(*curve);
    VerificationKey vk = prover->MakeKey(ExpectedICLength(ProofType::Deposit));

    EXPECT_TRUE(verifier.Verify(vk, prover->FixtureDepositInputs(), prover->FixtureDepositProof()));
}

TEST_P(Groth16Test, ProverReproducesFixture) {
    GrothProof proof = prover->Prove(prover->FixtureDepositInputs(), prover->FixtureDepositA());
    EXPECT_EQ(proof, prover->FixtureDepositProof());
}

TEST_P(Groth16Test, VerifyingInputs) {
    UniValue deposit = find_value(read_json_object(JSON_TEST_DATA(groth16_fixture)), "deposit");
    VerificationKey vk = prover->MakeKey(4);

    G1Point vkx = PrepareVerifyingInputs(*curve, vk, prover->FixtureDepositInputs());
    EXPECT_EQ(vkx, G1Point(bytes_from_json(find_value(deposit, "vk_x"))));

    // All-zero inputs leave IC[0].
    std::vector<uint256> zeros(3);
    EXPECT_EQ(PrepareVerifyingInputs(*curve, vk, zeros), vk.ic[0]);

    std::vector<uint256> tooFew(2);
    EXPECT_THROW(PrepareVerifyingInputs(*curve, vk, tooFew), std::invalid_argument);

    std::vector<uint256> nonCanonical(3);
    nonCanonical[1] = FromMpz(ScalarModulus());
    EXPECT_THROW(PrepareVerifyingInputs(*curve, vk, nonCanonical), CryptographyError);
}

TEST_P(Groth16Test, FalseStatementsFail) {
    ProofVerifier verifier = ProofVerifier::Strict(*curve);
    VerificationKey vk = prover->MakeKey(4);
    std::vector<uint256> inputs = prover->FixtureDepositInputs();
    GrothProof proof = prover->FixtureDepositProof();

    std::vector<uint256> other = inputs;
    other[1] = uint256::FromUint64(1);
    EXPECT_FALSE(verifier.Verify(vk, other, proof));

    // A valid proof of a different statement does not carry over.
    GrothProof otherProof = prover->Prove(other, uint256::FromUint64(11));
    EXPECT_TRUE(verifier.Verify(vk, other, otherProof));
    EXPECT_FALSE(verifier.Verify(vk, inputs, otherProof));

    // Same statement, different key.
    VerificationKey shifted = vk;
    shifted.ic[0] = vk.ic[1];
    EXPECT_FALSE(verifier.Verify(shifted, inputs, proof));
}

// True if verification fails or the tampered encoding is refused outright.
static bool RejectedOrFalse(const ProofVerifier& verifier, const VerificationKey& vk,
                            const std::vector<uint256>& inputs, const GrothProof& proof)
{
    try {
        return !verifier.Verify(vk, inputs, proof);
    } catch (const CryptographyError&) {
        return true;
    }
}

TEST_P(Groth16Test, EverySingleByteFlipFails) {
    ProofVerifier verifier = ProofVerifier::Strict(*curve);
    VerificationKey vk = prover->MakeKey(4);
    std::vector<uint256> inputs = prover->FixtureDepositInputs();
    GrothProof proof = prover->FixtureDepositProof();
    ASSERT_TRUE(verifier.Verify(vk, inputs, proof));
    ASSERT_EQ(proof.size(), (size_t)SP_PROOF_SIZE);

    for (size_t i = 0; i < proof.size(); i++) {
        GrothProof flipped = proof;
        flipped[i] ^= 0x01;
        EXPECT_TRUE(RejectedOrFalse(verifier, vk, inputs, flipped)) << "proof byte " << i;
    }

    for (size_t j = 0; j < inputs.size(); j++) {
        for (size_t i = 0; i < 32; i++) {
            std::vector<uint256> flipped = inputs;
            *(flipped[j].begin() + i) ^= 0x01;
            EXPECT_TRUE(RejectedOrFalse(verifier, vk, flipped, proof))
                << "input " << j << " byte " << i;
        }
    }
}

TEST_P(Groth16Test, RejectsMalformedProofs) {
    ProofVerifier verifier = ProofVerifier::Strict(*curve);
    VerificationKey vk = prover->MakeKey(4);
    std::vector<uint256> inputs = prover->FixtureDepositInputs();
    GrothProof proof = prover->FixtureDepositProof();

    GrothProof shortProof(proof.begin(), proof.end() - 1);
    EXPECT_THROW(verifier.Verify(vk, inputs, shortProof), std::invalid_argument);

    GrothProof badA = proof;
    badA[SP_G1_SIZE - 1] ^= 1;
    EXPECT_THROW(verifier.Verify(vk, inputs, badA), CryptographyError);

    GrothProof badC = proof;
    for (size_t i = SP_G1_SIZE + SP_G2_SIZE; i < SP_G1_SIZE + SP_G2_SIZE + 32; i++) {
        badC[i] = 0xff;
    }
    EXPECT_THROW(verifier.Verify(vk, inputs, badC), CryptographyError);

    std::vector<uint256> extra = inputs;
    extra.push_back(uint256());
    EXPECT_THROW(verifier.Verify(vk, extra, proof), std::invalid_argument);

    std::vector<uint256> nonCanonical = inputs;
    nonCanonical[0] = FromMpz(ScalarModulus() + 1);
    EXPECT_THROW(verifier.Verify(vk, nonCanonical, proof), CryptographyError);
}

TEST_P(Groth16Test, RequiresUsableKey) {
    ProofVerifier verifier = ProofVerifier::Strict(*curve);
    VerificationKey vk = prover->MakeKey(4);

    vk.locked = false;
    EXPECT_THROW(verifier.Verify(vk, prover->FixtureDepositInputs(), prover->FixtureDepositProof()),
                 VerificationKeyError);

    vk.locked = true;
    vk.initialized = false;
    EXPECT_THROW(verifier.Verify(vk, prover->FixtureDepositInputs(), prover->FixtureDepositProof()),
                 VerificationKeyError);
}

TEST_P(Groth16Test, EveryProofTypeShape) {
    ProofVerifier verifier = ProofVerifier::Strict(*curve);
    for (size_t t = 0; t < NUM_PROOF_TYPES; t++) {
        ProofType type = static_cast<ProofType>(t);
        size_t n = ExpectedICLength(type);
        VerificationKey vk = prover->MakeKey(n);
        std::vector<uint256> inputs;
        for (size_t i = 0; i + 1 < n; i++) {
            inputs.push_back(uint256::FromUint64(1000 + 17 * i));
        }
        EXPECT_TRUE(verifier.Verify(vk, inputs, prover->Prove(inputs))) << ProofTypeName(type);
    }
}

INSTANTIATE_TEST_SUITE_P(Backends, Groth16Test, ::testing::Values("libsnark", "reference"));

TEST(Groth16, DisabledVerifierChecksShapeOnly) {
    ProofVerifier verifier = ProofVerifier::Disabled();
    VerificationKey vk;
    vk.ic.resize(4);
    vk.initialized = true;
    vk.locked = true;

    GrothProof zeros(SP_PROOF_SIZE);
    EXPECT_TRUE(verifier.Verify(vk, std::vector<uint256>(3), zeros));
    EXPECT_THROW(verifier.Verify(vk, std::vector<uint256>(2), zeros), std::invalid_argument);
    EXPECT_THROW(verifier.Verify(vk, std::vector<uint256>(3), GrothProof(10)), std::invalid_argument);

    vk.locked = false;
    EXPECT_THROW(verifier.Verify(vk, std::vector<uint256>(3), zeros), VerificationKeyError);
}

TEST(VerificationKey, ProofTypes) {
    for (size_t t = 0; t < NUM_PROOF_TYPES; t++) {
        ProofType type = static_cast<ProofType>(t);
        ProofType parsed;
        ASSERT_TRUE(ParseProofType(ProofTypeName(type), parsed));
        EXPECT_EQ(parsed, type);
        EXPECT_TRUE(AcceptsICLength(type, ExpectedICLength(type)));
    }
    ProofType parsed;
    EXPECT_FALSE(ParseProofType("transfer", parsed));

    EXPECT_EQ(ExpectedICLength(ProofType::Deposit), 4u);
    EXPECT_EQ(ExpectedICLength(ProofType::Withdraw), 9u);
    EXPECT_EQ(ExpectedICLength(ProofType::WithdrawV2), 13u);
    EXPECT_FALSE(AcceptsICLength(ProofType::Deposit, 5));
    EXPECT_FALSE(AcceptsICLength(ProofType::JoinSplit, 7));
    EXPECT_TRUE(AcceptsICLength(ProofType::JoinSplit, 8));
    EXPECT_TRUE(AcceptsICLength(ProofType::JoinSplit, 14));
    EXPECT_FALSE(AcceptsICLength(ProofType::JoinSplit, 15));
}

TEST(VerificationKey, JSONAndHash) {
    std::unique_ptr<CurveBackend> curve = MakeCurveBackend("reference");
    TestProver prover(*curve);
    VerificationKey vk = prover.MakeKey(4);

    VerificationKey parsed = VerificationKey::FromJSON(vk.ToJSON());
    EXPECT_TRUE(parsed.initialized);
    EXPECT_FALSE(parsed.locked);
    EXPECT_EQ(parsed.ic, vk.ic);
    EXPECT_EQ(parsed.declaredICLength, 4u);
    EXPECT_EQ(parsed.GetHash(), vk.GetHash());

    VerificationKey other = vk;
    other.ic.pop_back();
    EXPECT_NE(other.GetHash(), vk.GetHash());

    UniValue missing = vk.ToJSON();
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("alpha", find_value(missing, "alpha"));
    EXPECT_THROW(VerificationKey::FromJSON(obj), std::runtime_error);
    EXPECT_THROW(VerificationKey::FromJSON(UniValue(UniValue::VARR)), std::runtime_error);
}
