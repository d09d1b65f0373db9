#include <gtest/gtest.h>

#include "test/data/groth16_fixture.json.h"

#include "shieldpool/Field.hpp"
#include "shieldpool/curve/CurveBackend.hpp"
#include "shieldpool/curve/Encoding.hpp"
#include "shieldpool/curve/ReferenceCurve.hpp"

#include "json_test_vectors.h"

#include <memory>
#include <stdexcept>

using namespace libshieldpool;

class CurveBackendTest : public ::testing::TestWithParam<std::string> {
protected:
    std::unique_ptr<CurveBackend> curve;
    UniValue vectors;

    void SetUp() {
        curve = MakeCurveBackend(GetParam());
        vectors = find_value(read_json_object(JSON_TEST_DATA(groth16_fixture)), "curve");
    }

    G1Point G1(const std::string& key) {
        return G1Point(bytes_from_json(find_value(vectors, key)));
    }

    G2Point G2(const std::string& key) {
        return G2Point(bytes_from_json(find_value(vectors, key)));
    }
};

TEST_P(CurveBackendTest, Generators) {
    EXPECT_EQ(G1Generator(), G1("g1"));
    EXPECT_EQ(G2Generator(), G2("g2"));
    EXPECT_NO_THROW(curve->CheckG1(G1Generator()));
    EXPECT_NO_THROW(curve->CheckG2(G2Generator()));
    EXPECT_EQ(curve->Name(), GetParam());
}

TEST_P(CurveBackendTest, Arithmetic) {
    G1Point g = G1Generator();
    EXPECT_EQ(curve->Add(g, g), G1("g1_times_2"));
    EXPECT_EQ(curve->Add(curve->Add(g, g), g), G1("g1_times_3"));
    EXPECT_EQ(curve->ScalarMul(g, uint256::FromUint64(3)), G1("g1_times_3"));
    EXPECT_EQ(curve->ScalarMul(g, uint256_from_json(find_value(vectors, "big"))), G1("g1_times_big"));
    EXPECT_EQ(curve->Negate(g), G1("g1_neg"));
}

TEST_P(CurveBackendTest, Identity) {
    G1Point g = G1Generator();
    G1Point zero;
    EXPECT_TRUE(zero.IsIdentity());
    EXPECT_NO_THROW(curve->CheckG1(zero));
    EXPECT_NO_THROW(curve->CheckG2(G2Point()));

    EXPECT_EQ(curve->Add(g, zero), g);
    EXPECT_EQ(curve->Add(zero, g), g);
    EXPECT_TRUE(curve->Add(g, curve->Negate(g)).IsIdentity());
    EXPECT_TRUE(curve->Negate(zero).IsIdentity());
    EXPECT_TRUE(curve->ScalarMul(g, uint256()).IsIdentity());
    // Scalars are reduced mod r, so r itself gives the identity.
    EXPECT_TRUE(curve->ScalarMul(g, FromMpz(ScalarModulus())).IsIdentity());
}

TEST_P(CurveBackendTest, RejectsInvalidPoints) {
    // (1, 3) is not on y^2 = x^3 + 3.
    G1Point offCurve = G1Generator();
    *(offCurve.begin() + 63) = 3;
    EXPECT_THROW(curve->CheckG1(offCurve), CryptographyError);
    EXPECT_THROW(curve->Add(offCurve, G1Generator()), CryptographyError);

    // A coordinate equal to p is out of range even though p = 0 mod p.
    G1Point outOfRange;
    FromMpz(BaseModulus(), outOfRange.begin());
    FromMpz(mpz_class(2), outOfRange.begin() + 32);
    EXPECT_THROW(curve->CheckG1(outOfRange), CryptographyError);

    G2Point badG2 = G2Generator();
    *(badG2.begin() + 127) ^= 1;
    EXPECT_THROW(curve->CheckG2(badG2), CryptographyError);
}

TEST_P(CurveBackendTest, PairingBilinearity) {
    G1Point g1 = G1Generator();
    G2Point g2 = G2Generator();
    G2Point g2x2 = G2("g2_times_2");

    // e(2.G1, G2) e(-G1, 2.G2) = 1
    PairingBatch batch;
    batch[0] = PairingInput(curve->Add(g1, g1), g2);
    batch[1] = PairingInput(curve->Negate(g1), g2x2);
    EXPECT_TRUE(curve->PairingCheck(batch));

    // e(G1, G2) alone is not one.
    PairingBatch single;
    single[0] = PairingInput(g1, g2);
    EXPECT_FALSE(curve->PairingCheck(single));

    // Four identity pairs multiply to one.
    EXPECT_TRUE(curve->PairingCheck(PairingBatch()));
}

TEST_P(CurveBackendTest, ZeroDenominators) {
    G1Point g = G1Generator();
    G1Point twoG = curve->Add(g, g);

    // Both sums have equal x coordinates, so the affine slope would divide by zero.
    EXPECT_TRUE(curve->Add(twoG, curve->Negate(twoG)).IsIdentity());
    G1Point minusG = curve->ScalarMul(g, FromMpz(ScalarModulus() - 1));
    EXPECT_EQ(minusG, curve->Negate(g));
    EXPECT_TRUE(curve->Add(minusG, g).IsIdentity());

    PairingBatch batch;
    batch[0] = PairingInput(g, G2Generator());
    batch[1] = PairingInput(curve->Negate(g), G2Generator());
    batch[2] = PairingInput(twoG, G2Generator());
    batch[3] = PairingInput(curve->Negate(twoG), G2Generator());
    EXPECT_TRUE(curve->PairingCheck(batch));
}

TEST(ReferenceCurve, InversionFailureIsACurveError) {
    ReferenceCurve curve;
    EXPECT_TRUE(curve.ScalarMulG2(G2Generator(), FromMpz(ScalarModulus())).IsIdentity());
    try {
        curve.ScalarMulG2(G2Generator(), FromMpz(ScalarModulus() - 1));
    } catch (const std::domain_error& e) {
        FAIL() << "field arithmetic error escaped the curve layer: " << e.what();
    }
}

INSTANTIATE_TEST_SUITE_P(Backends, CurveBackendTest, ::testing::Values("libsnark", "reference"));

TEST(CurveBackend, UnknownNameThrows) {
    EXPECT_THROW(MakeCurveBackend("bls12-381"), std::invalid_argument);
    std::vector<std::string> names = CurveBackendNames();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], DEFAULT_CURVE_BACKEND);
}

TEST(CurveBackend, BackendsAgreeOnMultiples) {
    std::unique_ptr<CurveBackend> libsnark = MakeCurveBackend("libsnark");
    std::unique_ptr<CurveBackend> reference = MakeCurveBackend("reference");

    G1Point p = G1Generator();
    for (uint64_t k = 1; k < 40; k += 7) {
        uint256 scalar = uint256::FromUint64(k * 0x9e3779b97f4a7c15ULL);
        G1Point a = libsnark->ScalarMul(p, scalar);
        G1Point b = reference->ScalarMul(p, scalar);
        EXPECT_EQ(a, b) << "k = " << k;
        EXPECT_EQ(libsnark->Add(a, p), reference->Add(b, p));
        p = a;
    }
}

TEST(CurveEncoding, RoundTripAndLayout) {
    AffineG1 g = DecodeG1(G1Generator());
    EXPECT_FALSE(g.infinity);
    EXPECT_EQ(g.x, 1);
    EXPECT_EQ(g.y, 2);
    EXPECT_EQ(EncodeG1(g), G1Generator());
    EXPECT_TRUE(DecodeG1(G1Point()).infinity);

    // G2 keeps the imaginary part first.
    AffineG2 q = DecodeG2(G2Generator());
    EXPECT_EQ(q.x_c1, mpz_class("198e9393920d483a7260bfb731fb5d25f1aa493335a9e71297e485b7aef312c2", 16));
    EXPECT_EQ(q.x_c0, mpz_class("1800deef121f1e76426a00665e5c4479674322d4f75edadd46debd5cd992f6ed", 16));
    EXPECT_EQ(EncodeG2(q), G2Generator());
}

TEST(CurveEncoding, SplitProof) {
    std::vector<unsigned char> proof(SP_PROOF_SIZE);
    for (size_t i = 0; i < proof.size(); i++) {
        proof[i] = i;
    }
    G1Point a, c;
    G2Point b;
    SplitProof(proof.data(), a, b, c);
    EXPECT_EQ(*a.begin(), 0);
    EXPECT_EQ(*b.begin(), SP_G1_SIZE);
    EXPECT_EQ(*c.begin(), SP_G1_SIZE + SP_G2_SIZE);
    EXPECT_EQ(*(c.begin() + SP_G1_SIZE - 1), SP_PROOF_SIZE - 1);
}

TEST(ReferenceCurve, G2ScalarMul) {
    ReferenceCurve curve;
    UniValue vectors = find_value(read_json_object(JSON_TEST_DATA(groth16_fixture)), "curve");
    EXPECT_EQ(curve.ScalarMulG2(G2Generator(), uint256::FromUint64(2)),
              G2Point(bytes_from_json(find_value(vectors, "g2_times_2"))));
}
