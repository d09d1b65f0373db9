#include "gtest/utils.h"
#include "gtest/json_test_vectors.h"

#include "test/data/groth16_fixture.json.h"

#include "shieldpool/Field.hpp"
#include "shieldpool/ShieldPool.h"

using namespace libshieldpool;

static mpz_class scalar_from_json(const UniValue& v)
{
    return ToMpz(uint256_from_json(v));
}

TestProver::TestProver(const CurveBackend& curve) : curve(curve)
{
    UniValue fixture = read_json_object(JSON_TEST_DATA(groth16_fixture));
    const UniValue& trapdoor = find_value(fixture, "trapdoor");

    alpha = scalar_from_json(find_value(trapdoor, "alpha"));
    beta = scalar_from_json(find_value(trapdoor, "beta"));
    gamma = scalar_from_json(find_value(trapdoor, "gamma"));
    delta = scalar_from_json(find_value(trapdoor, "delta"));
    b = scalar_from_json(find_value(trapdoor, "b"));

    alphaG1 = G1Point(bytes_from_json(find_value(trapdoor, "alpha_g1")));
    betaG2 = G2Point(bytes_from_json(find_value(trapdoor, "beta_g2")));
    gammaG2 = G2Point(bytes_from_json(find_value(trapdoor, "gamma_g2")));
    deltaG2 = G2Point(bytes_from_json(find_value(trapdoor, "delta_g2")));
    bG2 = G2Point(bytes_from_json(find_value(trapdoor, "b_g2")));

    const UniValue& scalars = find_value(trapdoor, "ic");
    const UniValue& points = find_value(trapdoor, "ic_g1");
    for (size_t i = 0; i < scalars.size(); i++) {
        ic.push_back(scalar_from_json(scalars[i]));
        icG1.push_back(G1Point(bytes_from_json(points[i])));
    }

    const UniValue& deposit = find_value(fixture, "deposit");
    fixtureProof = bytes_from_json(find_value(deposit, "proof"));
    fixtureA = uint256_from_json(find_value(deposit, "a"));
    const UniValue& inputs = find_value(deposit, "inputs");
    for (size_t i = 0; i < inputs.size(); i++) {
        fixtureInputs.push_back(uint256_from_json(inputs[i]));
    }
}

VerificationKey TestProver::MakeKey(size_t icLength) const
{
    if (icLength > icG1.size()) {
        throw std::invalid_argument("the fixture trapdoor has too few IC scalars");
    }
    VerificationKey vk;
    vk.alpha = alphaG1;
    vk.beta = betaG2;
    vk.gamma = gammaG2;
    vk.delta = deltaG2;
    vk.ic.assign(icG1.begin(), icG1.begin() + icLength);
    vk.declaredICLength = icLength;
    vk.initialized = true;
    vk.locked = true;
    return vk;
}

GrothProof TestProver::Prove(const std::vector<uint256>& inputs, const uint256& aIn) const
{
    const mpz_class& r = ScalarModulus();

    mpz_class s = ic[0];
    for (size_t i = 0; i < inputs.size(); i++) {
        s += ToMpz(inputs[i]) * ic[i + 1];
    }

    mpz_class deltaInv;
    mpz_invert(deltaInv.get_mpz_t(), delta.get_mpz_t(), r.get_mpz_t());

    mpz_class a = ToMpz(aIn);
    mpz_class c = a * b - alpha * beta - s * gamma;
    c = (c * deltaInv) % r;
    if (c < 0) {
        c += r;
    }

    G1Point A = curve.ScalarMul(G1Generator(), aIn);
    G1Point C = curve.ScalarMul(G1Generator(), FromMpz(c));

    GrothProof proof;
    proof.insert(proof.end(), A.begin(), A.end());
    proof.insert(proof.end(), bG2.begin(), bG2.end());
    proof.insert(proof.end(), C.begin(), C.end());
    return proof;
}
