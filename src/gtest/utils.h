#ifndef SHIELDPOOL_GTEST_UTILS_H
#define SHIELDPOOL_GTEST_UTILS_H

#include "uint256.h"
#include "shieldpool/Groth16.hpp"
#include "shieldpool/VerificationKey.hpp"
#include "shieldpool/curve/CurveBackend.hpp"

#include <vector>

#include <gmpxx.h>

/**
 * Proves arbitrary statements against keys built from a known trapdoor.
 * With the toxic waste in hand, C can be solved for directly:
 *
 *   A = a.G1, B = b.G2, C = ((a*b - alpha*beta - s*gamma) / delta).G1
 *
 * where s = k0 + sum(x_i * k_i) and IC_i = k_i.G1. Such proofs pass the
 * pairing check exactly like proofs from a real circuit.
 */
class TestProver {
public:
    explicit TestProver(const libshieldpool::CurveBackend& curve);

    /** An initialized, locked key with icLength IC points (at most 13). */
    libshieldpool::VerificationKey MakeKey(size_t icLength) const;

    /** A proof of the statement for a key from MakeKey, with A = a.G1. */
    libshieldpool::GrothProof Prove(const std::vector<uint256>& inputs,
                                    const uint256& a = uint256::FromUint64(7)) const;

    /** The deposit proof shipped with the fixture and the scalar a it was made with. */
    const libshieldpool::GrothProof& FixtureDepositProof() const { return fixtureProof; }
    const std::vector<uint256>& FixtureDepositInputs() const { return fixtureInputs; }
    const uint256& FixtureDepositA() const { return fixtureA; }

private:
    const libshieldpool::CurveBackend& curve;
    mpz_class alpha, beta, gamma, delta, b;
    std::vector<mpz_class> ic;
    libshieldpool::G1Point alphaG1;
    libshieldpool::G2Point betaG2, gammaG2, deltaG2, bG2;
    std::vector<libshieldpool::G1Point> icG1;
    libshieldpool::GrothProof fixtureProof;
    std::vector<uint256> fixtureInputs;
    uint256 fixtureA;
};

#endif // SHIELDPOOL_GTEST_UTILS_H
