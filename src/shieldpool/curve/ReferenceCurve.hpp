#ifndef SP_CURVE_REFERENCECURVE_H_
#define SP_CURVE_REFERENCECURVE_H_

#include "shieldpool/curve/CurveBackend.hpp"

namespace libshieldpool {

/**
 * Portable BN254 arithmetic on GMP integers.
 *
 * Points are affine. The pairing is the optimal ate pairing with the
 * Miller loop evaluated in Fp12 = Fp[w] / (w^12 - 18 w^6 + 82), where the
 * twist embeds Fp2 through i = w^6 - 9. Line functions are built from
 * slopes computed in Fp2, so no Fp12 inversion is needed. The final
 * exponentiation raises the product of all Miller loops to (p^12 - 1) / r.
 */
class ReferenceCurve : public CurveBackend {
public:
    ReferenceCurve();

    std::string Name() const { return "reference"; }

    void CheckG1(const G1Point& p) const;
    void CheckG2(const G2Point& q) const;

    G1Point Add(const G1Point& p, const G1Point& q) const;
    G1Point ScalarMul(const G1Point& p, const uint256& k) const;
    G1Point Negate(const G1Point& p) const;

    bool PairingCheck(const PairingBatch& pairs) const;

    /** Scalar multiplication in G2. Used to build keys in tests and tooling. */
    G2Point ScalarMulG2(const G2Point& q, const uint256& k) const;
};

}

#endif // SP_CURVE_REFERENCECURVE_H_
