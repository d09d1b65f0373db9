#ifndef SP_CURVE_LIBSNARKCURVE_H_
#define SP_CURVE_LIBSNARKCURVE_H_

#include "shieldpool/curve/CurveBackend.hpp"

namespace libshieldpool {

/** Loads the alt_bn128 parameters into libsnark. Safe to call repeatedly. */
void initialize_curve_params();

/** BN254 arithmetic delegated to libsnark's alt_bn128 curve. */
class LibsnarkCurve : public CurveBackend {
public:
    LibsnarkCurve();

    std::string Name() const { return "libsnark"; }

    void CheckG1(const G1Point& p) const;
    void CheckG2(const G2Point& q) const;

    G1Point Add(const G1Point& p, const G1Point& q) const;
    G1Point ScalarMul(const G1Point& p, const uint256& k) const;
    G1Point Negate(const G1Point& p) const;

    bool PairingCheck(const PairingBatch& pairs) const;
};

}

#endif // SP_CURVE_LIBSNARKCURVE_H_
