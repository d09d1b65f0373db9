#include "shieldpool/curve/LibsnarkCurve.hpp"

#include "shieldpool/Field.hpp"
#include "shieldpool/curve/Encoding.hpp"
#include "logging.h"

#include <mutex>

#include "libsnark/common/profiling.hpp"
#include "libsnark/algebra/curves/alt_bn128/alt_bn128_pp.hpp"

using namespace libsnark;

namespace libshieldpool {

static std::once_flag init_public_params_once_flag;

void initialize_curve_params()
{
    std::call_once (init_public_params_once_flag, []() {
        inhibit_profiling_info = true;
        inhibit_profiling_counters = true;
        alt_bn128_pp::init_public_params();
    });
}

namespace {

alt_bn128_Fq ToFq(const mpz_class& v)
{
    return alt_bn128_Fq(bigint<alt_bn128_q_limbs>(v.get_mpz_t()));
}

mpz_class FromFq(const alt_bn128_Fq& v)
{
    mpz_class out;
    v.as_bigint().to_mpz(out.get_mpz_t());
    return out;
}

alt_bn128_G1 ToLibsnarkG1(const G1Point& encoded)
{
    AffineG1 a = DecodeG1(encoded);
    if (a.infinity) {
        return alt_bn128_G1::zero();
    }
    alt_bn128_G1 pt(ToFq(a.x), ToFq(a.y), alt_bn128_Fq::one());
    if (!pt.is_well_formed()) {
        throw CryptographyError("G1 point is not on the curve");
    }
    return pt;
}

G1Point FromLibsnarkG1(alt_bn128_G1 pt)
{
    if (pt.is_zero()) {
        return G1Point();
    }
    pt.to_affine_coordinates();
    return EncodeG1(AffineG1(FromFq(pt.X), FromFq(pt.Y)));
}

alt_bn128_G2 ToLibsnarkG2(const G2Point& encoded)
{
    AffineG2 a = DecodeG2(encoded);
    if (a.infinity) {
        return alt_bn128_G2::zero();
    }
    alt_bn128_G2 pt(alt_bn128_Fq2(ToFq(a.x_c0), ToFq(a.x_c1)),
                    alt_bn128_Fq2(ToFq(a.y_c0), ToFq(a.y_c1)),
                    alt_bn128_Fq2::one());
    if (!pt.is_well_formed()) {
        throw CryptographyError("G2 point is not on the twist curve");
    }
    if (!(alt_bn128_modulus_r * pt).is_zero()) {
        throw CryptographyError("G2 point is not in the prime-order subgroup");
    }
    return pt;
}

}

LibsnarkCurve::LibsnarkCurve()
{
    initialize_curve_params();
}

void LibsnarkCurve::CheckG1(const G1Point& p) const
{
    ToLibsnarkG1(p);
}

void LibsnarkCurve::CheckG2(const G2Point& q) const
{
    ToLibsnarkG2(q);
}

G1Point LibsnarkCurve::Add(const G1Point& p, const G1Point& q) const
{
    return FromLibsnarkG1(ToLibsnarkG1(p) + ToLibsnarkG1(q));
}

G1Point LibsnarkCurve::ScalarMul(const G1Point& p, const uint256& k) const
{
    mpz_class scalar = ToMpz(k) % ScalarModulus();
    return FromLibsnarkG1(bigint<alt_bn128_r_limbs>(scalar.get_mpz_t()) * ToLibsnarkG1(p));
}

G1Point LibsnarkCurve::Negate(const G1Point& p) const
{
    return FromLibsnarkG1(-ToLibsnarkG1(p));
}

bool LibsnarkCurve::PairingCheck(const PairingBatch& pairs) const
{
    alt_bn128_Fq12 acc = alt_bn128_Fq12::one();
    for (const PairingInput& pair : pairs) {
        alt_bn128_G1 P = ToLibsnarkG1(pair.g1);
        alt_bn128_G2 Q = ToLibsnarkG2(pair.g2);
        if (P.is_zero() || Q.is_zero()) {
            continue;
        }
        acc = acc * alt_bn128_pp::miller_loop(alt_bn128_pp::precompute_G1(P),
                                              alt_bn128_pp::precompute_G2(Q));
    }
    bool result = alt_bn128_pp::final_exponentiation(acc) == alt_bn128_GT::one();
    LogPrint("curve", "libsnark pairing check: %s\n", result ? "one" : "not one");
    return result;
}

}
