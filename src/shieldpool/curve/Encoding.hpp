#ifndef SP_CURVE_ENCODING_H_
#define SP_CURVE_ENCODING_H_

#include "shieldpool/curve/CurveBackend.hpp"

#include <gmpxx.h>

namespace libshieldpool {

// Coordinates of a decoded G1 point. Range-checked, not curve-checked.
struct AffineG1 {
    bool infinity;
    mpz_class x;
    mpz_class y;

    AffineG1() : infinity(true) {}
    AffineG1(const mpz_class& x, const mpz_class& y) : infinity(false), x(x), y(y) {}
};

// Coordinates of a decoded G2 point, c0 the real and c1 the imaginary part.
struct AffineG2 {
    bool infinity;
    mpz_class x_c0, x_c1;
    mpz_class y_c0, y_c1;

    AffineG2() : infinity(true) {}
};

/** Throws CryptographyError for a coordinate >= p. */
AffineG1 DecodeG1(const G1Point& p);
G1Point EncodeG1(const AffineG1& p);

/** Throws CryptographyError for a coordinate >= p. */
AffineG2 DecodeG2(const G2Point& q);
G2Point EncodeG2(const AffineG2& q);

/** Split a 256-byte proof into A, B and C. */
void SplitProof(const unsigned char* proof, G1Point& a, G2Point& b, G1Point& c);

}

#endif // SP_CURVE_ENCODING_H_
