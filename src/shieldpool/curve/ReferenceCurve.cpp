#include "shieldpool/curve/ReferenceCurve.hpp"

#include "shieldpool/Field.hpp"
#include "shieldpool/curve/Encoding.hpp"
#include "logging.h"

#include <array>

namespace libshieldpool {

namespace {

mpz_class Mod(const mpz_class& a)
{
    mpz_class r;
    mpz_mod(r.get_mpz_t(), a.get_mpz_t(), BaseModulus().get_mpz_t());
    return r;
}

mpz_class Inv(const mpz_class& a)
{
    mpz_class r;
    if (mpz_invert(r.get_mpz_t(), a.get_mpz_t(), BaseModulus().get_mpz_t()) == 0) {
        throw CryptographyError("inverse of zero in the base field");
    }
    return r;
}

// Element of Fp.
struct Fp {
    mpz_class v;

    Fp() : v(0) {}
    explicit Fp(const mpz_class& a) : v(Mod(a)) {}

    Fp operator+(const Fp& o) const { return Fp(v + o.v); }
    Fp operator-(const Fp& o) const { return Fp(v - o.v); }
    Fp operator*(const Fp& o) const { return Fp(v * o.v); }
    Fp operator*(long k) const { return Fp(v * k); }
    Fp operator-() const { return Fp(-v); }
    Fp inverse() const { return Fp(Inv(v)); }

    bool is_zero() const { return v == 0; }
    bool operator==(const Fp& o) const { return v == o.v; }
};

// Element c0 + c1 * i of Fp2 = Fp[i] / (i^2 + 1).
struct Fp2 {
    mpz_class c0;
    mpz_class c1;

    Fp2() : c0(0), c1(0) {}
    Fp2(const mpz_class& a, const mpz_class& b) : c0(Mod(a)), c1(Mod(b)) {}

    static Fp2 one() { return Fp2(1, 0); }

    Fp2 operator+(const Fp2& o) const { return Fp2(c0 + o.c0, c1 + o.c1); }
    Fp2 operator-(const Fp2& o) const { return Fp2(c0 - o.c0, c1 - o.c1); }
    Fp2 operator*(const Fp2& o) const
    {
        return Fp2(c0 * o.c0 - c1 * o.c1, c0 * o.c1 + c1 * o.c0);
    }
    Fp2 operator*(long k) const { return Fp2(c0 * k, c1 * k); }
    Fp2 operator-() const { return Fp2(-c0, -c1); }

    Fp2 inverse() const
    {
        mpz_class d = Inv(Mod(c0 * c0 + c1 * c1));
        return Fp2(c0 * d, -c1 * d);
    }

    Fp2 conjugate() const { return Fp2(c0, -c1); }

    Fp2 pow(const mpz_class& e) const
    {
        Fp2 result = Fp2::one();
        for (size_t i = mpz_sizeinbase(e.get_mpz_t(), 2); i-- > 0;) {
            result = result * result;
            if (mpz_tstbit(e.get_mpz_t(), i)) {
                result = result * (*this);
            }
        }
        return result;
    }

    bool is_zero() const { return c0 == 0 && c1 == 0; }
    bool operator==(const Fp2& o) const { return c0 == o.c0 && c1 == o.c1; }

    // Coefficients of the element inside Fp12, where i = w^6 - 9.
    mpz_class w0() const { return c0 - 9 * c1; }
    const mpz_class& w6() const { return c1; }
};

// Element of Fp12 = Fp[w] / (w^12 - 18 w^6 + 82), coefficients by power of w.
struct Fp12 {
    std::array<mpz_class, 12> c;

    Fp12() {}

    static Fp12 one()
    {
        Fp12 r;
        r.c[0] = 1;
        return r;
    }

    Fp12 operator*(const Fp12& o) const
    {
        std::array<mpz_class, 23> t;
        for (size_t i = 0; i < 12; i++) {
            if (c[i] == 0) {
                continue;
            }
            for (size_t j = 0; j < 12; j++) {
                mpz_addmul(t[i + j].get_mpz_t(), c[i].get_mpz_t(), o.c[j].get_mpz_t());
            }
        }
        // w^12 = 18 w^6 - 82
        for (size_t e = 22; e >= 12; e--) {
            if (t[e] != 0) {
                t[e - 12] -= t[e] * 82;
                t[e - 6] += t[e] * 18;
                t[e] = 0;
            }
        }
        Fp12 r;
        for (size_t i = 0; i < 12; i++) {
            r.c[i] = Mod(t[i]);
        }
        return r;
    }

    Fp12 pow(const mpz_class& e) const
    {
        Fp12 result = Fp12::one();
        for (size_t i = mpz_sizeinbase(e.get_mpz_t(), 2); i-- > 0;) {
            result = result * result;
            if (mpz_tstbit(e.get_mpz_t(), i)) {
                result = result * (*this);
            }
        }
        return result;
    }

    bool is_one() const
    {
        if (c[0] != 1) {
            return false;
        }
        for (size_t i = 1; i < 12; i++) {
            if (c[i] != 0) {
                return false;
            }
        }
        return true;
    }
};

template<typename F>
struct Point {
    bool infinity;
    F x;
    F y;

    Point() : infinity(true) {}
    Point(const F& x, const F& y) : infinity(false), x(x), y(y) {}
};

template<typename F>
Point<F> Double(const Point<F>& a)
{
    if (a.infinity || a.y.is_zero()) {
        return Point<F>();
    }
    F l = (a.x * a.x * 3) * (a.y * 2).inverse();
    F x3 = l * l - a.x * 2;
    F y3 = l * (a.x - x3) - a.y;
    return Point<F>(x3, y3);
}

template<typename F>
Point<F> Add(const Point<F>& a, const Point<F>& b)
{
    if (a.infinity) {
        return b;
    }
    if (b.infinity) {
        return a;
    }
    if (a.x == b.x) {
        if (a.y == b.y) {
            return Double(a);
        }
        return Point<F>();
    }
    F l = (b.y - a.y) * (b.x - a.x).inverse();
    F x3 = l * l - a.x - b.x;
    F y3 = l * (a.x - x3) - a.y;
    return Point<F>(x3, y3);
}

template<typename F>
Point<F> Multiply(const Point<F>& a, const mpz_class& k)
{
    Point<F> result;
    for (size_t i = mpz_sizeinbase(k.get_mpz_t(), 2); i-- > 0;) {
        result = Double(result);
        if (mpz_tstbit(k.get_mpz_t(), i)) {
            result = Add(result, a);
        }
    }
    return result;
}

struct CurveParams {
    Fp2 twist_b;
    // Frobenius twist coefficients xi^((p-1)/3), xi^((p-1)/2),
    // xi^((p^2-1)/3), xi^((p^2-1)/2) with xi = 9 + i.
    Fp2 frob_x1, frob_y1, frob_x2, frob_y2;
    // 6u + 2, the optimal ate loop count.
    mpz_class ate_loop_count;
    mpz_class final_exponent;

    CurveParams()
    {
        const mpz_class& p = BaseModulus();
        Fp2 xi(9, 1);
        twist_b = Fp2(3, 0) * xi.inverse();
        frob_x1 = xi.pow((p - 1) / 3);
        frob_y1 = xi.pow((p - 1) / 2);
        frob_x2 = xi.pow((p * p - 1) / 3);
        frob_y2 = xi.pow((p * p - 1) / 2);
        ate_loop_count = mpz_class("29793968203157093288");
        mpz_class p12;
        mpz_pow_ui(p12.get_mpz_t(), p.get_mpz_t(), 12);
        final_exponent = (p12 - 1) / ScalarModulus();
    }
};

const CurveParams& Params()
{
    static const CurveParams params;
    return params;
}

Point<Fp> DecodeCheckedG1(const G1Point& encoded)
{
    AffineG1 a = DecodeG1(encoded);
    if (a.infinity) {
        return Point<Fp>();
    }
    Point<Fp> pt{Fp(a.x), Fp(a.y)};
    if (!(pt.y * pt.y == pt.x * pt.x * pt.x + Fp(3))) {
        throw CryptographyError("G1 point is not on the curve");
    }
    return pt;
}

G1Point EncodePoint(const Point<Fp>& pt)
{
    if (pt.infinity) {
        return G1Point();
    }
    return EncodeG1(AffineG1(pt.x.v, pt.y.v));
}

Point<Fp2> DecodeCheckedG2(const G2Point& encoded)
{
    AffineG2 a = DecodeG2(encoded);
    if (a.infinity) {
        return Point<Fp2>();
    }
    Point<Fp2> pt{Fp2(a.x_c0, a.x_c1), Fp2(a.y_c0, a.y_c1)};
    if (!(pt.y * pt.y == pt.x * pt.x * pt.x + Params().twist_b)) {
        throw CryptographyError("G2 point is not on the twist curve");
    }
    if (!Multiply(pt, ScalarModulus()).infinity) {
        throw CryptographyError("G2 point is not in the prime-order subgroup");
    }
    return pt;
}

G2Point EncodePoint(const Point<Fp2>& pt)
{
    AffineG2 a;
    if (!pt.infinity) {
        a.infinity = false;
        a.x_c0 = pt.x.c0;
        a.x_c1 = pt.x.c1;
        a.y_c0 = pt.y.c0;
        a.y_c1 = pt.y.c1;
    }
    return EncodeG2(a);
}

// Line through r and s (tangent when equal) on the twist, evaluated at P
// after untwisting. Only coefficients 0, 1, 3, 7 and 9 can be non-zero, or
// 0, 2 and 8 for a vertical line.
Fp12 LineFunction(const Point<Fp2>& r, const Point<Fp2>& s, const Point<Fp>& P)
{
    Fp12 f;
    Fp2 m;
    if (!(r.x == s.x)) {
        m = (s.y - r.y) * (s.x - r.x).inverse();
    } else if (r.y == s.y) {
        m = (r.x * r.x * 3) * (r.y * 2).inverse();
    } else {
        f.c[0] = P.x.v;
        f.c[2] = Mod(-r.x.w0());
        f.c[8] = Mod(-r.x.w6());
        return f;
    }

    mpz_class m0 = m.w0(), m6 = m.w6();
    mpz_class x0 = r.x.w0(), x6 = r.x.w6();
    mpz_class y0 = r.y.w0(), y6 = r.y.w6();

    f.c[0] = Mod(-P.y.v);
    f.c[1] = Mod(m0 * P.x.v);
    f.c[3] = Mod(-m0 * x0 + 82 * m6 * x6 + y0);
    f.c[7] = Mod(m6 * P.x.v);
    f.c[9] = Mod(-m0 * x6 - m6 * x0 - 18 * m6 * x6 + y6);
    return f;
}

Fp12 MillerLoop(const Point<Fp2>& Q, const Point<Fp>& P)
{
    const CurveParams& params = Params();

    // The top bit of the loop count is consumed by starting at Q.
    Point<Fp2> R = Q;
    Fp12 f = Fp12::one();
    for (size_t i = mpz_sizeinbase(params.ate_loop_count.get_mpz_t(), 2) - 1; i-- > 0;) {
        f = f * f * LineFunction(R, R, P);
        R = Double(R);
        if (mpz_tstbit(params.ate_loop_count.get_mpz_t(), i)) {
            f = f * LineFunction(R, Q, P);
            R = Add(R, Q);
        }
    }

    Point<Fp2> Q1(Q.x.conjugate() * params.frob_x1, Q.y.conjugate() * params.frob_y1);
    Point<Fp2> nQ2(Q.x * params.frob_x2, -(Q.y * params.frob_y2));

    f = f * LineFunction(R, Q1, P);
    R = Add(R, Q1);
    f = f * LineFunction(R, nQ2, P);
    return f;
}

}

ReferenceCurve::ReferenceCurve()
{
    // Derive the constants up front rather than inside the first check.
    Params();
}

void ReferenceCurve::CheckG1(const G1Point& p) const
{
    DecodeCheckedG1(p);
}

void ReferenceCurve::CheckG2(const G2Point& q) const
{
    DecodeCheckedG2(q);
}

G1Point ReferenceCurve::Add(const G1Point& p, const G1Point& q) const
{
    return EncodePoint(libshieldpool::Add(DecodeCheckedG1(p), DecodeCheckedG1(q)));
}

G1Point ReferenceCurve::ScalarMul(const G1Point& p, const uint256& k) const
{
    mpz_class scalar = ToMpz(k) % ScalarModulus();
    return EncodePoint(Multiply(DecodeCheckedG1(p), scalar));
}

G1Point ReferenceCurve::Negate(const G1Point& p) const
{
    Point<Fp> pt = DecodeCheckedG1(p);
    if (pt.infinity) {
        return G1Point();
    }
    // Fp keeps values reduced, so y = 0 maps to 0 and never to p.
    return EncodePoint(Point<Fp>(pt.x, -pt.y));
}

bool ReferenceCurve::PairingCheck(const PairingBatch& pairs) const
{
    Fp12 acc = Fp12::one();
    for (const PairingInput& pair : pairs) {
        Point<Fp> P = DecodeCheckedG1(pair.g1);
        Point<Fp2> Q = DecodeCheckedG2(pair.g2);
        if (P.infinity || Q.infinity) {
            continue;
        }
        acc = acc * MillerLoop(Q, P);
    }
    bool result = acc.pow(Params().final_exponent).is_one();
    LogPrint("curve", "reference pairing check: %s\n", result ? "one" : "not one");
    return result;
}

G2Point ReferenceCurve::ScalarMulG2(const G2Point& q, const uint256& k) const
{
    mpz_class scalar = ToMpz(k) % ScalarModulus();
    return EncodePoint(Multiply(DecodeCheckedG2(q), scalar));
}

}
