#include "shieldpool/curve/Encoding.hpp"

#include "shieldpool/Field.hpp"
#include "utilstrencodings.h"

namespace libshieldpool {

static mpz_class ReadCoordinate(const unsigned char* bytes, const char* name)
{
    mpz_class v = ToMpz(bytes);
    if (!IsCanonicalBase(v)) {
        throw CryptographyError(std::string("coordinate ") + name + " is not below the base field modulus");
    }
    return v;
}

AffineG1 DecodeG1(const G1Point& p)
{
    if (p.IsIdentity()) {
        return AffineG1();
    }
    return AffineG1(ReadCoordinate(p.begin(), "x"),
                    ReadCoordinate(p.begin() + 32, "y"));
}

G1Point EncodeG1(const AffineG1& p)
{
    G1Point out;
    if (!p.infinity) {
        FromMpz(p.x, out.begin());
        FromMpz(p.y, out.begin() + 32);
    }
    return out;
}

AffineG2 DecodeG2(const G2Point& q)
{
    AffineG2 out;
    if (q.IsIdentity()) {
        return out;
    }
    out.infinity = false;
    out.x_c1 = ReadCoordinate(q.begin(), "x.c1");
    out.x_c0 = ReadCoordinate(q.begin() + 32, "x.c0");
    out.y_c1 = ReadCoordinate(q.begin() + 64, "y.c1");
    out.y_c0 = ReadCoordinate(q.begin() + 96, "y.c0");
    return out;
}

G2Point EncodeG2(const AffineG2& q)
{
    G2Point out;
    if (!q.infinity) {
        FromMpz(q.x_c1, out.begin());
        FromMpz(q.x_c0, out.begin() + 32);
        FromMpz(q.y_c1, out.begin() + 64);
        FromMpz(q.y_c0, out.begin() + 96);
    }
    return out;
}

void SplitProof(const unsigned char* proof, G1Point& a, G2Point& b, G1Point& c)
{
    a = G1Point::FromRawBytes(proof);
    b = G2Point::FromRawBytes(proof + SP_G1_SIZE);
    c = G1Point::FromRawBytes(proof + SP_G1_SIZE + SP_G2_SIZE);
}

const G1Point& G1Generator()
{
    static const G1Point g(ParseHex(
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000002"));
    return g;
}

const G2Point& G2Generator()
{
    static const G2Point g(ParseHex(
        "198e9393920d483a7260bfb731fb5d25f1aa493335a9e71297e485b7aef312c2"
        "1800deef121f1e76426a00665e5c4479674322d4f75edadd46debd5cd992f6ed"
        "090689d0585ff075ec9e99ad690c3395bc4b313370b38ef355acdadcd122975b"
        "12c85ea5db8c6deb4aab71808dcb408fe3d1e7690c43d37b4ce6cc0166fa7daa"));
    return g;
}

}
