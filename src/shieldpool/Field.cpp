#include "shieldpool/Field.hpp"

#include <string.h>

namespace libshieldpool {

const mpz_class& ScalarModulus()
{
    static const mpz_class r("21888242871839275222246405745257275088548364400416034343698204186575808495617");
    return r;
}

const mpz_class& BaseModulus()
{
    static const mpz_class p("21888242871839275222246405745257275088696311157297823662689037894645226208583");
    return p;
}

mpz_class ToMpz(const unsigned char* bytes)
{
    mpz_class out;
    mpz_import(out.get_mpz_t(), 32, 1, 1, 1, 0, bytes);
    return out;
}

mpz_class ToMpz(const uint256& value)
{
    return ToMpz(value.begin());
}

void FromMpz(const mpz_class& value, unsigned char* bytes)
{
    if (sgn(value) < 0 || mpz_sizeinbase(value.get_mpz_t(), 2) > 256) {
        throw std::range_error("value does not fit in 32 bytes");
    }
    memset(bytes, 0, 32);
    if (sgn(value) == 0) {
        return;
    }
    size_t count = (mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8;
    mpz_export(bytes + (32 - count), NULL, 1, 1, 1, 0, value.get_mpz_t());
}

uint256 FromMpz(const mpz_class& value)
{
    uint256 out;
    FromMpz(value, out.begin());
    return out;
}

bool IsCanonicalScalar(const uint256& value)
{
    return ToMpz(value) < ScalarModulus();
}

bool IsCanonicalBase(const mpz_class& value)
{
    return sgn(value) >= 0 && value < BaseModulus();
}

uint256 ReduceScalar(const uint256& value)
{
    mpz_class v = ToMpz(value) % ScalarModulus();
    return FromMpz(v);
}

uint256 EncodeU64(uint64_t value)
{
    return uint256::FromUint64(value);
}

uint256 EncodeI64(int64_t value)
{
    if (value >= 0) {
        return uint256::FromUint64((uint64_t)value);
    }
    // |INT64_MIN| does not fit an int64_t, so negate in unsigned arithmetic
    uint64_t magnitude = ~((uint64_t)value) + 1;
    mpz_class m;
    mpz_import(m.get_mpz_t(), 1, 1, sizeof(magnitude), 0, 0, &magnitude);
    return FromMpz(ScalarModulus() - m);
}

}
