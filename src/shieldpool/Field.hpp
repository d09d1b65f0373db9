#ifndef SP_FIELD_H_
#define SP_FIELD_H_

#include "uint256.h"

#include <stdexcept>
#include <stdint.h>

#include <gmpxx.h>

namespace libshieldpool {

/** Order of the BN254 scalar field, r. Public inputs live below it. */
const mpz_class& ScalarModulus();

/** Characteristic of the BN254 base field, p. Curve coordinates live below it. */
const mpz_class& BaseModulus();

/** Big-endian 32 bytes to an integer. */
mpz_class ToMpz(const unsigned char* bytes);
mpz_class ToMpz(const uint256& value);

/**
 * Integer to big-endian 32 bytes. Throws std::range_error if the value
 * is negative or does not fit in 256 bits.
 */
void FromMpz(const mpz_class& value, unsigned char* bytes);
uint256 FromMpz(const mpz_class& value);

/** True iff the value is strictly below r. */
bool IsCanonicalScalar(const uint256& value);

/** True iff the value is strictly below p. */
bool IsCanonicalBase(const mpz_class& value);

/** value mod r */
uint256 ReduceScalar(const uint256& value);

/** Unsigned amount as a field element: big-endian in the last eight bytes. */
uint256 EncodeU64(uint64_t value);

/** Signed amount as a field element: v for v >= 0, r - |v| otherwise. */
uint256 EncodeI64(int64_t value);

}

#endif // SP_FIELD_H_
