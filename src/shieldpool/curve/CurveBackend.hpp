#ifndef SP_CURVE_CURVEBACKEND_H_
#define SP_CURVE_CURVEBACKEND_H_

#include "uint256.h"
#include "shieldpool/ShieldPool.h"

#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace libshieldpool {

/**
 * Raised for bytes that do not decode to a valid group element: a
 * coordinate at or above p, a point off the curve, or a G2 point outside
 * the order-r subgroup.
 */
class CryptographyError : public std::runtime_error {
public:
    explicit CryptographyError(const std::string& what) : std::runtime_error(what) { }
};

// Affine G1 point, x || y big-endian. All zero bytes encode the identity.
class G1Point : public base_blob<SP_G1_SIZE * 8> {
public:
    G1Point() {}
    G1Point(const base_blob<SP_G1_SIZE * 8>& b) : base_blob<SP_G1_SIZE * 8>(b) {}
    explicit G1Point(const std::vector<unsigned char>& vch) : base_blob<SP_G1_SIZE * 8>(vch) {}

    bool IsIdentity() const { return IsNull(); }

    static G1Point FromRawBytes(const unsigned char* bytes)
    {
        G1Point ret;
        memcpy(ret.begin(), bytes, ret.size());
        return ret;
    }
};

// Affine G2 point, x_imag || x_real || y_imag || y_real big-endian.
// All zero bytes encode the identity.
class G2Point : public base_blob<SP_G2_SIZE * 8> {
public:
    G2Point() {}
    G2Point(const base_blob<SP_G2_SIZE * 8>& b) : base_blob<SP_G2_SIZE * 8>(b) {}
    explicit G2Point(const std::vector<unsigned char>& vch) : base_blob<SP_G2_SIZE * 8>(vch) {}

    bool IsIdentity() const { return IsNull(); }

    static G2Point FromRawBytes(const unsigned char* bytes)
    {
        G2Point ret;
        memcpy(ret.begin(), bytes, ret.size());
        return ret;
    }
};

struct PairingInput {
    G1Point g1;
    G2Point g2;

    PairingInput() {}
    PairingInput(const G1Point& g1, const G2Point& g2) : g1(g1), g2(g2) {}
};

// The Groth16 check is a product of exactly four pairings.
typedef std::array<PairingInput, 4> PairingBatch;

/** The generator (1, 2) of G1. */
const G1Point& G1Generator();
/** The standard generator of G2. */
const G2Point& G2Generator();

/**
 * BN254 group arithmetic over wire encodings. Every implementation decodes
 * its inputs, rejects invalid ones with CryptographyError and produces
 * canonical encodings, so two implementations can be compared byte for byte.
 */
class CurveBackend {
public:
    virtual ~CurveBackend() {}

    virtual std::string Name() const = 0;

    /** Throws CryptographyError unless p is the identity or on the curve. */
    virtual void CheckG1(const G1Point& p) const = 0;
    /** Throws CryptographyError unless q is the identity or in the order-r subgroup. */
    virtual void CheckG2(const G2Point& q) const = 0;

    virtual G1Point Add(const G1Point& p, const G1Point& q) const = 0;
    /** k is reduced mod r. */
    virtual G1Point ScalarMul(const G1Point& p, const uint256& k) const = 0;
    virtual G1Point Negate(const G1Point& p) const = 0;

    /**
     * True iff the product of the four pairings is one in GT. Pairs with
     * an identity on either side contribute one.
     */
    virtual bool PairingCheck(const PairingBatch& pairs) const = 0;
};

static const char* const DEFAULT_CURVE_BACKEND = "libsnark";

/** Names accepted by MakeCurveBackend, default first. */
std::vector<std::string> CurveBackendNames();

/** Throws std::invalid_argument for an unknown name. */
std::unique_ptr<CurveBackend> MakeCurveBackend(const std::string& name);

}

#endif // SP_CURVE_CURVEBACKEND_H_
