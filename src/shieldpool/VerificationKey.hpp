#ifndef SP_VERIFICATIONKEY_H_
#define SP_VERIFICATIONKEY_H_

#include "uint256.h"
#include "shieldpool/curve/CurveBackend.hpp"

#include <string>
#include <vector>

#include <univalue.h>

namespace libshieldpool {

enum class ProofType : uint8_t {
    Deposit = 0,
    Withdraw = 1,
    JoinSplit = 2,
    Membership = 3,
    MerkleBatchUpdate = 4,
    WithdrawV2 = 5,
};

static const size_t NUM_PROOF_TYPES = 6;

std::string ProofTypeName(ProofType type);
/** Parses the names returned by ProofTypeName. */
bool ParseProofType(const std::string& name, ProofType& type);

/** IC length of the deployed circuit; for JoinSplit the 2-in 2-out shape. */
size_t ExpectedICLength(ProofType type);

/**
 * Whether a key with this many IC points may be locked for the type.
 * Join-split keys cover 1..4 inputs and outputs, so 8 to 14 points are
 * accepted; every other type needs exactly ExpectedICLength.
 */
bool AcceptsICLength(ProofType type, size_t length);

/** Raised when a key is used before it is initialized and locked. */
class VerificationKeyError : public std::runtime_error {
public:
    explicit VerificationKeyError(const std::string& what) : std::runtime_error(what) { }
};

/**
 * Groth16 verification key for one proof type. Keys are provisioned in
 * steps (initialize, append IC chunks, lock) and only a locked key is
 * used for verification.
 */
class VerificationKey {
public:
    G1Point alpha;
    G2Point beta;
    G2Point gamma;
    G2Point delta;
    std::vector<G1Point> ic;
    //! IC points announced when chunked provisioning started
    uint32_t declaredICLength;

    bool initialized;
    bool locked;

    VerificationKey() : declaredICLength(0), initialized(false), locked(false) {}

    size_t NumPublicInputs() const { return ic.empty() ? 0 : ic.size() - 1; }

    bool IsUsable() const { return initialized && locked; }

    //! keccak256(alpha || beta || gamma || delta || IC[0] || ... )
    uint256 GetHash() const;

    /**
     * Reads {"alpha": hex, "beta": hex, "gamma": hex, "delta": hex,
     * "ic": [hex, ...]} into an initialized, unlocked key. Throws
     * std::runtime_error for a missing or mis-sized field.
     */
    static VerificationKey FromJSON(const UniValue& obj);
    UniValue ToJSON() const;

    friend bool operator==(const VerificationKey& a, const VerificationKey& b)
    {
        return a.alpha == b.alpha && a.beta == b.beta && a.gamma == b.gamma &&
               a.delta == b.delta && a.ic == b.ic &&
               a.declaredICLength == b.declaredICLength &&
               a.initialized == b.initialized && a.locked == b.locked;
    }
};

}

#endif // SP_VERIFICATIONKEY_H_
