#ifndef SP_GROTH16_H_
#define SP_GROTH16_H_

#include "uint256.h"
#include "shieldpool/VerificationKey.hpp"
#include "shieldpool/curve/CurveBackend.hpp"

#include <vector>

namespace libshieldpool {

typedef std::vector<unsigned char> GrothProof;

/**
 * vk_x = IC[0] + sum(inputs[i] * IC[i + 1]). Throws CryptographyError for a
 * non-canonical input or a bad IC point and std::invalid_argument when the
 * number of inputs does not match the key.
 */
G1Point PrepareVerifyingInputs(const CurveBackend& curve,
                               const VerificationKey& vk,
                               const std::vector<uint256>& inputs);

class ProofVerifier {
private:
    const CurveBackend* curve;
    bool perform_verification;

    ProofVerifier(const CurveBackend* curve, bool perform_verification) :
        curve(curve), perform_verification(perform_verification) { }

public:
    // ProofVerifier should never be copied
    ProofVerifier(const ProofVerifier&) = delete;
    ProofVerifier& operator=(const ProofVerifier&) = delete;
    ProofVerifier(ProofVerifier&&);
    ProofVerifier& operator=(ProofVerifier&&);

    // Creates a verification context that strictly verifies
    // all proofs on the given curve backend.
    static ProofVerifier Strict(const CurveBackend& curve);

    // Creates a verification context that performs no verification.
    // Only for exercising state transitions without real proofs.
    static ProofVerifier Disabled();

    /**
     * Checks e(-A, B) e(alpha, beta) e(vk_x, gamma) e(C, delta) == 1.
     *
     * Returns false for a well-formed proof of a false statement. Throws
     * VerificationKeyError for a key that is not initialized and locked,
     * std::invalid_argument for a proof that is not SP_PROOF_SIZE bytes or
     * an input count that does not match the key, and CryptographyError for
     * malformed points or a non-canonical input.
     */
    bool Verify(const VerificationKey& vk,
                const std::vector<uint256>& inputs,
                const GrothProof& proof) const;
};

}

#endif // SP_GROTH16_H_
