#include "shieldpool/Groth16.hpp"

#include "shieldpool/Field.hpp"
#include "shieldpool/curve/Encoding.hpp"
#include "logging.h"

#include <stdexcept>

namespace libshieldpool {

G1Point PrepareVerifyingInputs(const CurveBackend& curve,
                               const VerificationKey& vk,
                               const std::vector<uint256>& inputs)
{
    if (vk.ic.size() != inputs.size() + 1) {
        throw std::invalid_argument(tfm::format(
            "verification key expects %d public inputs, got %d", vk.NumPublicInputs(), inputs.size()));
    }

    G1Point acc = vk.ic[0];
    curve.CheckG1(acc);
    for (size_t i = 0; i < inputs.size(); i++) {
        if (!IsCanonicalScalar(inputs[i])) {
            throw CryptographyError(tfm::format("public input %d is not below the scalar field modulus", i));
        }
        acc = curve.Add(acc, curve.ScalarMul(vk.ic[i + 1], inputs[i]));
    }
    return acc;
}

ProofVerifier::ProofVerifier(ProofVerifier&& other) :
    curve(other.curve), perform_verification(other.perform_verification) { }

ProofVerifier& ProofVerifier::operator=(ProofVerifier&& other)
{
    curve = other.curve;
    perform_verification = other.perform_verification;
    return *this;
}

ProofVerifier ProofVerifier::Strict(const CurveBackend& curve)
{
    return ProofVerifier(&curve, true);
}

ProofVerifier ProofVerifier::Disabled()
{
    return ProofVerifier(nullptr, false);
}

bool ProofVerifier::Verify(const VerificationKey& vk,
                           const std::vector<uint256>& inputs,
                           const GrothProof& proof) const
{
    if (!vk.IsUsable()) {
        throw VerificationKeyError("verification key is not initialized and locked");
    }
    if (proof.size() != SP_PROOF_SIZE) {
        throw std::invalid_argument(tfm::format("proof must be %d bytes, got %d", SP_PROOF_SIZE, proof.size()));
    }
    if (vk.ic.size() != inputs.size() + 1) {
        throw std::invalid_argument(tfm::format(
            "verification key expects %d public inputs, got %d", vk.NumPublicInputs(), inputs.size()));
    }

    if (!perform_verification) {
        return true;
    }

    G1Point a, c;
    G2Point b;
    SplitProof(proof.data(), a, b, c);

    PairingBatch pairs;
    pairs[0] = PairingInput(curve->Negate(a), b);
    pairs[1] = PairingInput(vk.alpha, vk.beta);
    pairs[2] = PairingInput(PrepareVerifyingInputs(*curve, vk, inputs), vk.gamma);
    pairs[3] = PairingInput(c, vk.delta);

    bool result = curve->PairingCheck(pairs);
    LogPrint("groth16", "proof over %d inputs with key %s: %s\n",
             inputs.size(), vk.GetHash().GetHex(), result ? "valid" : "invalid");
    return result;
}

}
