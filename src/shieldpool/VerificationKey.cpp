#include "shieldpool/VerificationKey.hpp"

#include "crypto/keccak.h"
#include "utilstrencodings.h"

#include <stdexcept>

namespace libshieldpool {

std::string ProofTypeName(ProofType type)
{
    switch (type) {
    case ProofType::Deposit: return "deposit";
    case ProofType::Withdraw: return "withdraw";
    case ProofType::JoinSplit: return "joinsplit";
    case ProofType::Membership: return "membership";
    case ProofType::MerkleBatchUpdate: return "merklebatchupdate";
    case ProofType::WithdrawV2: return "withdrawv2";
    }
    return "unknown";
}

bool ParseProofType(const std::string& name, ProofType& type)
{
    for (size_t i = 0; i < NUM_PROOF_TYPES; i++) {
        ProofType candidate = static_cast<ProofType>(i);
        if (ProofTypeName(candidate) == name) {
            type = candidate;
            return true;
        }
    }
    return false;
}

size_t ExpectedICLength(ProofType type)
{
    switch (type) {
    case ProofType::Deposit: return 4;
    case ProofType::Withdraw: return 9;
    case ProofType::JoinSplit: return 10;
    case ProofType::Membership: return 5;
    case ProofType::MerkleBatchUpdate: return 6;
    case ProofType::WithdrawV2: return 13;
    }
    return 0;
}

bool AcceptsICLength(ProofType type, size_t length)
{
    if (type == ProofType::JoinSplit) {
        // 5 fixed inputs plus 1..4 nullifiers and 1..4 outputs, plus IC[0]
        return length >= 8 && length <= 14;
    }
    return length == ExpectedICLength(type);
}

uint256 VerificationKey::GetHash() const
{
    CKeccak256 hasher;
    hasher.Write(alpha.begin(), alpha.size());
    hasher.Write(beta.begin(), beta.size());
    hasher.Write(gamma.begin(), gamma.size());
    hasher.Write(delta.begin(), delta.size());
    for (const G1Point& point : ic) {
        hasher.Write(point.begin(), point.size());
    }
    uint256 result;
    hasher.Finalize(result.begin());
    return result;
}

template<typename Point>
static Point ParsePoint(const UniValue& v, const std::string& name)
{
    if (!v.isStr()) {
        throw std::runtime_error("verification key field " + name + " is missing");
    }
    if (!IsHex(v.get_str()) || v.get_str().size() != 2 * Point::size()) {
        throw std::runtime_error("verification key field " + name + " has the wrong length");
    }
    return Point(ParseHex(v.get_str()));
}

VerificationKey VerificationKey::FromJSON(const UniValue& obj)
{
    if (!obj.isObject()) {
        throw std::runtime_error("verification key must be a JSON object");
    }
    VerificationKey vk;
    vk.alpha = ParsePoint<G1Point>(find_value(obj, "alpha"), "alpha");
    vk.beta = ParsePoint<G2Point>(find_value(obj, "beta"), "beta");
    vk.gamma = ParsePoint<G2Point>(find_value(obj, "gamma"), "gamma");
    vk.delta = ParsePoint<G2Point>(find_value(obj, "delta"), "delta");

    const UniValue& ic = find_value(obj, "ic");
    if (!ic.isArray()) {
        throw std::runtime_error("verification key field ic is missing");
    }
    for (size_t i = 0; i < ic.size(); i++) {
        vk.ic.push_back(ParsePoint<G1Point>(ic[i], "ic"));
    }
    vk.declaredICLength = vk.ic.size();
    vk.initialized = true;
    return vk;
}

UniValue VerificationKey::ToJSON() const
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("alpha", HexStr(alpha.begin(), alpha.end()));
    obj.pushKV("beta", HexStr(beta.begin(), beta.end()));
    obj.pushKV("gamma", HexStr(gamma.begin(), gamma.end()));
    obj.pushKV("delta", HexStr(delta.begin(), delta.end()));
    UniValue points(UniValue::VARR);
    for (const G1Point& point : ic) {
        points.push_back(HexStr(point.begin(), point.end()));
    }
    obj.pushKV("ic", points);
    return obj;
}

}
