#include "shieldpool/PublicInputs.hpp"

#include "shieldpool/Field.hpp"
#include "crypto/keccak.h"

#include <stdexcept>
#include <string.h>

namespace libshieldpool {

static const char ASSET_ID_DOMAIN[] = "psol:asset_id:v1";

uint256 DeriveAssetId(const uint256& mint)
{
    unsigned char digest[CKeccak256::OUTPUT_SIZE];
    CKeccak256()
        .Write((const unsigned char*)ASSET_ID_DOMAIN, strlen(ASSET_ID_DOMAIN))
        .Write(mint.begin(), mint.size())
        .Finalize(digest);

    uint256 id;
    memcpy(id.begin() + 1, digest, 31);
    return id;
}

uint256 AddressToScalar(const uint256& address)
{
    uint256 out;
    memcpy(out.begin() + 1, address.begin(), 31);
    return out;
}

bool DepositPublicInputs::Validate(std::string& strReason) const
{
    if (commitment.IsNull()) {
        strReason = "bad-deposit-commitment";
        return false;
    }
    if (amount == 0) {
        strReason = "bad-deposit-amount";
        return false;
    }
    if (assetId.IsNull()) {
        strReason = "bad-deposit-asset";
        return false;
    }
    return true;
}

std::vector<uint256> DepositPublicInputs::ToFieldElements() const
{
    return {commitment, EncodeU64(amount), assetId};
}

bool WithdrawPublicInputs::Validate(std::string& strReason) const
{
    if (merkleRoot.IsNull()) {
        strReason = "bad-withdraw-root";
        return false;
    }
    if (nullifierHash.IsNull()) {
        strReason = "bad-withdraw-nullifier";
        return false;
    }
    if (assetId.IsNull()) {
        strReason = "bad-withdraw-asset";
        return false;
    }
    if (amount == 0) {
        strReason = "bad-withdraw-amount";
        return false;
    }
    if (relayerFee > amount) {
        strReason = "bad-withdraw-fee";
        return false;
    }
    return true;
}

std::vector<uint256> WithdrawPublicInputs::ToFieldElements() const
{
    return {
        merkleRoot,
        nullifierHash,
        assetId,
        AddressToScalar(recipient),
        EncodeU64(amount),
        AddressToScalar(relayer),
        EncodeU64(relayerFee),
        publicDataHash,
    };
}

uint64_t WithdrawPublicInputs::NetAmount() const
{
    if (relayerFee > amount) {
        throw std::domain_error("relayer fee exceeds the withdrawal amount");
    }
    return amount - relayerFee;
}

bool WithdrawV2PublicInputs::Validate(std::string& strReason) const
{
    if (merkleRoot.IsNull()) {
        strReason = "bad-withdraw-root";
        return false;
    }
    if (assetId.IsNull()) {
        strReason = "bad-withdraw-asset";
        return false;
    }
    if (nullifierHash0.IsNull()) {
        strReason = "bad-withdraw-nullifier";
        return false;
    }
    if (nullifierHash1 == nullifierHash0) {
        strReason = "bad-withdraw-duplicate-nullifier";
        return false;
    }
    if (changeCommitment.IsNull()) {
        strReason = "bad-withdraw-change-commitment";
        return false;
    }
    if (amount == 0) {
        strReason = "bad-withdraw-amount";
        return false;
    }
    if (relayerFee > amount) {
        strReason = "bad-withdraw-fee";
        return false;
    }
    return true;
}

std::vector<uint256> WithdrawV2PublicInputs::ToFieldElements() const
{
    return {
        uint256::FromUint64(SP_WITHDRAW_SCHEMA_VERSION),
        merkleRoot,
        assetId,
        nullifierHash0,
        nullifierHash1,
        changeCommitment,
        AddressToScalar(recipient),
        EncodeU64(amount),
        AddressToScalar(relayer),
        EncodeU64(relayerFee),
        publicDataHash,
        uint256(),
    };
}

uint64_t WithdrawV2PublicInputs::NetAmount() const
{
    if (relayerFee > amount) {
        throw std::domain_error("relayer fee exceeds the withdrawal amount");
    }
    return amount - relayerFee;
}

bool JoinSplitPublicInputs::Validate(std::string& strReason) const
{
    if (merkleRoot.IsNull()) {
        strReason = "bad-joinsplit-root";
        return false;
    }
    if (assetId.IsNull()) {
        strReason = "bad-joinsplit-asset";
        return false;
    }
    if (inputNullifiers.empty() || inputNullifiers.size() > SP_MAX_JS_INPUTS) {
        strReason = "bad-joinsplit-input-count";
        return false;
    }
    if (outputCommitments.empty() || outputCommitments.size() > SP_MAX_JS_OUTPUTS) {
        strReason = "bad-joinsplit-output-count";
        return false;
    }
    for (const uint256& nf : inputNullifiers) {
        if (nf.IsNull()) {
            strReason = "bad-joinsplit-nullifier";
            return false;
        }
    }
    for (const uint256& cm : outputCommitments) {
        if (cm.IsNull()) {
            strReason = "bad-joinsplit-commitment";
            return false;
        }
    }
    for (size_t i = 0; i < inputNullifiers.size(); i++) {
        for (size_t j = i + 1; j < inputNullifiers.size(); j++) {
            if (inputNullifiers[i] == inputNullifiers[j]) {
                strReason = "bad-joinsplit-duplicate-nullifier";
                return false;
            }
        }
    }
    if (IsWithdrawal() && relayerFee > PublicMagnitude()) {
        strReason = "bad-joinsplit-fee";
        return false;
    }
    return true;
}

std::vector<uint256> JoinSplitPublicInputs::ToFieldElements() const
{
    std::vector<uint256> elements;
    elements.reserve(Count());
    elements.push_back(merkleRoot);
    elements.push_back(assetId);
    elements.insert(elements.end(), inputNullifiers.begin(), inputNullifiers.end());
    elements.insert(elements.end(), outputCommitments.begin(), outputCommitments.end());
    elements.push_back(EncodeI64(publicAmount));
    elements.push_back(AddressToScalar(relayer));
    elements.push_back(EncodeU64(relayerFee));
    return elements;
}

uint64_t JoinSplitPublicInputs::PublicMagnitude() const
{
    if (publicAmount >= 0) {
        return static_cast<uint64_t>(publicAmount);
    }
    return uint64_t(0) - static_cast<uint64_t>(publicAmount);
}

uint64_t JoinSplitPublicInputs::NetWithdrawal() const
{
    if (!IsWithdrawal()) {
        throw std::domain_error("join-split does not withdraw");
    }
    uint64_t outflow = PublicMagnitude();
    if (relayerFee > outflow) {
        throw std::domain_error("relayer fee exceeds the outflow");
    }
    return outflow - relayerFee;
}

bool MembershipPublicInputs::Validate(std::string& strReason) const
{
    if (merkleRoot.IsNull()) {
        strReason = "bad-membership-root";
        return false;
    }
    if (commitmentHash.IsNull()) {
        strReason = "bad-membership-commitment";
        return false;
    }
    if (threshold == 0) {
        strReason = "bad-membership-threshold";
        return false;
    }
    if (assetId.IsNull()) {
        strReason = "bad-membership-asset";
        return false;
    }
    return true;
}

std::vector<uint256> MembershipPublicInputs::ToFieldElements() const
{
    return {merkleRoot, commitmentHash, EncodeU64(threshold), assetId};
}

bool MerkleBatchUpdatePublicInputs::Validate(std::string& strReason) const
{
    if (oldRoot.IsNull() || newRoot.IsNull()) {
        strReason = "bad-batch-root";
        return false;
    }
    if (batchSize == 0 || batchSize > SP_MAX_BATCH_SIZE) {
        strReason = "bad-batch-size";
        return false;
    }
    return true;
}

std::vector<uint256> MerkleBatchUpdatePublicInputs::ToFieldElements() const
{
    return {oldRoot, newRoot, EncodeU64(startIndex), EncodeU64(batchSize), commitmentsHash};
}

template<typename T>
static const T& Require(const std::optional<T>& field, const char* name)
{
    if (!field) {
        throw std::logic_error(std::string("missing public input field: ") + name);
    }
    return *field;
}

WithdrawPublicInputs WithdrawPublicInputsBuilder::Build() const
{
    WithdrawPublicInputs inputs;
    inputs.merkleRoot = Require(merkleRoot, "merkle_root");
    inputs.nullifierHash = Require(nullifierHash, "nullifier_hash");
    inputs.assetId = Require(assetId, "asset_id");
    inputs.recipient = Require(recipient, "recipient");
    inputs.amount = Require(amount, "amount");
    inputs.relayer = Require(relayer, "relayer");
    inputs.relayerFee = relayerFee.value_or(0);
    inputs.publicDataHash = publicDataHash.value_or(uint256());

    std::string strReason;
    if (!inputs.Validate(strReason)) {
        throw std::invalid_argument(strReason);
    }
    return inputs;
}

WithdrawPublicInputs WithdrawPublicInputsBuilder::BuildSelfRelay() const
{
    WithdrawPublicInputsBuilder self(*this);
    self.relayer = Require(recipient, "recipient");
    self.relayerFee = 0;
    return self.Build();
}

JoinSplitPublicInputs JoinSplitPublicInputsBuilder::Build() const
{
    JoinSplitPublicInputs inputs;
    inputs.merkleRoot = Require(merkleRoot, "merkle_root");
    inputs.assetId = Require(assetId, "asset_id");
    inputs.inputNullifiers = inputNullifiers;
    inputs.outputCommitments = outputCommitments;
    inputs.publicAmount = publicAmount;
    inputs.relayer = relayer;
    inputs.relayerFee = relayerFee;

    std::string strReason;
    if (!inputs.Validate(strReason)) {
        throw std::invalid_argument(strReason);
    }
    return inputs;
}

}
