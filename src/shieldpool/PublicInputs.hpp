#ifndef SP_PUBLICINPUTS_H_
#define SP_PUBLICINPUTS_H_

#include "uint256.h"
#include "shieldpool/ShieldPool.h"

#include <optional>
#include <string>
#include <vector>

namespace libshieldpool {

/** 0x00 || keccak256("psol:asset_id:v1" || mint)[0..31] */
uint256 DeriveAssetId(const uint256& mint);

/** 0x00 || address[0..31]. The last byte is dropped to stay below r. */
uint256 AddressToScalar(const uint256& address);

// Each statement below knows its circuit's public-input order. Validate()
// applies the cheap structural checks and names the first failure in
// strReason; ToFieldElements() produces the vector the verifier consumes.

class DepositPublicInputs {
public:
    uint256 commitment;
    uint64_t amount;
    uint256 assetId;

    DepositPublicInputs() : amount(0) {}
    DepositPublicInputs(const uint256& commitment, uint64_t amount, const uint256& assetId)
        : commitment(commitment), amount(amount), assetId(assetId) {}

    static constexpr size_t COUNT = 3;

    bool Validate(std::string& strReason) const;
    std::vector<uint256> ToFieldElements() const;
};

class WithdrawPublicInputs {
public:
    uint256 merkleRoot;
    uint256 nullifierHash;
    uint256 assetId;
    uint256 recipient;
    uint64_t amount;
    uint256 relayer;
    uint64_t relayerFee;
    uint256 publicDataHash;

    WithdrawPublicInputs() : amount(0), relayerFee(0) {}

    static constexpr size_t COUNT = 8;

    bool Validate(std::string& strReason) const;
    std::vector<uint256> ToFieldElements() const;

    /** Amount paid to the recipient. Throws std::domain_error if the fee exceeds the amount. */
    uint64_t NetAmount() const;
    bool IsSelfRelay() const { return recipient == relayer; }
};

// Schema-versioned withdrawal that spends up to two notes and returns
// change as a new commitment.
class WithdrawV2PublicInputs {
public:
    uint256 merkleRoot;
    uint256 assetId;
    uint256 nullifierHash0;
    // Null when only one note is spent.
    uint256 nullifierHash1;
    uint256 changeCommitment;
    uint256 recipient;
    uint64_t amount;
    uint256 relayer;
    uint64_t relayerFee;
    uint256 publicDataHash;

    WithdrawV2PublicInputs() : amount(0), relayerFee(0) {}

    static constexpr size_t COUNT = 12;

    bool Validate(std::string& strReason) const;
    std::vector<uint256> ToFieldElements() const;

    bool HasSecondNullifier() const { return !nullifierHash1.IsNull(); }
    uint64_t NetAmount() const;
};

class JoinSplitPublicInputs {
public:
    uint256 merkleRoot;
    uint256 assetId;
    std::vector<uint256> inputNullifiers;
    std::vector<uint256> outputCommitments;
    // Positive adds to the pool, negative leaves it.
    int64_t publicAmount;
    uint256 relayer;
    uint64_t relayerFee;

    JoinSplitPublicInputs() : publicAmount(0), relayerFee(0) {}

    static constexpr size_t BASE_COUNT = 5;

    size_t Count() const { return BASE_COUNT + inputNullifiers.size() + outputCommitments.size(); }

    bool Validate(std::string& strReason) const;
    std::vector<uint256> ToFieldElements() const;

    bool IsPurePrivate() const { return publicAmount == 0; }
    bool IsDeposit() const { return publicAmount > 0; }
    bool IsWithdrawal() const { return publicAmount < 0; }

    /** |publicAmount| as an unsigned value, INT64_MIN included. */
    uint64_t PublicMagnitude() const;
    /** Outflow minus fee. Throws std::domain_error unless this is a withdrawal covering the fee. */
    uint64_t NetWithdrawal() const;
};

class MembershipPublicInputs {
public:
    uint256 merkleRoot;
    uint256 commitmentHash;
    uint64_t threshold;
    uint256 assetId;

    MembershipPublicInputs() : threshold(0) {}

    static constexpr size_t COUNT = 4;

    bool Validate(std::string& strReason) const;
    std::vector<uint256> ToFieldElements() const;
};

class MerkleBatchUpdatePublicInputs {
public:
    uint256 oldRoot;
    uint256 newRoot;
    uint64_t startIndex;
    uint64_t batchSize;
    uint256 commitmentsHash;

    MerkleBatchUpdatePublicInputs() : startIndex(0), batchSize(0) {}

    static constexpr size_t COUNT = 5;

    bool Validate(std::string& strReason) const;
    std::vector<uint256> ToFieldElements() const;
};

/**
 * Collects withdraw statement fields. Build() throws std::logic_error for a
 * missing required field and std::invalid_argument when the result does not
 * validate. The relayer fee defaults to zero and the public data hash to null.
 */
class WithdrawPublicInputsBuilder {
public:
    WithdrawPublicInputsBuilder& MerkleRoot(const uint256& v) { merkleRoot = v; return *this; }
    WithdrawPublicInputsBuilder& NullifierHash(const uint256& v) { nullifierHash = v; return *this; }
    WithdrawPublicInputsBuilder& AssetId(const uint256& v) { assetId = v; return *this; }
    WithdrawPublicInputsBuilder& Recipient(const uint256& v) { recipient = v; return *this; }
    WithdrawPublicInputsBuilder& Amount(uint64_t v) { amount = v; return *this; }
    WithdrawPublicInputsBuilder& Relayer(const uint256& v) { relayer = v; return *this; }
    WithdrawPublicInputsBuilder& RelayerFee(uint64_t v) { relayerFee = v; return *this; }
    WithdrawPublicInputsBuilder& PublicDataHash(const uint256& v) { publicDataHash = v; return *this; }

    WithdrawPublicInputs Build() const;
    /** The recipient relays for itself without a fee. */
    WithdrawPublicInputs BuildSelfRelay() const;

private:
    std::optional<uint256> merkleRoot;
    std::optional<uint256> nullifierHash;
    std::optional<uint256> assetId;
    std::optional<uint256> recipient;
    std::optional<uint64_t> amount;
    std::optional<uint256> relayer;
    std::optional<uint64_t> relayerFee;
    std::optional<uint256> publicDataHash;
};

/**
 * Collects join-split statement fields. The root and asset are required;
 * the relayer defaults to null and amounts to zero.
 */
class JoinSplitPublicInputsBuilder {
public:
    JoinSplitPublicInputsBuilder& MerkleRoot(const uint256& v) { merkleRoot = v; return *this; }
    JoinSplitPublicInputsBuilder& AssetId(const uint256& v) { assetId = v; return *this; }
    JoinSplitPublicInputsBuilder& AddNullifier(const uint256& v) { inputNullifiers.push_back(v); return *this; }
    JoinSplitPublicInputsBuilder& AddOutput(const uint256& v) { outputCommitments.push_back(v); return *this; }
    JoinSplitPublicInputsBuilder& PublicAmount(int64_t v) { publicAmount = v; return *this; }
    JoinSplitPublicInputsBuilder& Relayer(const uint256& v) { relayer = v; return *this; }
    JoinSplitPublicInputsBuilder& RelayerFee(uint64_t v) { relayerFee = v; return *this; }

    JoinSplitPublicInputs Build() const;

private:
    std::optional<uint256> merkleRoot;
    std::optional<uint256> assetId;
    std::vector<uint256> inputNullifiers;
    std::vector<uint256> outputCommitments;
    int64_t publicAmount = 0;
    uint256 relayer;
    uint64_t relayerFee = 0;
};

}

#endif // SP_PUBLICINPUTS_H_
