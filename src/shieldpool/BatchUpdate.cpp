#include "shieldpool/BatchUpdate.hpp"

#include "crypto/common.h"

#include <algorithm>
#include <stdexcept>

namespace libshieldpool {

uint256 BatchCommitmentsHash(const std::vector<uint256>& commitments)
{
    if (commitments.size() > SP_MAX_BATCH_SIZE) {
        throw std::invalid_argument("batch holds more than SP_MAX_BATCH_SIZE commitments");
    }
    std::vector<unsigned char> buffer(SP_MAX_BATCH_SIZE * 32, 0);
    for (size_t i = 0; i < commitments.size(); i++) {
        std::copy(commitments[i].begin(), commitments[i].end(), buffer.begin() + i * 32);
    }

    uint256 digest;
    crypto_hash_sha256(digest.begin(), buffer.data(), buffer.size());
    // mod 2^253
    *digest.begin() &= 0x1F;
    return digest;
}

size_t PendingDepositsBuffer::Add(const uint256& commitment)
{
    if (commitment.IsNull()) {
        throw std::invalid_argument("pending commitment is null");
    }
    if (IsFull()) {
        throw std::length_error("pending deposits buffer is full");
    }
    commitments.push_back(commitment);
    return commitments.size() - 1;
}

std::vector<uint256> PendingDepositsBuffer::Front(size_t n) const
{
    if (n > commitments.size()) {
        n = commitments.size();
    }
    return std::vector<uint256>(commitments.begin(), commitments.begin() + n);
}

void PendingDepositsBuffer::Drain(size_t n, int64_t nTime)
{
    if (n > commitments.size()) {
        throw std::out_of_range("draining more commitments than are pending");
    }
    commitments.erase(commitments.begin(), commitments.begin() + n);
    totalBatched += n;
    batchCount++;
    lastBatchTime = nTime;
}

}
