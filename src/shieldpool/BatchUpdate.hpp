#ifndef SP_BATCHUPDATE_H_
#define SP_BATCHUPDATE_H_

#include "uint256.h"
#include "shieldpool/ShieldPool.h"

#include <vector>

namespace libshieldpool {

/**
 * Field element binding a settlement proof to the queued commitments:
 * SHA-256 over SP_MAX_BATCH_SIZE 32-byte slots holding the commitments in
 * order followed by zero slots, reduced mod 2^253 by clearing the top three
 * bits. Throws std::invalid_argument for more than SP_MAX_BATCH_SIZE
 * commitments.
 */
uint256 BatchCommitmentsHash(const std::vector<uint256>& commitments);

/**
 * FIFO of commitments waiting to be inserted into the tree, oldest first,
 * at most SP_MAX_PENDING_DEPOSITS long.
 */
class PendingDepositsBuffer {
public:
    std::vector<uint256> commitments;
    uint64_t totalBatched;
    uint64_t batchCount;
    int64_t lastBatchTime;

    PendingDepositsBuffer() : totalBatched(0), batchCount(0), lastBatchTime(0) {}

    size_t Size() const { return commitments.size(); }
    bool IsEmpty() const { return commitments.empty(); }
    bool IsFull() const { return commitments.size() >= SP_MAX_PENDING_DEPOSITS; }

    /** Queue a commitment. Throws std::invalid_argument for a null one and std::length_error when full. */
    size_t Add(const uint256& commitment);

    /** The oldest min(n, Size()) commitments. */
    std::vector<uint256> Front(size_t n) const;

    /** Remove n commitments from the front and count one batch. Throws std::out_of_range if n > Size(). */
    void Drain(size_t n, int64_t nTime);

    friend bool operator==(const PendingDepositsBuffer& a, const PendingDepositsBuffer& b)
    {
        return a.commitments == b.commitments && a.totalBatched == b.totalBatched &&
               a.batchCount == b.batchCount && a.lastBatchTime == b.lastBatchTime;
    }
};

}

#endif // SP_BATCHUPDATE_H_
