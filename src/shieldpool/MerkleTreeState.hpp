#ifndef SP_MERKLETREESTATE_H_
#define SP_MERKLETREESTATE_H_

#include "uint256.h"
#include "shieldpool/IncrementalMerkleTree.hpp"

#include <stdexcept>
#include <vector>

namespace libshieldpool {

/** Thrown when leaves are appended past the tree's capacity. */
class TreeFullError : public std::runtime_error {
public:
    TreeFullError() : std::runtime_error("tree is full") { }
};

/**
 * The pool's commitment tree as held on the ledger: the filled-subtree
 * frontier, the current root and a ring of recent roots. Withdrawals may
 * prove membership against the current root or any root in the ring.
 */
class MerkleTreeState {
public:
    /**
     * Throws std::invalid_argument unless SP_MIN_TREE_DEPTH <= depth <=
     * SP_MAX_TREE_DEPTH and rootHistorySize >= SP_MIN_ROOT_HISTORY.
     */
    MerkleTreeState(const MerkleHasher& hasher, size_t depth, size_t rootHistorySize);

    /** Appends a leaf and returns its index. Throws TreeFullError. */
    uint64_t insert(const uint256& leaf);

    /**
     * Appends every leaf, or none of them when they do not all fit.
     * Returns the index of the first leaf.
     */
    uint64_t insertBatch(const std::vector<uint256>& leaves);

    /**
     * Appends the leaves as one step: the root before the batch enters the
     * history once and intermediate roots are never recorded. Returns false
     * and changes nothing when the resulting root is not expectedRoot.
     * Throws TreeFullError when the leaves do not fit.
     */
    bool settleBatch(const std::vector<uint256>& leaves, const uint256& expectedRoot);

    /** True for the current root and the last W replaced roots; never for zero. */
    bool isKnownRoot(const uint256& root) const;

    uint64_t capacity() const { return uint64_t(1) << depth_; }
    bool isFull() const { return nextIndex_ >= capacity(); }
    uint64_t availableSpace() const { return capacity() - nextIndex_; }

    size_t depth() const { return depth_; }
    uint64_t nextIndex() const { return nextIndex_; }
    const uint256& currentRoot() const { return currentRoot_; }
    size_t rootHistorySize() const { return rootHistory_.size(); }
    const std::vector<uint256>& filledSubtrees() const { return filledSubtrees_; }

    friend bool operator==(const MerkleTreeState& a, const MerkleTreeState& b);

private:
    const MerkleHasher* hasher_;
    size_t depth_;
    uint64_t nextIndex_;
    std::vector<uint256> filledSubtrees_;
    uint256 currentRoot_;
    std::vector<uint256> rootHistory_;
    size_t rootHistoryIndex_;

    // Level walk of one leaf at position index over the given frontier.
    uint256 walk(std::vector<uint256>& subtrees, uint64_t index, const uint256& leaf) const;
    void pushRoot(const uint256& root);
};

}

#endif // SP_MERKLETREESTATE_H_
