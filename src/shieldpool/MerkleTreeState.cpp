#include "shieldpool/MerkleTreeState.hpp"

#include "logging.h"

#include <stdexcept>

namespace libshieldpool {

MerkleTreeState::MerkleTreeState(const MerkleHasher& hasher, size_t depth, size_t rootHistorySize) :
    hasher_(&hasher), depth_(depth), nextIndex_(0), rootHistoryIndex_(0)
{
    if (depth < SP_MIN_TREE_DEPTH || depth > SP_MAX_TREE_DEPTH) {
        throw std::invalid_argument("tree depth out of range");
    }
    if (rootHistorySize < SP_MIN_ROOT_HISTORY) {
        throw std::invalid_argument("root history is too small");
    }
    filledSubtrees_.assign(hasher.zeros().begin(), hasher.zeros().begin() + depth);
    currentRoot_ = hasher.empty_root(depth);
    rootHistory_.assign(rootHistorySize, uint256());
}

uint256 MerkleTreeState::walk(std::vector<uint256>& subtrees, uint64_t index, const uint256& leaf) const
{
    uint256 current = leaf;
    for (size_t level = 0; level < depth_; level++) {
        if ((index & 1) == 0) {
            subtrees[level] = current;
            current = hasher_->combine(current, hasher_->empty_root(level));
        } else {
            current = hasher_->combine(subtrees[level], current);
        }
        index >>= 1;
    }
    return current;
}

void MerkleTreeState::pushRoot(const uint256& root)
{
    rootHistory_[rootHistoryIndex_] = root;
    rootHistoryIndex_ = (rootHistoryIndex_ + 1) % rootHistory_.size();
}

uint64_t MerkleTreeState::insert(const uint256& leaf)
{
    if (isFull()) {
        throw TreeFullError();
    }
    uint64_t index = nextIndex_;
    uint256 root = walk(filledSubtrees_, index, leaf);
    pushRoot(currentRoot_);
    currentRoot_ = root;
    nextIndex_++;

    LogPrint("merkle", "inserted leaf %d, root %s\n", index, currentRoot_.GetHex());
    return index;
}

uint64_t MerkleTreeState::insertBatch(const std::vector<uint256>& leaves)
{
    if (leaves.size() > availableSpace()) {
        throw TreeFullError();
    }
    uint64_t first = nextIndex_;
    for (const uint256& leaf : leaves) {
        insert(leaf);
    }
    return first;
}

bool MerkleTreeState::settleBatch(const std::vector<uint256>& leaves, const uint256& expectedRoot)
{
    if (leaves.size() > availableSpace()) {
        throw TreeFullError();
    }
    std::vector<uint256> subtrees = filledSubtrees_;
    uint256 root = currentRoot_;
    uint64_t index = nextIndex_;
    for (const uint256& leaf : leaves) {
        root = walk(subtrees, index++, leaf);
    }
    if (root != expectedRoot) {
        LogPrint("merkle", "batch of %d leaves yields root %s, expected %s\n",
                 leaves.size(), root.GetHex(), expectedRoot.GetHex());
        return false;
    }

    pushRoot(currentRoot_);
    currentRoot_ = root;
    filledSubtrees_.swap(subtrees);
    nextIndex_ = index;

    LogPrint("merkle", "settled %d leaves, next index %d\n", leaves.size(), nextIndex_);
    return true;
}

bool MerkleTreeState::isKnownRoot(const uint256& root) const
{
    if (root.IsNull()) {
        return false;
    }
    if (root == currentRoot_) {
        return true;
    }
    for (const uint256& r : rootHistory_) {
        if (r == root) {
            return true;
        }
    }
    return false;
}

bool operator==(const MerkleTreeState& a, const MerkleTreeState& b)
{
    return a.depth_ == b.depth_ &&
           a.nextIndex_ == b.nextIndex_ &&
           a.filledSubtrees_ == b.filledSubtrees_ &&
           a.currentRoot_ == b.currentRoot_ &&
           a.rootHistory_ == b.rootHistory_ &&
           a.rootHistoryIndex_ == b.rootHistoryIndex_;
}

}
