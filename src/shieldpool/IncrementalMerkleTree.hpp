#ifndef SP_INCREMENTALMERKLETREE_H_
#define SP_INCREMENTALMERKLETREE_H_

#include <deque>
#include <optional>
#include <vector>

#include "uint256.h"

#include "shieldpool/ShieldPool.h"
#include "shieldpool/Poseidon.hpp"

namespace libshieldpool {

/**
 * Poseidon two-to-one hashing of tree nodes together with the table of
 * empty subtree roots: zeros[0] = 0 and zeros[i] = H(zeros[i-1], zeros[i-1]).
 * The ledger tree and the mirror below both draw from one instance.
 */
class MerkleHasher {
public:
    explicit MerkleHasher(const PoseidonHasher& poseidon);

    uint256 combine(const uint256& left, const uint256& right) const;

    //! Root of an empty subtree of the given height, up to SP_MAX_TREE_DEPTH.
    const uint256& empty_root(size_t depth) const;

    const std::vector<uint256>& zeros() const { return zeros_; }

    const PoseidonHasher& poseidon() const { return poseidon_; }

private:
    const PoseidonHasher& poseidon_;
    std::vector<uint256> zeros_;
};

// Authentication path ordered from the leaf towards the root. index[i] is
// true when the node at level i is a right child, so authentication_path[i]
// is its left sibling.
class MerklePath {
public:
    std::vector<uint256> authentication_path;
    std::vector<bool> index;

    MerklePath() { }

    MerklePath(std::vector<uint256> authentication_path, std::vector<bool> index)
    : authentication_path(authentication_path), index(index) { }

    //! Position of the leaf the path belongs to.
    uint64_t position() const;

    //! Fold the leaf up the path.
    uint256 root(const MerkleHasher& hasher, const uint256& leaf) const;
};

template<size_t Depth>
class IncrementalWitness;

// Append-only frontier of a Poseidon Merkle tree, for clients that need
// authentication paths. It keeps only the rightmost branch.
template<size_t Depth>
class IncrementalMerkleTree {

friend class IncrementalWitness<Depth>;

public:
    static_assert(Depth >= 1 && Depth <= SP_MAX_TREE_DEPTH, "unsupported tree depth");

    explicit IncrementalMerkleTree(const MerkleHasher& hasher) : hasher(&hasher) { }

    //! Returns the number of (filled) leaves present in this tree, or
    //! in other words, the 0-indexed position that the next leaf
    //! added to the tree will occupy.
    uint64_t size() const;

    void append(const uint256& obj);
    uint256 root() const {
        return root(Depth, std::deque<uint256>());
    }
    uint256 last() const;

    IncrementalWitness<Depth> witness() const {
        return IncrementalWitness<Depth>(*this);
    }

    uint256 empty_root() const {
        return hasher->empty_root(Depth);
    }

    //! Presence byte and 32 bytes for left and right, a parent count, then
    //! a presence byte and 32 bytes per parent.
    std::vector<unsigned char> ToBytes() const;

    //! Inverse of ToBytes. Throws std::ios_base::failure for malformed or
    //! non-canonical input.
    static IncrementalMerkleTree FromBytes(const MerkleHasher& hasher,
                                           const std::vector<unsigned char>& bytes);

    template <size_t D>
    friend bool operator==(const IncrementalMerkleTree<D>& a,
                           const IncrementalMerkleTree<D>& b);

private:
    const MerkleHasher* hasher;
    std::optional<uint256> left;
    std::optional<uint256> right;

    // Collapsed "left" subtrees ordered toward the root of the tree.
    std::vector<std::optional<uint256>> parents;
    MerklePath path(std::deque<uint256> filler_hashes = std::deque<uint256>()) const;
    uint256 root(size_t depth, std::deque<uint256> filler_hashes = std::deque<uint256>()) const;
    bool is_complete(size_t depth = Depth) const;
    size_t next_depth(size_t skip) const;
    void wfcheck() const;
};

template<size_t Depth>
bool operator==(const IncrementalMerkleTree<Depth>& a,
                const IncrementalMerkleTree<Depth>& b) {
    return (a.left == b.left &&
            a.right == b.right &&
            a.parents == b.parents);
}

// Tracks the authentication path of one leaf as later leaves are appended.
template <size_t Depth>
class IncrementalWitness {
friend class IncrementalMerkleTree<Depth>;

public:
    MerklePath path() const {
        return tree.path(partial_path());
    }

    // Return the element being witnessed (should be a note
    // commitment!)
    uint256 element() const {
        return tree.last();
    }

    uint64_t position() const {
        return tree.size() - 1;
    }

    uint256 root() const {
        return tree.root(Depth, partial_path());
    }

    void append(const uint256& obj);

private:
    IncrementalMerkleTree<Depth> tree;
    std::vector<uint256> filled;
    std::optional<IncrementalMerkleTree<Depth>> cursor;
    size_t cursor_depth = 0;
    std::deque<uint256> partial_path() const;
    IncrementalWitness(IncrementalMerkleTree<Depth> tree) : tree(tree) {}
};

} // end namespace `libshieldpool`

typedef libshieldpool::IncrementalMerkleTree<SP_TREE_DEPTH> PoolMerkleTree;
typedef libshieldpool::IncrementalMerkleTree<SP_TREE_DEPTH_TESTING> PoolTestingMerkleTree;

typedef libshieldpool::IncrementalWitness<SP_TREE_DEPTH> PoolWitness;
typedef libshieldpool::IncrementalWitness<SP_TREE_DEPTH_TESTING> PoolTestingWitness;

#endif /* SP_INCREMENTALMERKLETREE_H_ */
