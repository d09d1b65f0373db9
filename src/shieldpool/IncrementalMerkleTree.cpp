#include <stdexcept>

#include <boost/foreach.hpp>

#include "shieldpool/IncrementalMerkleTree.hpp"

namespace libshieldpool {

MerkleHasher::MerkleHasher(const PoseidonHasher& poseidon) : poseidon_(poseidon)
{
    zeros_.reserve(SP_MAX_TREE_DEPTH + 1);
    zeros_.push_back(uint256());
    for (size_t d = 1; d <= SP_MAX_TREE_DEPTH; d++) {
        zeros_.push_back(combine(zeros_[d - 1], zeros_[d - 1]));
    }
}

uint256 MerkleHasher::combine(const uint256& left, const uint256& right) const
{
    return poseidon_.Hash(left, right);
}

const uint256& MerkleHasher::empty_root(size_t depth) const
{
    if (depth >= zeros_.size()) {
        throw std::out_of_range("no empty root at that depth");
    }
    return zeros_[depth];
}

uint64_t MerklePath::position() const
{
    uint64_t ret = 0;
    for (size_t i = 0; i < index.size(); i++) {
        if (index[i]) {
            ret |= (uint64_t(1) << i);
        }
    }
    return ret;
}

uint256 MerklePath::root(const MerkleHasher& hasher, const uint256& leaf) const
{
    if (authentication_path.size() != index.size()) {
        throw std::logic_error("authentication path and index differ in length");
    }
    uint256 node = leaf;
    for (size_t i = 0; i < authentication_path.size(); i++) {
        if (index[i]) {
            node = hasher.combine(authentication_path[i], node);
        } else {
            node = hasher.combine(node, authentication_path[i]);
        }
    }
    return node;
}

template <size_t Depth>
class PathFiller {
private:
    const MerkleHasher& hasher;
    std::deque<uint256> queue;
public:
    PathFiller(const MerkleHasher& hasher, std::deque<uint256> queue) : hasher(hasher), queue(queue) { }

    uint256 next(size_t depth) {
        if (queue.size() > 0) {
            uint256 h = queue.front();
            queue.pop_front();

            return h;
        } else {
            return hasher.empty_root(depth);
        }
    }

};

template<size_t Depth>
void IncrementalMerkleTree<Depth>::wfcheck() const {
    if (parents.size() >= Depth) {
        throw std::ios_base::failure("tree has too many parents");
    }

    // The last parent cannot be null.
    if (!(parents.empty()) && !(parents.back())) {
        throw std::ios_base::failure("tree has non-canonical representation of parent");
    }

    // Left cannot be empty when right exists.
    if (!left && right) {
        throw std::ios_base::failure("tree has non-canonical representation; right should not exist");
    }

    // Left cannot be empty when parents is nonempty.
    if (!left && parents.size() > 0) {
        throw std::ios_base::failure("tree has non-canonical representation; parents should not be unempty");
    }
}

template<size_t Depth>
uint256 IncrementalMerkleTree<Depth>::last() const {
    if (right) {
        return *right;
    } else if (left) {
        return *left;
    } else {
        throw std::runtime_error("tree has no cursor");
    }
}

template<size_t Depth>
uint64_t IncrementalMerkleTree<Depth>::size() const {
    uint64_t ret = 0;
    if (left) {
        ret++;
    }
    if (right) {
        ret++;
    }
    // Treat occupation of parents array as a binary number
    // (right-shifted by 1)
    for (size_t i = 0; i < parents.size(); i++) {
        if (parents[i]) {
            ret += (uint64_t(1) << (i+1));
        }
    }
    return ret;
}

template<size_t Depth>
void IncrementalMerkleTree<Depth>::append(const uint256& obj) {
    if (is_complete(Depth)) {
        throw std::runtime_error("tree is full");
    }

    if (!left) {
        // Set the left leaf
        left = obj;
    } else if (!right) {
        // Set the right leaf
        right = obj;
    } else {
        // Combine the leaves and propagate it up the tree
        std::optional<uint256> combined = hasher->combine(*left, *right);

        // Set the "left" leaf to the object and make the "right" leaf none
        left = obj;
        right = std::nullopt;

        for (size_t i = 0; i < Depth; i++) {
            if (i < parents.size()) {
                if (parents[i]) {
                    combined = hasher->combine(*parents[i], *combined);
                    parents[i] = std::nullopt;
                } else {
                    parents[i] = *combined;
                    break;
                }
            } else {
                parents.push_back(combined);
                break;
            }
        }
    }
}

// This is for allowing the witness to determine if a subtree has filled
// to a particular depth, or for append() to ensure we're not appending
// to a full tree.
template<size_t Depth>
bool IncrementalMerkleTree<Depth>::is_complete(size_t depth) const {
    if (!left || !right) {
        return false;
    }

    if (parents.size() != (depth - 1)) {
        return false;
    }

    BOOST_FOREACH(const std::optional<uint256>& parent, parents) {
        if (!parent) {
            return false;
        }
    }

    return true;
}

// This finds the next "depth" of an unfilled subtree, given that we've filled
// `skip` uncles/subtrees.
template<size_t Depth>
size_t IncrementalMerkleTree<Depth>::next_depth(size_t skip) const {
    if (!left) {
        if (skip) {
            skip--;
        } else {
            return 0;
        }
    }

    if (!right) {
        if (skip) {
            skip--;
        } else {
            return 0;
        }
    }

    size_t d = 1;

    BOOST_FOREACH(const std::optional<uint256>& parent, parents) {
        if (!parent) {
            if (skip) {
                skip--;
            } else {
                return d;
            }
        }

        d++;
    }

    return d + skip;
}

// This calculates the root of the tree.
template<size_t Depth>
uint256 IncrementalMerkleTree<Depth>::root(size_t depth,
                                           std::deque<uint256> filler_hashes) const {
    PathFiller<Depth> filler(*hasher, filler_hashes);

    uint256 combine_left =  left  ? *left  : filler.next(0);
    uint256 combine_right = right ? *right : filler.next(0);

    uint256 root = hasher->combine(combine_left, combine_right);

    size_t d = 1;

    BOOST_FOREACH(const std::optional<uint256>& parent, parents) {
        if (parent) {
            root = hasher->combine(*parent, root);
        } else {
            root = hasher->combine(root, filler.next(d));
        }

        d++;
    }

    // We may not have parents for ancestor trees, so we fill
    // the rest in here.
    while (d < depth) {
        root = hasher->combine(root, filler.next(d));
        d++;
    }

    return root;
}

// This constructs an authentication path into the tree, leaf first. The
// caller provides `filler_hashes` to fill in the uncle subtrees.
template<size_t Depth>
MerklePath IncrementalMerkleTree<Depth>::path(std::deque<uint256> filler_hashes) const {
    if (!left) {
        throw std::runtime_error("can't create an authentication path for the beginning of the tree");
    }

    PathFiller<Depth> filler(*hasher, filler_hashes);

    std::vector<uint256> path;
    std::vector<bool> index;

    if (right) {
        index.push_back(true);
        path.push_back(*left);
    } else {
        index.push_back(false);
        path.push_back(filler.next(0));
    }

    size_t d = 1;

    BOOST_FOREACH(const std::optional<uint256>& parent, parents) {
        if (parent) {
            index.push_back(true);
            path.push_back(*parent);
        } else {
            index.push_back(false);
            path.push_back(filler.next(d));
        }

        d++;
    }

    while (d < Depth) {
        index.push_back(false);
        path.push_back(filler.next(d));
        d++;
    }

    return MerklePath(path, index);
}

static void WriteNode(std::vector<unsigned char>& out, const std::optional<uint256>& node)
{
    out.push_back(node ? 1 : 0);
    if (node) {
        out.insert(out.end(), node->begin(), node->end());
    }
}

static std::optional<uint256> ReadNode(const std::vector<unsigned char>& in, size_t& pos)
{
    if (pos >= in.size()) {
        throw std::ios_base::failure("tree encoding is truncated");
    }
    unsigned char flag = in[pos++];
    if (flag == 0) {
        return std::nullopt;
    }
    if (flag != 1) {
        throw std::ios_base::failure("tree encoding has an invalid presence flag");
    }
    if (in.size() - pos < 32) {
        throw std::ios_base::failure("tree encoding is truncated");
    }
    uint256 node = uint256::FromRawBytes(&in[pos]);
    pos += 32;
    return node;
}

template<size_t Depth>
std::vector<unsigned char> IncrementalMerkleTree<Depth>::ToBytes() const {
    std::vector<unsigned char> out;
    WriteNode(out, left);
    WriteNode(out, right);
    out.push_back(static_cast<unsigned char>(parents.size()));
    BOOST_FOREACH(const std::optional<uint256>& parent, parents) {
        WriteNode(out, parent);
    }
    return out;
}

template<size_t Depth>
IncrementalMerkleTree<Depth> IncrementalMerkleTree<Depth>::FromBytes(
    const MerkleHasher& hasher, const std::vector<unsigned char>& bytes)
{
    IncrementalMerkleTree<Depth> tree(hasher);
    size_t pos = 0;
    tree.left = ReadNode(bytes, pos);
    tree.right = ReadNode(bytes, pos);
    if (pos >= bytes.size()) {
        throw std::ios_base::failure("tree encoding is truncated");
    }
    size_t count = bytes[pos++];
    for (size_t i = 0; i < count; i++) {
        tree.parents.push_back(ReadNode(bytes, pos));
    }
    if (pos != bytes.size()) {
        throw std::ios_base::failure("tree encoding has trailing bytes");
    }

    tree.wfcheck();
    return tree;
}

template<size_t Depth>
std::deque<uint256> IncrementalWitness<Depth>::partial_path() const {
    std::deque<uint256> uncles(filled.begin(), filled.end());

    if (cursor) {
        uncles.push_back(cursor->root(cursor_depth));
    }

    return uncles;
}

template<size_t Depth>
void IncrementalWitness<Depth>::append(const uint256& obj) {
    if (cursor) {
        cursor->append(obj);

        if (cursor->is_complete(cursor_depth)) {
            filled.push_back(cursor->root(cursor_depth));
            cursor = std::nullopt;
        }
    } else {
        cursor_depth = tree.next_depth(filled.size());

        if (cursor_depth >= Depth) {
            throw std::runtime_error("tree is full");
        }

        if (cursor_depth == 0) {
            filled.push_back(obj);
        } else {
            cursor = IncrementalMerkleTree<Depth>(*tree.hasher);
            cursor->append(obj);
        }
    }
}

template class IncrementalMerkleTree<SP_TREE_DEPTH>;
template class IncrementalMerkleTree<SP_TREE_DEPTH_TESTING>;

template class IncrementalWitness<SP_TREE_DEPTH>;
template class IncrementalWitness<SP_TREE_DEPTH_TESTING>;

} // end namespace `libshieldpool`
