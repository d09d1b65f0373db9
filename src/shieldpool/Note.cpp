#include "shieldpool/Note.hpp"

#include "shieldpool/Field.hpp"

namespace libshieldpool {

uint256 Note::cm(const PoseidonHasher& hasher) const
{
    return hasher.Hash(secret, nullifier, EncodeU64(value), assetId);
}

uint256 Note::nullifier_hash(const PoseidonHasher& hasher, uint64_t position) const
{
    return hasher.Hash(hasher.Hash(nullifier, secret), EncodeU64(position));
}

}
