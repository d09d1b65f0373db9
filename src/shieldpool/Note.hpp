#ifndef SP_NOTE_H_
#define SP_NOTE_H_

#include "uint256.h"
#include "shieldpool/Poseidon.hpp"

namespace libshieldpool {

// A hidden balance of one asset. Only its commitment is ever public.
class Note {
public:
    uint256 secret;
    uint256 nullifier;
    uint64_t value;
    uint256 assetId;

    Note() : value(0) {}
    Note(const uint256& secret, const uint256& nullifier, uint64_t value, const uint256& assetId)
        : secret(secret), nullifier(nullifier), value(value), assetId(assetId) {}

    //! Poseidon(secret, nullifier, value, asset_id)
    uint256 cm(const PoseidonHasher& hasher) const;

    //! Poseidon(Poseidon(nullifier, secret), position), revealed when the
    //! note at that leaf position is spent.
    uint256 nullifier_hash(const PoseidonHasher& hasher, uint64_t position) const;
};

}

#endif // SP_NOTE_H_
