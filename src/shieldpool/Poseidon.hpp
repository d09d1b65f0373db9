#ifndef SP_POSEIDON_H_
#define SP_POSEIDON_H_

#include "uint256.h"

#include <vector>

#include <gmpxx.h>

namespace libshieldpool {

/**
 * Poseidon over the BN254 scalar field with the x^5 S-box, compatible
 * with circomlib. Arity 2 uses width 3 with 8 full and 57 partial rounds;
 * arity 4 uses width 5 with 8 full and 60 partial rounds.
 *
 * Round constants and MDS matrices are produced by the Grain LFSR when
 * the hasher is constructed. Construct one hasher and pass it to every
 * component that hashes.
 */
class PoseidonHasher {
public:
    PoseidonHasher();

    PoseidonHasher(const PoseidonHasher&) = delete;
    PoseidonHasher& operator=(const PoseidonHasher&) = delete;

    /**
     * Hash two or four field elements. Throws std::invalid_argument for
     * any other arity and std::domain_error for an input that is not
     * below r.
     */
    uint256 Hash(const std::vector<uint256>& inputs) const;

    uint256 Hash(const uint256& a, const uint256& b) const;
    uint256 Hash(const uint256& a, const uint256& b, const uint256& c, const uint256& d) const;

    struct Params {
        size_t width;
        size_t full_rounds;
        size_t partial_rounds;
        std::vector<mpz_class> round_constants;
        std::vector<std::vector<mpz_class>> mds;
    };

    const Params& ParamsForWidth(size_t width) const;

private:
    Params params3;
    Params params5;
};

}

#endif // SP_POSEIDON_H_
